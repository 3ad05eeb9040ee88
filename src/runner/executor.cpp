#include "executor.h"
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fstream>
#include <vector>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>

#include "core/utils.h"
#include "log/log_manager.h"
#include "session/interrupt_scope.h"

namespace autorun::runner {

using SteadyClock = std::chrono::steady_clock;

namespace {

constexpr std::size_t CHUNK_SIZE = 4096;
constexpr int POLL_TIMEOUT_MS = 50;

void set_nonblocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0) return;
    ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

// 控制台可能是串口 / tty，写不完要循环
void write_all(int fd, const char* data, std::size_t len) {
    while (len > 0) {
        const ssize_t n = ::write(fd, data, len);
        if (n < 0) {
            if (errno == EINTR) continue;
            return;
        }
        data += n;
        len -= static_cast<std::size_t>(n);
    }
}

/**
 * @brief 把管道里当前可读的数据全部转发出去
 *
 * 每读到一块（最多 CHUNK_SIZE 字节）就立刻写到控制台并追加到日志文件、flush，
 * 这样子进程的进度条之类的输出能实时显示。EOF 或读错误时关闭 fd 并把 openFlag 置为 false。
 */
void forward_fd(int fd, int consoleFd, std::ofstream& log, bool& openFlag) {
    char buf[CHUNK_SIZE];
    while (true) {
        const ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0) {
            write_all(consoleFd, buf, static_cast<std::size_t>(n));
            if (log.is_open()) {
                log.write(buf, n);
                log.flush();
            }
            continue;
        }
        if (n == 0) {
            openFlag = false;
            ::close(fd);
            return;
        }
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return;

        openFlag = false;
        ::close(fd);
        return;
    }
}

int decode_status(int childStatus) {
    if (WIFEXITED(childStatus)) return WEXITSTATUS(childStatus);
    if (WIFSIGNALED(childStatus)) return 128 + WTERMSIG(childStatus);
    return childStatus;
}

} // namespace

Executor::Executor(std::string logDir, int consoleFd)
    : _logDir(std::move(logDir)), _consoleFd(consoleFd) {}

std::string Executor::logPathFor(const std::string &baseName) const {
    return _logDir + "/" + baseName + core::LOG_FILE_SUFFIX;
}

std::string Executor::returnPathFor(const std::string &baseName) const {
    return _logDir + "/" + baseName + core::RETURN_FILE_SUFFIX;
}

core::ExecutionSummary Executor::run(const core::StagedScriptList &scripts,
                                     const core::AutorunConfig &cfg) const {
    core::ExecutionSummary summary;
    // AutorunApp 里 SessionGuard 已经装好，这里只是嵌套一层
    session::InterruptScope interrupts;

    for (std::size_t i = 0; i < scripts.size(); ++i) {
        core::ExecutionRecord rec = runOne(scripts[i]);
        const bool failed = !rec.ok();
        if (failed) {
            ++summary.failureCount;
        }

        if (const int sig = session::InterruptScope::receivedSignal()) {
            rec.aborted = true;
            summary.interrupted = true;
            summary.signal = sig;
            summary.records.push_back(std::move(rec));
            Logger::error("Interrupted by signal " + std::to_string(sig) +
                          ", not running the remaining " + std::to_string(scripts.size() - i - 1) +
                          " script(s)");
            break;
        }

        if (failed && !cfg.ignoreFailure) {
            rec.aborted = true;
            const std::size_t remaining = scripts.size() - i - 1;
            summary.records.push_back(std::move(rec));
            if (remaining > 0) {
                Logger::error("Stopping after failure of " + scripts[i].baseName + ", " +
                              std::to_string(remaining) + " script(s) not executed "
                              "(set ar_ignorefail to continue after failures)");
            }
            break;
        }

        summary.records.push_back(std::move(rec));
    }

    return summary;
}

/**
 * @brief 执行一个 staged 脚本
 *
 * fork 之后子进程把 stdout/stderr 接到同一个管道再直接 exec 脚本；
 * 另开一个 O_CLOEXEC 管道回传 exec 失败的 errno，用来区分“脚本自己返回 127”和“根本没启动起来”。
 */
core::ExecutionRecord Executor::runOne(const core::StagedScript &script) const {
    core::ExecutionRecord rec;
    rec.baseName = script.baseName;
    rec.logPath = logPathFor(script.baseName);

    const auto start = SteadyClock::now();
    core::emitEvent(script.baseName, LogLevel::Info, "Executing " + script.localPath,
                    {{"source", script.sourcePath}, {"log", rec.logPath}});

    auto finish = [&](int exitCode) {
        rec.exitCode = exitCode;
        if (!utils::write_file(returnPathFor(script.baseName), std::to_string(exitCode))) {
            core::emitEvent(script.baseName, LogLevel::Warn,
                            "Cannot write " + returnPathFor(script.baseName));
        }
        const auto durationMs =
            std::chrono::duration_cast<std::chrono::milliseconds>(SteadyClock::now() - start).count();
        core::emitEvent(script.baseName,
                        exitCode == 0 ? LogLevel::Info : LogLevel::Error,
                        "Execution of " + script.baseName + " returned " + std::to_string(exitCode),
                        {{"exit_code", std::to_string(exitCode)}},
                        durationMs);
        return rec;
    };

    // 1) 输出管道 + exec 错误回传管道
    int outPipe[2]{-1, -1};
    int errPipe[2]{-1, -1};
    if (::pipe2(outPipe, O_CLOEXEC) != 0) {
        core::emitEvent(script.baseName, LogLevel::Error,
                        std::string("pipe() failed: ") + std::strerror(errno));
        return finish(core::SPAWN_FAILURE_EXIT_CODE);
    }
    if (::pipe2(errPipe, O_CLOEXEC) != 0) {
        ::close(outPipe[0]); ::close(outPipe[1]);
        core::emitEvent(script.baseName, LogLevel::Error,
                        std::string("pipe() failed: ") + std::strerror(errno));
        return finish(core::SPAWN_FAILURE_EXIT_CODE);
    }

    // 2) fork；父进程登记好子进程 pid 之前先不处理中断信号
    sigset_t prevMask;
    session::InterruptScope::blockSignals(&prevMask);
    const pid_t pid = ::fork();
    if (pid < 0) {
        const int e = errno;
        session::InterruptScope::restoreMask(&prevMask);
        ::close(outPipe[0]); ::close(outPipe[1]);
        ::close(errPipe[0]); ::close(errPipe[1]);
        core::emitEvent(script.baseName, LogLevel::Error,
                        std::string("fork() failed: ") + std::strerror(e));
        return finish(core::SPAWN_FAILURE_EXIT_CODE);
    }

    if (pid == 0) {
        // ---- child ----
        // 不改进程组：脚本要能从终端读输入，也要能收到终端的 Ctrl-C
        session::InterruptScope::resetInChild();
        session::InterruptScope::restoreMask(&prevMask);
        ::dup2(outPipe[1], STDOUT_FILENO);
        ::dup2(outPipe[1], STDERR_FILENO);

        char* const argv[] = {const_cast<char*>(script.localPath.c_str()), nullptr};
        ::execv(script.localPath.c_str(), argv);

        const int e = errno;
        ssize_t ignored = ::write(errPipe[1], &e, sizeof(e));
        (void)ignored;
        _exit(core::SPAWN_FAILURE_EXIT_CODE);
    }

    // ---- parent ----
    session::InterruptScope::setChild(pid);
    session::InterruptScope::restoreMask(&prevMask);
    ::close(outPipe[1]);
    ::close(errPipe[1]);

    // fork 之后才打开，脚本不会继承日志文件的 fd
    std::ofstream log(rec.logPath, std::ios::binary | std::ios::trunc);
    if (!log.is_open()) {
        core::emitEvent(script.baseName, LogLevel::Warn, "Cannot open log file " + rec.logPath);
    }

    // 3) exec 成功时 errPipe 因 CLOEXEC 关闭，read 返回 0
    int execErrno = 0;
    ssize_t n;
    do {
        n = ::read(errPipe[0], &execErrno, sizeof(execErrno));
    } while (n < 0 && errno == EINTR);
    ::close(errPipe[0]);
    const bool spawnFailed = (n == static_cast<ssize_t>(sizeof(execErrno)));

    set_nonblocking(outPipe[0]);

    bool outOpen = true;
    bool childExited = false;
    int childStatus = 0;

    // 4) 读到 EOF 且子进程结束为止
    while (outOpen || !childExited) {
        if (outOpen) {
            pollfd fds{outPipe[0], POLLIN, 0};
            ::poll(&fds, 1, POLL_TIMEOUT_MS);
            forward_fd(outPipe[0], _consoleFd, log, outOpen);
        } else {
            ::usleep(10 * 1000);
        }

        if (!childExited) {
            const pid_t w = ::waitpid(pid, &childStatus, WNOHANG);
            if (w == pid) {
                childExited = true;
            } else if (w < 0 && errno != EINTR) {
                core::emitEvent(script.baseName, LogLevel::Error,
                                std::string("waitpid() failed: ") + std::strerror(errno));
                childExited = true;
                childStatus = core::SPAWN_FAILURE_EXIT_CODE << 8;
            }
        }

        // 被中断：子进程一退出就不再等管道 EOF（脚本留下的后台进程可能一直占着写端）
        if (childExited && outOpen && session::InterruptScope::receivedSignal() != 0) {
            forward_fd(outPipe[0], _consoleFd, log, outOpen);
            if (outOpen) {
                ::close(outPipe[0]);
                outOpen = false;
            }
        }
    }
    session::InterruptScope::setChild(0);
    log.close();

    if (spawnFailed) {
        core::emitEvent(script.baseName, LogLevel::Error,
                        "Cannot execute " + script.localPath + ": " + std::strerror(execErrno));
        return finish(core::SPAWN_FAILURE_EXIT_CODE);
    }

    return finish(decode_status(childStatus));
}

} // namespace autorun::runner
