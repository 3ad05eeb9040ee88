#include "test_support.h"
#include <chrono>
#include <csignal>
#include <thread>
#include <fcntl.h>
#include <pthread.h>

#include "log/log_sink_file.h"
#include "runner/executor.h"

using namespace autorun;
using namespace autorun::runner;

namespace {

struct Fixture {
    fs::path root;
    fs::path logDir;
    fs::path stage;
    int devnull{-1};

    explicit Fixture(const std::string& name)
        : root(make_temp_dir(name)), logDir(root / "log"), stage(root / "tmp") {
        fs::create_directories(logDir);
        fs::create_directories(stage);
        // 子进程输出不刷到测试自己的终端
        devnull = ::open("/dev/null", O_WRONLY | O_CLOEXEC);
        assert(devnull >= 0);
    }
    ~Fixture() {
        ::close(devnull);
        fs::remove_all(root);
    }

    core::StagedScript add(const std::string& name, const std::string& body) {
        write_script(stage / name, body);
        return core::StagedScript{"/src/" + name, (stage / name).string(), name};
    }
};

} // namespace

static void test_fail_fast() {
    Fixture fx("exec_failfast");
    core::StagedScriptList scripts{
        fx.add("autorun", "#!/bin/sh\necho A\nexit 0\n"),
        fx.add("autorun1", "#!/bin/sh\necho B\nexit 1\n"),
        fx.add("autorun2", "#!/bin/sh\necho C\nexit 0\n"),
    };

    Executor executor(fx.logDir.string(), fx.devnull);
    core::AutorunConfig cfg;
    auto summary = executor.run(scripts, cfg);

    assert(summary.records.size() == 2);
    assert(summary.failureCount == 1);
    assert(!summary.interrupted);
    assert(summary.records[0].exitCode == 0);
    assert(!summary.records[0].aborted);
    assert(summary.records[1].exitCode == 1);
    assert(summary.records[1].aborted);

    assert(slurp(fx.logDir / "autorun.return") == "0");
    assert(slurp(fx.logDir / "autorun1.return") == "1");
    assert(!fs::exists(fx.logDir / "autorun2.log"));
    assert(!fs::exists(fx.logDir / "autorun2.return"));
    std::cout << "[executor] fail-fast OK\n";
}

static void test_ignore_failure() {
    Fixture fx("exec_ignorefail");
    core::StagedScriptList scripts{
        fx.add("autorun", "#!/bin/sh\nexit 0\n"),
        fx.add("autorun1", "#!/bin/sh\nexit 3\n"),
        fx.add("autorun2", "#!/bin/sh\nexit 0\n"),
    };

    Executor executor(fx.logDir.string(), fx.devnull);
    core::AutorunConfig cfg;
    cfg.ignoreFailure = true;
    auto summary = executor.run(scripts, cfg);

    assert(summary.records.size() == 3);
    assert(summary.failureCount == 1);
    assert(summary.records[1].exitCode == 3);
    assert(!summary.records[1].aborted);
    assert(slurp(fx.logDir / "autorun2.return") == "0");
    std::cout << "[executor] ignore failure OK\n";
}

static void test_output_captured() {
    Fixture fx("exec_output");
    auto s = fx.add("autorun5", "#!/bin/sh\necho to-stdout\necho to-stderr 1>&2\nexit 7\n");

    Executor executor(fx.logDir.string(), fx.devnull);
    auto rec = executor.runOne(s);

    assert(rec.exitCode == 7);
    assert(!rec.ok());
    assert(rec.logPath == executor.logPathFor("autorun5"));
    const std::string log = slurp(rec.logPath);
    assert(log.find("to-stdout") != std::string::npos);
    assert(log.find("to-stderr") != std::string::npos);
    assert(slurp(executor.returnPathFor("autorun5")) == "7");
    std::cout << "[executor] output captured OK\n";
}

static void test_spawn_failure() {
    Fixture fx("exec_spawn");
    Executor executor(fx.logDir.string(), fx.devnull);

    // 不存在
    core::StagedScript missing{"/src/autorun", (fx.stage / "autorun").string(), "autorun"};
    auto rec = executor.runOne(missing);
    assert(rec.exitCode == core::SPAWN_FAILURE_EXIT_CODE);
    assert(slurp(fx.logDir / "autorun.return") == "127");

    // 没有执行权限
    write_script(fx.stage / "autorun1", "#!/bin/sh\nexit 0\n", false);
    fs::permissions(fx.stage / "autorun1", fs::perms::owner_read | fs::perms::owner_write,
                    fs::perm_options::replace);
    core::StagedScript noexec{"/src/autorun1", (fx.stage / "autorun1").string(), "autorun1"};
    if (::geteuid() != 0) {
        rec = executor.runOne(noexec);
        assert(rec.exitCode == core::SPAWN_FAILURE_EXIT_CODE);
    }
    std::cout << "[executor] spawn failure OK\n";
}

static void test_killed_by_signal() {
    Fixture fx("exec_signal");
    auto s = fx.add("autorun", "#!/bin/sh\nkill -TERM $$\nsleep 5\n");

    Executor executor(fx.logDir.string(), fx.devnull);
    core::AutorunConfig cfg;
    auto summary = executor.run({s}, cfg);

    // 脚本自己被信号杀死：128 + 15，不算引擎被中断
    assert(summary.records.size() == 1);
    assert(summary.records[0].exitCode == 143);
    assert(summary.failureCount == 1);
    assert(!summary.interrupted);
    assert(slurp(fx.logDir / "autorun.return") == "143");
    std::cout << "[executor] killed by signal OK\n";
}

static void test_interrupt_forwarded() {
    Fixture fx("exec_interrupt");
    // sleep 是脚本的子进程，脚本被杀后它还占着输出管道
    core::StagedScriptList scripts{
        fx.add("autorun", "#!/bin/sh\nsleep 5\necho done\n"),
        fx.add("autorun1", "#!/bin/sh\nexit 0\n"),
    };

    Executor executor(fx.logDir.string(), fx.devnull);
    core::AutorunConfig cfg;
    cfg.ignoreFailure = true;

    // 发送线程自己屏蔽 SIGTERM，信号只会落到跑 executor 的主线程上
    std::thread sender([] {
        sigset_t set;
        sigemptyset(&set);
        sigaddset(&set, SIGTERM);
        pthread_sigmask(SIG_BLOCK, &set, nullptr);
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        ::kill(::getpid(), SIGTERM);
    });
    const auto start = std::chrono::steady_clock::now();
    auto summary = executor.run(scripts, cfg);
    const auto elapsed = std::chrono::steady_clock::now() - start;
    sender.join();

    assert(summary.interrupted);
    assert(summary.signal == SIGTERM);
    assert(summary.records.size() == 1);
    assert(summary.records[0].exitCode == 128 + SIGTERM);
    assert(summary.records[0].aborted);
    assert(slurp(fx.logDir / "autorun.return") == "143");
    assert(slurp(fx.logDir / "autorun.log").find("done") == std::string::npos);
    // ignoreFailure 也不会让中断后的脚本继续跑
    assert(!fs::exists(fx.logDir / "autorun1.log"));
    // 不等后台的 sleep 退出
    assert(elapsed < std::chrono::seconds(3));

    // 处理函数已恢复
    struct sigaction cur {};
    ::sigaction(SIGTERM, nullptr, &cur);
    assert(cur.sa_handler == SIG_DFL);
    std::cout << "[executor] interrupt forwarded OK\n";
}

static void test_log_fds_not_inherited() {
    Fixture fx("exec_fds");
    auto capture = std::make_shared<CaptureSink>();
    core::FileLogSink::Options opt;
    opt.path = (fx.root / "engine.log").string();
    core::LogManager::instance().setSinks({capture, std::make_shared<core::FileLogSink>(opt)});
    Logger::info("engine log opened");

    auto s = fx.add("autorun", "#!/bin/sh\nls -l /proc/self/fd/\n");
    Executor executor(fx.logDir.string(), fx.devnull);
    auto rec = executor.runOne(s);
    install_capture_sink();

    assert(rec.exitCode == 0);
    const std::string listing = slurp(rec.logPath);
    assert(listing.find("pipe:") != std::string::npos);
    assert(listing.find(opt.path) == std::string::npos);
    assert(listing.find(rec.logPath) == std::string::npos);
    assert(slurp(opt.path).find("engine log opened") != std::string::npos);
    std::cout << "[executor] log fds not inherited OK\n";
}

static void test_empty_list() {
    Fixture fx("exec_empty");
    Executor executor(fx.logDir.string(), fx.devnull);
    auto summary = executor.run({}, core::AutorunConfig{});
    assert(summary.records.empty());
    assert(summary.failureCount == 0);
    assert(fs::is_empty(fx.logDir));
    std::cout << "[executor] empty list OK\n";
}

int main() {
    install_capture_sink();
    test_fail_fast();
    test_ignore_failure();
    test_output_captured();
    test_spawn_failure();
    test_killed_by_signal();
    test_interrupt_forwarded();
    test_log_fds_not_inherited();
    test_empty_list();
    std::cout << "ALL executor tests passed\n";
    return 0;
}
