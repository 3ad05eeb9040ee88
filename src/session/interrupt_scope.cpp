#include "interrupt_scope.h"
#include <array>
#include <climits>
#include <csignal>
#include <cstring>
#include <pthread.h>
#include <unistd.h>

namespace autorun::session {

namespace {

constexpr std::array<int, 3> kSignals{SIGINT, SIGTERM, SIGHUP};

// 信号处理函数只能碰 sig_atomic_t 和预先准备好的缓冲
volatile sig_atomic_t g_childPid = 0;
volatile sig_atomic_t g_interruptSignal = 0;
volatile sig_atomic_t g_lockArmed = 0;
char g_lockPath[PATH_MAX]{};

// 嵌套安装（AutorunApp 和 Executor 各一层）时只有最外层真正改 sigaction
int g_depth = 0;
std::array<struct sigaction, kSignals.size()> g_old{};

void on_interrupt(int sig, siginfo_t* info, void*) {
    g_interruptSignal = sig;

    const pid_t child = static_cast<pid_t>(g_childPid);
    if (child > 0) {
        if (!info || info->si_code <= 0) {
            ::kill(child, sig);
        }
        return;
    }

    // 1) 没有子进程可等：先把锁删掉
    if (g_lockArmed) {
        g_lockArmed = 0;
        ::unlink(g_lockPath);
    }

    // 2) 恢复默认动作；处理函数返回后挂起的信号立即生效
    struct sigaction dfl {};
    dfl.sa_handler = SIG_DFL;
    ::sigemptyset(&dfl.sa_mask);
    ::sigaction(sig, &dfl, nullptr);
    ::raise(sig);
}

} // namespace

InterruptScope::InterruptScope() {
    if (g_depth++ > 0) return;

    g_interruptSignal = 0;
    g_childPid = 0;

    struct sigaction sa {};
    sa.sa_sigaction = on_interrupt;
    sa.sa_flags = SA_SIGINFO;
    ::sigemptyset(&sa.sa_mask);
    for (std::size_t i = 0; i < kSignals.size(); ++i) {
        ::sigaction(kSignals[i], &sa, &g_old[i]);
    }
}

InterruptScope::~InterruptScope() {
    if (--g_depth > 0) return;

    for (std::size_t i = 0; i < kSignals.size(); ++i) {
        ::sigaction(kSignals[i], &g_old[i], nullptr);
    }
    g_childPid = 0;
}

int InterruptScope::receivedSignal() {
    return g_interruptSignal;
}

void InterruptScope::setChild(pid_t pid) {
    g_childPid = pid;
}

void InterruptScope::setLockFile(const std::string &path) {
    g_lockArmed = 0;
    if (path.empty() || path.size() >= sizeof(g_lockPath)) return;
    std::memcpy(g_lockPath, path.c_str(), path.size() + 1);
    g_lockArmed = 1;
}

void InterruptScope::blockSignals(sigset_t *previous) {
    sigset_t set;
    ::sigemptyset(&set);
    for (int sig : kSignals) {
        ::sigaddset(&set, sig);
    }
    ::pthread_sigmask(SIG_BLOCK, &set, previous);
}

void InterruptScope::restoreMask(const sigset_t *previous) {
    ::pthread_sigmask(SIG_SETMASK, previous, nullptr);
}

void InterruptScope::resetInChild() {
    g_lockArmed = 0;
    struct sigaction dfl {};
    dfl.sa_handler = SIG_DFL;
    ::sigemptyset(&dfl.sa_mask);
    for (int sig : kSignals) {
        ::sigaction(sig, &dfl, nullptr);
    }
}

} // namespace autorun::session
