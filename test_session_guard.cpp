#include "test_support.h"
#include <csignal>
#include <sstream>
#include <sys/wait.h>

#include "core/errors.h"
#include "session/session_guard.h"

using namespace autorun;
using namespace autorun::session;

namespace {

core::Paths paths_under(const fs::path& root) {
    core::Paths p;
    p.baseDir = (root / "var_autorun").string();
    p.lockFile = (root / "run" / "autorun.pid").string();
    p.nowaitFile = (root / "etc" / "autorun-nowait").string();
    return p;
}

} // namespace

static void test_single_instance() {
    const fs::path root = make_temp_dir("guard_lock");
    const core::Paths p = paths_under(root);

    {
        SessionGuard first(p);
        assert(first.acquire());
        assert(first.ownsLock());
        assert(fs::exists(p.lockFile));
        assert(slurp(p.lockFile) == std::to_string(::getpid()) + "\n");

        SessionGuard second(p);
        assert(!second.acquire());
        assert(!second.ownsLock());
    }
    // second 析构不能删掉 first 的锁；first 析构后锁消失
    assert(!fs::exists(p.lockFile));

    {
        // 别人持有的锁：析构后仍然在
        write_script(p.lockFile, "4242\n", false);
        SessionGuard g(p);
        assert(!g.acquire());
    }
    assert(fs::exists(p.lockFile));
    assert(slurp(p.lockFile) == "4242\n");

    fs::remove_all(root);
    std::cout << "[guard] single instance OK\n";
}

static void test_release_on_exception() {
    const fs::path root = make_temp_dir("guard_unwind");
    const core::Paths p = paths_under(root);

    bool caught = false;
    try {
        SessionGuard g(p);
        assert(g.acquire());
        throw core::SetupError("boom");
    } catch (const core::SetupError&) {
        caught = true;
    }
    assert(caught);
    assert(!fs::exists(p.lockFile));

    fs::remove_all(root);
    std::cout << "[guard] release on exception OK\n";
}

static void test_signal_removes_lock() {
    const fs::path root = make_temp_dir("guard_signal");
    const core::Paths p = paths_under(root);

    const pid_t pid = ::fork();
    assert(pid >= 0);
    if (pid == 0) {
        SessionGuard g(p);
        if (!g.acquire()) ::_exit(2);
        ::raise(SIGTERM);
        ::_exit(0); // 不应该走到这里
    }

    int status = 0;
    assert(::waitpid(pid, &status, 0) == pid);
    // 进程仍然是被 SIGTERM 杀死的，但锁已经删掉
    assert(WIFSIGNALED(status));
    assert(WTERMSIG(status) == SIGTERM);
    assert(!fs::exists(p.lockFile));

    fs::remove_all(root);
    std::cout << "[guard] signal removes lock OK\n";
}

static void test_handlers_follow_lock() {
    const fs::path root = make_temp_dir("guard_handlers");
    const core::Paths p = paths_under(root);

    struct sigaction cur {};
    {
        SessionGuard g(p);
        assert(g.acquire());
        ::sigaction(SIGINT, nullptr, &cur);
        assert(cur.sa_flags & SA_SIGINFO);

        // 没拿到锁的实例不接管信号
        SessionGuard other(p);
        assert(!other.acquire());
        ::sigaction(SIGHUP, nullptr, &cur);
        assert(cur.sa_flags & SA_SIGINFO);
    }
    ::sigaction(SIGINT, nullptr, &cur);
    assert(cur.sa_handler == SIG_DFL);
    ::sigaction(SIGHUP, nullptr, &cur);
    assert(cur.sa_handler == SIG_DFL);

    fs::remove_all(root);
    std::cout << "[guard] handlers follow lock OK\n";
}

static void test_lock_dir_unusable() {
    const fs::path root = make_temp_dir("guard_badlock");
    core::Paths p = paths_under(root);
    // 父路径是个普通文件，既不是 EEXIST 也建不出来
    write_script(root / "notadir", "x", false);
    p.lockFile = (root / "notadir" / "autorun.pid").string();

    SessionGuard g(p);
    bool thrown = false;
    try {
        g.acquire();
    } catch (const core::SetupError&) {
        thrown = true;
    }
    assert(thrown);
    assert(!g.ownsLock());

    fs::remove_all(root);
    std::cout << "[guard] unusable lock dir OK\n";
}

static void test_directories() {
    const fs::path root = make_temp_dir("guard_dirs");
    const core::Paths p = paths_under(root);

    SessionGuard g(p);
    g.ensureDirectories();
    g.ensureDirectories(); // 重复调用不报错
    assert(fs::is_directory(p.logDir()));
    assert(fs::is_directory(p.mountDir()));
    assert(fs::is_directory(p.stagingDir()));

    fs::remove_all(root);
    std::cout << "[guard] directories OK\n";
}

static void test_cleanup() {
    const fs::path root = make_temp_dir("guard_cleanup");
    const core::Paths p = paths_under(root);
    SessionGuard g(p);
    g.ensureDirectories();

    const fs::path a = fs::path(p.stagingDir()) / "autorun";
    const fs::path b = fs::path(p.stagingDir()) / "autorun1";
    write_script(a, "#!/bin/sh\n");
    write_script(b, "#!/bin/sh\n");
    core::StagedScriptList scripts{{"/src/autorun", a.string(), "autorun"},
                                   {"/src/autorun1", b.string(), "autorun1"}};

    core::AutorunConfig cfg;
    cfg.noDelete = true;
    g.cleanup(scripts, cfg);
    assert(fs::exists(a) && fs::exists(b));

    cfg.noDelete = false;
    g.cleanup(scripts, cfg);
    assert(!fs::exists(a) && !fs::exists(b));

    // 已经不存在了也没关系
    g.cleanup(scripts, cfg);

    fs::remove_all(root);
    std::cout << "[guard] cleanup OK\n";
}

static void test_interactive_gate() {
    const fs::path root = make_temp_dir("guard_gate");
    const core::Paths p = paths_under(root);

    std::istringstream in("\n\n\n");
    std::ostringstream out;
    SessionGuard g(p, in, out);
    core::AutorunConfig cfg;

    // 跑过脚本、没设 nowait：等待
    assert(g.interactiveGate(cfg, true));
    assert(out.str().find("press <Enter>") != std::string::npos);

    // 什么都没跑：不等
    out.str("");
    assert(!g.interactiveGate(cfg, false));
    assert(out.str().empty());

    // ar_nowait
    cfg.noWait = true;
    assert(!g.interactiveGate(cfg, true));
    assert(out.str().empty());

    // 运行期间脚本创建了 nowait 文件：不等，并删掉它
    cfg.noWait = false;
    write_script(p.nowaitFile, "", false);
    assert(!g.interactiveGate(cfg, true));
    assert(!fs::exists(p.nowaitFile));
    assert(out.str().empty());

    // 只对一次运行生效
    assert(g.interactiveGate(cfg, true));

    fs::remove_all(root);
    std::cout << "[guard] interactive gate OK\n";
}

int main() {
    install_capture_sink();
    test_single_instance();
    test_release_on_exception();
    test_signal_removes_lock();
    test_handlers_follow_lock();
    test_lock_dir_unusable();
    test_directories();
    test_cleanup();
    test_interactive_gate();
    std::cout << "ALL session guard tests passed\n";
    return 0;
}
