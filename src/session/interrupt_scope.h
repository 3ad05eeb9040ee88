#pragma once
#include <csignal>
#include <string>
#include <sys/types.h>

namespace autorun::session {

/// InterruptScope：在作用域内接管 SIGINT / SIGTERM / SIGHUP，析构时恢复原来的处理
///
/// - 有脚本在跑（setChild 设置了 pid）：记下信号；别的进程发来的信号转发给子进程，
///   终端产生的（si_code > 0）子进程自己已经收到，不再转发。引擎等子进程退出后停止。
/// - 没有脚本在跑：删掉已登记的锁文件，按默认动作重新投递信号，进程以该信号结束。
///
/// 信号处理函数里只用 async-signal-safe 的调用（kill / unlink / sigaction / raise）
class InterruptScope {
public:
    InterruptScope();
    ~InterruptScope();

    InterruptScope(const InterruptScope&) = delete;
    InterruptScope& operator=(const InterruptScope&) = delete;

    /// 0 表示还没收到
    static int receivedSignal();

    /// 正在运行的脚本；0 表示没有
    static void setChild(pid_t pid);

    /// 由 SessionGuard 在拿到 / 释放锁时登记；空串表示清除
    static void setLockFile(const std::string& path);

    /// fork 前屏蔽这几个信号，直到父进程 setChild() 之后再用 restoreMask() 放开
    static void blockSignals(sigset_t* previous);
    static void restoreMask(const sigset_t* previous);

    /// 子进程 exec 之前调用：恢复默认处理，子进程里不能删锁
    static void resetInChild();
};

} // namespace autorun::session
