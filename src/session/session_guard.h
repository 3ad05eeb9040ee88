#pragma once

#include <iostream>
#include <optional>
#include <string>

#include "core/autorun_config.h"
#include "core/paths.h"
#include "runner/staged_script.h"
#include "interrupt_scope.h"

namespace autorun::session {

/// SessionGuard：
/// - 锁文件保证同一时间只有一个引擎在跑（先拿到的赢，后来的直接退出 0）
/// - 析构时释放锁，任何退出路径（包括异常展开）都会删掉锁文件
/// - 持有锁期间接管 SIGINT/SIGTERM/SIGHUP（见 InterruptScope），被信号杀死前也会删锁
/// - 工作目录、运行后的清理、结束时的“按回车继续”
class SessionGuard {
public:
    explicit SessionGuard(core::Paths paths,
                          std::istream& in = std::cin,
                          std::ostream& out = std::cout);
    ~SessionGuard();

    SessionGuard(const SessionGuard&) = delete;
    SessionGuard& operator=(const SessionGuard&) = delete;

    /// false：锁已被别的实例持有
    bool acquire();
    void release();
    bool ownsLock() const { return _owned; }

    /// <base>, <base>/log, <base>/mnt, <base>/tmp；已存在不报错
    void ensureDirectories() const;

    /// 删除 staging 里的副本（noDelete 时保留）
    void cleanup(const core::StagedScriptList& scripts, const core::AutorunConfig& cfg) const;

    /// 返回是否真的等待了用户输入
    bool interactiveGate(const core::AutorunConfig& cfg, bool scriptsRan);

private:
    core::Paths _paths;
    std::istream& _in;
    std::ostream& _out;
    bool _owned{false};
    std::optional<InterruptScope> _interrupts;
};

} // namespace autorun::session
