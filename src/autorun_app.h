#pragma once
#include <chrono>
#include <iostream>

#include "core/paths.h"
#include "runner/execution_record.h"

namespace autorun {

/// 进程入口：
/// SessionGuard -> ConfigGateway -> SourceResolver(Transport) -> ScriptStager -> Executor -> 清理
/// 返回值就是进程退出码
class AutorunApp {
public:
    struct Options {
        bool installLogSinks{ true }; // 测试里自己装 sink
        std::chrono::milliseconds retryDelay{ std::chrono::milliseconds(1000) };
    };

    static constexpr int EXIT_FATAL = 1;
    // 进程退出码只有 8 位
    static constexpr int EXIT_STATUS_MAX = 255;

    explicit AutorunApp(core::Paths paths);
    AutorunApp(core::Paths paths, Options opt, std::istream& in, std::ostream& out);

    int run();

    /// 被信号中断：128 + 信号；否则失败脚本数，封顶 EXIT_STATUS_MAX
    static int exitStatus(const core::ExecutionSummary& summary);

private:
    void init_logger();

private:
    core::Paths _paths;
    Options _opt;
    std::istream& _in;
    std::ostream& _out;
};

} // namespace autorun
