#pragma once
#include <string>
#include <vector>

namespace autorun::core {

/// spawn 失败（找不到 / 不可执行）时记录的退出码
constexpr int SPAWN_FAILURE_EXIT_CODE = 127;

/// 旁路文件后缀：<logdir>/<baseName>.return 里存文本形式的退出码
constexpr const char* RETURN_FILE_SUFFIX = ".return";
constexpr const char* LOG_FILE_SUFFIX = ".log";

struct ExecutionRecord {
    std::string baseName;
    int exitCode{0};
    std::string logPath;
    // 这条记录之后不再执行后续脚本：fail-fast 触发，或运行中引擎收到中断
    bool aborted{false};

    bool ok() const { return exitCode == 0; }
};

struct ExecutionSummary {
    std::vector<ExecutionRecord> records;
    int failureCount{0};
    bool interrupted{false};
    int signal{0}; // interrupted 时收到的信号
};

} // namespace autorun::core
