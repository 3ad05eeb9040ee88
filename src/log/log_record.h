#pragma once
#include <string>
#include <map>
#include <chrono>
#include <cstdint>
#include "log/logger.h"

namespace autorun::core {

enum class LogStream : int {
    None   = 0,
    Output = 1, // 脚本输出（stdout+stderr 合并）
    Event  = 2, // 状态/事件类日志（staging / start / end / spawn error 等）
};

struct LogRecord {
    // ---- routing ----
    std::string script;                    // 可选：关联到哪个 autorun 脚本（baseName）

    // ---- content ----
    LogLevel level{LogLevel::Info};
    LogStream stream{LogStream::Event};
    std::string message;

    // ---- timing ----
    std::chrono::system_clock::time_point ts{std::chrono::system_clock::now()};
    std::int64_t durationMs{0};
    int attempt{0};                        // 可选：HTTP 第几次尝试（1..n）

    // ---- extra fields ----
    std::map<std::string, std::string> fields;
};

} // namespace autorun::core
