#pragma once
#include <string>
#include "log_record.h"

namespace autorun::core {

// 文件日志：一行一条，k=v 形式
// 例：
// ts=[2026-10-18 09:12:01.234] level=[WARN] stream=EVENT script=autorun1 msg="..." k1=v1
//
// 控制台：只保留级别 + 脚本名 + 消息，启动时给人看的
// 例：
// [WARN] autorun1: Script has Windows line endings ...
class LogFormatter {
public:
    static LogFormatter& instance();

    std::string formatLine(const LogRecord& r) const;
    std::string formatConsole(const LogRecord& r) const;

private:
    LogFormatter() = default;

    static const char* levelName_(LogLevel lv);
    static const char* streamName_(LogStream s);

    static std::string escapeMsg_(const std::string& s);
};

} // namespace autorun::core
