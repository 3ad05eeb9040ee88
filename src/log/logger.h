#pragma once
#include <string>

namespace autorun {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

class Logger {
public:
    static void debug(const std::string& msg);
    static void info(const std::string& msg);
    static void warn(const std::string& msg);
    static void error(const std::string& msg);

    // "debug" / "info" / "warn" / "error"，不认识的返回 fallback
    static LogLevel level_from_string(const std::string& name, LogLevel fallback);

private:
    static void write(LogLevel level, const std::string& msg);
};

} // namespace autorun
