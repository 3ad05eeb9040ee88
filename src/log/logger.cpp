#include "logger.h"
#include <algorithm>
#include <cctype>
#include "log_manager.h"
#include "log_record.h"

void autorun::Logger::debug(const std::string &msg) {
    write(LogLevel::Debug, msg);
}

void autorun::Logger::info(const std::string &msg) {
    write(LogLevel::Info, msg);
}

void autorun::Logger::warn(const std::string &msg) {
    write(LogLevel::Warn, msg);
}

void autorun::Logger::error(const std::string &msg) {
    write(LogLevel::Error, msg);
}

void autorun::Logger::write(LogLevel level, const std::string &msg) {
    // 引擎自身的日志：不挂脚本名，stream=None
    autorun::core::LogRecord rec;
    rec.stream = autorun::core::LogStream::None;
    rec.level = level;
    rec.message = msg;
    rec.ts = std::chrono::system_clock::now();
    autorun::core::LogManager::instance().emit(rec);
}

autorun::LogLevel autorun::Logger::level_from_string(const std::string &name, LogLevel fallback) {
    std::string s = name;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c){ return std::tolower(c); });
    if (s == "debug") return LogLevel::Debug;
    if (s == "info")  return LogLevel::Info;
    if (s == "warn" || s == "warning") return LogLevel::Warn;
    if (s == "error") return LogLevel::Error;
    return fallback;
}
