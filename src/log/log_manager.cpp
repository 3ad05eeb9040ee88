#include "log_manager.h"
#include <iostream>
#include "log_formatter.h"

namespace autorun::core {

LogManager& LogManager::instance() {
    static LogManager g;
    return g;
}

void LogManager::emit(const LogRecord& rec) {
    std::vector<std::shared_ptr<ILogSink>> sinksSnapshot;
    {
        std::lock_guard<std::mutex> lk(_mu);
        if (rec.level < _minLevel) return;
        // 拷贝 sinks，避免锁内做 IO
        sinksSnapshot = _sinks;
    }

    if (sinksSnapshot.empty()) {
        // 还没 init（或测试里没装 sink）：至少打到控制台，别丢日志
        std::cout << LogFormatter::instance().formatConsole(rec) << std::endl;
        return;
    }

    for (auto& s : sinksSnapshot) {
        if (s) s->consume(rec);
    }
}

void LogManager::setSinks(std::vector<std::shared_ptr<ILogSink>> sinks) {
    std::lock_guard<std::mutex> lk(_mu);
    _sinks = std::move(sinks);
}

void LogManager::setMinLevel(LogLevel level) {
    std::lock_guard<std::mutex> lk(_mu);
    _minLevel = level;
}

void emitEvent(const std::string& script, LogLevel level, const std::string& msg) {
    LogRecord rec;
    rec.script  = script;
    rec.stream  = LogStream::Event;
    rec.level   = level;
    rec.message = msg;
    LogManager::instance().emit(rec);
}

void emitEvent(const std::string& script,
               LogLevel level,
               const std::string& msg,
               const std::map<std::string, std::string>& extra,
               long long durationMs,
               int attempt) {
    LogRecord rec;
    rec.script     = script;
    rec.stream     = LogStream::Event;
    rec.level      = level;
    rec.message    = msg;
    rec.durationMs = durationMs;
    rec.attempt    = attempt;
    rec.fields     = extra;
    LogManager::instance().emit(rec);
}

} // namespace autorun::core
