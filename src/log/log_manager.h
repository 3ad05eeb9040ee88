#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "log_record.h"
#include "log_sink.h"

namespace autorun::core {

// 统一入口：所有日志都走 emit()，再分发给 sinks（console / file）
class LogManager {
public:
    static LogManager& instance();

    void emit(const LogRecord& rec);

    void setSinks(std::vector<std::shared_ptr<ILogSink>> sinks);

    void setMinLevel(LogLevel level);

private:
    LogManager() = default;

    std::mutex _mu;
    std::vector<std::shared_ptr<ILogSink>> _sinks;
    LogLevel _minLevel{LogLevel::Info};
};

void emitEvent(const std::string& script, LogLevel level, const std::string& msg);
void emitEvent(const std::string& script,
               LogLevel level,
               const std::string& msg,
               const std::map<std::string, std::string>& extra,
               long long durationMs = 0,
               int attempt = 0);

} // namespace autorun::core
