#include "log_formatter.h"
#include <cstddef>
#include <sstream>
#include "core/utils.h"
namespace autorun::core {

LogFormatter& LogFormatter::instance() {
    static LogFormatter f;
    return f;
}

const char* LogFormatter::levelName_(LogLevel lv) {
    static const char* const kNames[] = {"DEBUG", "INFO", "WARN", "ERROR"};
    const auto i = static_cast<std::size_t>(lv);
    return i < sizeof(kNames) / sizeof(kNames[0]) ? kNames[i] : "INFO";
}

// None 是引擎自己的日志
const char* LogFormatter::streamName_(LogStream s) {
    switch (s) {
    case LogStream::Output: return "OUTPUT";
    case LogStream::None:   return "ENGINE";
    case LogStream::Event:
    default:                return "EVENT";
    }
}

// 脚本输出里可能有控制字符，文件日志必须保持一条一行
std::string LogFormatter::escapeMsg_(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 8);
    for (const unsigned char c : s) {
        switch (c) {
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        case '"':  out += "\\\""; break;
        default:
            if (c < 0x20) {
                static const char hex[] = "0123456789abcdef";
                out += "\\x";
                out += hex[c >> 4];
                out += hex[c & 0x0f];
            } else {
                out += static_cast<char>(c);
            }
        }
    }
    return out;
}

std::string LogFormatter::formatLine(const LogRecord& r) const {
    std::ostringstream oss;

    oss << "ts=[" << utils::formatTimestampMs(r.ts) << ']'
        << " level=[" << levelName_(r.level) << "]"
        << " stream=" << streamName_(r.stream);

    if (!r.script.empty())    oss << " script=" << r.script;
    if (r.attempt > 0)        oss << " attempt=" << r.attempt;
    if (r.durationMs > 0)     oss << " duration_ms=" << r.durationMs;

    oss << " msg=\"" << escapeMsg_(r.message) << "\"";

    for (const auto& kv : r.fields) {
        oss << " " << kv.first << "=" << escapeMsg_(kv.second);
    }

    return oss.str();
}

std::string LogFormatter::formatConsole(const LogRecord& r) const {
    std::ostringstream oss;
    oss << "[" << levelName_(r.level) << "] ";
    if (!r.script.empty()) oss << r.script << ": ";
    oss << r.message;
    return oss.str();
}

} // namespace autorun::core
