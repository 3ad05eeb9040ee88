// log_sink_console.cpp
#include "log_sink_console.h"
#include <iostream>
#include "log_formatter.h"
namespace autorun::core {

void ConsoleLogSink::consume(const LogRecord& rec) {
    const std::string line = LogFormatter::instance().formatConsole(rec);
    if (rec.level >= LogLevel::Error) {
        std::cerr << line << std::endl;
    } else {
        std::cout << line << std::endl;
    }
}
}
