// log_sink_file.h
#pragma once
#include "log_sink.h"
#include <string>
#include <mutex>

namespace autorun::core {

/// 追加写引擎日志。fd 带 O_CLOEXEC，autorun 脚本不会继承它
class FileLogSink : public ILogSink {
public:
    struct Options {
        std::string path = "/var/log/sysrescue-autorun.log";
    };

    explicit FileLogSink(Options opt);
    ~FileLogSink() override;

    FileLogSink(const FileLogSink&) = delete;
    FileLogSink& operator=(const FileLogSink&) = delete;

    void consume(const LogRecord& rec) override;

private:
    void ensureOpen_();

private:
    Options _opt;
    int _fd{-1};
    std::mutex _mu;
};

}
