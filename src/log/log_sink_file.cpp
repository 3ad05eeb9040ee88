// log_sink_file.cpp
#include "log_sink_file.h"
#include "log_formatter.h"
#include <cerrno>
#include <filesystem>
#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;
namespace autorun::core {

FileLogSink::FileLogSink(Options opt) : _opt(std::move(opt)) {}

FileLogSink::~FileLogSink() {
    if (_fd >= 0) ::close(_fd);
}

void FileLogSink::ensureOpen_() {
    if (_fd >= 0) return;
    if (_opt.path.empty()) return;

    std::error_code ec;
    auto parent = fs::path(_opt.path).parent_path();
    if (!parent.empty() && !fs::exists(parent, ec)) {
        fs::create_directories(parent, ec);
    }
    _fd = ::open(_opt.path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
}

void FileLogSink::consume(const LogRecord& rec) {
    std::lock_guard<std::mutex> lk(_mu);
    ensureOpen_();
    // 打不开（只读介质 / 权限）就只剩控制台
    if (_fd < 0) return;

    // 一条一次 write，不经过用户态缓冲，不需要 flush
    const std::string line = LogFormatter::instance().formatLine(rec) + "\n";
    const char* p = line.data();
    std::size_t left = line.size();
    while (left > 0) {
        const ssize_t n = ::write(_fd, p, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            return;
        }
        p += n;
        left -= static_cast<std::size_t>(n);
    }
}

}
