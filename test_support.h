#pragma once
#undef NDEBUG
#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <unistd.h>

#include "core/utils.h"
#include "log/log_manager.h"
#include "log/log_sink.h"

namespace fs = std::filesystem;

// 每个测试用例一个干净的临时目录
inline fs::path make_temp_dir(const std::string& name) {
    fs::path dir = fs::temp_directory_path() /
                   ("autorun_" + name + "_" + std::to_string(::getpid()));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

inline void write_script(const fs::path& path, const std::string& content, bool executable = true) {
    fs::create_directories(path.parent_path());
    bool ok = autorun::utils::write_file(path.string(), content);
    assert(ok);
    if (executable) {
        fs::permissions(path, fs::perms::owner_all, fs::perm_options::replace);
    }
}

inline std::string slurp(const fs::path& path) {
    auto c = autorun::utils::read_file(path.string());
    return c ? *c : std::string{};
}

// 把日志收集起来，方便断言警告条数
class CaptureSink : public autorun::core::ILogSink {
public:
    void consume(const autorun::core::LogRecord& rec) override {
        records.push_back(rec);
    }

    std::size_t count(autorun::LogLevel level, const std::string& script, const std::string& needle) const {
        std::size_t n = 0;
        for (const auto& r : records) {
            if (r.level == level && r.script == script &&
                r.message.find(needle) != std::string::npos) {
                ++n;
            }
        }
        return n;
    }

    std::vector<autorun::core::LogRecord> records;
};

inline std::shared_ptr<CaptureSink> install_capture_sink() {
    auto sink = std::make_shared<CaptureSink>();
    autorun::core::LogManager::instance().setMinLevel(autorun::LogLevel::Debug);
    autorun::core::LogManager::instance().setSinks({ sink });
    return sink;
}
