#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace autorun {
namespace utils {

// 格式：YYYY-MM-DD HH:MM:SS.mmm
std::string formatTimestampMs(const std::chrono::system_clock::time_point& ts);

// String utilities
std::string trim(const std::string& str);
std::vector<std::string> split(const std::string& str, char delim);
bool starts_with(const std::string& str, const std::string& prefix);

// File I/O（二进制方式读写，不做换行转换）
std::optional<std::string> read_file(const std::string& path);
bool write_file(const std::string& path, const std::string& content);

// 外部命令（mount / umount），stdout+stderr 合并捕获
struct ExecResult {
    int exit_code{-1};
    std::string output;
};
ExecResult exec_command(const std::vector<std::string>& args);

std::string join_command(const std::vector<std::string>& args);

} // namespace utils
} // namespace autorun
