#pragma once
#include <stdexcept>
#include <string>

namespace autorun::core {

// 致命错误：配置文档缺失 / 无法解析，直接非零退出
class SetupError : public std::runtime_error {
public:
    explicit SetupError(const std::string& msg) : std::runtime_error(msg) {}
};

class ConfigMissing : public SetupError {
public:
    explicit ConfigMissing(const std::string& path)
        : SetupError("effective configuration not found: " + path), _path(path) {}

    const std::string& path() const { return _path; }

private:
    std::string _path;
};

// 致命错误：设备 / 网络共享挂载失败（不回退，不 umount）
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& msg) : std::runtime_error(msg) {}
};

} // namespace autorun::core
