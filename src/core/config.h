#pragma once
#include <optional>
#include <string>

#include <nlohmann/json.hpp>
#include "autorun_config.h"
#include "paths.h"

using json = nlohmann::json;

namespace autorun::core {

/// ConfigGateway：读取配置提供方生成的 effective config（JSON），
/// 再叠加 boot 命令行里唯一的历史参数 autoruns=<value>
class ConfigGateway {
public:
    explicit ConfigGateway(Paths paths);

    /// 文档不存在 -> ConfigMissing；不是合法 JSON 对象 -> SetupError
    AutorunConfig load() const;

    /// 只解析 "autorun" 这一段，缺的 key 用默认值
    static AutorunConfig parse(const json& doc);

    /// 在命令行里找 autoruns=<value>，多个时取最后一个
    static std::optional<std::string> findLegacySuffixes(const std::string& cmdline);

    /// true / "y" / "yes" / "true" -> true；false / "n" / "no" / "false" -> false；
    /// 其他任何值都不算布尔值
    static std::optional<bool> parseBool(const json& v);
    static std::optional<int> parseInt(const json& v);

private:
    Paths _paths;
};

} // namespace autorun::core
