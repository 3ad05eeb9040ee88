#pragma once
#include <string>
#include <vector>

namespace autorun::core {

/// 默认后缀：autorun0 .. autorunF
constexpr const char* DEFAULT_SUFFIXES = "0,1,2,3,4,5,6,7,8,9,A,B,C,D,E,F";
/// ar_suffixes 的禁用标记：只找裸名 autorun
constexpr const char* SUFFIXES_DISABLED = "no";

/// AutorunConfig：effective config 里 "autorun" 这一段
/// 由 ConfigGateway 构造一次，之后只读地传给各个组件
struct AutorunConfig {
    bool disabled{ false };      // ar_disable
    bool noWait{ false };        // ar_nowait：结束后不等待按键
    bool noDelete{ false };      // ar_nodel：保留 staging 里的副本
    bool ignoreFailure{ false }; // ar_ignorefail：失败后继续跑后面的脚本
    int attempts{ 1 };           // ar_attempts：HTTP 源的尝试次数（>=0）
    std::string source;          // ar_source：/dev/xxx, nfs://, smb://, http(s)://, 或空
    std::string suffixes{ DEFAULT_SUFFIXES }; // ar_suffixes：逗号分隔
};

/// 后缀列表：第一个永远是 ""（裸名 autorun），后面按配置顺序，不去重
using SuffixList = std::vector<std::string>;

SuffixList deriveSuffixes(const std::string& suffixes);

} // namespace autorun::core
