#pragma once
#include <optional>
#include <string>

#include "core/autorun_config.h"
#include "runner/staged_script.h"

namespace autorun::transport {

constexpr const char* AUTORUN_BASE_NAME = "autorun";

/// "" -> "autorun"，"1" -> "autorun1"
std::string candidateName(const std::string& suffix);

/// 把 dir/autorun<suffix> 拷贝到 stagingDir，并设成 0700
/// 不存在 / 不是普通文件 / 拷贝失败 -> nullopt（staging 里不会留下半个文件）
std::optional<core::StagedScript> stageFromDirectory(const std::string& dir,
                                                     const std::string& suffix,
                                                     const std::string& stagingDir);

/// 按后缀顺序扫描一个目录
core::StagedScriptList scanDirectory(const std::string& dir,
                                     const core::SuffixList& suffixes,
                                     const std::string& stagingDir);

/// 写入下载内容到 staging，成功返回本地路径
std::optional<std::string> stageContent(const std::string& name,
                                        const std::string& content,
                                        const std::string& stagingDir);

} // namespace autorun::transport
