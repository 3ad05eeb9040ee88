#pragma once
#include <string>
#include "staged_script.h"

namespace autorun::runner {

enum class ScriptKind {
    Binary, // ELF，原样执行
    Text,   // 脚本，需要规范化
};

/// ScriptStager：对 staging 里的文本脚本做兼容处理
/// 1) 去掉所有 '\r'（Windows 换行）
/// 2) 没有 "#!" 开头时补上 "#!/bin/sh"
/// 两者都会发 deprecation 警告；任何错误都只记日志，不阻止执行
class ScriptStager {
public:
    static constexpr const char* DEFAULT_SHEBANG = "#!/bin/sh\n";

    /// 读前 4 个字节判断是否 ELF；读不了按 Text 处理
    static ScriptKind classify(const std::string& path);

    void normalize(const core::StagedScript& script) const;
    void normalizeAll(const core::StagedScriptList& scripts) const;
};

} // namespace autorun::runner
