#pragma once
#include <string>
#include <vector>

namespace autorun::core {

/// 一个已经拷贝 / 下载到 staging 目录的候选脚本
struct StagedScript {
    std::string sourcePath; // 原始位置（目录里的路径或 URL），只读
    std::string localPath;  // staging 目录里的副本，运行结束由 SessionGuard 删除
    std::string baseName;   // autorun / autorun<suffix>
};

/// 发现顺序 == 执行顺序
using StagedScriptList = std::vector<StagedScript>;

} // namespace autorun::core
