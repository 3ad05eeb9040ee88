#pragma once

#include <string>
#include <unistd.h>

#include "core/autorun_config.h"
#include "execution_record.h"
#include "staged_script.h"

namespace autorun::runner {

/// Executor：严格按列表顺序、一个一个地同步执行脚本
/// - 直接 exec（不经过 shell），stdin 继承自引擎，方便交互式脚本读终端
/// - stdout/stderr 合并成一个管道，读到的每一块同时写到控制台和 <logdir>/<name>.log
/// - 退出码写到 <logdir>/<name>.return
/// - 非零退出：计数；没设 ignoreFailure 时后面的脚本不再执行
/// - 执行期间其他进程发给引擎的 SIGINT/SIGTERM/SIGHUP 会转发给子进程，
///   子进程结束后停止执行剩余脚本，不再等它留下的后台进程关闭输出管道
class Executor {
public:
    explicit Executor(std::string logDir, int consoleFd = STDOUT_FILENO);

    core::ExecutionSummary run(const core::StagedScriptList& scripts,
                               const core::AutorunConfig& cfg) const;

    /// 执行单个脚本（不含 fail-fast 判断）
    core::ExecutionRecord runOne(const core::StagedScript& script) const;

    std::string logPathFor(const std::string& baseName) const;
    std::string returnPathFor(const std::string& baseName) const;

private:
    std::string _logDir;
    int _consoleFd;
};

} // namespace autorun::runner
