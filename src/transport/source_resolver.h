#pragma once

#include <chrono>
#include <functional>
#include <memory>

#include "transport.h"
#include "core/paths.h"

namespace autorun::transport {

/// SourceResolver：
/// - 把 ar_source 分类成一个 SourceSpec（每次只激活一个 transport）
/// - HTTP：按 attempts 重试，两次之间 sleep 一个单位，找到任意文件就停
/// - 设备 / 共享：mount -> discover 一次 -> 无条件 unmount；mount 失败直接抛 TransportError
class SourceResolver {
public:
    using TransportFactory = std::function<std::unique_ptr<ITransport>(const SourceSpec&)>;

    struct Options {
        std::chrono::milliseconds retryDelay{ std::chrono::milliseconds(1000) };
    };

    explicit SourceResolver(core::Paths paths);
    SourceResolver(core::Paths paths, TransportFactory factory, Options opt);

    static SourceSpec classify(const std::string& source);

    core::StagedScriptList resolve(const core::AutorunConfig& cfg) const;

    /// 默认工厂：按 SourceKind 构造具体 transport
    std::unique_ptr<ITransport> makeTransport(const SourceSpec& spec) const;

private:
    core::StagedScriptList resolveWithRetry_(ITransport& transport,
                                             const core::SuffixList& suffixes,
                                             int attempts) const;
    core::StagedScriptList resolveMounted_(ITransport& transport,
                                           const core::SuffixList& suffixes) const;

private:
    core::Paths _paths;
    TransportFactory _factory;
    Options _opt;
};

} // namespace autorun::transport
