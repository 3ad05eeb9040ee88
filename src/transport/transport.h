#pragma once

#include <string>

#include "core/autorun_config.h"
#include "runner/staged_script.h"
#include "log/logger.h"

namespace autorun::transport {

/// ar_source 分类结果
enum class SourceKind {
    LocalDefaults, // 空 / 不认识的 scheme：扫默认目录
    BlockDevice,   // /dev/...
    NfsShare,      // nfs://host/path
    SmbShare,      // smb://host/path
    Http,          // http:// https://
};

struct SourceSpec {
    SourceKind kind{ SourceKind::LocalDefaults };
    // 交给 transport 的目标：设备路径 / host:/path / //host/path / URL；LocalDefaults 为空
    std::string target;
};

inline std::string SourceKindToString(SourceKind kind) {
    switch (kind) {
        case SourceKind::LocalDefaults: return "LocalDefaults";
        case SourceKind::BlockDevice:   return "BlockDevice";
        case SourceKind::NfsShare:      return "NfsShare";
        case SourceKind::SmbShare:      return "SmbShare";
        case SourceKind::Http:          return "Http";
        default: return "Unknown";
    }
}

/// Transport 抽象接口：
/// - mount()：准备好源（挂载设备 / 共享），失败抛 core::TransportError
/// - discover()：对每个后缀找 autorun<suffix>，成功拷贝 / 下载到 staging 的才返回
/// - unmount()：释放 mount() 拿到的资源，结果不影响流程
/// 重试和挂载生命周期由 SourceResolver 负责
class ITransport {
public:
    virtual ~ITransport() = default;

    virtual void mount() = 0;
    virtual core::StagedScriptList discover(const core::SuffixList& suffixes) = 0;
    virtual void unmount() = 0;

    virtual SourceKind kind() const = 0;
};

} // namespace autorun::transport
