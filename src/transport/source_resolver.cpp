#include "source_resolver.h"
#include <thread>

#include "block_device_transport.h"
#include "http_transport.h"
#include "local_defaults_transport.h"
#include "network_share_transport.h"
#include "core/utils.h"
#include "log/log_manager.h"

namespace autorun::transport {

namespace {

constexpr const char* DEV_PREFIX   = "/dev/";
constexpr const char* NFS_PREFIX   = "nfs://";
constexpr const char* SMB_PREFIX   = "smb://";
constexpr const char* HTTP_PREFIX  = "http://";
constexpr const char* HTTPS_PREFIX = "https://";

// mount 成功才构造；析构时无条件 unmount（不检查之前是否真的挂上）
class MountScope {
public:
    explicit MountScope(ITransport& t) : _t(t) { _t.mount(); }
    ~MountScope() { _t.unmount(); }

    MountScope(const MountScope&) = delete;
    MountScope& operator=(const MountScope&) = delete;

private:
    ITransport& _t;
};

} // namespace

SourceResolver::SourceResolver(core::Paths paths)
    : SourceResolver(std::move(paths), nullptr, Options{}) {}

SourceResolver::SourceResolver(core::Paths paths, TransportFactory factory, Options opt)
    : _paths(std::move(paths)), _factory(std::move(factory)), _opt(opt) {}

SourceSpec SourceResolver::classify(const std::string &source) {
    using utils::starts_with;
    SourceSpec spec;

    if (starts_with(source, DEV_PREFIX)) {
        spec.kind = SourceKind::BlockDevice;
        spec.target = source;
    } else if (starts_with(source, NFS_PREFIX)) {
        // nfs://host/path -> host:/path
        const std::string rest = source.substr(std::char_traits<char>::length(NFS_PREFIX));
        const auto slash = rest.find('/');
        spec.kind = SourceKind::NfsShare;
        spec.target = slash == std::string::npos ? rest + ":/"
                                                 : rest.substr(0, slash) + ":" + rest.substr(slash);
    } else if (starts_with(source, SMB_PREFIX)) {
        // smb://host/path -> //host/path
        spec.kind = SourceKind::SmbShare;
        spec.target = "//" + source.substr(std::char_traits<char>::length(SMB_PREFIX));
    } else if (starts_with(source, HTTP_PREFIX) || starts_with(source, HTTPS_PREFIX)) {
        spec.kind = SourceKind::Http;
        spec.target = source;
    } else {
        if (!source.empty()) {
            Logger::warn("Unrecognized autorun source '" + source + "', using default locations");
        }
        spec.kind = SourceKind::LocalDefaults;
    }
    return spec;
}

std::unique_ptr<ITransport> SourceResolver::makeTransport(const SourceSpec &spec) const {
    switch (spec.kind) {
        case SourceKind::BlockDevice:
            return std::make_unique<BlockDeviceTransport>(spec.target, _paths.mountDir(), _paths.stagingDir());
        case SourceKind::NfsShare:
            return std::make_unique<NetworkShareTransport>(NetworkShareTransport::Protocol::Nfs, spec.target,
                                                           _paths.mountDir(), _paths.stagingDir());
        case SourceKind::SmbShare:
            return std::make_unique<NetworkShareTransport>(NetworkShareTransport::Protocol::Smb, spec.target,
                                                           _paths.mountDir(), _paths.stagingDir());
        case SourceKind::Http:
            return std::make_unique<HttpTransport>(spec.target, _paths.stagingDir());
        case SourceKind::LocalDefaults:
        default:
            return std::make_unique<LocalDefaultsTransport>(_paths.defaultSources, _paths.stagingDir());
    }
}

core::StagedScriptList SourceResolver::resolve(const core::AutorunConfig &cfg) const {
    const SourceSpec spec = classify(cfg.source);
    const core::SuffixList suffixes = core::deriveSuffixes(cfg.suffixes);

    core::emitEvent("", LogLevel::Info, "Resolving autorun source", {
        {"source", cfg.source.empty() ? "<default>" : cfg.source},
        {"transport", SourceKindToString(spec.kind)},
        {"suffixes", std::to_string(suffixes.size())}
    });

    std::unique_ptr<ITransport> transport = _factory ? _factory(spec) : makeTransport(spec);

    core::StagedScriptList scripts;
    switch (spec.kind) {
        case SourceKind::Http:
            scripts = resolveWithRetry_(*transport, suffixes, cfg.attempts);
            break;
        case SourceKind::BlockDevice:
        case SourceKind::NfsShare:
        case SourceKind::SmbShare:
            scripts = resolveMounted_(*transport, suffixes);
            break;
        case SourceKind::LocalDefaults:
        default:
            scripts = transport->discover(suffixes);
            break;
    }

    if (scripts.empty()) {
        Logger::info("No autorun script found");
    }
    return scripts;
}

core::StagedScriptList SourceResolver::resolveWithRetry_(ITransport &transport,
                                                         const core::SuffixList &suffixes,
                                                         int attempts) const {
    core::StagedScriptList scripts;
    if (attempts <= 0) {
        Logger::warn("ar_attempts is 0, nothing will be downloaded");
        return scripts;
    }

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        core::emitEvent("", LogLevel::Info, "Fetching autorun scripts", {}, 0, attempt);
        scripts = transport.discover(suffixes);
        if (!scripts.empty()) {
            break;
        }

        // 最后一次失败后不再等待
        if (attempt < attempts) {
            Logger::info("Nothing downloaded, retrying (" + std::to_string(attempt) + "/" +
                         std::to_string(attempts) + ")");
            std::this_thread::sleep_for(_opt.retryDelay);
        }
    }

    if (scripts.empty()) {
        Logger::warn("No autorun script could be downloaded after " + std::to_string(attempts) + " attempt(s)");
    }
    return scripts;
}

core::StagedScriptList SourceResolver::resolveMounted_(ITransport &transport,
                                                       const core::SuffixList &suffixes) const {
    MountScope scope(transport);
    return transport.discover(suffixes);
}

} // namespace autorun::transport
