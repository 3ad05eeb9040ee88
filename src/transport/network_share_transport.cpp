#include "network_share_transport.h"

namespace autorun::transport {

NetworkShareTransport::NetworkShareTransport(Protocol protocol, std::string share, std::string mountPoint,
                                             std::string stagingDir, CommandRunner runner)
    : MountedTransport(std::move(mountPoint), std::move(stagingDir), std::move(runner)),
      _protocol(protocol),
      _share(std::move(share)) {}

std::vector<std::string> NetworkShareTransport::mountCommand() const {
    if (_protocol == Protocol::Nfs) {
        // 启动阶段没有 rpc.statd，必须 nolock
        return {"mount", "-t", "nfs", "-o", "nolock", _share, _mountPoint};
    }
    return {"mount", "-t", "cifs", _share, _mountPoint};
}

SourceKind NetworkShareTransport::kind() const {
    return _protocol == Protocol::Nfs ? SourceKind::NfsShare : SourceKind::SmbShare;
}

} // namespace autorun::transport
