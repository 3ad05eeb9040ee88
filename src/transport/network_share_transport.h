#pragma once
#include "mounted_transport.h"

namespace autorun::transport {

/// nfs://host/path -> mount -t nfs -o nolock host:/path
/// smb://host/path -> mount -t cifs //host/path
class NetworkShareTransport : public MountedTransport {
public:
    enum class Protocol { Nfs, Smb };

    /// share 已经是 mount 能直接用的形式（host:/path 或 //host/path），见 SourceResolver::classify
    NetworkShareTransport(Protocol protocol, std::string share, std::string mountPoint,
                          std::string stagingDir, CommandRunner runner = nullptr);

    std::vector<std::string> mountCommand() const override;
    SourceKind kind() const override;

private:
    Protocol _protocol;
    std::string _share;
};

} // namespace autorun::transport
