#pragma once
#include "mounted_transport.h"

namespace autorun::transport {

/// ar_source=/dev/xxx：只读挂载设备
class BlockDeviceTransport : public MountedTransport {
public:
    BlockDeviceTransport(std::string device, std::string mountPoint, std::string stagingDir,
                         CommandRunner runner = nullptr);

    std::vector<std::string> mountCommand() const override;
    SourceKind kind() const override { return SourceKind::BlockDevice; }

private:
    std::string _device;
};

} // namespace autorun::transport
