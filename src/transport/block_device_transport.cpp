#include "block_device_transport.h"

namespace autorun::transport {

BlockDeviceTransport::BlockDeviceTransport(std::string device, std::string mountPoint,
                                           std::string stagingDir, CommandRunner runner)
    : MountedTransport(std::move(mountPoint), std::move(stagingDir), std::move(runner)),
      _device(std::move(device)) {}

std::vector<std::string> BlockDeviceTransport::mountCommand() const {
    return {"mount", "-r", _device, _mountPoint};
}

} // namespace autorun::transport
