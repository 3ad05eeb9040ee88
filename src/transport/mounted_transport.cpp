#include "mounted_transport.h"
#include <filesystem>
#include "staging.h"
#include "core/errors.h"

namespace autorun::transport {

MountedTransport::MountedTransport(std::string mountPoint, std::string stagingDir, CommandRunner runner)
    : _mountPoint(std::move(mountPoint)),
      _stagingDir(std::move(stagingDir)),
      _runner(runner ? std::move(runner) : CommandRunner(&utils::exec_command)) {}

void MountedTransport::mount() {
    std::error_code ec;
    std::filesystem::create_directories(_mountPoint, ec);

    const auto cmd = mountCommand();
    Logger::info("Mounting: " + utils::join_command(cmd));

    const auto res = _runner(cmd);
    if (res.exit_code != 0) {
        throw core::TransportError("Failed to mount " + SourceKindToString(kind()) +
                                   " source with '" + utils::join_command(cmd) +
                                   "' (exit code " + std::to_string(res.exit_code) + "): " +
                                   utils::trim(res.output));
    }
}

core::StagedScriptList MountedTransport::discover(const core::SuffixList &suffixes) {
    return scanDirectory(_mountPoint, suffixes, _stagingDir);
}

void MountedTransport::unmount() {
    const auto cmd = unmountCommand();
    const auto res = _runner(cmd);
    if (res.exit_code != 0) {
        Logger::warn("'" + utils::join_command(cmd) + "' exited with code " +
                     std::to_string(res.exit_code) + ": " + utils::trim(res.output));
    } else {
        Logger::debug("Unmounted " + _mountPoint);
    }
}

std::vector<std::string> MountedTransport::unmountCommand() const {
    return {"umount", _mountPoint};
}

} // namespace autorun::transport
