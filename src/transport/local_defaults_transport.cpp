#include "local_defaults_transport.h"
#include "staging.h"

namespace autorun::transport {

LocalDefaultsTransport::LocalDefaultsTransport(std::vector<std::string> dirs, std::string stagingDir)
    : _dirs(std::move(dirs)), _stagingDir(std::move(stagingDir)) {}

core::StagedScriptList LocalDefaultsTransport::discover(const core::SuffixList &suffixes) {
    for (const auto& dir : _dirs) {
        Logger::debug("Searching for autorun scripts in " + dir);
        auto found = scanDirectory(dir, suffixes, _stagingDir);
        if (!found.empty()) {
            Logger::info("Using " + std::to_string(found.size()) + " autorun script(s) from " + dir);
            return found;
        }
    }
    return {};
}

} // namespace autorun::transport
