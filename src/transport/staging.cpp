#include "staging.h"
#include <filesystem>
#include "core/utils.h"
#include "log/logger.h"

namespace fs = std::filesystem;

namespace autorun::transport {

namespace {

constexpr fs::perms STAGED_PERMS = fs::perms::owner_all;

void removeQuietly(const fs::path& p) {
    std::error_code ec;
    fs::remove(p, ec);
}

} // namespace

std::string candidateName(const std::string &suffix) {
    return std::string(AUTORUN_BASE_NAME) + suffix;
}

std::optional<core::StagedScript> stageFromDirectory(const std::string &dir,
                                                     const std::string &suffix,
                                                     const std::string &stagingDir) {
    const std::string name = candidateName(suffix);
    const fs::path src = fs::path(dir) / name;

    std::error_code ec;
    if (!fs::is_regular_file(src, ec)) {
        return std::nullopt;
    }

    const fs::path dst = fs::path(stagingDir) / name;
    fs::copy_file(src, dst, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        Logger::warn("Failed to copy " + src.string() + " to " + dst.string() + ": " + ec.message());
        removeQuietly(dst);
        return std::nullopt;
    }

    fs::permissions(dst, STAGED_PERMS, fs::perm_options::replace, ec);
    if (ec) {
        Logger::warn("Failed to set permissions on " + dst.string() + ": " + ec.message());
    }

    Logger::info("Found autorun script " + src.string());
    return core::StagedScript{src.string(), dst.string(), name};
}

core::StagedScriptList scanDirectory(const std::string &dir,
                                     const core::SuffixList &suffixes,
                                     const std::string &stagingDir) {
    core::StagedScriptList out;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        Logger::debug("Directory " + dir + " does not exist, skipped");
        return out;
    }

    for (const auto& suffix : suffixes) {
        if (auto staged = stageFromDirectory(dir, suffix, stagingDir)) {
            out.push_back(std::move(*staged));
        }
    }
    return out;
}

std::optional<std::string> stageContent(const std::string &name,
                                        const std::string &content,
                                        const std::string &stagingDir) {
    const fs::path dst = fs::path(stagingDir) / name;
    if (!utils::write_file(dst.string(), content)) {
        Logger::warn("Failed to write " + dst.string());
        removeQuietly(dst);
        return std::nullopt;
    }

    std::error_code ec;
    fs::permissions(dst, STAGED_PERMS, fs::perm_options::replace, ec);
    if (ec) {
        Logger::warn("Failed to set permissions on " + dst.string() + ": " + ec.message());
    }
    return dst.string();
}

} // namespace autorun::transport
