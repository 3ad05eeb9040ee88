#include "session_guard.h"
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fcntl.h>
#include <unistd.h>

#include "core/errors.h"
#include "log/logger.h"

namespace fs = std::filesystem;

namespace autorun::session {

SessionGuard::SessionGuard(core::Paths paths, std::istream &in, std::ostream &out)
    : _paths(std::move(paths)), _in(in), _out(out) {}

SessionGuard::~SessionGuard() {
    release();
}

bool SessionGuard::acquire() {
    if (_owned) return true;

    std::error_code ec;
    const auto parent = fs::path(_paths.lockFile).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
    }

    _interrupts.emplace();
    const int fd = ::open(_paths.lockFile.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd < 0) {
        const int e = errno;
        _interrupts.reset();
        if (e == EEXIST) {
            Logger::info("Lock file " + _paths.lockFile + " exists, another instance is already running");
            return false;
        }
        throw core::SetupError("cannot create lock file " + _paths.lockFile + ": " + std::strerror(e));
    }

    InterruptScope::setLockFile(_paths.lockFile);
    _owned = true;

    const std::string pid = std::to_string(::getpid()) + "\n";
    const ssize_t n = ::write(fd, pid.data(), pid.size());
    ::close(fd);

    if (n != static_cast<ssize_t>(pid.size())) {
        Logger::warn("Failed to write pid to lock file " + _paths.lockFile);
    }
    Logger::debug("Lock acquired: " + _paths.lockFile);
    return true;
}

void SessionGuard::release() {
    if (!_owned) return;
    InterruptScope::setLockFile("");
    std::error_code ec;
    fs::remove(_paths.lockFile, ec);
    if (ec) {
        Logger::warn("Failed to remove lock file " + _paths.lockFile + ": " + ec.message());
    }
    _owned = false;
    _interrupts.reset();
}

void SessionGuard::ensureDirectories() const {
    for (const auto& dir : {_paths.baseDir, _paths.logDir(), _paths.mountDir(), _paths.stagingDir()}) {
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            throw core::SetupError("cannot create directory " + dir + ": " + ec.message());
        }
    }
}

void SessionGuard::cleanup(const core::StagedScriptList &scripts, const core::AutorunConfig &cfg) const {
    if (cfg.noDelete) {
        Logger::info("ar_nodel is set, keeping staged copies in " + _paths.stagingDir());
        return;
    }
    for (const auto& s : scripts) {
        std::error_code ec;
        fs::remove(s.localPath, ec);
        if (ec) {
            Logger::warn("Failed to delete " + s.localPath + ": " + ec.message());
        }
    }
}

bool SessionGuard::interactiveGate(const core::AutorunConfig &cfg, bool scriptsRan) {
    bool noWait = cfg.noWait;

    // 用户可以在脚本里 touch 这个文件，让本次运行不等待
    std::error_code ec;
    if (fs::exists(_paths.nowaitFile, ec)) {
        Logger::debug("Found " + _paths.nowaitFile + ", not waiting for a keypress");
        noWait = true;
        fs::remove(_paths.nowaitFile, ec);
        if (ec) {
            Logger::warn("Failed to delete " + _paths.nowaitFile + ": " + ec.message());
        }
    }

    if (noWait || !scriptsRan) {
        return false;
    }

    _out << "Autorun scripts completed, press <Enter> to continue" << std::endl;
    std::string ignored;
    std::getline(_in, ignored);
    return true;
}

} // namespace autorun::session
