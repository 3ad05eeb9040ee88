#include "http_transport.h"
#include <stdexcept>
#include <httplib.h>
#include "staging.h"
#include "log/log_manager.h"

namespace autorun::transport {

HttpTransport::HttpTransport(std::string url, std::string stagingDir)
    : _url(std::move(url)), _stagingDir(std::move(stagingDir)) {}

HttpTransport::Url HttpTransport::splitUrl(const std::string &url) {
    Url u;
    const auto schemePos = url.find("://");
    const std::size_t hostStart = schemePos == std::string::npos ? 0 : schemePos + 3;

    const auto pathPos = url.find('/', hostStart);
    if (pathPos == std::string::npos) {
        u.origin = url;
        return u;
    }

    u.origin = url.substr(0, pathPos);
    u.basePath = url.substr(pathPos);
    while (!u.basePath.empty() && u.basePath.back() == '/') {
        u.basePath.pop_back();
    }
    return u;
}

core::StagedScriptList HttpTransport::discover(const core::SuffixList &suffixes) {
    core::StagedScriptList out;
    const Url u = splitUrl(_url);

    try {
        httplib::Client cli(u.origin);
        if (!cli.is_valid()) {
            Logger::error("Invalid autorun URL: " + _url);
            return out;
        }
        cli.set_keep_alive(true);
        cli.set_follow_location(true);
        cli.set_connection_timeout(REQUEST_TIMEOUT_SEC, 0);
        cli.set_read_timeout(REQUEST_TIMEOUT_SEC, 0);

        for (const auto& suffix : suffixes) {
            const std::string name = candidateName(suffix);
            const std::string path = u.basePath + "/" + name;
            const std::string fullUrl = u.origin + path;

            auto res = cli.Get(path);
            if (!res) {
                core::emitEvent(name, LogLevel::Debug, "Failed to download " + fullUrl +
                                ": " + httplib::to_string(res.error()));
                continue;
            }
            if (res->status != 200) {
                core::emitEvent(name, LogLevel::Debug, "Failed to download " + fullUrl +
                                ": received HTTP code " + std::to_string(res->status));
                continue;
            }

            if (auto local = stageContent(name, res->body, _stagingDir)) {
                Logger::info("Downloaded autorun script " + fullUrl);
                out.push_back(core::StagedScript{fullUrl, *local, name});
            }
        }
    } catch (const std::invalid_argument& ex) {
        // httplib 在不支持的 scheme 上抛（例如没编 OpenSSL 却给了 https://）
        Logger::error("Cannot fetch from " + _url + ": " + ex.what());
    }

    return out;
}

} // namespace autorun::transport
