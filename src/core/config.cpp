#include "config.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include "errors.h"
#include "utils.h"
#include "log/logger.h"

namespace autorun::core {

namespace {

constexpr const char* SCOPE = "autorun";
constexpr const char* LEGACY_SUFFIXES_OPT = "autoruns=";

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c){ return std::tolower(c); });
    return s;
}

void readBool(const json& scope, const char* key, bool& out) {
    if (!scope.contains(key)) return;
    const auto v = ConfigGateway::parseBool(scope[key]);
    if (!v) {
        Logger::warn(std::string("Config: '") + key + "' is not a boolean (" +
                     scope[key].dump() + "), keeping default");
        return;
    }
    out = *v;
}

} // namespace

SuffixList deriveSuffixes(const std::string &suffixes) {
    SuffixList out{""};
    if (suffixes.empty() || suffixes == SUFFIXES_DISABLED) {
        return out;
    }
    for (auto& tok : utils::split(suffixes, ',')) {
        out.push_back(tok);
    }
    return out;
}

void Paths::loadFromEnv() {
    if (const char* p = std::getenv("AUTORUN_CONFIG")) {
        effectiveConfig = p;
    }
    if (const char* p = std::getenv("AUTORUN_CMDLINE")) {
        kernelCmdline = p;
    }
    if (const char* p = std::getenv("AUTORUN_BASEDIR")) {
        baseDir = p;
    }
    if (const char* p = std::getenv("AUTORUN_LOCKFILE")) {
        lockFile = p;
    }
    if (const char* p = std::getenv("AUTORUN_NOWAIT_FILE")) {
        nowaitFile = p;
    }
    if (const char* p = std::getenv("AUTORUN_LOGFILE")) {
        engineLog = p;
    }
    if (const char* p = std::getenv("AUTORUN_DEFAULT_SOURCES")) {
        defaultSources.clear();
        for (auto& dir : utils::split(p, ':')) {
            if (!dir.empty()) defaultSources.push_back(dir);
        }
    }
}

ConfigGateway::ConfigGateway(Paths paths) : _paths(std::move(paths)) {}

AutorunConfig ConfigGateway::load() const {
    std::error_code ec;
    if (!std::filesystem::exists(_paths.effectiveConfig, ec)) {
        throw ConfigMissing(_paths.effectiveConfig);
    }

    std::ifstream ifs(_paths.effectiveConfig);
    if (!ifs.is_open()) {
        throw ConfigMissing(_paths.effectiveConfig);
    }

    json doc;
    try {
        ifs >> doc;
    } catch (const json::exception& ex) {
        throw SetupError("failed to parse " + _paths.effectiveConfig + ": " + ex.what());
    }
    if (!doc.is_object()) {
        throw SetupError("effective configuration is not a JSON object: " + _paths.effectiveConfig);
    }

    AutorunConfig cfg = parse(doc);
    Logger::info("Config loaded from: " + _paths.effectiveConfig);

    // 历史兼容：autoruns=<value> 覆盖 ar_suffixes（新的 ar_suffixes= 已经在配置提供方那边处理过了）
    if (auto cmdline = utils::read_file(_paths.kernelCmdline)) {
        if (auto legacy = findLegacySuffixes(*cmdline)) {
            Logger::info("Config: suffixes overridden by boot option autoruns=" + *legacy);
            cfg.suffixes = *legacy;
        }
    } else {
        Logger::debug("Config: cannot read " + _paths.kernelCmdline + ", skipping legacy options");
    }

    return cfg;
}

AutorunConfig ConfigGateway::parse(const json &doc) {
    AutorunConfig cfg;

    if (!doc.contains(SCOPE)) {
        Logger::warn("Config: no 'autorun' scope in effective configuration, using defaults");
        return cfg;
    }
    const auto& s = doc[SCOPE];
    if (!s.is_object()) {
        Logger::warn("Config: 'autorun' scope is not an object, using defaults");
        return cfg;
    }

    readBool(s, "ar_disable", cfg.disabled);
    readBool(s, "ar_nowait", cfg.noWait);
    readBool(s, "ar_nodel", cfg.noDelete);
    readBool(s, "ar_ignorefail", cfg.ignoreFailure);

    if (s.contains("ar_attempts")) {
        if (auto n = parseInt(s["ar_attempts"])) {
            cfg.attempts = std::max(0, *n);
        } else {
            Logger::warn("Config: 'ar_attempts' is not an integer (" + s["ar_attempts"].dump() +
                         "), keeping default");
        }
    }

    if (s.contains("ar_source")) {
        const auto& v = s["ar_source"];
        if (v.is_string()) {
            cfg.source = v.get<std::string>();
        } else if (!v.is_null() && !(v.is_boolean() && !v.get<bool>())) {
            Logger::warn("Config: 'ar_source' is not a string (" + v.dump() + "), ignoring");
        }
    }

    if (s.contains("ar_suffixes")) {
        const auto& v = s["ar_suffixes"];
        if (v.is_string()) {
            cfg.suffixes = v.get<std::string>();
        } else if (v.is_boolean() && !v.get<bool>()) {
            // ar_suffixes=no 在命令行上会被配置提供方转成 false
            cfg.suffixes = SUFFIXES_DISABLED;
        } else {
            Logger::warn("Config: 'ar_suffixes' is not a string (" + v.dump() + "), keeping default");
        }
    }

    return cfg;
}

std::optional<std::string> ConfigGateway::findLegacySuffixes(const std::string &cmdline) {
    std::optional<std::string> result;
    std::istringstream iss(cmdline);
    std::string tok;
    while (iss >> tok) {
        if (utils::starts_with(tok, LEGACY_SUFFIXES_OPT)) {
            result = tok.substr(std::char_traits<char>::length(LEGACY_SUFFIXES_OPT));
        }
    }
    return result;
}

std::optional<bool> ConfigGateway::parseBool(const json &v) {
    if (v.is_boolean()) return v.get<bool>();
    if (!v.is_string()) return std::nullopt;

    const std::string s = lower(utils::trim(v.get<std::string>()));
    if (s == "y" || s == "yes" || s == "true") return true;
    if (s == "n" || s == "no" || s == "false") return false;
    return std::nullopt;
}

std::optional<int> ConfigGateway::parseInt(const json &v) {
    if (v.is_number_integer()) return v.get<int>();
    if (!v.is_string()) return std::nullopt;

    const std::string s = utils::trim(v.get<std::string>());
    if (s.empty()) return std::nullopt;
    std::size_t i = (s[0] == '-' || s[0] == '+') ? 1 : 0;
    if (i == s.size()) return std::nullopt;
    for (std::size_t k = i; k < s.size(); ++k) {
        if (!std::isdigit(static_cast<unsigned char>(s[k]))) return std::nullopt;
    }
    try {
        return std::stoi(s);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

} // namespace autorun::core
