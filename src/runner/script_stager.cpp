#include "script_stager.h"
#include <algorithm>
#include <cstring>
#include <fstream>
#include <stdexcept>

#include "core/utils.h"
#include "log/log_manager.h"

namespace autorun::runner {

namespace {

constexpr char ELF_MAGIC[4] = {0x7f, 'E', 'L', 'F'};

} // namespace

ScriptKind ScriptStager::classify(const std::string &path) {
    std::ifstream ifs(path, std::ios::binary);
    char head[sizeof(ELF_MAGIC)]{};
    if (!ifs.read(head, sizeof(head))) {
        return ScriptKind::Text;
    }
    return std::memcmp(head, ELF_MAGIC, sizeof(ELF_MAGIC)) == 0 ? ScriptKind::Binary : ScriptKind::Text;
}

void ScriptStager::normalize(const core::StagedScript &script) const {
    if (classify(script.localPath) == ScriptKind::Binary) {
        core::emitEvent(script.baseName, LogLevel::Debug, "Native binary, left untouched");
        return;
    }

    try {
        auto content = utils::read_file(script.localPath);
        if (!content) {
            core::emitEvent(script.baseName, LogLevel::Warn,
                            "Cannot read " + script.localPath + ", skipping normalization");
            return;
        }

        std::string text = std::move(*content);
        bool changed = false;

        const auto crCount = std::count(text.begin(), text.end(), '\r');
        if (crCount > 0) {
            text.erase(std::remove(text.begin(), text.end(), '\r'), text.end());
            changed = true;
            core::emitEvent(script.baseName, LogLevel::Warn,
                            "Script has Windows line endings, they have been converted. "
                            "This is deprecated and will stop working in a future version.",
                            {{"removed_cr", std::to_string(crCount)}});
        }

        if (!utils::starts_with(text, "#!")) {
            text.insert(0, DEFAULT_SHEBANG);
            changed = true;
            core::emitEvent(script.baseName, LogLevel::Warn,
                            "Script has no shebang, '#!/bin/sh' has been added. "
                            "This is deprecated and will stop working in a future version.");
        }

        if (changed && !utils::write_file(script.localPath, text)) {
            core::emitEvent(script.baseName, LogLevel::Warn,
                            "Cannot rewrite " + script.localPath + ", running it unmodified");
        }
    } catch (const std::exception& ex) {
        // 规范化失败不阻止执行
        core::emitEvent(script.baseName, LogLevel::Warn,
                        std::string("Normalization failed: ") + ex.what());
    }
}

void ScriptStager::normalizeAll(const core::StagedScriptList &scripts) const {
    for (const auto& s : scripts) {
        normalize(s);
    }
}

} // namespace autorun::runner
