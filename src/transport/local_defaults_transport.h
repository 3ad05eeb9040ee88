#pragma once
#include <string>
#include <vector>
#include "transport.h"

namespace autorun::transport {

/// 本地默认目录：按优先级扫描，第一个找到脚本的目录胜出，后面的不再扫
class LocalDefaultsTransport : public ITransport {
public:
    LocalDefaultsTransport(std::vector<std::string> dirs, std::string stagingDir);

    void mount() override {}
    core::StagedScriptList discover(const core::SuffixList& suffixes) override;
    void unmount() override {}

    SourceKind kind() const override { return SourceKind::LocalDefaults; }

private:
    std::vector<std::string> _dirs;
    std::string _stagingDir;
};

} // namespace autorun::transport
