#pragma once
#include <string>
#include "transport.h"

namespace autorun::transport {

/// ar_source=http(s)://host[:port]/dir：对每个后缀 GET /dir/autorun<suffix>
/// 单次 discover() 不重试，重试由 SourceResolver 负责
class HttpTransport : public ITransport {
public:
    struct Url {
        std::string origin;   // scheme://host[:port]，交给 httplib::Client
        std::string basePath; // 不带结尾 '/'，可以为空
    };

    HttpTransport(std::string url, std::string stagingDir);

    void mount() override {}
    core::StagedScriptList discover(const core::SuffixList& suffixes) override;
    void unmount() override {}

    SourceKind kind() const override { return SourceKind::Http; }

    static Url splitUrl(const std::string& url);

    // 与配置提供方下载 yaml 时一样，单个请求 10 秒超时
    static constexpr int REQUEST_TIMEOUT_SEC = 10;

private:
    std::string _url;
    std::string _stagingDir;
};

} // namespace autorun::transport
