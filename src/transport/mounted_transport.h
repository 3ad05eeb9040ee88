#pragma once
#include <functional>
#include <string>
#include <vector>

#include "transport.h"
#include "core/utils.h"

namespace autorun::transport {

/// 需要先挂载再扫描的源（块设备 / NFS / SMB）的公共部分：
/// mount() 执行 mountCommand()，失败抛 TransportError；
/// discover() 只扫一次挂载点；unmount() 无条件 umount，结果只记日志
class MountedTransport : public ITransport {
public:
    using CommandRunner = std::function<utils::ExecResult(const std::vector<std::string>&)>;

    MountedTransport(std::string mountPoint, std::string stagingDir, CommandRunner runner = nullptr);

    void mount() override;
    core::StagedScriptList discover(const core::SuffixList& suffixes) override;
    void unmount() override;

    /// 具体的 mount 命令行（不同源不同）
    virtual std::vector<std::string> mountCommand() const = 0;
    std::vector<std::string> unmountCommand() const;

protected:
    std::string _mountPoint;
    std::string _stagingDir;
    CommandRunner _runner;
};

} // namespace autorun::transport
