#pragma once
#include <string>
#include <vector>

namespace autorun::core {

/// 引擎用到的所有固定路径。默认值对应 live 系统的布局，
/// 可以用环境变量覆盖（调试 / 测试用），见 loadFromEnv()。
struct Paths {
    std::string effectiveConfig = "/etc/sysrescue/sysrescue-effective-config.json";
    std::string kernelCmdline   = "/proc/cmdline";
    std::string baseDir         = "/var/autorun";
    std::string lockFile        = "/run/sysrescue-autorun.pid";
    std::string nowaitFile      = "/etc/sysrescue/autorun-nowait";
    std::string engineLog       = "/var/log/sysrescue-autorun.log";

    // 按优先级排列，第一个找到脚本的目录胜出
    std::vector<std::string> defaultSources = {
        "/run/archiso/bootmnt/autorun",
        "/run/archiso/bootmnt",
        "/run/archiso/copytoram/autorun",
        "/run/archiso/copytoram",
        "/var/autorun/cdrom",
        "/root",
        "/usr/share/sysrescue/autorun",
    };

    std::string logDir() const { return baseDir + "/log"; }
    std::string mountDir() const { return baseDir + "/mnt"; }
    std::string stagingDir() const { return baseDir + "/tmp"; }

    // 从环境变量覆盖：
    // AUTORUN_CONFIG / AUTORUN_CMDLINE / AUTORUN_BASEDIR / AUTORUN_LOCKFILE /
    // AUTORUN_NOWAIT_FILE / AUTORUN_LOGFILE / AUTORUN_DEFAULT_SOURCES（冒号分隔）
    void loadFromEnv();
};

} // namespace autorun::core
