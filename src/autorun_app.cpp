#include "autorun_app.h"
#include <algorithm>
#include <cstdlib>
#include <memory>

#include "core/config.h"
#include "core/errors.h"
#include "log/log_manager.h"
#include "log/log_sink_console.h"
#include "log/log_sink_file.h"
#include "runner/executor.h"
#include "runner/script_stager.h"
#include "session/session_guard.h"
#include "transport/source_resolver.h"

namespace autorun {

AutorunApp::AutorunApp(core::Paths paths)
    : AutorunApp(std::move(paths), Options{}, std::cin, std::cout) {}

AutorunApp::AutorunApp(core::Paths paths, Options opt, std::istream &in, std::ostream &out)
    : _paths(std::move(paths)), _opt(opt), _in(in), _out(out) {}

void AutorunApp::init_logger() {
    if (const char* lv = std::getenv("AUTORUN_LOG_LEVEL")) {
        core::LogManager::instance().setMinLevel(Logger::level_from_string(lv, LogLevel::Info));
    }
    if (!_opt.installLogSinks) return;

    core::FileLogSink::Options opt;
    opt.path = _paths.engineLog;

    auto consoleSink = std::make_shared<core::ConsoleLogSink>();
    auto fileSink    = std::make_shared<core::FileLogSink>(opt);
    core::LogManager::instance().setSinks({ consoleSink, fileSink });
}

int AutorunApp::exitStatus(const core::ExecutionSummary &summary) {
    if (summary.interrupted) {
        return 128 + summary.signal;
    }
    return std::min(summary.failureCount, EXIT_STATUS_MAX);
}

/**
 * @brief 执行一次完整的 autorun 流程
 *
 * 致命错误（配置缺失、设备/共享挂载失败）在这里统一转成退出码 1；
 * SessionGuard 在函数返回时析构；持锁期间没有脚本在跑时收到信号，也会先删锁再按信号退出。
 *
 * @return 0：没有脚本失败（包括被禁用、什么都没找到、已有实例在运行）；
 *         否则为失败脚本数（最多 255）；被信号中断时为 128 + 信号值
 */
int AutorunApp::run() {
    init_logger();
    Logger::info("===== sysrescue-autorun starting =====");

    session::SessionGuard guard(_paths, _in, _out);
    try {
        // 1. 单实例
        if (!guard.acquire()) {
            return 0;
        }

        // 2. 配置
        core::ConfigGateway gateway(_paths);
        const core::AutorunConfig cfg = gateway.load();
        if (cfg.disabled) {
            Logger::info("Autorun has been disabled using ar_disable, exiting");
            return 0;
        }

        // 3. 工作目录
        guard.ensureDirectories();

        // 4. 发现并 staging
        transport::SourceResolver resolver(_paths, nullptr, transport::SourceResolver::Options{_opt.retryDelay});
        const core::StagedScriptList scripts = resolver.resolve(cfg);

        // 5. 兼容处理
        runner::ScriptStager stager;
        stager.normalizeAll(scripts);

        // 6. 执行
        runner::Executor executor(_paths.logDir());
        const core::ExecutionSummary summary = executor.run(scripts, cfg);

        // 7. 清理
        guard.cleanup(scripts, cfg);

        for (const auto& rec : summary.records) {
            Logger::info("  " + rec.baseName + ": exit code " + std::to_string(rec.exitCode) +
                         (rec.aborted ? " (stopped here)" : "") + ", log " + rec.logPath);
        }

        if (summary.interrupted) {
            Logger::error("Autorun interrupted by signal " + std::to_string(summary.signal));
            return exitStatus(summary);
        }

        guard.interactiveGate(cfg, !summary.records.empty());

        if (summary.failureCount > 0) {
            Logger::error("Autorun finished with " + std::to_string(summary.failureCount) + " failed script(s)");
        } else {
            Logger::info("Autorun finished successfully, " + std::to_string(summary.records.size()) +
                         " script(s) executed");
        }
        return exitStatus(summary);
    }
    catch (const core::SetupError& ex) {
        Logger::error(std::string("Fatal: ") + ex.what());
        return EXIT_FATAL;
    }
    catch (const core::TransportError& ex) {
        Logger::error(std::string("Fatal: ") + ex.what());
        return EXIT_FATAL;
    }
    catch (const std::exception& ex) {
        Logger::error(std::string("Fatal: unexpected error: ") + ex.what());
        return EXIT_FATAL;
    }
}

} // namespace autorun
