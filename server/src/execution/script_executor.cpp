#include "script_executor.h"
#include <algorithm>
#include "core/config.h"
#include "log/log_manager.h"
#include "log/logger.h"
#include "result_decoder.h"

namespace scripthub::exec {

namespace fs = std::filesystem;

ExecutorSettings ExecutorSettings::fromConfig(const Config& cfg)
{
    ExecutorSettings s;
    s.scriptsRoot = fs::absolute(cfg.scripts_dir());
    const int seconds = cfg.get<int>("executor.max_execution_seconds", kDefaultTimeoutSeconds);
    if (seconds <= 0) {
        Logger::warn("Config: executor.max_execution_seconds=" + std::to_string(seconds) +
                     " is not positive, using " + std::to_string(kDefaultTimeoutSeconds));
        s.timeout = std::chrono::seconds(kDefaultTimeoutSeconds);
    } else {
        s.timeout = std::chrono::seconds(seconds);
    }
    s.allowedExtensions = cfg.get<std::vector<std::string>>("executor.allowed_extensions",
                                                            std::vector<std::string>{".py"});
    s.interpreter = cfg.get<std::string>("executor.python", "python3");
    s.tempRoot = cfg.get<std::string>("executor.temp_dir", "");
    return s;
}

ScriptExecutor::ScriptExecutor(ExecutorSettings settings, const scripts::IScriptResolver& resolver)
    : m_settings(std::move(settings)),
      m_resolver(resolver),
      m_builder(m_settings.tempRoot),
      m_runner(m_settings.interpreter)
{
}

bool ScriptExecutor::extensionAllowed_(const fs::path& p) const
{
    const std::string ext = p.extension().string();
    return std::find(m_settings.allowedExtensions.begin(),
                     m_settings.allowedExtensions.end(), ext) != m_settings.allowedExtensions.end();
}

scripts::ResolvedScript ScriptExecutor::resolve_(const std::string& targetPath) const
{
    auto found = m_resolver.resolve(targetPath);
    if (!found) {
        throw ScriptNotFoundError("Script '" + targetPath + "' not found");
    }

    std::error_code ec;
    if (!fs::is_regular_file(found->storageLocation, ec)) {
        throw ScriptNotFoundError("Script file '" + found->storageLocation.filename().string() +
                                  "' not found in filesystem");
    }

    if (!extensionAllowed_(found->storageLocation)) {
        std::string allowed;
        for (const auto& e : m_settings.allowedExtensions) {
            if (!allowed.empty()) allowed += ", ";
            allowed += e;
        }
        throw ScriptNotFoundError("Script '" + targetPath + "' has invalid extension. Allowed: " + allowed);
    }

    return std::move(*found);
}

/**
 * @brief 执行一个脚本的 main 函数
 *
 * 严格按顺序：解析路径 -> 生成临时驱动程序 -> 启动子进程（带超时） -> 解释输出。
 * 临时目录由 HarnessArtifact 持有，任何路径退出都会被删除。
 * elapsedSeconds 从进入函数开始计时。
 *
 * @param targetPath 逻辑路径，例如 "geology/test.py"
 * @param payload 传给 main 的 JSON object；null 视为 {}
 * @return ExecutionOutcome Success 带 object 结果，Failure 带原因
 */
ExecutionOutcome ScriptExecutor::execute(const std::string& targetPath, const json& payload) const
{
    const auto start = SteadyClock::now();
    auto elapsed = [&start]() {
        return std::chrono::duration<double>(SteadyClock::now() - start).count();
    };

    if (!payload.is_null() && !payload.is_object()) {
        throw InvalidPayloadError("payload must be a JSON object");
    }
    const json input = payload.is_null() ? json::object() : payload;

    const scripts::ResolvedScript script = resolve_(targetPath);

    core::emitEvent(targetPath, LogLevel::Info, "Execution start");

    RunResult run;
    try {
        HarnessArtifact artifact = m_builder.build(script.storageLocation, input);
        run = m_runner.run(std::move(artifact), m_settings.scriptsRoot, m_settings.timeout);
    } catch (const InfrastructureError& ex) {
        core::emitEvent(targetPath, LogLevel::Error,
                        std::string("Execution aborted: ") + ex.what(),
                        static_cast<long long>(elapsed() * 1000));
        throw;
    }

    ExecutionOutcome outcome = ResultDecoder::decode(run, m_settings.timeout);
    outcome.elapsedSeconds = elapsed();

    if (!outcome.ok()) {
        core::LogManager::instance().outputLines(targetPath, core::LogStream::Stderr,
                                                 LogLevel::Warn, run.stderrData);
    }

    LogLevel lvl = LogLevel::Info;
    if (run.timedOut) lvl = LogLevel::Warn;
    else if (!outcome.ok()) lvl = LogLevel::Error;

    std::string endMsg = "Execution end: status=" + OutcomeStatusToString(outcome.status);
    if (!outcome.ok()) endMsg += ", reason=" + outcome.reason;

    core::emitEvent(targetPath, lvl, endMsg, run.durationMs,
                    {
                        {"exit_code", std::to_string(run.exitCode)},
                        {"timed_out", run.timedOut ? "true" : "false"},
                        {"status", OutcomeStatusToString(outcome.status)}
                    });
    return outcome;
}

} // namespace scripthub::exec
