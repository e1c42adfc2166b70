#pragma once
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include "execution_types.h"
#include "harness_builder.h"
#include "process_runner.h"
#include "scripts/script_resolver.h"

namespace scripthub {
class Config;
}

namespace scripthub::exec {

/// 执行器配置：启动时从 Config 生成一次，之后不再修改
struct ExecutorSettings {
    static constexpr int kDefaultTimeoutSeconds = 300;

    std::filesystem::path scriptsRoot{"./scripts"};     // 子进程工作目录
    std::chrono::milliseconds timeout{std::chrono::seconds(kDefaultTimeoutSeconds)};
    std::vector<std::string> allowedExtensions{".py"};
    std::string interpreter{"python3"};
    std::filesystem::path tempRoot;                     // 为空时用系统临时目录

    static ExecutorSettings fromConfig(const Config& cfg);
};

/// 执行入口：resolve -> build -> run -> decode
/// 不持有任何按调用变化的状态，可被多个线程同时调用
class ScriptExecutor {
public:
    ScriptExecutor(ExecutorSettings settings, const scripts::IScriptResolver& resolver);

    // @throws ScriptNotFoundError 路径无法解析 / 文件不存在 / 扩展名不允许
    // @throws InvalidPayloadError payload 不是 object
    // @throws InfrastructureError 临时文件或子进程无法创建
    ExecutionOutcome execute(const std::string& targetPath, const json& payload) const;

    const ExecutorSettings& settings() const { return m_settings; }

private:
    scripts::ResolvedScript resolve_(const std::string& targetPath) const;
    bool extensionAllowed_(const std::filesystem::path& p) const;

private:
    ExecutorSettings m_settings;
    const scripts::IScriptResolver& m_resolver;
    HarnessBuilder m_builder;
    ProcessRunner m_runner;
};

} // namespace scripthub::exec
