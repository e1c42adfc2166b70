#pragma once
#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace scripthub::exec {

using json = nlohmann::json;
using SteadyClock = std::chrono::steady_clock;

/// 子进程一次运行的原始结果（不解释 exit code 和输出）
struct RunResult {
    int exitCode{-1};
    std::string stdoutData;
    std::string stderrData;
    bool timedOut{false};
    long long durationMs{0};
};

enum class OutcomeStatus {
    Success,
    Failure
};

/// 一次执行的结果：Failure 是正常返回值，不是异常
struct ExecutionOutcome {
    OutcomeStatus status{OutcomeStatus::Failure};
    json result = json::object();   // 仅 Success 时有效，总是 object
    std::string reason;             // 仅 Failure 时有效
    double elapsedSeconds{0.0};

    bool ok() const { return status == OutcomeStatus::Success; }

    static ExecutionOutcome success(json result) {
        ExecutionOutcome o;
        o.status = OutcomeStatus::Success;
        o.result = std::move(result);
        return o;
    }

    static ExecutionOutcome failure(std::string reason) {
        ExecutionOutcome o;
        o.status = OutcomeStatus::Failure;
        o.reason = std::move(reason);
        return o;
    }
};

inline std::string OutcomeStatusToString(OutcomeStatus s) {
    switch (s) {
        case OutcomeStatus::Success: return "Success";
        case OutcomeStatus::Failure: return "Failure";
        default: return "Unknown";
    }
}

// ---- 错误分类 ----

/// 逻辑路径无法解析、文件不存在或扩展名不允许（客户端问题，映射为 404）
class ScriptNotFoundError : public std::runtime_error {
public:
    explicit ScriptNotFoundError(const std::string& msg) : std::runtime_error(msg) {}
};

/// 调用方传入的 payload 不是 JSON object（映射为 400）
class InvalidPayloadError : public std::runtime_error {
public:
    explicit InvalidPayloadError(const std::string& msg) : std::runtime_error(msg) {}
};

/// 基础设施故障：临时文件、进程创建等。表示系统健康问题，而不是脚本质量问题
class InfrastructureError : public std::runtime_error {
public:
    explicit InfrastructureError(const std::string& msg) : std::runtime_error(msg) {}
};

class BuilderIOError : public InfrastructureError {
public:
    explicit BuilderIOError(const std::string& msg) : InfrastructureError(msg) {}
};

class SpawnError : public InfrastructureError {
public:
    SpawnError(const std::string& msg, int err) : InfrastructureError(msg), m_errno(err) {}
    int error_code() const { return m_errno; }

private:
    int m_errno;
};

} // namespace scripthub::exec
