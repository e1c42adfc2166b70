#include "result_decoder.h"
#include <iomanip>
#include <sstream>
#include "core/utils.h"

namespace scripthub::exec {

std::string ResultDecoder::timeoutReason(std::chrono::milliseconds timeout)
{
    std::ostringstream oss;
    const auto ms = timeout.count();
    if (ms % 1000 == 0) {
        oss << (ms / 1000);
    } else {
        oss << std::fixed << std::setprecision(3) << (static_cast<double>(ms) / 1000.0);
    }
    return "execution exceeded " + oss.str() + " seconds";
}

/**
 * @brief 解释一次运行结果
 *
 * - 超时                       -> Failure("execution exceeded N seconds")
 * - 退出码非 0                 -> Failure(stderr / stdout / "unknown error")
 * - 退出码 0 且 stdout 为空    -> Success({})，即 main 返回了 None
 * - stdout 不是合法 JSON       -> Failure("output is not valid JSON: ...")
 * - JSON 但不是 object         -> Failure("entry function must return a mapping")
 */
ExecutionOutcome ResultDecoder::decode(const RunResult& run, std::chrono::milliseconds timeout)
{
    if (run.timedOut) {
        return ExecutionOutcome::failure(timeoutReason(timeout));
    }

    if (run.exitCode != 0) {
        std::string reason = utils::trim(run.stderrData);
        if (reason.empty()) reason = utils::trim(run.stdoutData);
        if (reason.empty()) reason = "unknown error";
        return ExecutionOutcome::failure(reason);
    }

    const std::string output = utils::trim(run.stdoutData);
    if (output.empty()) {
        return ExecutionOutcome::success(json::object());
    }

    json value;
    try {
        value = json::parse(output);
    } catch (const json::parse_error& ex) {
        return ExecutionOutcome::failure(std::string("output is not valid JSON: ") + ex.what());
    }

    if (!value.is_object()) {
        return ExecutionOutcome::failure("entry function must return a mapping");
    }

    return ExecutionOutcome::success(std::move(value));
}

} // namespace scripthub::exec
