#pragma once
#include <chrono>
#include "execution_types.h"

namespace scripthub::exec {

/// 把子进程原始输出解释成 ExecutionOutcome
/// 脚本行为异常是预期内的情况，这里从不抛出，一律转成 Failure
class ResultDecoder {
public:
    // timeout 仅用于超时时的提示信息
    static ExecutionOutcome decode(const RunResult& run, std::chrono::milliseconds timeout);

    static std::string timeoutReason(std::chrono::milliseconds timeout);
};

} // namespace scripthub::exec
