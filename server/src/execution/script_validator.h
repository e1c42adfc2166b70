#pragma once
#include <string>

namespace scripthub::exec {

enum class ValidationCode {
    Ok,
    SyntaxInvalid,      // 无法解析为 Python 语法树
    MissingEntryPoint,  // 没有名为 main 的函数
    BadSignature,       // main 不是恰好一个位置参数
    BadParameterType,   // 参数注解不是 dict 类型
    InternalError       // 解释器不可用等
};

struct ValidationVerdict {
    bool valid{false};
    ValidationCode code{ValidationCode::InternalError};
    std::string message;    // valid 时为空
};

std::string ValidationCodeToString(ValidationCode code);

/// 提交时的静态校验：只解析语法树，不编译、不执行、不导入用户代码
class ScriptValidator {
public:
    static ValidationVerdict validate(const std::string& source);

    // 提前初始化内嵌解释器；失败时 error 带原因
    static bool warmUp(std::string& error);

    static constexpr const char* kEntryFunction = "main";
};

} // namespace scripthub::exec
