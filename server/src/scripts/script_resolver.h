#pragma once
#include <filesystem>
#include <optional>
#include <string>

namespace scripthub::scripts {

/// 逻辑路径解析结果
struct ResolvedScript {
    std::string logicalPath;                 // 例如 "geology/test.py"
    std::filesystem::path storageLocation;   // 脚本根目录下的真实文件
    std::string sourceText;                  // 解析时刻的文件内容
};

/// 执行器只依赖这个接口：逻辑路径 -> 文件位置和内容
/// 实现负责把结果限制在脚本根目录内
class IScriptResolver {
public:
    virtual ~IScriptResolver() = default;

    // 找不到时返回 std::nullopt
    virtual std::optional<ResolvedScript> resolve(const std::string& logicalPath) const = 0;
};

} // namespace scripthub::scripts
