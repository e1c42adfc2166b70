#pragma once
#include <string>
#include <unordered_map>
#include <chrono>
#include <cstdint>
#include "log/logger.h"

namespace scripthub::core {

enum class LogStream : int {
    None   = 0,
    Stdout = 1,
    Stderr = 2,
    Event  = 3, // 执行事件（start/end/timeout 等）
};

struct LogRecord {
    // ---- routing ----
    std::string scriptPath;                // 可选：关联的脚本逻辑路径
    std::string source;                    // 可选：产生日志的模块

    // ---- content ----
    LogLevel level{LogLevel::Info};
    LogStream stream{LogStream::None};
    std::string message;

    // ---- timing ----
    std::chrono::system_clock::time_point ts{std::chrono::system_clock::now()};
    std::int64_t durationMs{0};            // 可选：执行耗时

    // ---- extra fields ----
    std::unordered_map<std::string, std::string> fields; // 任意扩展字段
};

} // namespace scripthub::core
