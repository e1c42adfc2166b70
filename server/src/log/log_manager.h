#pragma once
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "log_record.h"
#include "log_sink.h"

namespace scripthub::core {

// 统一日志入口：按最低级别过滤后分发到所有 sink
// 未调用 setSinks 之前默认只有一个 ConsoleLogSink
class LogManager {
public:
    static LogManager& instance();

    void setMinLevel(LogLevel level);

    void emit(const LogRecord& rec);

    void setSinks(std::vector<std::shared_ptr<ILogSink>> sinks);

    // 便捷：把子进程输出按行写成 Stdout/Stderr 记录
    void outputLines(const std::string& scriptPath, LogStream stream,
                     LogLevel level, const std::string& text);

private:
    LogManager();

private:
    mutable std::mutex _mu;
    LogLevel _minLevel{LogLevel::Info};
    std::vector<std::shared_ptr<ILogSink>> _sinks;
};

// 执行事件
void emitEvent(const std::string& scriptPath,
               LogLevel level,
               const std::string& msg,
               long long durationMs = 0,
               const std::unordered_map<std::string, std::string>& extra = {});

} // namespace scripthub::core
