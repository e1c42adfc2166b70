//
// ScriptHub 日志门面
//
#pragma once
#include <string>

namespace scripthub {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// 静态门面：所有系统日志都经由 LogManager 分发到各个 sink
class Logger {
public:
    static void debug(const std::string& msg);
    static void info(const std::string& msg);
    static void warn(const std::string& msg);
    static void error(const std::string& msg);

    static std::string level_to_string(LogLevel level);
    static LogLevel level_from_string(std::string str);

private:
    static void write(LogLevel level, const std::string& msg);
};

} // namespace scripthub
