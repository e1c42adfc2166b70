#include "logger.h"
#include <algorithm>
#include <cctype>
#include "log_manager.h"
#include "log_record.h"

namespace scripthub {

void Logger::debug(const std::string& msg) {
    write(LogLevel::Debug, msg);
}

void Logger::info(const std::string& msg) {
    write(LogLevel::Info, msg);
}

void Logger::warn(const std::string& msg) {
    write(LogLevel::Warn, msg);
}

void Logger::error(const std::string& msg) {
    write(LogLevel::Error, msg);
}

void Logger::write(LogLevel level, const std::string& msg) {
    core::LogRecord rec;
    rec.stream = core::LogStream::None;
    rec.level = level;
    rec.message = msg;
    rec.ts = std::chrono::system_clock::now();
    core::LogManager::instance().emit(rec);
}

std::string Logger::level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        default: return "UNK";
    }
}

LogLevel Logger::level_from_string(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c){ return std::tolower(c); });
    if (str == "debug") return LogLevel::Debug;
    if (str == "warn" || str == "warning") return LogLevel::Warn;
    if (str == "error") return LogLevel::Error;
    return LogLevel::Info;
}

} // namespace scripthub
