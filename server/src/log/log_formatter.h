#pragma once
#include <string>
#include "log_record.h"

namespace scripthub::core {

// 一条记录格式化为一行文本，例：
// ts=[2025-11-11 10:00:00.123] level=[INFO] stream=EVENT script=geology/test.py duration_ms=7 msg="..." k1=v1
class LogFormatter {
public:
    static LogFormatter& instance();

    std::string formatLine(const LogRecord& r) const;

    static const char* levelName(LogLevel lv);
    static const char* streamName(LogStream s);
    static std::string escapeMsg(const std::string& s);

private:
    LogFormatter() = default;
};

} // namespace scripthub::core
