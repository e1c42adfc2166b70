#include "log_formatter.h"
#include <map>
#include <sstream>
#include "core/utils.h"

namespace scripthub::core {

LogFormatter& LogFormatter::instance() {
    static LogFormatter f;
    return f;
}

const char* LogFormatter::levelName(LogLevel lv) {
    switch (lv) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info:  return "INFO";
    case LogLevel::Warn:  return "WARN";
    case LogLevel::Error: return "ERROR";
    default:              return "INFO";
    }
}

const char* LogFormatter::streamName(LogStream s) {
    switch (s) {
    case LogStream::Stdout: return "STDOUT";
    case LogStream::Stderr: return "STDERR";
    case LogStream::Event:  return "EVENT";
    case LogStream::None:   return "SYSTEM";
    default:                return "SYSTEM";
    }
}

std::string LogFormatter::escapeMsg(const std::string& s) {
    // 单行日志，只做最小转义
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '\n') out += "\\n";
        else if (c == '\r') out += "\\r";
        else if (c == '\t') out += "\\t";
        else if (c == '"')  out += "\\\"";
        else out += c;
    }
    return out;
}

std::string LogFormatter::formatLine(const LogRecord& r) const {
    std::ostringstream oss;

    oss << "ts=[" << utils::formatTimestampMs(r.ts) << ']'
        << " level=[" << levelName(r.level) << ']'
        << " stream=" << streamName(r.stream);

    if (!r.source.empty())     oss << " source=" << r.source;
    if (!r.scriptPath.empty()) oss << " script=" << r.scriptPath;
    if (r.durationMs > 0)      oss << " duration_ms=" << r.durationMs;

    oss << " msg=\"" << escapeMsg(r.message) << "\"";

    // 按 key 排序输出，保证同一记录格式稳定
    std::map<std::string, std::string> sorted(r.fields.begin(), r.fields.end());
    for (const auto& kv : sorted) {
        oss << " " << kv.first << "=" << escapeMsg(kv.second);
    }

    return oss.str();
}

} // namespace scripthub::core
