#include "log_manager.h"
#include "log_sink_console.h"

namespace scripthub::core {

LogManager& LogManager::instance() {
    static LogManager g;
    return g;
}

LogManager::LogManager() {
    _sinks.push_back(std::make_shared<ConsoleLogSink>());
}

void LogManager::setMinLevel(LogLevel level) {
    std::lock_guard<std::mutex> lk(_mu);
    _minLevel = level;
}

void LogManager::emit(const LogRecord& rec) {
    std::vector<std::shared_ptr<ILogSink>> sinksSnapshot;
    {
        std::lock_guard<std::mutex> lk(_mu);
        if (rec.level < _minLevel) return;
        // 拷贝 sinks，避免锁内做 IO
        sinksSnapshot = _sinks;
    }

    for (auto& s : sinksSnapshot) {
        if (s) s->consume(rec);
    }
}

void LogManager::setSinks(std::vector<std::shared_ptr<ILogSink>> sinks) {
    std::lock_guard<std::mutex> lk(_mu);
    _sinks = std::move(sinks);
}

void LogManager::outputLines(const std::string& scriptPath, LogStream stream,
                             LogLevel level, const std::string& text) {
    if (text.empty()) return;

    auto push = [&](const std::string& line) {
        LogRecord rec;
        rec.scriptPath = scriptPath;
        rec.stream = stream;
        rec.level = level;
        rec.message = line;
        emit(rec);
    };

    std::string line;
    line.reserve(256);
    for (char c : text) {
        if (c == '\n') {
            push(line);
            line.clear();
        } else if (c != '\r') {
            line.push_back(c);
        }
    }
    // 末尾没有换行的残余
    if (!line.empty()) push(line);
}

void emitEvent(const std::string& scriptPath,
               LogLevel level,
               const std::string& msg,
               long long durationMs,
               const std::unordered_map<std::string, std::string>& extra)
{
    LogRecord rec;
    rec.scriptPath = scriptPath;
    rec.level = level;
    rec.stream = LogStream::Event;
    rec.message = msg;
    rec.durationMs = durationMs;
    rec.fields = extra;
    LogManager::instance().emit(rec);
}

} // namespace scripthub::core
