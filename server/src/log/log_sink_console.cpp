// log_sink_console.cpp
#include "log_sink_console.h"
#include <iostream>
#include "log_formatter.h"

namespace scripthub::core {

void ConsoleLogSink::consume(const LogRecord& rec) {
    const std::string line = LogFormatter::instance().formatLine(rec);
    // 多个 HTTP 工作线程同时写，避免行交错
    std::lock_guard<std::mutex> lk(_mu);
    if (rec.level >= LogLevel::Error) {
        std::cerr << line << "\n";
    } else {
        std::cout << line << "\n";
    }
}

} // namespace scripthub::core
