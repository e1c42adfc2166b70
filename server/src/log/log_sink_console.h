// log_sink_console.h
#pragma once
#include "log_sink.h"
#include <mutex>

namespace scripthub::core {

class ConsoleLogSink : public ILogSink {
public:
    void consume(const LogRecord& rec) override;

private:
    std::mutex _mu;
};

} // namespace scripthub::core
