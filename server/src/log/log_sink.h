#pragma once
#include "log_record.h"

namespace scripthub::core {

class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void consume(const LogRecord& rec) = 0;
};

} // namespace scripthub::core
