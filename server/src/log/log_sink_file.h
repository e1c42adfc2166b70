// log_sink_file.h
#pragma once
#include "log_sink.h"
#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>

namespace scripthub::core {

class LogRotation;

class FileLogSink : public ILogSink {
public:
    struct Options {
        std::string path = "./logs/scripthub.log";
        std::size_t rotateBytes = 10 * 1024 * 1024; // 10MB
        int maxFiles = 5;
        bool flushEachLine = false;
    };

    explicit FileLogSink(Options opt);
    ~FileLogSink() override;

    void consume(const LogRecord& rec) override;

private:
    void ensureOpen_();
    void rotateIfNeeded_(std::uint64_t addBytes);

private:
    Options _opt;
    std::ofstream _ofs;
    std::unique_ptr<LogRotation> _rot;
    std::mutex _mu;
};

} // namespace scripthub::core
