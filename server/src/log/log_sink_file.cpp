// log_sink_file.cpp
#include "log_sink_file.h"
#include "log_formatter.h"
#include "log_rotation.h"
#include <filesystem>

namespace fs = std::filesystem;

namespace scripthub::core {

FileLogSink::FileLogSink(Options opt) : _opt(std::move(opt)) {
    RotationPolicy p;
    p.maxBytes = _opt.rotateBytes;
    p.maxFiles = _opt.maxFiles;
    _rot = std::make_unique<LogRotation>(p);
}

FileLogSink::~FileLogSink() = default;

void FileLogSink::ensureOpen_() {
    if (_ofs.is_open()) return;
    if (_opt.path.empty()) return;

    std::error_code ec;
    auto parent = fs::path(_opt.path).parent_path();
    if (!parent.empty() && !fs::exists(parent, ec)) {
        fs::create_directories(parent, ec);
    }
    _ofs.open(_opt.path, std::ios::app);
}

void FileLogSink::rotateIfNeeded_(std::uint64_t addBytes) {
    if (_opt.rotateBytes == 0) return;

    std::error_code ec;
    auto current = fs::file_size(_opt.path, ec);
    if (ec) return;

    if (_rot->shouldRotate(static_cast<std::uint64_t>(current), addBytes)) {
        if (_ofs.is_open()) _ofs.close();
        _rot->rotate(_opt.path);
        _ofs.open(_opt.path, std::ios::app);
    }
}

void FileLogSink::consume(const LogRecord& rec) {
    std::lock_guard<std::mutex> lk(_mu);
    ensureOpen_();
    if (!_ofs.is_open()) return;

    const std::string line = LogFormatter::instance().formatLine(rec);
    rotateIfNeeded_(static_cast<std::uint64_t>(line.size() + 1)); // + '\n'

    _ofs << line << "\n";
    if (_opt.flushEachLine) {
        _ofs.flush();
    }
}

} // namespace scripthub::core
