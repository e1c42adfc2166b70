#include "log_rotation.h"
#include <algorithm>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <vector>

namespace fs = std::filesystem;

namespace scripthub::core {

LogRotation::LogRotation(RotationPolicy policy) : _p(policy) {}

bool LogRotation::shouldRotate(std::uint64_t currentSizeBytes,
                               std::uint64_t addBytes) const {
    if (_p.maxBytes == 0) return false;
    return (currentSizeBytes + addBytes) > _p.maxBytes;
}

std::string LogRotation::nowStamp_() {
    using namespace std::chrono;
    std::time_t tt = system_clock::to_time_t(system_clock::now());
    std::tm tm{};
    localtime_r(&tt, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y%m%d-%H%M%S");
    return oss.str();
}

bool LogRotation::exists_(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

void LogRotation::rename_(const std::string& from, const std::string& to) {
    std::error_code ec;
    fs::rename(from, to, ec);
    if (ec) {
        // 跨盘时 rename 会失败，退化为 copy + remove
        fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
        if (!ec) fs::remove(from, ec);
    }
}

std::string LogRotation::makeRotatedName_(const std::string& basePath, int index) {
    std::ostringstream oss;
    oss << basePath << "." << nowStamp_() << "." << index;
    return oss.str();
}

void LogRotation::prune_(const std::string& basePath) const {
    if (_p.maxFiles <= 0) return;

    std::vector<fs::directory_entry> rotated;
    std::error_code ec;

    fs::path base(basePath);
    fs::path dir = base.parent_path().empty() ? fs::current_path() : base.parent_path();
    const std::string prefix = base.filename().string() + ".";

    for (auto& e : fs::directory_iterator(dir, ec)) {
        if (!e.is_regular_file(ec)) continue;
        if (e.path().filename().string().rfind(prefix, 0) == 0) {
            rotated.push_back(e);
        }
    }

    // 旧的在前
    std::sort(rotated.begin(), rotated.end(),
              [](const fs::directory_entry& a, const fs::directory_entry& b) {
                  std::error_code ec1, ec2;
                  auto ta = fs::last_write_time(a, ec1);
                  auto tb = fs::last_write_time(b, ec2);
                  if (ec1 || ec2) return a.path().string() < b.path().string();
                  return ta < tb;
              });

    while (static_cast<int>(rotated.size()) > _p.maxFiles) {
        std::error_code rmec;
        fs::remove(rotated.front().path(), rmec);
        rotated.erase(rotated.begin());
    }
}

void LogRotation::rotate(const std::string& basePath) const {
    if (!exists_(basePath)) return;

    int idx = 1;
    std::string rotatedPath;
    for (; idx < 10000; ++idx) {
        rotatedPath = makeRotatedName_(basePath, idx);
        if (!exists_(rotatedPath)) break;
    }

    rename_(basePath, rotatedPath);
    prune_(basePath);
}

} // namespace scripthub::core
