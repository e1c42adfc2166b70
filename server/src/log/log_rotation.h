#pragma once
#include <string>
#include <cstdint>

namespace scripthub::core {

// 按文件大小轮转：
//   scripthub.log                        （当前写入）
//   scripthub.log.20251214-235959.1      （轮转出来的）
// 只保留 maxFiles 个历史文件
struct RotationPolicy {
    std::uint64_t maxBytes = 10 * 1024 * 1024; // 10MB
    int maxFiles = 5;
};

class LogRotation {
public:
    explicit LogRotation(RotationPolicy policy);

    // currentSizeBytes: 写入前的文件大小；addBytes: 本次将要追加的字节数
    bool shouldRotate(std::uint64_t currentSizeBytes,
                      std::uint64_t addBytes) const;

    // basePath -> basePath.<timestamp>.<index>，然后清理多余历史文件
    void rotate(const std::string& basePath) const;

private:
    RotationPolicy _p;

    static std::string makeRotatedName_(const std::string& basePath, int index);
    static std::string nowStamp_(); // YYYYMMDD-HHMMSS
    static bool exists_(const std::string& path);
    static void rename_(const std::string& from, const std::string& to);

    void prune_(const std::string& basePath) const;
};

} // namespace scripthub::core
