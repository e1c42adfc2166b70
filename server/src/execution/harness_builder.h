#pragma once
#include <filesystem>
#include <string>
#include "execution_types.h"

namespace scripthub::exec {

namespace fs = std::filesystem;

/// 一次执行专用的临时目录：harness.py + payload.json
/// 只能移动不能拷贝；析构时删除整个目录（成功、失败、超时、异常路径都一样）
class HarnessArtifact {
public:
    HarnessArtifact() = default;
    HarnessArtifact(fs::path dir, fs::path harnessFile, fs::path payloadFile, fs::path scriptFile);
    ~HarnessArtifact();

    HarnessArtifact(HarnessArtifact&& other) noexcept;
    HarnessArtifact& operator=(HarnessArtifact&& other) noexcept;

    HarnessArtifact(const HarnessArtifact&) = delete;
    HarnessArtifact& operator=(const HarnessArtifact&) = delete;

    const fs::path& directory() const { return m_dir; }
    const fs::path& harnessFile() const { return m_harnessFile; }
    const fs::path& payloadFile() const { return m_payloadFile; }
    const fs::path& scriptFile() const { return m_scriptFile; }

    bool empty() const { return m_dir.empty(); }

    // 立即删除目录；可重复调用
    void cleanup() noexcept;

private:
    fs::path m_dir;
    fs::path m_harnessFile;
    fs::path m_payloadFile;
    fs::path m_scriptFile;
};

/// 生成驱动程序：加载目标脚本、读入 payload、调用 main、把返回值写成一行 JSON
/// payload 通过文件传递，驱动程序源码本身是固定的，不拼接任何数据
class HarnessBuilder {
public:
    // tempRoot 为空时使用系统临时目录
    explicit HarnessBuilder(fs::path tempRoot = {});

    // @throws BuilderIOError 临时目录或文件无法创建
    // @throws InvalidPayloadError payload 无法序列化（如非法 UTF-8 字符串）
    HarnessArtifact build(const fs::path& scriptLocation, const json& payload) const;

    // 临时目录名前缀，测试里用来扫描残留
    static constexpr const char* kArtifactPrefix = "scripthub-";

    static const std::string& driverSource();

private:
    fs::path m_tempRoot;
};

} // namespace scripthub::exec
