#include "harness_builder.h"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <vector>
#include "log/logger.h"

namespace scripthub::exec {

namespace {

const char* kHarnessName = "harness.py";
const char* kPayloadName = "payload.json";

// 驱动程序：argv[1] 为目标脚本，argv[2] 为 payload 文件
const std::string kDriverSource = R"PY(import importlib.util
import json
import os
import sys


def _fail(message):
    sys.stderr.write(message + "\n")
    sys.stderr.flush()
    sys.exit(2)


def _run(script_path, payload_path):
    sys.path.insert(0, os.path.dirname(os.path.abspath(script_path)))

    spec = importlib.util.spec_from_file_location("user_script", script_path)
    if spec is None or spec.loader is None:
        _fail("cannot load script '%s'" % script_path)
    module = importlib.util.module_from_spec(spec)
    sys.modules["user_script"] = module
    spec.loader.exec_module(module)

    entry = getattr(module, "main", None)
    if entry is None or not callable(entry):
        _fail("script must define a callable 'main' function")

    with open(payload_path, "r", encoding="utf-8") as fh:
        payload = json.load(fh)

    result = entry(payload)
    if result is not None:
        sys.stdout.write(json.dumps(result, allow_nan=False) + "\n")
        sys.stdout.flush()


if __name__ == "__main__":
    if len(sys.argv) != 3:
        _fail("usage: harness.py <script> <payload.json>")
    _run(sys.argv[1], sys.argv[2])
)PY";

void writeFile(const fs::path& path, const std::string& content)
{
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs.is_open()) {
        throw BuilderIOError("cannot create " + path.string() + ": " + std::strerror(errno));
    }
    ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
    ofs.close();
    if (!ofs) {
        throw BuilderIOError("cannot write " + path.string());
    }
}

} // namespace

// ---------------- HarnessArtifact ----------------

HarnessArtifact::HarnessArtifact(fs::path dir, fs::path harnessFile,
                                 fs::path payloadFile, fs::path scriptFile)
    : m_dir(std::move(dir)),
      m_harnessFile(std::move(harnessFile)),
      m_payloadFile(std::move(payloadFile)),
      m_scriptFile(std::move(scriptFile))
{
}

HarnessArtifact::~HarnessArtifact()
{
    cleanup();
}

HarnessArtifact::HarnessArtifact(HarnessArtifact&& other) noexcept
    : m_dir(std::move(other.m_dir)),
      m_harnessFile(std::move(other.m_harnessFile)),
      m_payloadFile(std::move(other.m_payloadFile)),
      m_scriptFile(std::move(other.m_scriptFile))
{
    other.m_dir.clear();
}

HarnessArtifact& HarnessArtifact::operator=(HarnessArtifact&& other) noexcept
{
    if (this != &other) {
        cleanup();
        m_dir = std::move(other.m_dir);
        m_harnessFile = std::move(other.m_harnessFile);
        m_payloadFile = std::move(other.m_payloadFile);
        m_scriptFile = std::move(other.m_scriptFile);
        other.m_dir.clear();
    }
    return *this;
}

void HarnessArtifact::cleanup() noexcept
{
    if (m_dir.empty()) return;

    std::error_code ec;
    fs::remove_all(m_dir, ec);
    if (ec) {
        Logger::warn("HarnessArtifact: failed to remove " + m_dir.string() + ": " + ec.message());
    }
    m_dir.clear();
}

// ---------------- HarnessBuilder ----------------

HarnessBuilder::HarnessBuilder(fs::path tempRoot) : m_tempRoot(std::move(tempRoot))
{
}

const std::string& HarnessBuilder::driverSource()
{
    return kDriverSource;
}

/**
 * @brief 为一次执行生成独立的临时目录
 *
 * 目录名由 mkdtemp 保证唯一，并发执行之间不会冲突。
 * 任何一步失败都会删掉已创建的目录再抛出。
 *
 * @param scriptLocation 目标脚本的绝对路径
 * @param payload 传给 main 的数据
 * @return HarnessArtifact 拥有临时目录的 RAII 对象
 */
HarnessArtifact HarnessBuilder::build(const fs::path& scriptLocation, const json& payload) const
{
    // 先序列化，失败时还没有创建任何文件
    std::string payloadText;
    try {
        payloadText = payload.dump();
    } catch (const json::type_error& ex) {
        throw InvalidPayloadError(std::string("payload cannot be serialized: ") + ex.what());
    }

    std::error_code ec;
    fs::path root = m_tempRoot;
    if (root.empty()) {
        root = fs::temp_directory_path(ec);
        if (ec) {
            throw BuilderIOError("cannot determine temp directory: " + ec.message());
        }
    }

    std::string pattern = (root / (std::string(kArtifactPrefix) + "XXXXXX")).string();
    std::vector<char> buf(pattern.begin(), pattern.end());
    buf.push_back('\0');
    if (::mkdtemp(buf.data()) == nullptr) {
        throw BuilderIOError("cannot create harness directory under " + root.string() +
                             ": " + std::strerror(errno));
    }

    const fs::path dir(buf.data());
    HarnessArtifact artifact(dir, dir / kHarnessName, dir / kPayloadName, scriptLocation);

    // 写入失败时 artifact 析构负责删目录
    writeFile(artifact.payloadFile(), payloadText);
    writeFile(artifact.harnessFile(), kDriverSource);

    Logger::debug("HarnessBuilder: built " + dir.string() + " for " + scriptLocation.string());
    return artifact;
}

} // namespace scripthub::exec
