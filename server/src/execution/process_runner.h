#pragma once
#include <chrono>
#include <filesystem>
#include <string>
#include "execution_types.h"
#include "harness_builder.h"

namespace scripthub::exec {

/// 启动驱动程序子进程并抓取输出：
/// - 超时从进程启动开始计时，到点直接 SIGKILL 整个进程组
/// - 不解释退出码和输出
/// - 返回或抛出前总会删除 artifact
class ProcessRunner {
public:
    explicit ProcessRunner(std::string interpreter = "python3");

    // @throws SpawnError pipe/fork/chdir/exec 失败
    RunResult run(HarnessArtifact artifact,
                  const std::filesystem::path& workingDirectory,
                  std::chrono::milliseconds timeout) const;

    const std::string& interpreter() const { return m_interpreter; }

private:
    std::string m_interpreter;
};

} // namespace scripthub::exec
