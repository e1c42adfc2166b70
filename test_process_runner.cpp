#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <unistd.h>

#include "execution/harness_builder.h"
#include "execution/process_runner.h"
#include "execution/result_decoder.h"

using namespace scripthub::exec;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

static fs::path g_root;

static bool python_available() {
    return std::system("python3 -c 'import sys' >/dev/null 2>&1") == 0;
}

static fs::path write_script(const std::string& name, const std::string& body) {
    fs::path p = g_root / "scripts" / name;
    std::ofstream(p, std::ios::binary) << body;
    return p;
}

static size_t leftover_artifacts() {
    size_t n = 0;
    for (const auto& e : fs::directory_iterator(g_root / "tmp")) {
        if (e.path().filename().string().rfind(HarnessBuilder::kArtifactPrefix, 0) == 0) ++n;
    }
    return n;
}

static RunResult run_script(const fs::path& script, const json& payload,
                            std::chrono::milliseconds timeout = 10s) {
    HarnessBuilder builder(g_root / "tmp");
    ProcessRunner runner("python3");
    return runner.run(builder.build(script, payload), g_root / "scripts", timeout);
}

static void test_builder_layout() {
    HarnessBuilder builder(g_root / "tmp");
    fs::path dir;
    {
        auto a = builder.build(g_root / "scripts" / "none.py", json{{"k", "v"}});
        dir = a.directory();
        assert(fs::is_directory(dir));
        assert(dir.filename().string().rfind(HarnessBuilder::kArtifactPrefix, 0) == 0);
        assert(fs::is_regular_file(a.harnessFile()));
        assert(fs::is_regular_file(a.payloadFile()));

        std::ifstream ifs(a.payloadFile());
        json stored;
        ifs >> stored;
        assert(stored == json({{"k", "v"}}));

        // 两次构建互不冲突
        auto b = builder.build(g_root / "scripts" / "none.py", json::object());
        assert(b.directory() != a.directory());

        // move 之后只有新对象负责清理
        HarnessArtifact moved = std::move(b);
        assert(b.empty());
        assert(fs::exists(moved.directory()));
    }
    assert(!fs::exists(dir));
    assert(leftover_artifacts() == 0);
    std::cout << "[OK] harness layout and cleanup\n";
}

static void test_round_trip_payload() {
    auto script = write_script("echo.py",
        "def main(data: dict) -> dict:\n"
        "    return {'echo': data, 'n': len(data)}\n");

    json payload = {
        {"text", "line1\nline2 \"quoted\" 'single' \\ backslash"},
        {"unicode", "héllo wörld 你好 \xF0\x9F\x9A\x80"},
        {"nested", {{"list", {1, 2.5, true, nullptr}}, {"empty", json::object()}}},
        {"code", "'''); import os; os._exit(9) #"}
    };

    RunResult r = run_script(script, payload);
    assert(!r.timedOut);
    assert(r.exitCode == 0);

    auto o = ResultDecoder::decode(r, 10s);
    assert(o.ok());
    assert(o.result["echo"] == payload);
    assert(o.result["n"] == 4);
    assert(leftover_artifacts() == 0);
    std::cout << "[OK] payload round trip, duration=" << r.durationMs << "ms\n";
}

static void test_working_directory_is_scripts_root() {
    auto script = write_script("cwd.py",
        "import os\n\n"
        "def main(data: dict) -> dict:\n"
        "    return {'cwd': os.getcwd()}\n");
    auto o = ResultDecoder::decode(run_script(script, json::object()), 10s);
    assert(o.ok());
    assert(fs::equivalent(fs::path(o.result["cwd"].get<std::string>()), g_root / "scripts"));
    std::cout << "[OK] child runs in scripts root\n";
}

static void test_timeout_kills_child() {
    auto script = write_script("spin.py",
        "def main(data: dict) -> dict:\n"
        "    while True:\n"
        "        pass\n");

    const auto start = std::chrono::steady_clock::now();
    RunResult r = run_script(script, json::object(), 1s);
    const auto took = std::chrono::steady_clock::now() - start;

    assert(r.timedOut);
    assert(took < 1500ms);
    assert(leftover_artifacts() == 0);

    auto o = ResultDecoder::decode(r, 1s);
    assert(!o.ok());
    assert(o.reason == "execution exceeded 1 seconds");
    std::cout << "[OK] timeout after "
              << std::chrono::duration_cast<std::chrono::milliseconds>(took).count() << "ms\n";
}

static void test_non_positive_timeout_expires_immediately() {
    // 0 和负数不是"不限时"：死循环脚本也必须马上返回
    auto script = write_script("spin_zero.py",
        "def main(data: dict) -> dict:\n"
        "    while True:\n"
        "        pass\n");

    for (auto timeout : {0ms, -5ms}) {
        const auto start = std::chrono::steady_clock::now();
        RunResult r = run_script(script, json::object(), timeout);
        assert(r.timedOut);
        assert(std::chrono::steady_clock::now() - start < 1500ms);
    }
    assert(leftover_artifacts() == 0);
    std::cout << "[OK] non-positive timeout expires immediately\n";
}

static void test_timeout_kills_grandchildren() {
    // 子进程再 fork 出的进程也在同一进程组里
    auto script = write_script("forker.py",
        "import subprocess, time\n\n"
        "def main(data: dict) -> dict:\n"
        "    subprocess.Popen(['sleep', '30'])\n"
        "    time.sleep(30)\n"
        "    return {}\n");

    const auto start = std::chrono::steady_clock::now();
    RunResult r = run_script(script, json::object(), 1s);
    assert(r.timedOut);
    assert(std::chrono::steady_clock::now() - start < 1500ms);
    std::cout << "[OK] process group killed\n";
}

static void test_script_errors() {
    auto boom = write_script("boom.py",
        "def main(data: dict) -> dict:\n"
        "    raise ValueError('boom')\n");
    RunResult r = run_script(boom, json::object());
    assert(!r.timedOut);
    assert(r.exitCode != 0);
    auto o = ResultDecoder::decode(r, 10s);
    assert(!o.ok());
    assert(o.reason.find("ValueError: boom") != std::string::npos);

    auto noMain = write_script("nomain.py", "x = 1\n");
    r = run_script(noMain, json::object());
    o = ResultDecoder::decode(r, 10s);
    assert(!o.ok());
    assert(o.reason.find("'main'") != std::string::npos);

    auto badReturn = write_script("badreturn.py",
        "def main(data: dict):\n"
        "    return {'v': float('nan')}\n");
    o = ResultDecoder::decode(run_script(badReturn, json::object()), 10s);
    assert(!o.ok());
    assert(leftover_artifacts() == 0);
    std::cout << "[OK] script errors reported: " << o.reason.substr(0, 60) << "...\n";
}

static void test_spawn_error() {
    auto script = write_script("fine.py", "def main(data: dict):\n    return {}\n");
    HarnessBuilder builder(g_root / "tmp");
    ProcessRunner runner("/nonexistent/python-interpreter");
    bool thrown = false;
    try {
        runner.run(builder.build(script, json::object()), g_root / "scripts", 5s);
    } catch (const SpawnError& e) {
        thrown = true;
        assert(e.error_code() == ENOENT);
        std::cout << "[OK] spawn error: " << e.what() << "\n";
    }
    assert(thrown);
    assert(leftover_artifacts() == 0);

    // 工作目录不存在同样是启动失败
    thrown = false;
    try {
        ProcessRunner("python3").run(builder.build(script, json::object()),
                                     g_root / "missing-dir", 5s);
    } catch (const InfrastructureError&) {
        thrown = true;
    }
    assert(thrown);
    assert(leftover_artifacts() == 0);
}

int main() {
    if (!python_available()) {
        std::cout << "[SKIP] python3 not found on PATH\n";
        return 0;
    }

    g_root = fs::temp_directory_path() / ("runner_test_" + std::to_string(::getpid()));
    fs::remove_all(g_root);
    fs::create_directories(g_root / "scripts");
    fs::create_directories(g_root / "tmp");

    test_builder_layout();
    test_round_trip_payload();
    test_working_directory_is_scripts_root();
    test_timeout_kills_child();
    test_non_positive_timeout_expires_immediately();
    test_timeout_kills_grandchildren();
    test_script_errors();
    test_spawn_error();

    fs::remove_all(g_root);
    std::cout << "\nALL process runner tests passed\n";
    return 0;
}
