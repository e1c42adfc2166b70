#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <unistd.h>

#include "core/config.h"
#include "execution/script_executor.h"
#include "log/log_formatter.h"
#include "log/log_manager.h"
#include "log/log_sink_file.h"
#include "log/logger.h"

using namespace scripthub;
namespace fs = std::filesystem;

// 把记录收集到内存里
class CaptureSink : public core::ILogSink {
public:
    void consume(const core::LogRecord& rec) override {
        std::lock_guard<std::mutex> lk(mu);
        records.push_back(rec);
    }
    std::mutex mu;
    std::vector<core::LogRecord> records;
};

static fs::path g_root;

static void test_config_defaults_and_file() {
    auto& cfg = Config::instance();
    cfg.reset();
    assert(cfg.host() == "0.0.0.0");
    assert(cfg.port() == 8000);
    assert(cfg.api_prefix() == "/api/v1");
    assert(cfg.scripts_dir() == "./scripts");
    assert(cfg.get<int>("executor.max_execution_seconds", 0) == 300);

    const fs::path file = g_root / "config.json";
    std::ofstream(file) << R"({
        "server": {"port": 9100},
        "scripts": {"dir": "/srv/scripts"},
        "executor": {"max_execution_seconds": 12, "allowed_extensions": [".py", ".pyw"]}
    })";
    assert(cfg.load(file.string()));
    assert(cfg.port() == 9100);
    assert(cfg.host() == "0.0.0.0");
    assert(cfg.scripts_dir() == "/srv/scripts");

    auto s = exec::ExecutorSettings::fromConfig(cfg);
    assert(s.timeout == std::chrono::seconds(12));
    assert(s.allowedExtensions.size() == 2);
    assert(s.scriptsRoot == fs::path("/srv/scripts"));

    // 类型不对时回落到默认值
    cfg.set("server.port", "not-a-number");
    assert(cfg.port() == 8000);

    assert(!cfg.load((g_root / "missing.json").string()));
    std::cout << "[OK] config defaults + file\n";
}

static void test_config_env_override() {
    auto& cfg = Config::instance();
    cfg.reset();
    ::setenv("SCRIPTHUB_PORT", "9200", 1);
    ::setenv("SCRIPTHUB_MAX_EXEC_SECONDS", "5", 1);
    ::setenv("SCRIPTHUB_PYTHON", "/usr/bin/python3", 1);
    cfg.load_from_env();
    assert(cfg.port() == 9200);
    assert(cfg.get<int>("executor.max_execution_seconds", 0) == 5);
    assert(cfg.get<std::string>("executor.python", "") == "/usr/bin/python3");
    ::unsetenv("SCRIPTHUB_PORT");
    ::unsetenv("SCRIPTHUB_MAX_EXEC_SECONDS");
    ::unsetenv("SCRIPTHUB_PYTHON");
    cfg.reset();

    // 不是整数的值被忽略
    ::setenv("SCRIPTHUB_MAX_EXEC_SECONDS", "abc", 1);
    cfg.load_from_env();
    assert(cfg.get<int>("executor.max_execution_seconds", 0) == 300);
    ::setenv("SCRIPTHUB_MAX_EXEC_SECONDS", "12x", 1);
    cfg.load_from_env();
    assert(cfg.get<int>("executor.max_execution_seconds", 0) == 300);
    ::unsetenv("SCRIPTHUB_MAX_EXEC_SECONDS");
    cfg.reset();
    std::cout << "[OK] env override\n";
}

static void test_timeout_must_be_positive() {
    auto& cfg = Config::instance();
    cfg.reset();
    for (int bad : {0, -1}) {
        cfg.set("executor.max_execution_seconds", bad);
        auto s = exec::ExecutorSettings::fromConfig(cfg);
        assert(s.timeout == std::chrono::seconds(exec::ExecutorSettings::kDefaultTimeoutSeconds));
    }
    cfg.set("executor.max_execution_seconds", "forever");
    assert(exec::ExecutorSettings::fromConfig(cfg).timeout == std::chrono::seconds(300));
    cfg.set("executor.max_execution_seconds", 7);
    assert(exec::ExecutorSettings::fromConfig(cfg).timeout == std::chrono::seconds(7));
    cfg.reset();
    std::cout << "[OK] non-positive timeout falls back to default\n";
}

static void test_formatter() {
    core::LogRecord r;
    r.level = LogLevel::Warn;
    r.stream = core::LogStream::Event;
    r.scriptPath = "geology/test.py";
    r.durationMs = 7;
    r.message = "line1\n\"quoted\"";
    r.fields = {{"status", "Failure"}, {"exit_code", "1"}};

    const std::string line = core::LogFormatter::instance().formatLine(r);
    assert(line.find("level=[WARN]") != std::string::npos);
    assert(line.find("stream=EVENT") != std::string::npos);
    assert(line.find("script=geology/test.py") != std::string::npos);
    assert(line.find("duration_ms=7") != std::string::npos);
    assert(line.find("msg=\"line1\\n\\\"quoted\\\"\"") != std::string::npos);
    // 字段按 key 排序
    assert(line.find("exit_code=1") < line.find("status=Failure"));
    assert(line.find('\n') == std::string::npos);
    std::cout << "[OK] formatter: " << line << "\n";
}

static void test_manager_filters_and_events() {
    auto& mgr = core::LogManager::instance();
    auto sink = std::make_shared<CaptureSink>();
    mgr.setSinks({sink});
    mgr.setMinLevel(LogLevel::Info);

    Logger::debug("dropped");
    Logger::info("kept");
    core::emitEvent("a.py", LogLevel::Info, "Execution end", 12,
                    {{"exit_code", "0"}, {"status", "Success"}, {"timed_out", "false"}});
    mgr.outputLines("a.py", core::LogStream::Stderr, LogLevel::Warn, "first\r\nsecond\nthird");

    assert(sink->records.size() == 5);
    assert(sink->records[0].message == "kept");
    assert(sink->records[1].stream == core::LogStream::Event);
    assert(sink->records[1].fields.at("status") == "Success");
    assert(sink->records[1].durationMs == 12);
    assert(sink->records[2].message == "first");
    assert(sink->records[3].message == "second");
    assert(sink->records[4].message == "third");
    assert(sink->records[4].stream == core::LogStream::Stderr);

    mgr.setMinLevel(LogLevel::Error);
    Logger::warn("dropped too");
    assert(sink->records.size() == 5);

    assert(Logger::level_from_string("debug") == LogLevel::Debug);
    assert(Logger::level_from_string("ERROR") == LogLevel::Error);
    mgr.setMinLevel(LogLevel::Info);
    std::cout << "[OK] level filter, events, output lines\n";
}

static void test_file_sink_rotation() {
    const fs::path base = g_root / "logs" / "scripthub.log";
    fs::create_directories(base.parent_path());

    core::FileLogSink::Options opt;
    opt.path = base.string();
    opt.rotateBytes = 512;
    opt.maxFiles = 2;
    opt.flushEachLine = true;
    {
        core::FileLogSink sink(opt);
        for (int i = 0; i < 100; ++i) {
            core::LogRecord r;
            r.message = "message number " + std::to_string(i);
            sink.consume(r);
        }
    }

    assert(fs::exists(base));
    int rotated = 0;
    for (const auto& e : fs::directory_iterator(base.parent_path())) {
        if (e.path().filename().string().rfind("scripthub.log.", 0) == 0) ++rotated;
    }
    assert(rotated >= 1 && rotated <= 2);
    assert(fs::file_size(base) <= 512);
    std::cout << "[OK] file sink rotation, kept " << rotated << " rotated files\n";
}

int main() {
    g_root = fs::temp_directory_path() / ("config_test_" + std::to_string(::getpid()));
    fs::remove_all(g_root);
    fs::create_directories(g_root);

    test_config_defaults_and_file();
    test_config_env_override();
    test_timeout_must_be_positive();
    test_formatter();
    test_manager_filters_and_events();
    test_file_sink_rotation();

    fs::remove_all(g_root);
    std::cout << "\nALL config / logging tests passed\n";
    return 0;
}
