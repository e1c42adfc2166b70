#include "server_app.h"
#include <filesystem>
#include <vector>
#include "core/config.h"
#include "core/http_response.h"
#include "db/db.h"
#include "execution/script_executor.h"
#include "execution/script_validator.h"
#include "log/log_manager.h"
#include "log/log_sink_console.h"
#include "log/log_sink_file.h"
#include "log/logger.h"
#include "router.h"
#include "scripts/script_store.h"

namespace scripthub {

namespace fs = std::filesystem;

ServerApp::ServerApp() = default;

ServerApp::~ServerApp() = default;

/**
 * @brief 启动并运行服务器
 *
 * 配置 -> 日志 -> 数据库 -> 脚本目录与执行器 -> HTTP 路由 -> 监听（阻塞）
 *
 * @return int 0 表示正常退出，1 表示启动失败
 */
int ServerApp::run() {
    // 1. 加载配置
    init_config();

    // 2. 初始化日志系统
    init_logger();
    Logger::info("===== ScriptHub Server Starting =====");

    // 3. 数据库
    if (!init_db()) {
        Logger::error("Failed to initialize database, exiting");
        return 1;
    }

    // 4. 脚本目录、存储和执行器
    if (!init_scripts()) {
        Logger::error("Failed to initialize scripts directory, exiting");
        return 1;
    }

    // 5. HTTP Server 和路由
    init_http_server();
    setup_routes();
    Logger::info("Routes registered");

    // 6. 启动监听（阻塞）
    Logger::info("Listening at " + m_host + ":" + std::to_string(m_port));
    if (!m_server->listen(m_host.c_str(), m_port)) {
        Logger::error("Failed to listen at " + m_host + ":" + std::to_string(m_port));
        return 1;
    }
    return 0;
}

void ServerApp::init_config() {
    auto& cfg = Config::instance();
    const fs::path cwd = fs::current_path();

    // 优先加载生产环境配置
    bool loaded = cfg.load("/etc/scripthub/config.json");
    if (!loaded) {
        // 1) 当前工作目录
        loaded = cfg.load("config.json");
    }
    if (!loaded) {
        // 2) 源码默认配置
        loaded = cfg.load((cwd / "server" / "config" / "default_config.json").string());
    }
    if (!loaded) {
        Logger::warn("No config file found in fallback paths, using built-in defaults");
    }

    // 环境变量覆盖（支持 Docker / 本地调试）
    cfg.load_from_env();

    m_host = cfg.host();
    m_port = cfg.port();
}

void ServerApp::init_logger() {
    auto& cfg = Config::instance();
    auto& mgr = core::LogManager::instance();

    mgr.setMinLevel(Logger::level_from_string(cfg.get<std::string>("log.level", "INFO")));

    std::vector<std::shared_ptr<core::ILogSink>> sinks;
    sinks.push_back(std::make_shared<core::ConsoleLogSink>());

    // 空串表示只打到控制台
    const std::string logPath = cfg.log_path();
    if (!logPath.empty()) {
        std::error_code ec;
        fs::path p(logPath);
        if (p.has_parent_path()) {
            fs::create_directories(p.parent_path(), ec);
        }
        if (ec) {
            Logger::warn("Cannot create log directory for " + logPath + ": " + ec.message() +
                         ", console only");
        } else {
            core::FileLogSink::Options opt;
            opt.path = logPath;
            opt.rotateBytes = static_cast<std::size_t>(cfg.get<long long>("log.rotateBytes", 10 * 1024 * 1024));
            opt.maxFiles = cfg.get<int>("log.maxFiles", 5);
            opt.flushEachLine = cfg.get<bool>("log.flushEachLine", false);
            sinks.push_back(std::make_shared<core::FileLogSink>(opt));
        }
    }
    mgr.setSinks(std::move(sinks));

    Logger::info(std::string("Logger initialized") +
                 (logPath.empty() ? " (console-only)" : (" (file=" + logPath + ")")));
}

bool ServerApp::init_db()
{
    m_db = std::make_unique<Db>();
    if (!m_db->open(Config::instance().db_path())) {
        return false;
    }
    Logger::info("Database opened");
    return true;
}

bool ServerApp::init_scripts()
{
    auto& cfg = Config::instance();
    exec::ExecutorSettings settings = exec::ExecutorSettings::fromConfig(cfg);

    std::error_code ec;
    fs::create_directories(settings.scriptsRoot, ec);
    if (ec) {
        Logger::error("Cannot create scripts directory " + settings.scriptsRoot.string() +
                      ": " + ec.message());
        return false;
    }

    m_store = std::make_unique<scripts::ScriptStore>(*m_db, settings.scriptsRoot,
                                                      settings.allowedExtensions);
    if (!m_store->ensureSchema()) {
        return false;
    }

    // 提前初始化内嵌解释器，失败只影响提交时的校验
    std::string pyError;
    if (!exec::ScriptValidator::warmUp(pyError)) {
        Logger::warn("Embedded Python unavailable, script validation will fail: " + pyError);
    }

    Logger::info("Scripts root: " + settings.scriptsRoot.string() +
                 ", timeout=" + std::to_string(settings.timeout.count()) + "ms" +
                 ", python=" + settings.interpreter);
    m_executor = std::make_unique<exec::ScriptExecutor>(std::move(settings), *m_store);
    return true;
}

void ServerApp::init_http_server() {
    m_server = std::make_unique<httplib::Server>();

    const int threads = Config::instance().get<int>("server.threads", 8);
    m_server->new_task_queue = [threads] {
        return new httplib::ThreadPool(static_cast<size_t>(threads > 0 ? threads : 1));
    };

    // handler 里没有处理的异常统一回 500
    m_server->set_exception_handler([](const httplib::Request& req, httplib::Response& res,
                                       std::exception_ptr ep) {
        std::string what = "unknown exception";
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            what = e.what();
        } catch (...) {
            what = "non-standard exception";
        }
        Logger::error("Unhandled exception on " + req.method + " " + req.path + ": " + what);
        resp::internal_error(res, "Internal server error: " + what);
    });
}

void ServerApp::setup_routes() {
    Router::setup_routes(*m_server, *m_executor, *m_store, Config::instance().api_prefix());
}

} // namespace scripthub
