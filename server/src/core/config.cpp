#include "config.h"
#include <cstdlib>
#include <fstream>
#include "log/logger.h"

namespace scripthub {

Config& Config::instance() {
    static Config instance;
    return instance;
}

Config::Config() {
    apply_defaults();
}

void Config::apply_defaults() {
    m_config["server.host"] = "0.0.0.0";
    m_config["server.port"] = 8000;
    m_config["server.api_prefix"] = "/api/v1";
    m_config["server.threads"] = 8;
    m_config["database.db_path"] = "scripthub.db";
    m_config["log.path"] = "";
    m_config["log.level"] = "INFO";
    m_config["log.rotateBytes"] = 10 * 1024 * 1024;
    m_config["log.maxFiles"] = 5;
    m_config["log.flushEachLine"] = false;
    m_config["scripts.dir"] = "./scripts";
    m_config["executor.max_execution_seconds"] = 300;
    m_config["executor.allowed_extensions"] = std::vector<std::string>{".py"};
    m_config["executor.python"] = "python3";
    m_config["executor.temp_dir"] = "";
}

void Config::reset() {
    m_config.clear();
    apply_defaults();
}

// 加载 JSON 配置文件：每个 section 下的字段展开为 "section.key"
bool Config::load(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        Logger::warn("Config file not found: " + path + ", using defaults");
        return false;
    }

    try {
        nlohmann::json j;
        ifs >> j;
        if (!j.is_object()) {
            Logger::error("Config file root must be an object: " + path);
            return false;
        }
        for (auto& [key, value] : j.items()) {
            if (value.is_object()) {
                for (auto& [k, v] : value.items()) {
                    m_config[key + "." + k] = v;
                }
            } else {
                m_config[key] = value;
            }
        }
        Logger::info("Config loaded from: " + path);
        return true;
    }
    catch (const std::exception& ex) {
        Logger::error(std::string("Failed to parse config file: ") + path +
                      ", error: " + ex.what());
        return false;
    }
}

// 从环境变量覆盖（Docker / 本地调试）
void Config::load_from_env() {
    if (const char* p = std::getenv("SCRIPTHUB_PORT")) {
        m_config["server.port"] = std::atoi(p);
    }
    if (const char* p = std::getenv("SCRIPTHUB_HOST")) {
        m_config["server.host"] = p;
    }
    if (const char* p = std::getenv("SCRIPTHUB_DB")) {
        m_config["database.db_path"] = p;
    }
    if (const char* p = std::getenv("SCRIPTHUB_LOG")) {
        m_config["log.path"] = p;
    }
    if (const char* p = std::getenv("SCRIPTHUB_SCRIPTS_DIR")) {
        m_config["scripts.dir"] = p;
    }
    if (const char* p = std::getenv("SCRIPTHUB_MAX_EXEC_SECONDS")) {
        char* end = nullptr;
        const long v = std::strtol(p, &end, 10);
        if (end == p || *end != '\0') {
            Logger::warn(std::string("Config: ignoring SCRIPTHUB_MAX_EXEC_SECONDS='") + p + "'");
        } else {
            m_config["executor.max_execution_seconds"] = v;
        }
    }
    if (const char* p = std::getenv("SCRIPTHUB_PYTHON")) {
        m_config["executor.python"] = p;
    }
}

} // namespace scripthub
