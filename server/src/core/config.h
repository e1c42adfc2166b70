#pragma once
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace scripthub {

// 进程级配置：启动时加载一次，之后只读
class Config {
public:
    static Config& instance();

    // 加载 JSON 配置文件；失败时保留默认值并返回 false
    bool load(const std::string& path);

    // 从环境变量覆盖配置
    void load_from_env();

    // 恢复内置默认值（测试用）
    void reset();

    std::string host() const { return get<std::string>("server.host", "0.0.0.0"); }
    int port() const { return get<int>("server.port", 8000); }
    std::string api_prefix() const { return get<std::string>("server.api_prefix", "/api/v1"); }
    std::string db_path() const { return get<std::string>("database.db_path", "scripthub.db"); }
    std::string log_path() const { return get<std::string>("log.path", ""); }
    std::string scripts_dir() const { return get<std::string>("scripts.dir", "./scripts"); }

    // 按 "section.key" 读取，类型不符或不存在时返回默认值
    template <typename T>
    T get(const std::string& key, T def = T{}) const {
        auto it = m_config.find(key);
        if (it == m_config.end()) return def;
        try {
            return it->second.get<T>();
        } catch (const nlohmann::json::exception&) {
            return def;
        }
    }


    void set(const std::string& key, nlohmann::json value) { m_config[key] = std::move(value); }

private:
    Config();
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    void apply_defaults();

private:
    // 扁平化后的配置项：key 为 "section.key"
    std::unordered_map<std::string, nlohmann::json> m_config;
};

} // namespace scripthub
