#pragma once
#include <memory>
#include <string>
#include <httplib.h>

namespace scripthub {

class Db;

namespace exec {
class ScriptExecutor;
}
namespace scripts {
class ScriptStore;
}

class ServerApp {
public:
    ServerApp();
    ~ServerApp();

    // 程序主入口
    int run();

private:
    void init_config();
    void init_logger();
    bool init_db();
    bool init_scripts();
    void init_http_server();
    void setup_routes();

private:
    // HTTP 服务对象
    std::unique_ptr<httplib::Server> m_server;
    std::unique_ptr<Db> m_db;
    std::unique_ptr<scripts::ScriptStore> m_store;
    std::unique_ptr<exec::ScriptExecutor> m_executor;
    // 服务运行参数
    std::string m_host;
    int m_port{8000};
};

} // namespace scripthub
