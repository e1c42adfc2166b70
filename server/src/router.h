#pragma once

#include <string>
#include <httplib.h>

namespace scripthub {

namespace exec {
class ScriptExecutor;
}
namespace scripts {
class ScriptStore;
}

// 注册路由
class Router {
public:
    // 只提供静态方法，不需要实例化
    Router() = delete;
    ~Router() = delete;

    static void setup_routes(httplib::Server& server,
                             const exec::ScriptExecutor& executor,
                             scripts::ScriptStore& store,
                             const std::string& apiPrefix);
};

} // namespace scripthub
