#include "router.h"
#include "handlers/script_exec_handler.h"
#include "handlers/scripts_manager_handler.h"
#include "handlers/system_handler.h"

namespace scripthub {

void Router::setup_routes(httplib::Server& server,
                          const exec::ScriptExecutor& executor,
                          scripts::ScriptStore& store,
                          const std::string& apiPrefix)
{
    // 系统信息类接口
    SystemHandler::setup_routes(server);
    // 脚本执行
    ScriptExecHandler::setup_routes(server, executor, apiPrefix);
    // 脚本管理
    ScriptsManagerHandler::setup_routes(server, store, apiPrefix);
}

} // namespace scripthub
