#pragma once

#include <string>
#include <httplib.h>

namespace scripthub {

namespace exec {
class ScriptExecutor;
}

// POST {prefix}/scripts/<logical path>
class ScriptExecHandler {
public:
    static void setup_routes(httplib::Server& server,
                             const exec::ScriptExecutor& executor,
                             const std::string& apiPrefix);

    static void execute(const exec::ScriptExecutor& executor,
                        const httplib::Request& req, httplib::Response& res);
};

} // namespace scripthub
