#include "script_exec_handler.h"
#include <chrono>
#include <nlohmann/json.hpp>
#include "core/http_response.h"
#include "execution/script_executor.h"
#include "log/logger.h"

using json = nlohmann::json;

namespace scripthub {

void ScriptExecHandler::setup_routes(httplib::Server& server,
                                     const exec::ScriptExecutor& executor,
                                     const std::string& apiPrefix)
{
    server.Post(apiPrefix + R"(/scripts/(.+))",
                [&executor](const httplib::Request& req, httplib::Response& res) {
                    execute(executor, req, res);
                });
}

// Request: POST /api/v1/scripts/geology/test.py
//   Body JSON: {"data": {...}}，缺少 data 时按 {} 处理
// Response:
//   200 {"success":true,"result":{...},"error":null,"execution_time":0.12}
//   200 {"success":false,"result":null,"error":"<reason>","execution_time":0.12}
//   400 请求体不是 JSON object / data 不是 object
//   404 脚本不存在
//   500 临时文件或子进程无法创建
void ScriptExecHandler::execute(const exec::ScriptExecutor& executor,
                                const httplib::Request& req, httplib::Response& res)
{
    const std::string scriptPath = req.matches[1].str();
    Logger::info("POST /scripts/" + scriptPath);

    const auto start = std::chrono::steady_clock::now();
    auto elapsed = [&start]() {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    };

    json data = json::object();
    if (!req.body.empty()) {
        json body;
        try {
            body = json::parse(req.body);
        } catch (const json::parse_error& e) {
            Logger::warn(std::string("Failed to parse JSON request: ") + e.what());
            resp::bad_request(res, "request body is not valid JSON");
            return;
        }
        if (!body.is_object()) {
            resp::bad_request(res, "request body must be a JSON object");
            return;
        }
        if (body.contains("data")) {
            data = body["data"];
        }
    }

    try {
        const exec::ExecutionOutcome outcome = executor.execute(scriptPath, data);

        json out;
        out["success"] = outcome.ok();
        out["result"] = outcome.ok() ? outcome.result : json(nullptr);
        out["error"] = outcome.ok() ? json(nullptr) : json(outcome.reason);
        out["execution_time"] = elapsed();
        resp::raw(res, out);
    } catch (const exec::ScriptNotFoundError& e) {
        Logger::warn(std::string("Script not found: ") + e.what());
        resp::not_found(res, e.what());
    } catch (const exec::InvalidPayloadError& e) {
        resp::bad_request(res, e.what());
    } catch (const exec::InfrastructureError& e) {
        Logger::error(std::string("Script execution infrastructure error: ") + e.what());
        resp::internal_error(res, std::string("Internal server error: ") + e.what());
    }
}

} // namespace scripthub
