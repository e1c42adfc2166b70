#include "system_handler.h"
#include <chrono>
#include <nlohmann/json.hpp>
#include "core/http_response.h"
#include "core/utils.h"
#include "log/logger.h"

namespace scripthub {
    namespace {
        const auto g_startedAt = std::chrono::steady_clock::now();
    }

    void SystemHandler::setup_routes(httplib::Server &server)
    {
        server.Get("/api/health", SystemHandler::health);
    }

    // Request: GET /api/health
    // Response: 200 {"code":0,"message":"ok","data":{"status":"healthy","time":"<local>","uptime_sec":<int>}}
    void SystemHandler::health(const httplib::Request &, httplib::Response &res) {
        Logger::debug("GET /api/health");

        nlohmann::json data;
        data["status"] = "healthy";
        data["time"] = utils::now_string();
        data["uptime_sec"] = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::steady_clock::now() - g_startedAt).count();

        resp::ok(res, data);
    }
}
