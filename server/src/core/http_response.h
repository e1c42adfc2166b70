#pragma once

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <string>

namespace scripthub::resp {

using Json = nlohmann::json;

// 直接写一个 JSON 文档（不加外层信封）
inline void raw(httplib::Response& res, const Json& body, int http_status = 200)
{
    res.status = http_status;
    res.set_content(body.dump(), "application/json; charset=utf-8");
}

// 最底层：统一构造 {"code", "message", "data"} 并写入 Response
inline void json(httplib::Response& res,
                 int code,
                 const Json& data,
                 const std::string& message,
                 int http_status = 200)
{
    Json body;
    body["code"]    = code;
    body["message"] = message;
    if (data.is_null()) {
        body["data"] = nullptr;
    } else {
        body["data"] = data;
    }
    raw(res, body, http_status);
}

// 成功：无 data
inline void ok(httplib::Response& res, const std::string& message = "ok") {
    json(res, 0, Json(), message, 200);
}

// 成功：有 data
inline void ok(httplib::Response& res, const Json& data, const std::string& message = "ok") {
    json(res, 0, data, message, 200);
}

// 创建成功：201
inline void created(httplib::Response& res, const Json& data, const std::string& message = "created") {
    json(res, 0, data, message, 201);
}

// 业务错误：data 里带字符串错误码和细节
inline void error(httplib::Response& res,
                  int http_status,
                  const std::string& error_code,
                  const std::string& message,
                  const Json& details = Json::object())
{
    Json data;
    data["error_code"] = error_code;
    data["details"] = details;
    json(res, http_status, data, message, http_status);
}

// Bad Request（参数错误等）
inline void bad_request(httplib::Response& res,
                        const std::string& message = "bad request")
{
    json(res, 400, Json(), message, 400);
}

// 未找到
inline void not_found(httplib::Response& res,
                      const std::string& message = "not found")
{
    json(res, 404, Json(), message, 404);
}

inline void internal_error(httplib::Response& res,
                           const std::string& message = "internal server error")
{
    json(res, 500, Json(), message, 500);
}

} // namespace scripthub::resp
