#include "scripts_manager_handler.h"
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <optional>
#include <nlohmann/json.hpp>
#include "core/http_response.h"
#include "execution/script_validator.h"
#include "log/logger.h"
#include "scripts/script_store.h"

using json = nlohmann::json;

namespace scripthub {

namespace {

// 请求体必须是 JSON object；失败时已写好 400
std::optional<json> parse_body(const httplib::Request& req, httplib::Response& res)
{
    try {
        json body = json::parse(req.body);
        if (!body.is_object()) {
            resp::bad_request(res, "request body must be a JSON object");
            return std::nullopt;
        }
        return body;
    } catch (const json::parse_error& e) {
        Logger::warn(std::string("Failed to parse JSON request: ") + e.what());
        resp::bad_request(res, "request body is not valid JSON");
        return std::nullopt;
    }
}

// null / 缺省 -> std::nullopt
std::optional<std::int64_t> opt_id(const json& body, const char* key)
{
    auto it = body.find(key);
    if (it == body.end() || it->is_null()) return std::nullopt;
    return it->get<std::int64_t>();
}

std::optional<std::string> opt_string(const json& body, const char* key)
{
    auto it = body.find(key);
    if (it == body.end() || it->is_null()) return std::nullopt;
    return it->get<std::string>();
}

// 超出 int64 的 id 不可能存在，按 404 处理
std::int64_t path_id(const httplib::Request& req, scripts::ErrorCode notFound)
{
    const std::string raw = req.matches[1].str();
    try {
        return std::stoll(raw);
    } catch (const std::out_of_range&) {
        const bool folder = notFound == scripts::ErrorCode::FolderNotFound;
        throw scripts::StoreError(notFound,
                                  std::string(folder ? "Folder" : "Script") + " with id " + raw + " not found",
                                  {{folder ? "folder_id" : "script_id", raw}});
    }
}

std::int64_t folder_id(const httplib::Request& req)
{
    return path_id(req, scripts::ErrorCode::FolderNotFound);
}

std::int64_t script_id(const httplib::Request& req)
{
    return path_id(req, scripts::ErrorCode::ScriptNotFound);
}

} // namespace

// StoreError -> 对应 HTTP 状态；字段类型不对 -> 400
ScriptsManagerHandler::Handler ScriptsManagerHandler::guarded(const char* what, Handler fn)
{
    return [what, fn](const httplib::Request& req, httplib::Response& res) {
        Logger::info(std::string(what) + " " + req.path);
        try {
            fn(req, res);
        } catch (const scripts::StoreError& e) {
            const int status = scripts::ErrorCodeToHttpStatus(e.code());
            if (status >= 500) Logger::error(std::string(what) + " failed: " + e.what());
            else Logger::warn(std::string(what) + " rejected: " + e.what());
            resp::error(res, status, scripts::ErrorCodeToString(e.code()), e.what(), e.details());
        } catch (const json::exception& e) {
            resp::error(res, 400, "VALIDATION_ERROR",
                        std::string("invalid request field: ") + e.what());
        }
    };
}

void ScriptsManagerHandler::setup_routes(httplib::Server& server,
                                         scripts::ScriptStore& store,
                                         const std::string& apiPrefix)
{
    const std::string base = apiPrefix + "/scripts-manager";
    auto with_store = [&store](void (*fn)(scripts::ScriptStore&, const httplib::Request&, httplib::Response&)) {
        return [&store, fn](const httplib::Request& req, httplib::Response& res) { fn(store, req, res); };
    };

    server.Post(base + "/validate", guarded("validate", validate));
    server.Post(base + "/folders", guarded("create folder", with_store(createFolder)));
    server.Get(base + R"(/folders/(\d+))", guarded("get folder", with_store(getFolder)));
    server.Put(base + R"(/folders/(\d+))", guarded("rename folder", with_store(renameFolder)));
    server.Delete(base + R"(/folders/(\d+))", guarded("delete folder", with_store(deleteFolder)));
    server.Post(base + "/scripts", guarded("create script", with_store(createScript)));
    server.Get(base + R"(/scripts/(\d+))", guarded("get script", with_store(getScript)));
    server.Get(base + R"(/scripts/(\d+)/content)", guarded("get script content", with_store(getContent)));
    server.Put(base + R"(/scripts/(\d+))", guarded("update script", with_store(updateScript)));
    server.Put(base + R"(/scripts/(\d+)/content)", guarded("update script content", with_store(updateContent)));
    server.Delete(base + R"(/scripts/(\d+))", guarded("delete script", with_store(deleteScript)));
    server.Get(base + "/tree", guarded("tree", with_store(tree)));
}

// Request: POST /scripts-manager/validate  Body: {"content":"def main(data: dict): ..."}
// Response: 200 {"code":0,"data":{"valid":bool,"code":"OK"|"MISSING_ENTRY_POINT"|...,"message":"..."}}
void ScriptsManagerHandler::validate(const httplib::Request& req, httplib::Response& res)
{
    auto body = parse_body(req, res);
    if (!body) return;
    const std::string content = body->value("content", "");

    const exec::ValidationVerdict v = exec::ScriptValidator::validate(content);
    json data;
    data["valid"] = v.valid;
    data["code"] = exec::ValidationCodeToString(v.code);
    data["message"] = v.message;
    resp::ok(res, data);
}

// Request: POST /scripts-manager/folders  Body: {"name":"geology","parent_id":null}
// Response: 201 {folder} | 400 INVALID_FOLDER_NAME | 404 PARENT_FOLDER_NOT_FOUND | 409 FOLDER_ALREADY_EXISTS
void ScriptsManagerHandler::createFolder(scripts::ScriptStore& store,
                                         const httplib::Request& req, httplib::Response& res)
{
    auto body = parse_body(req, res);
    if (!body) return;
    const auto folder = store.createFolder(body->value("name", ""), opt_id(*body, "parent_id"));
    resp::created(res, scripts::folder_to_json(folder));
}

void ScriptsManagerHandler::getFolder(scripts::ScriptStore& store,
                                      const httplib::Request& req, httplib::Response& res)
{
    const auto id = folder_id(req);
    auto folder = store.getFolder(id);
    if (!folder) {
        resp::error(res, 404, "FOLDER_NOT_FOUND",
                    "Folder with id " + std::to_string(id) + " not found",
                    {{"folder_id", id}});
        return;
    }
    resp::ok(res, scripts::folder_to_json(*folder));
}

// Request: PUT /scripts-manager/folders/{id}  Body: {"name":"new-name"}
// Response: 200 {folder} | 400 INVALID_FOLDER_NAME | 404 FOLDER_NOT_FOUND | 409 FOLDER_ALREADY_EXISTS
void ScriptsManagerHandler::renameFolder(scripts::ScriptStore& store,
                                         const httplib::Request& req, httplib::Response& res)
{
    auto body = parse_body(req, res);
    if (!body) return;
    const auto folder = store.renameFolder(folder_id(req), body->value("name", ""));
    resp::ok(res, scripts::folder_to_json(folder));
}

// Request: DELETE /scripts-manager/folders/{id}
// Response: 200 | 404 FOLDER_NOT_FOUND
void ScriptsManagerHandler::deleteFolder(scripts::ScriptStore& store,
                                         const httplib::Request& req, httplib::Response& res)
{
    store.deleteFolder(folder_id(req));
    resp::ok(res);
}

// Request: POST /scripts-manager/scripts
//   Body: {"filename","display_name","description","folder_id","content","replace"}
// Response: 201 {script} | 400 INVALID_FILENAME / SCRIPT_MISSING_MAIN / INVALID_SCRIPT_CONTENT
//           404 FOLDER_NOT_FOUND | 409 SCRIPT_EXISTS_REPLACE_REQUIRED
void ScriptsManagerHandler::createScript(scripts::ScriptStore& store,
                                         const httplib::Request& req, httplib::Response& res)
{
    auto body = parse_body(req, res);
    if (!body) return;

    scripts::NewScript ns;
    ns.filename = body->value("filename", "");
    ns.displayName = body->value("display_name", ns.filename);
    ns.description = opt_string(*body, "description").value_or("");
    ns.folderId = opt_id(*body, "folder_id");
    ns.content = body->value("content", "");
    ns.replace = body->value("replace", false);

    const auto script = store.createScript(ns);
    resp::created(res, scripts::script_to_json(script));
}

void ScriptsManagerHandler::getScript(scripts::ScriptStore& store,
                                      const httplib::Request& req, httplib::Response& res)
{
    const auto id = script_id(req);
    auto script = store.getScript(id);
    if (!script) {
        resp::error(res, 404, "SCRIPT_NOT_FOUND",
                    "Script with id " + std::to_string(id) + " not found",
                    {{"script_id", id}});
        return;
    }
    resp::ok(res, scripts::script_to_json(*script));
}

// Response: 200 {"id":1,"content":"..."}
void ScriptsManagerHandler::getContent(scripts::ScriptStore& store,
                                       const httplib::Request& req, httplib::Response& res)
{
    const auto id = script_id(req);
    json data;
    data["id"] = id;
    data["content"] = store.getScriptContent(id);
    resp::ok(res, data);
}

// Request: PUT /scripts-manager/scripts/{id}  Body: {"display_name"?, "description"?, "filename"?}
// Response: 200 {script} | 404 SCRIPT_NOT_FOUND | 409 SCRIPT_ALREADY_EXISTS
void ScriptsManagerHandler::updateScript(scripts::ScriptStore& store,
                                         const httplib::Request& req, httplib::Response& res)
{
    auto body = parse_body(req, res);
    if (!body) return;

    scripts::ScriptPatch patch;
    patch.displayName = opt_string(*body, "display_name");
    patch.description = opt_string(*body, "description");
    patch.filename = opt_string(*body, "filename");

    const auto script = store.updateScript(script_id(req), patch);
    resp::ok(res, scripts::script_to_json(script));
}

// Request: PUT /scripts-manager/scripts/{id}/content  Body: {"content":"..."}
void ScriptsManagerHandler::updateContent(scripts::ScriptStore& store,
                                          const httplib::Request& req, httplib::Response& res)
{
    auto body = parse_body(req, res);
    if (!body) return;
    const auto script = store.updateScriptContent(script_id(req), body->value("content", ""));
    resp::ok(res, scripts::script_to_json(script));
}

void ScriptsManagerHandler::deleteScript(scripts::ScriptStore& store,
                                         const httplib::Request& req, httplib::Response& res)
{
    store.deleteScript(script_id(req));
    resp::ok(res);
}

// Response: 200 {"root_folders":[{"folder":{},"scripts":[],"subfolders":[]}],"root_scripts":[]}
void ScriptsManagerHandler::tree(scripts::ScriptStore& store,
                                 const httplib::Request&, httplib::Response& res)
{
    resp::ok(res, store.tree());
}

} // namespace scripthub
