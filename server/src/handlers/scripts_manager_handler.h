#pragma once

#include <functional>
#include <string>
#include <httplib.h>

namespace scripthub {

namespace scripts {
class ScriptStore;
}

// {prefix}/scripts-manager/...：校验、文件夹、脚本 CRUD、目录树
class ScriptsManagerHandler {
public:
    using Handler = std::function<void(const httplib::Request&, httplib::Response&)>;

    static void setup_routes(httplib::Server& server,
                             scripts::ScriptStore& store,
                             const std::string& apiPrefix);

    // 包一层：StoreError / json 字段错误 -> 对应的错误响应
    static Handler guarded(const char* what, Handler fn);

    static void validate(const httplib::Request& req, httplib::Response& res);
    static void createFolder(scripts::ScriptStore& store, const httplib::Request& req, httplib::Response& res);
    static void getFolder(scripts::ScriptStore& store, const httplib::Request& req, httplib::Response& res);
    static void renameFolder(scripts::ScriptStore& store, const httplib::Request& req, httplib::Response& res);
    static void deleteFolder(scripts::ScriptStore& store, const httplib::Request& req, httplib::Response& res);
    static void createScript(scripts::ScriptStore& store, const httplib::Request& req, httplib::Response& res);
    static void getScript(scripts::ScriptStore& store, const httplib::Request& req, httplib::Response& res);
    static void getContent(scripts::ScriptStore& store, const httplib::Request& req, httplib::Response& res);
    static void updateScript(scripts::ScriptStore& store, const httplib::Request& req, httplib::Response& res);
    static void updateContent(scripts::ScriptStore& store, const httplib::Request& req, httplib::Response& res);
    static void deleteScript(scripts::ScriptStore& store, const httplib::Request& req, httplib::Response& res);
    static void tree(scripts::ScriptStore& store, const httplib::Request& req, httplib::Response& res);
};

} // namespace scripthub
