#pragma once
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "script_resolver.h"
#include "script_types.h"

namespace scripthub {
class Db;
}

namespace scripthub::scripts {

// 新建脚本请求
struct NewScript {
    std::string filename;
    std::string displayName;
    std::string description;
    std::optional<std::int64_t> folderId;
    std::string content;
    bool replace{false};
};

// 元数据修改：未设置的字段保持不变
struct ScriptPatch {
    std::optional<std::string> displayName;
    std::optional<std::string> description;
    std::optional<std::string> filename;
};

/**
 * 脚本与文件夹的存储
 *
 * 文件夹只存在于数据库；所有脚本文件平铺在 scriptsRoot 下，
 * 文件名为 storage_filename。逻辑路径 = 文件夹路径 + "/" + filename。
 * 所有操作串行执行（共享一个 sqlite 连接）。
 *
 * 失败时抛出 StoreError，错误码见 ErrorCode。
 */
class ScriptStore : public IScriptResolver {
public:
    ScriptStore(Db& db, std::filesystem::path scriptsRoot,
                std::vector<std::string> allowedExtensions = {".py"});

    // 建表，启动时调用一次
    bool ensureSchema();

    Folder createFolder(const std::string& name, std::optional<std::int64_t> parentId);
    std::optional<Folder> getFolder(std::int64_t id) const;
    // 改名：同时改写所有子文件夹的 path 和其中脚本的 logical_path
    Folder renameFolder(std::int64_t id, const std::string& name);
    // 递归删除子文件夹、其中的脚本和脚本文件
    void deleteFolder(std::int64_t id);

    Script createScript(const NewScript& req);
    Script updateScript(std::int64_t id, const ScriptPatch& patch);
    Script updateScriptContent(std::int64_t id, const std::string& content);
    void deleteScript(std::int64_t id);

    std::optional<Script> getScript(std::int64_t id) const;
    std::string getScriptContent(std::int64_t id) const;
    std::optional<Script> findByLogicalPath(const std::string& logicalPath) const;

    // {"root_folders": [{folder, scripts, subfolders}], "root_scripts": [...]}
    json tree() const;

    std::optional<ResolvedScript> resolve(const std::string& logicalPath) const override;

    const std::filesystem::path& scriptsRoot() const { return m_root; }

private:
    void checkFilename_(const std::string& filename) const;
    static void checkFolderName_(const std::string& name);
    static void checkContent_(const std::string& content);

    std::optional<Folder> folderById_(std::int64_t id) const;
    std::optional<Script> scriptById_(std::int64_t id) const;
    std::optional<Script> scriptByLogicalPath_(const std::string& logicalPath) const;
    std::vector<Folder> allFolders_() const;
    std::vector<Script> allScripts_() const;

    std::string uniqueStorageName_(const std::string& filename) const;
    bool storageNameTaken_(const std::string& storageFilename) const;
    void writeFile_(const std::string& storageFilename, const std::string& content) const;
    void removeFile_(const std::string& storageFilename) const;

    [[noreturn]] void dbFail_(const std::string& what) const;

private:
    Db& m_db;
    std::filesystem::path m_root;
    std::vector<std::string> m_allowedExtensions;
    mutable std::mutex m_mu;
};

} // namespace scripthub::scripts
