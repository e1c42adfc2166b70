#include "script_store.h"
#include <algorithm>
#include <fstream>
#include <functional>
#include <sstream>
#include <unordered_map>

#include "core/utils.h"
#include "db/db.h"
#include "execution/script_validator.h"
#include "log/logger.h"

namespace scripthub::scripts {

namespace fs = std::filesystem;

namespace {

const char* kSchemaSql = R"SQL(
CREATE TABLE IF NOT EXISTS folders (
    id            INTEGER PRIMARY KEY AUTOINCREMENT,
    name          TEXT NOT NULL,
    path          TEXT NOT NULL UNIQUE,
    parent_id     INTEGER REFERENCES folders(id),
    created_at_ms INTEGER NOT NULL,
    updated_at_ms INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_folders_parent ON folders(parent_id);

CREATE TABLE IF NOT EXISTS scripts (
    id               INTEGER PRIMARY KEY AUTOINCREMENT,
    filename         TEXT NOT NULL,
    storage_filename TEXT NOT NULL UNIQUE,
    logical_path     TEXT NOT NULL UNIQUE,
    display_name     TEXT NOT NULL,
    description      TEXT NOT NULL DEFAULT '',
    folder_id        INTEGER REFERENCES folders(id),
    created_at_ms    INTEGER NOT NULL,
    updated_at_ms    INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_scripts_folder ON scripts(folder_id);
)SQL";

const char* kFolderColumns =
    "SELECT id, name, path, parent_id, created_at_ms, updated_at_ms FROM folders ";
const char* kScriptColumns =
    "SELECT id, filename, storage_filename, logical_path, display_name, description, "
    "folder_id, created_at_ms, updated_at_ms FROM scripts ";

// 目标文件夹及其所有子孙文件夹
const char* kSubtreeCte =
    "WITH RECURSIVE subtree(id) AS ("
    " SELECT ?1"
    " UNION ALL"
    " SELECT f.id FROM folders f JOIN subtree s ON f.parent_id = s.id) ";

Folder readFolder(const Statement& st)
{
    Folder f;
    f.id = st.column_int64(0);
    f.name = st.column_text(1);
    f.path = st.column_text(2);
    f.parentId = st.column_opt_int64(3);
    f.createdAtMs = st.column_int64(4);
    f.updatedAtMs = st.column_int64(5);
    return f;
}

Script readScript(const Statement& st)
{
    Script s;
    s.id = st.column_int64(0);
    s.filename = st.column_text(1);
    s.storageFilename = st.column_text(2);
    s.logicalPath = st.column_text(3);
    s.displayName = st.column_text(4);
    s.description = st.column_text(5);
    s.folderId = st.column_opt_int64(6);
    s.createdAtMs = st.column_int64(7);
    s.updatedAtMs = st.column_int64(8);
    return s;
}

std::string buildLogicalPath(const std::string& filename, const std::optional<Folder>& folder)
{
    if (folder) return folder->path + "/" + filename;
    return filename;
}

std::string sql(const char* head, const char* tail)
{
    return std::string(head) + tail;
}

} // namespace

ScriptStore::ScriptStore(Db& db, fs::path scriptsRoot, std::vector<std::string> allowedExtensions)
    : m_db(db),
      m_root(std::move(scriptsRoot)),
      m_allowedExtensions(std::move(allowedExtensions))
{
}

bool ScriptStore::ensureSchema()
{
    std::lock_guard<std::mutex> lock(m_mu);
    if (!m_db.exec(kSchemaSql)) {
        Logger::error("ScriptStore: schema creation failed: " + m_db.last_error());
        return false;
    }
    return true;
}

void ScriptStore::dbFail_(const std::string& what) const
{
    const std::string msg = what + ": " + m_db.last_error();
    Logger::error("ScriptStore: " + msg);
    throw StoreError(ErrorCode::DatabaseError, msg);
}

// ---------------- 校验 ----------------

void ScriptStore::checkFilename_(const std::string& filename) const
{
    if (filename.empty() || filename == "." || filename == ".." ||
        filename.find('/') != std::string::npos ||
        filename.find('\\') != std::string::npos ||
        filename.find('\0') != std::string::npos) {
        throw StoreError(ErrorCode::InvalidFilename,
                         "Invalid script filename '" + filename + "'",
                         {{"filename", filename}});
    }

    const fs::path p(filename);
    const std::string ext = p.extension().string();
    const bool allowed = std::find(m_allowedExtensions.begin(), m_allowedExtensions.end(), ext)
                         != m_allowedExtensions.end();
    if (!allowed || p.stem().empty()) {
        std::string list;
        for (const auto& e : m_allowedExtensions) {
            if (!list.empty()) list += ", ";
            list += e;
        }
        throw StoreError(ErrorCode::InvalidFilename,
                         "Script filename must have one of the extensions: " + list,
                         {{"filename", filename}});
    }
}

void ScriptStore::checkFolderName_(const std::string& name)
{
    if (utils::trim(name).empty() || name == "." || name == ".." ||
        name.find('/') != std::string::npos ||
        name.find('\\') != std::string::npos) {
        throw StoreError(ErrorCode::InvalidFolderName,
                         "Invalid folder name '" + name + "'",
                         {{"name", name}});
    }
}

void ScriptStore::checkContent_(const std::string& content)
{
    const exec::ValidationVerdict v = exec::ScriptValidator::validate(content);
    if (v.valid) return;

    const json details = {{"validation_code", exec::ValidationCodeToString(v.code)}};
    switch (v.code) {
        case exec::ValidationCode::MissingEntryPoint:
        case exec::ValidationCode::BadSignature:
        case exec::ValidationCode::BadParameterType:
            throw StoreError(ErrorCode::ScriptMissingMain, v.message, details);
        case exec::ValidationCode::SyntaxInvalid:
            throw StoreError(ErrorCode::InvalidScriptContent,
                             "Script validation failed: " + v.message, details);
        default:
            throw StoreError(ErrorCode::ValidationError,
                             "Script validation failed: " + v.message, details);
    }
}

// ---------------- 查询 ----------------

std::optional<Folder> ScriptStore::folderById_(std::int64_t id) const
{
    const std::string q = sql(kFolderColumns, "WHERE id = ?;");
    Statement st(m_db.handle(), q.c_str());
    if (!st.ok()) dbFail_("SELECT folder prepare failed");
    st.bind(1, id);
    if (st.step() == SQLITE_ROW) return readFolder(st);
    return std::nullopt;
}

std::optional<Script> ScriptStore::scriptById_(std::int64_t id) const
{
    const std::string q = sql(kScriptColumns, "WHERE id = ?;");
    Statement st(m_db.handle(), q.c_str());
    if (!st.ok()) dbFail_("SELECT script prepare failed");
    st.bind(1, id);
    if (st.step() == SQLITE_ROW) return readScript(st);
    return std::nullopt;
}

std::optional<Script> ScriptStore::scriptByLogicalPath_(const std::string& logicalPath) const
{
    const std::string q = sql(kScriptColumns, "WHERE logical_path = ?;");
    Statement st(m_db.handle(), q.c_str());
    if (!st.ok()) dbFail_("SELECT script prepare failed");
    st.bind(1, logicalPath);
    if (st.step() == SQLITE_ROW) return readScript(st);
    return std::nullopt;
}

std::vector<Folder> ScriptStore::allFolders_() const
{
    const std::string q = sql(kFolderColumns, "ORDER BY path;");
    Statement st(m_db.handle(), q.c_str());
    if (!st.ok()) dbFail_("SELECT folders prepare failed");
    std::vector<Folder> out;
    while (st.step() == SQLITE_ROW) out.push_back(readFolder(st));
    return out;
}

std::vector<Script> ScriptStore::allScripts_() const
{
    const std::string q = sql(kScriptColumns, "ORDER BY logical_path;");
    Statement st(m_db.handle(), q.c_str());
    if (!st.ok()) dbFail_("SELECT scripts prepare failed");
    std::vector<Script> out;
    while (st.step() == SQLITE_ROW) out.push_back(readScript(st));
    return out;
}

std::optional<Folder> ScriptStore::getFolder(std::int64_t id) const
{
    std::lock_guard<std::mutex> lock(m_mu);
    return folderById_(id);
}

std::optional<Script> ScriptStore::getScript(std::int64_t id) const
{
    std::lock_guard<std::mutex> lock(m_mu);
    return scriptById_(id);
}

std::optional<Script> ScriptStore::findByLogicalPath(const std::string& logicalPath) const
{
    std::lock_guard<std::mutex> lock(m_mu);
    return scriptByLogicalPath_(logicalPath);
}

// ---------------- 文件 ----------------

bool ScriptStore::storageNameTaken_(const std::string& storageFilename) const
{
    Statement st(m_db.handle(), "SELECT 1 FROM scripts WHERE storage_filename = ?;");
    if (!st.ok()) dbFail_("SELECT storage_filename prepare failed");
    st.bind(1, storageFilename);
    return st.step() == SQLITE_ROW;
}

// name.py 已被占用时依次尝试 name_1.py, name_2.py ...
std::string ScriptStore::uniqueStorageName_(const std::string& filename) const
{
    const fs::path p(filename);
    const std::string stem = p.stem().string();
    const std::string ext = p.extension().string();

    std::string candidate = filename;
    std::error_code ec;
    for (int counter = 1; fs::exists(m_root / candidate, ec) || storageNameTaken_(candidate); ++counter) {
        candidate = stem + "_" + std::to_string(counter) + ext;
    }
    if (candidate != filename) {
        Logger::warn("ScriptStore: file '" + filename + "' exists, storing as '" + candidate + "'");
    }
    return candidate;
}

// 先写临时文件再 rename，读者不会看到写了一半的脚本
void ScriptStore::writeFile_(const std::string& storageFilename, const std::string& content) const
{
    std::error_code ec;
    fs::create_directories(m_root, ec);
    if (ec) {
        throw StoreError(ErrorCode::FileSystemError,
                         "cannot create scripts directory " + m_root.string() + ": " + ec.message());
    }

    const fs::path target = m_root / storageFilename;
    const fs::path tmp = m_root / ("." + storageFilename + ".tmp");
    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
        ofs.close();
        if (!ofs) {
            fs::remove(tmp, ec);
            throw StoreError(ErrorCode::FileSystemError,
                             "cannot write script file " + target.string(),
                             {{"storage_filename", storageFilename}});
        }
    }
    fs::rename(tmp, target, ec);
    if (ec) {
        const std::string reason = ec.message();
        fs::remove(tmp, ec);
        throw StoreError(ErrorCode::FileSystemError,
                         "cannot replace script file " + target.string() + ": " + reason,
                         {{"storage_filename", storageFilename}});
    }
}

void ScriptStore::removeFile_(const std::string& storageFilename) const
{
    std::error_code ec;
    fs::remove(m_root / storageFilename, ec);
    if (ec) {
        Logger::warn("ScriptStore: failed to delete " + (m_root / storageFilename).string() +
                     ": " + ec.message());
    }
}

// ---------------- 文件夹 ----------------

/**
 * @brief 创建文件夹（只写数据库）
 * @param name 文件夹名，不能包含 '/'
 * @param parentId 父文件夹，std::nullopt 表示根
 */
Folder ScriptStore::createFolder(const std::string& name, std::optional<std::int64_t> parentId)
{
    checkFolderName_(name);
    std::lock_guard<std::mutex> lock(m_mu);

    std::string path = name;
    if (parentId) {
        auto parent = folderById_(*parentId);
        if (!parent) {
            throw StoreError(ErrorCode::ParentFolderNotFound,
                             "Parent folder with id " + std::to_string(*parentId) + " not found",
                             {{"parent_id", *parentId}});
        }
        path = parent->path + "/" + name;
    }

    {
        Statement st(m_db.handle(), "SELECT 1 FROM folders WHERE path = ?;");
        if (!st.ok()) dbFail_("SELECT folder path prepare failed");
        st.bind(1, path);
        if (st.step() == SQLITE_ROW) {
            throw StoreError(ErrorCode::FolderAlreadyExists,
                             "Folder '" + path + "' already exists",
                             {{"path", path}});
        }
    }

    Folder f;
    f.name = name;
    f.path = path;
    f.parentId = parentId;
    f.createdAtMs = f.updatedAtMs = utils::now_millis();

    Statement st(m_db.handle(),
                 "INSERT INTO folders (name, path, parent_id, created_at_ms, updated_at_ms) "
                 "VALUES (?,?,?,?,?);");
    if (!st.ok()) dbFail_("INSERT folder prepare failed");
    st.bind(1, f.name);
    st.bind(2, f.path);
    st.bind(3, f.parentId);
    st.bind(4, f.createdAtMs);
    st.bind(5, f.updatedAtMs);
    if (st.step() != SQLITE_DONE) dbFail_("INSERT folder step failed");
    f.id = m_db.last_insert_id();

    Logger::info("Folder created: id=" + std::to_string(f.id) + " path=" + f.path);
    return f;
}

void ScriptStore::deleteFolder(std::int64_t id)
{
    std::lock_guard<std::mutex> lock(m_mu);

    auto folder = folderById_(id);
    if (!folder) {
        throw StoreError(ErrorCode::FolderNotFound,
                         "Folder with id " + std::to_string(id) + " not found",
                         {{"folder_id", id}});
    }

    std::vector<std::string> files;
    {
        const std::string q = std::string(kSubtreeCte) +
            "SELECT storage_filename FROM scripts WHERE folder_id IN (SELECT id FROM subtree);";
        Statement st(m_db.handle(), q.c_str());
        if (!st.ok()) dbFail_("SELECT folder scripts prepare failed");
        st.bind(1, id);
        while (st.step() == SQLITE_ROW) files.push_back(st.column_text(0));
    }

    if (!m_db.exec("BEGIN;")) dbFail_("BEGIN failed");
    const std::string delScripts = std::string(kSubtreeCte) +
        "DELETE FROM scripts WHERE folder_id IN (SELECT id FROM subtree);";
    const std::string delFolders = std::string(kSubtreeCte) +
        "DELETE FROM folders WHERE id IN (SELECT id FROM subtree);";
    bool ok = true;
    for (const std::string* q : {&delScripts, &delFolders}) {
        Statement st(m_db.handle(), q->c_str());
        if (!st.ok()) { ok = false; break; }
        st.bind(1, id);
        if (st.step() != SQLITE_DONE) { ok = false; break; }
    }
    if (!ok) {
        const std::string err = m_db.last_error();
        if (!m_db.exec("ROLLBACK;")) Logger::warn("Store: rollback failed");
        throw StoreError(ErrorCode::DatabaseError, "delete folder failed: " + err,
                         {{"folder_id", id}});
    }
    if (!m_db.exec("COMMIT;")) {
        const std::string err = m_db.last_error();
        if (!m_db.exec("ROLLBACK;")) Logger::warn("Store: rollback failed");
        throw StoreError(ErrorCode::DatabaseError, "delete folder commit failed: " + err,
                         {{"folder_id", id}});
    }

    for (const auto& f : files) removeFile_(f);

    Logger::info("Folder deleted: id=" + std::to_string(id) + " path=" + folder->path +
                 " scripts=" + std::to_string(files.size()));
}

/**
 * @brief 文件夹改名（只改数据库，脚本文件不动）
 *
 * 子树内所有文件夹的 path 和脚本的 logical_path 把旧前缀替换为新前缀，
 * 在一个事务里完成。新路径已被占用时抛 FolderAlreadyExists。
 */
Folder ScriptStore::renameFolder(std::int64_t id, const std::string& name)
{
    checkFolderName_(name);
    std::lock_guard<std::mutex> lock(m_mu);

    auto folder = folderById_(id);
    if (!folder) {
        throw StoreError(ErrorCode::FolderNotFound,
                         "Folder with id " + std::to_string(id) + " not found",
                         {{"folder_id", id}});
    }

    std::string newPath = name;
    if (folder->parentId) {
        auto parent = folderById_(*folder->parentId);
        if (!parent) dbFail_("parent folder missing for folder " + std::to_string(id));
        newPath = parent->path + "/" + name;
    }
    if (newPath == folder->path) return *folder;

    {
        Statement st(m_db.handle(), "SELECT 1 FROM folders WHERE path = ?;");
        if (!st.ok()) dbFail_("SELECT folder path prepare failed");
        st.bind(1, newPath);
        if (st.step() == SQLITE_ROW) {
            throw StoreError(ErrorCode::FolderAlreadyExists,
                             "Folder '" + newPath + "' already exists",
                             {{"path", newPath}});
        }
    }

    const std::int64_t now = utils::now_millis();

    // ?1 = 文件夹 id, ?2 = 新前缀, ?3 = 旧前缀长度, ?4 = 时间戳
    const std::string moveFolders = std::string(kSubtreeCte) +
        "UPDATE folders SET path = ?2 || substr(path, ?3 + 1), updated_at_ms = ?4 "
        "WHERE id IN (SELECT id FROM subtree);";
    const std::string moveScripts = std::string(kSubtreeCte) +
        "UPDATE scripts SET logical_path = ?2 || substr(logical_path, ?3 + 1), updated_at_ms = ?4 "
        "WHERE folder_id IN (SELECT id FROM subtree);";

    if (!m_db.exec("BEGIN;")) dbFail_("BEGIN failed");
    bool ok = true;
    for (const std::string* q : {&moveFolders, &moveScripts}) {
        Statement st(m_db.handle(), q->c_str());
        if (!st.ok()) { ok = false; break; }
        st.bind(1, id);
        st.bind(2, newPath);
        st.bind(3, static_cast<std::int64_t>(folder->path.size()));
        st.bind(4, now);
        if (st.step() != SQLITE_DONE) { ok = false; break; }
    }
    if (ok) {
        Statement st(m_db.handle(), "UPDATE folders SET name = ? WHERE id = ?;");
        ok = st.ok();
        if (ok) {
            st.bind(1, name);
            st.bind(2, id);
            ok = st.step() == SQLITE_DONE;
        }
    }
    if (!ok || !m_db.exec("COMMIT;")) {
        const std::string err = m_db.last_error();
        if (!m_db.exec("ROLLBACK;")) Logger::warn("Store: rollback failed");
        throw StoreError(ErrorCode::DatabaseError, "rename folder failed: " + err,
                         {{"folder_id", id}});
    }

    Logger::info("Folder renamed: id=" + std::to_string(id) + " " + folder->path + " -> " + newPath);
    return *folderById_(id);
}

// ---------------- 脚本 ----------------

/**
 * @brief 新建脚本；同一逻辑路径已存在时需要 replace=true 才会覆盖
 *
 * 覆盖时保留原来的 storage_filename，只改内容和元数据。
 * 新建时如果根目录下已有同名文件，存储名改为 name_1.py、name_2.py ...
 */
Script ScriptStore::createScript(const NewScript& req)
{
    checkFilename_(req.filename);
    checkContent_(req.content);

    std::lock_guard<std::mutex> lock(m_mu);

    std::optional<Folder> folder;
    if (req.folderId) {
        folder = folderById_(*req.folderId);
        if (!folder) {
            throw StoreError(ErrorCode::FolderNotFound,
                             "Folder with id " + std::to_string(*req.folderId) + " not found",
                             {{"folder_id", *req.folderId}});
        }
    }

    const std::string logicalPath = buildLogicalPath(req.filename, folder);
    const auto now = utils::now_millis();

    if (auto existing = scriptByLogicalPath_(logicalPath)) {
        if (!req.replace) {
            throw StoreError(ErrorCode::ScriptExistsReplaceRequired,
                             "Script '" + logicalPath + "' already exists. Use replace=true to replace it.",
                             {{"logical_path", logicalPath}, {"script_id", existing->id}});
        }

        writeFile_(existing->storageFilename, req.content);

        Statement st(m_db.handle(),
                     "UPDATE scripts SET filename = ?, display_name = ?, description = ?, "
                     "updated_at_ms = ? WHERE id = ?;");
        if (!st.ok()) dbFail_("UPDATE script prepare failed");
        st.bind(1, req.filename);
        st.bind(2, req.displayName);
        st.bind(3, req.description);
        st.bind(4, static_cast<std::int64_t>(now));
        st.bind(5, existing->id);
        if (st.step() != SQLITE_DONE) dbFail_("UPDATE script step failed");

        Logger::info("Script replaced: id=" + std::to_string(existing->id) + " path=" + logicalPath);
        return *scriptById_(existing->id);
    }

    Script s;
    s.filename = req.filename;
    s.storageFilename = uniqueStorageName_(req.filename);
    s.logicalPath = logicalPath;
    s.displayName = req.displayName;
    s.description = req.description;
    s.folderId = req.folderId;
    s.createdAtMs = s.updatedAtMs = now;

    writeFile_(s.storageFilename, req.content);

    Statement st(m_db.handle(),
                 "INSERT INTO scripts (filename, storage_filename, logical_path, display_name, "
                 "description, folder_id, created_at_ms, updated_at_ms) VALUES (?,?,?,?,?,?,?,?);");
    bool ok = st.ok();
    if (ok) {
        st.bind(1, s.filename);
        st.bind(2, s.storageFilename);
        st.bind(3, s.logicalPath);
        st.bind(4, s.displayName);
        st.bind(5, s.description);
        st.bind(6, s.folderId);
        st.bind(7, s.createdAtMs);
        st.bind(8, s.updatedAtMs);
        ok = st.step() == SQLITE_DONE;
    }
    if (!ok) {
        removeFile_(s.storageFilename);
        dbFail_("INSERT script failed");
    }
    s.id = m_db.last_insert_id();

    Logger::info("Script created: id=" + std::to_string(s.id) + " path=" + s.logicalPath +
                 " storage=" + s.storageFilename);
    return s;
}

Script ScriptStore::updateScript(std::int64_t id, const ScriptPatch& patch)
{
    if (patch.filename) checkFilename_(*patch.filename);

    std::lock_guard<std::mutex> lock(m_mu);

    auto script = scriptById_(id);
    if (!script) {
        throw StoreError(ErrorCode::ScriptNotFound,
                         "Script with id " + std::to_string(id) + " not found",
                         {{"script_id", id}});
    }

    if (patch.displayName) script->displayName = *patch.displayName;
    if (patch.description) script->description = *patch.description;

    // 改名只改逻辑路径，磁盘上的存储文件名不变
    if (patch.filename) {
        std::optional<Folder> folder;
        if (script->folderId) folder = folderById_(*script->folderId);
        const std::string newPath = buildLogicalPath(*patch.filename, folder);

        auto other = scriptByLogicalPath_(newPath);
        if (other && other->id != id) {
            throw StoreError(ErrorCode::ScriptAlreadyExists,
                             "Script '" + newPath + "' already exists",
                             {{"logical_path", newPath}});
        }
        script->filename = *patch.filename;
        script->logicalPath = newPath;
    }
    script->updatedAtMs = utils::now_millis();

    Statement st(m_db.handle(),
                 "UPDATE scripts SET filename = ?, logical_path = ?, display_name = ?, "
                 "description = ?, updated_at_ms = ? WHERE id = ?;");
    if (!st.ok()) dbFail_("UPDATE script prepare failed");
    st.bind(1, script->filename);
    st.bind(2, script->logicalPath);
    st.bind(3, script->displayName);
    st.bind(4, script->description);
    st.bind(5, script->updatedAtMs);
    st.bind(6, id);
    if (st.step() != SQLITE_DONE) dbFail_("UPDATE script step failed");

    Logger::info("Script updated: id=" + std::to_string(id) + " path=" + script->logicalPath);
    return *script;
}

Script ScriptStore::updateScriptContent(std::int64_t id, const std::string& content)
{
    checkContent_(content);

    std::lock_guard<std::mutex> lock(m_mu);

    auto script = scriptById_(id);
    if (!script) {
        throw StoreError(ErrorCode::ScriptNotFound,
                         "Script with id " + std::to_string(id) + " not found",
                         {{"script_id", id}});
    }

    writeFile_(script->storageFilename, content);
    script->updatedAtMs = utils::now_millis();

    Statement st(m_db.handle(), "UPDATE scripts SET updated_at_ms = ? WHERE id = ?;");
    if (!st.ok()) dbFail_("UPDATE script prepare failed");
    st.bind(1, script->updatedAtMs);
    st.bind(2, id);
    if (st.step() != SQLITE_DONE) dbFail_("UPDATE script step failed");

    Logger::info("Script content updated: id=" + std::to_string(id) + " path=" + script->logicalPath);
    return *script;
}

void ScriptStore::deleteScript(std::int64_t id)
{
    std::lock_guard<std::mutex> lock(m_mu);

    auto script = scriptById_(id);
    if (!script) {
        throw StoreError(ErrorCode::ScriptNotFound,
                         "Script with id " + std::to_string(id) + " not found",
                         {{"script_id", id}});
    }

    Statement st(m_db.handle(), "DELETE FROM scripts WHERE id = ?;");
    if (!st.ok()) dbFail_("DELETE script prepare failed");
    st.bind(1, id);
    if (st.step() != SQLITE_DONE) dbFail_("DELETE script step failed");

    removeFile_(script->storageFilename);
    Logger::info("Script deleted: id=" + std::to_string(id) + " path=" + script->logicalPath);
}

std::string ScriptStore::getScriptContent(std::int64_t id) const
{
    std::lock_guard<std::mutex> lock(m_mu);

    auto script = scriptById_(id);
    if (!script) {
        throw StoreError(ErrorCode::ScriptNotFound,
                         "Script with id " + std::to_string(id) + " not found",
                         {{"script_id", id}});
    }

    std::ifstream ifs(m_root / script->storageFilename, std::ios::binary);
    if (!ifs) {
        throw StoreError(ErrorCode::FileSystemError,
                         "Script file '" + script->storageFilename + "' not found in filesystem",
                         {{"script_id", id}});
    }
    std::ostringstream oss;
    oss << ifs.rdbuf();
    return oss.str();
}

json ScriptStore::tree() const
{
    std::lock_guard<std::mutex> lock(m_mu);

    const std::vector<Folder> folders = allFolders_();
    const std::vector<Script> scripts = allScripts_();

    std::unordered_map<std::int64_t, std::vector<const Folder*>> children;
    std::unordered_map<std::int64_t, std::vector<const Script*>> byFolder;
    std::vector<const Folder*> rootFolders;
    json rootScripts = json::array();

    for (const auto& f : folders) {
        if (f.parentId) children[*f.parentId].push_back(&f);
        else rootFolders.push_back(&f);
    }
    for (const auto& s : scripts) {
        if (s.folderId) byFolder[*s.folderId].push_back(&s);
        else rootScripts.push_back(script_to_json(s));
    }

    std::function<json(const Folder&)> build = [&](const Folder& f) {
        json item;
        item["folder"] = folder_to_json(f);
        item["scripts"] = json::array();
        item["subfolders"] = json::array();
        for (const Script* s : byFolder[f.id]) item["scripts"].push_back(script_to_json(*s));
        for (const Folder* sub : children[f.id]) item["subfolders"].push_back(build(*sub));
        return item;
    };

    json out;
    out["root_folders"] = json::array();
    for (const Folder* f : rootFolders) out["root_folders"].push_back(build(*f));
    out["root_scripts"] = std::move(rootScripts);
    return out;
}

// ---------------- IScriptResolver ----------------

/**
 * @brief 逻辑路径 -> 存储文件
 *
 * 只接受数据库里登记过的逻辑路径；解析后的文件必须直接位于脚本根目录下
 * （符号链接指向外部的也拒绝）。文件不存在时仍返回位置，sourceText 为空，
 * 由执行器报告 "not found in filesystem"。
 */
std::optional<ResolvedScript> ScriptStore::resolve(const std::string& logicalPath) const
{
    std::string key = logicalPath;
    while (!key.empty() && key.front() == '/') key.erase(0, 1);
    if (key.empty()) return std::nullopt;

    std::optional<Script> script;
    {
        std::lock_guard<std::mutex> lock(m_mu);
        script = scriptByLogicalPath_(key);
    }
    if (!script) return std::nullopt;

    const fs::path location = m_root / script->storageFilename;

    std::error_code ec;
    const fs::path canonRoot = fs::weakly_canonical(m_root, ec);
    if (ec) return std::nullopt;
    const fs::path canonLoc = fs::weakly_canonical(location, ec);
    if (ec || canonLoc.parent_path() != canonRoot) {
        Logger::warn("ScriptStore: '" + key + "' resolves outside scripts root, rejected");
        return std::nullopt;
    }

    ResolvedScript r;
    r.logicalPath = key;
    r.storageLocation = canonLoc;
    std::ifstream ifs(canonLoc, std::ios::binary);
    if (ifs) {
        std::ostringstream oss;
        oss << ifs.rdbuf();
        r.sourceText = oss.str();
    }
    return r;
}

} // namespace scripthub::scripts
