#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace scripthub::scripts {

using json = nlohmann::json;

// 脚本管理的错误码，HTTP 层按它选状态码
enum class ErrorCode {
    ValidationError,
    InvalidFilename,
    InvalidScriptContent,
    ScriptMissingMain,
    InvalidFolderName,
    FolderNotFound,
    ScriptNotFound,
    ParentFolderNotFound,
    FolderAlreadyExists,
    ScriptAlreadyExists,
    ScriptExistsReplaceRequired,
    FileSystemError,
    DatabaseError,
};

inline std::string ErrorCodeToString(ErrorCode c)
{
    switch (c) {
        case ErrorCode::ValidationError:             return "VALIDATION_ERROR";
        case ErrorCode::InvalidFilename:             return "INVALID_FILENAME";
        case ErrorCode::InvalidScriptContent:        return "INVALID_SCRIPT_CONTENT";
        case ErrorCode::ScriptMissingMain:           return "SCRIPT_MISSING_MAIN";
        case ErrorCode::InvalidFolderName:           return "INVALID_FOLDER_NAME";
        case ErrorCode::FolderNotFound:              return "FOLDER_NOT_FOUND";
        case ErrorCode::ScriptNotFound:              return "SCRIPT_NOT_FOUND";
        case ErrorCode::ParentFolderNotFound:        return "PARENT_FOLDER_NOT_FOUND";
        case ErrorCode::FolderAlreadyExists:         return "FOLDER_ALREADY_EXISTS";
        case ErrorCode::ScriptAlreadyExists:         return "SCRIPT_ALREADY_EXISTS";
        case ErrorCode::ScriptExistsReplaceRequired: return "SCRIPT_EXISTS_REPLACE_REQUIRED";
        case ErrorCode::FileSystemError:             return "FILE_SYSTEM_ERROR";
        case ErrorCode::DatabaseError:               return "DATABASE_ERROR";
        default:                                     return "UNKNOWN";
    }
}

// 400 校验 / 404 不存在 / 409 冲突 / 500 存储
inline int ErrorCodeToHttpStatus(ErrorCode c)
{
    switch (c) {
        case ErrorCode::FolderNotFound:
        case ErrorCode::ScriptNotFound:
        case ErrorCode::ParentFolderNotFound:
            return 404;
        case ErrorCode::FolderAlreadyExists:
        case ErrorCode::ScriptAlreadyExists:
        case ErrorCode::ScriptExistsReplaceRequired:
            return 409;
        case ErrorCode::FileSystemError:
        case ErrorCode::DatabaseError:
            return 500;
        default:
            return 400;
    }
}

class StoreError : public std::runtime_error {
public:
    StoreError(ErrorCode code, const std::string& msg, json details = json::object())
        : std::runtime_error(msg), m_code(code), m_details(std::move(details)) {}

    ErrorCode code() const { return m_code; }
    const json& details() const { return m_details; }

private:
    ErrorCode m_code;
    json m_details;
};

struct Folder {
    std::int64_t id{0};
    std::string name;
    std::string path;                       // "geology/sub"，不带前导 '/'
    std::optional<std::int64_t> parentId;
    std::int64_t createdAtMs{0};
    std::int64_t updatedAtMs{0};
};

struct Script {
    std::int64_t id{0};
    std::string filename;                   // 用户看到的文件名
    std::string storageFilename;            // 脚本根目录下的真实文件名
    std::string logicalPath;                // 执行时使用的路径
    std::string displayName;
    std::string description;
    std::optional<std::int64_t> folderId;
    std::int64_t createdAtMs{0};
    std::int64_t updatedAtMs{0};
};

inline json folder_to_json(const Folder& f)
{
    json j;
    j["id"] = f.id;
    j["name"] = f.name;
    j["path"] = f.path;
    j["parent_id"] = f.parentId ? json(*f.parentId) : json(nullptr);
    j["created_at_ms"] = f.createdAtMs;
    j["updated_at_ms"] = f.updatedAtMs;
    return j;
}

inline json script_to_json(const Script& s)
{
    json j;
    j["id"] = s.id;
    j["filename"] = s.filename;
    j["storage_filename"] = s.storageFilename;
    j["logical_path"] = s.logicalPath;
    j["display_name"] = s.displayName;
    j["description"] = s.description;
    j["folder_id"] = s.folderId ? json(*s.folderId) : json(nullptr);
    j["created_at_ms"] = s.createdAtMs;
    j["updated_at_ms"] = s.updatedAtMs;
    return j;
}

} // namespace scripthub::scripts
