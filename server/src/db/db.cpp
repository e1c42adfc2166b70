#include "db.h"
#include "log/logger.h"

namespace scripthub {

Db::~Db()
{
    close();
}

bool Db::open(const std::string &path)
{
    if (m_db) {
        return true; // 已经打开
    }
    int rc = sqlite3_open(path.c_str(), &m_db);
    if (rc != SQLITE_OK) {
        Logger::error("Failed to open DB: " + std::string(sqlite3_errmsg(m_db)));
        sqlite3_close(m_db);
        m_db = nullptr;
        return false;
    }
    // 多个 HTTP 线程共用一个连接时，遇到锁稍等而不是立即失败
    sqlite3_busy_timeout(m_db, 5000);
    if (!exec("PRAGMA foreign_keys = ON;")) {
        Logger::warn("DB: foreign key enforcement unavailable");
    }
    Logger::info("DB opened at " + path);
    return true;
}

void Db::close()
{
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
        Logger::info("DB closed");
    }
}

bool Db::exec(const std::string &sql)
{
    char* errmsg = nullptr;
    int rc = sqlite3_exec(m_db, sql.c_str(), nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        std::string msg = errmsg ? errmsg : "";
        Logger::error("DB exec error: " + msg + " SQL: " + sql);
        if (errmsg) sqlite3_free(errmsg);
        return false;
    }
    return true;
}

std::string Db::last_error() const
{
    if (!m_db) return {};
    return sqlite3_errmsg(m_db);
}

std::int64_t Db::last_insert_id() const
{
    if (!m_db) return 0;
    return static_cast<std::int64_t>(sqlite3_last_insert_rowid(m_db));
}

// ---------------- Statement ----------------

Statement::Statement(sqlite3* db, const char* sql)
{
    if (sqlite3_prepare_v2(db, sql, -1, &m_stmt, nullptr) != SQLITE_OK) {
        Logger::error(std::string("prepare failed: ") + sqlite3_errmsg(db) + " SQL: " + sql);
        sqlite3_finalize(m_stmt);
        m_stmt = nullptr;
    }
}

Statement::~Statement()
{
    if (m_stmt) sqlite3_finalize(m_stmt);
}

void Statement::bind(int idx, const std::string& v)
{
    sqlite3_bind_text(m_stmt, idx, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
}

void Statement::bind(int idx, std::int64_t v)
{
    sqlite3_bind_int64(m_stmt, idx, static_cast<sqlite3_int64>(v));
}

void Statement::bind(int idx, const std::optional<std::int64_t>& v)
{
    if (v) bind(idx, *v);
    else bind_null(idx);
}

void Statement::bind_null(int idx)
{
    sqlite3_bind_null(m_stmt, idx);
}

int Statement::step()
{
    if (!m_stmt) return SQLITE_MISUSE;
    return sqlite3_step(m_stmt);
}

std::string Statement::column_text(int col) const
{
    const unsigned char* p = sqlite3_column_text(m_stmt, col);
    if (!p) return {};
    return std::string(reinterpret_cast<const char*>(p),
                       static_cast<size_t>(sqlite3_column_bytes(m_stmt, col)));
}

std::int64_t Statement::column_int64(int col) const
{
    return static_cast<std::int64_t>(sqlite3_column_int64(m_stmt, col));
}

std::optional<std::int64_t> Statement::column_opt_int64(int col) const
{
    if (sqlite3_column_type(m_stmt, col) == SQLITE_NULL) return std::nullopt;
    return column_int64(col);
}

} // namespace scripthub
