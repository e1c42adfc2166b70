#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <sqlite3.h>

namespace scripthub {

// sqlite3 连接；由 ServerApp 持有，传给各个 store
class Db {
public:
    Db() = default;
    ~Db();

    Db(const Db&) = delete;
    Db& operator=(const Db&) = delete;

    // 打开数据库：path 由 Config 决定，":memory:" 用于测试
    bool open(const std::string& path);
    void close();
    bool is_open() const { return m_db != nullptr; }

    // 执行无结果的 SQL（建表、事务控制等）
    bool exec(const std::string& sql);

    sqlite3* handle() const { return m_db; }

    std::string last_error() const;

    std::int64_t last_insert_id() const;

private:
    sqlite3* m_db = nullptr;
};

// prepared statement，离开作用域自动 finalize
class Statement {
public:
    Statement(sqlite3* db, const char* sql);
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    bool ok() const { return m_stmt != nullptr; }

    // 下标从 1 开始
    void bind(int idx, const std::string& v);
    void bind(int idx, std::int64_t v);
    void bind(int idx, const std::optional<std::int64_t>& v);
    void bind_null(int idx);

    // 返回 SQLITE_ROW / SQLITE_DONE / 错误码
    int step();

    // 下标从 0 开始
    std::string column_text(int col) const;
    std::int64_t column_int64(int col) const;
    std::optional<std::int64_t> column_opt_int64(int col) const;

private:
    sqlite3_stmt* m_stmt = nullptr;
};

} // namespace scripthub
