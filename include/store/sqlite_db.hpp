#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace errorengine {

/**
 * @brief Thin RAII wrapper around sqlite3*.
 *
 * All failures throw std::runtime_error carrying sqlite3_errmsg.
 */
class SqliteDb {
public:
    enum class Mode { READ_WRITE, READ_ONLY };

    explicit SqliteDb(std::string path, Mode mode = Mode::READ_WRITE);
    ~SqliteDb();

    SqliteDb(const SqliteDb&) = delete;
    SqliteDb& operator=(const SqliteDb&) = delete;

    [[nodiscard]] sqlite3* handle() const { return db_; }
    [[nodiscard]] const std::string& path() const { return path_; }

    /// Execute one or more statements without results (pragmas, DDL)
    void exec(const std::string& sql);

    /// WAL, foreign keys, busy timeout
    void configure(int busy_timeout_ms = 5000);

    [[nodiscard]] int64_t last_insert_rowid() const { return sqlite3_last_insert_rowid(db_); }
    [[nodiscard]] int changes() const { return sqlite3_changes(db_); }

private:
    sqlite3* db_ = nullptr;
    std::string path_;
};

/**
 * @brief Prepared statement, finalized on destruction.
 */
class SqliteStatement {
public:
    SqliteStatement(sqlite3* db, const std::string& sql);
    ~SqliteStatement();

    SqliteStatement(const SqliteStatement&) = delete;
    SqliteStatement& operator=(const SqliteStatement&) = delete;

    SqliteStatement& bind(int idx, const std::string& value);
    SqliteStatement& bind(int idx, const char* value) { return bind(idx, std::string(value)); }
    SqliteStatement& bind(int idx, int64_t value);
    SqliteStatement& bind(int idx, int value) { return bind(idx, static_cast<int64_t>(value)); }
    SqliteStatement& bind(int idx, bool value) { return bind(idx, static_cast<int64_t>(value ? 1 : 0)); }
    SqliteStatement& bind(int idx, double value);
    SqliteStatement& bind_null(int idx);
    SqliteStatement& bind(int idx, const std::optional<int64_t>& value) {
        return value ? bind(idx, *value) : bind_null(idx);
    }

    /// true while a row is available; throws on error
    bool step();

    /// Step to completion of a statement with no result rows
    void run();

    void reset();

    [[nodiscard]] int column_count() const { return sqlite3_column_count(stmt_); }
    [[nodiscard]] std::string column_name(int col) const;
    [[nodiscard]] int column_type(int col) const { return sqlite3_column_type(stmt_, col); }
    [[nodiscard]] bool is_null(int col) const { return column_type(col) == SQLITE_NULL; }

    [[nodiscard]] std::string text(int col) const;
    [[nodiscard]] int64_t int64(int col) const { return sqlite3_column_int64(stmt_, col); }
    [[nodiscard]] double real(int col) const { return sqlite3_column_double(stmt_, col); }
    [[nodiscard]] std::optional<int64_t> optional_int64(int col) const;

    [[nodiscard]] sqlite3_stmt* handle() const { return stmt_; }

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
};

/**
 * @brief BEGIN IMMEDIATE transaction; rolls back unless committed.
 */
class SqliteTransaction {
public:
    explicit SqliteTransaction(SqliteDb& db);
    ~SqliteTransaction();

    SqliteTransaction(const SqliteTransaction&) = delete;
    SqliteTransaction& operator=(const SqliteTransaction&) = delete;

    void commit();

private:
    SqliteDb& db_;
    bool committed_ = false;
};

} // namespace errorengine
