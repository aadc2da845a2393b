#include "store/sqlite_db.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>

namespace errorengine {

namespace {

void throw_if(int rc, sqlite3* db, const char* what) {
    if (rc != SQLITE_OK) {
        throw std::runtime_error(std::format("{}: {}", what, sqlite3_errmsg(db)));
    }
}

} // anonymous namespace

// ============================================================================
// SqliteDb
// ============================================================================

SqliteDb::SqliteDb(std::string path, Mode mode)
    : path_(std::move(path)) {
    const int flags = mode == Mode::READ_ONLY
        ? SQLITE_OPEN_READONLY | SQLITE_OPEN_FULLMUTEX
        : SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;

    const int rc = sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error(std::format("open '{}': {}", path_, msg));
    }
}

SqliteDb::~SqliteDb() {
    if (db_) sqlite3_close(db_);
}

void SqliteDb::exec(const std::string& sql) {
    char* err = nullptr;
    const int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : "sqlite exec failed";
        sqlite3_free(err);
        throw std::runtime_error(msg);
    }
}

void SqliteDb::configure(int busy_timeout_ms) {
    // In-memory databases silently keep journal_mode=memory
    exec("PRAGMA journal_mode=WAL;");
    exec("PRAGMA synchronous=NORMAL;");
    exec("PRAGMA foreign_keys=ON;");
    throw_if(sqlite3_busy_timeout(db_, busy_timeout_ms), db_, "busy_timeout");
}

// ============================================================================
// SqliteStatement
// ============================================================================

SqliteStatement::SqliteStatement(sqlite3* db, const std::string& sql)
    : db_(db) {
    throw_if(sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr), db_, "sqlite prepare");
}

SqliteStatement::~SqliteStatement() {
    if (stmt_) sqlite3_finalize(stmt_);
}

SqliteStatement& SqliteStatement::bind(int idx, const std::string& value) {
    throw_if(sqlite3_bind_text(stmt_, idx, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT),
             db_, "sqlite bind");
    return *this;
}

SqliteStatement& SqliteStatement::bind(int idx, int64_t value) {
    throw_if(sqlite3_bind_int64(stmt_, idx, static_cast<sqlite3_int64>(value)), db_, "sqlite bind");
    return *this;
}

SqliteStatement& SqliteStatement::bind(int idx, double value) {
    throw_if(sqlite3_bind_double(stmt_, idx, value), db_, "sqlite bind");
    return *this;
}

SqliteStatement& SqliteStatement::bind_null(int idx) {
    throw_if(sqlite3_bind_null(stmt_, idx), db_, "sqlite bind");
    return *this;
}

bool SqliteStatement::step() {
    const int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw std::runtime_error(std::format("sqlite step: {}", sqlite3_errmsg(db_)));
}

void SqliteStatement::run() {
    while (step()) {}
}

void SqliteStatement::reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
}

std::string SqliteStatement::column_name(int col) const {
    const char* name = sqlite3_column_name(stmt_, col);
    return name ? name : "";
}

std::string SqliteStatement::text(int col) const {
    const unsigned char* t = sqlite3_column_text(stmt_, col);
    if (!t) return {};
    return std::string(reinterpret_cast<const char*>(t),
                       static_cast<size_t>(sqlite3_column_bytes(stmt_, col)));
}

std::optional<int64_t> SqliteStatement::optional_int64(int col) const {
    if (is_null(col)) return std::nullopt;
    return int64(col);
}

// ============================================================================
// SqliteTransaction
// ============================================================================

SqliteTransaction::SqliteTransaction(SqliteDb& db)
    : db_(db) {
    db_.exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
    if (committed_) return;
    try {
        db_.exec("ROLLBACK;");
    } catch (const std::exception& e) {
        utils::log::error(std::format("SQLite rollback failed: {}", e.what()));
    }
}

void SqliteTransaction::commit() {
    db_.exec("COMMIT;");
    committed_ = true;
}

} // namespace errorengine
