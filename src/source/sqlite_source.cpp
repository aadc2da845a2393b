#include "source/sqlite_source.hpp"
#include "store/sqlite_db.hpp"

#include <format>
#include <memory>
#include <stdexcept>

namespace errorengine {

namespace {

struct Deadline {
    std::chrono::steady_clock::time_point at;
    bool expired = false;
};

int progress_callback(void* arg) {
    auto* deadline = static_cast<Deadline*>(arg);
    if (std::chrono::steady_clock::now() >= deadline->at) {
        deadline->expired = true;
        return 1;   // Interrupt
    }
    return 0;
}

} // anonymous namespace

SqliteSource::SqliteSource(SourceConfig config)
    : config_(std::move(config)) {}

FetchResult SqliteSource::fetch(const std::string& query_text, std::chrono::milliseconds timeout) {
    std::unique_ptr<SqliteDb> db;
    try {
        db = std::make_unique<SqliteDb>(config_.connection_string, SqliteDb::Mode::READ_ONLY);
        sqlite3_busy_timeout(db->handle(), timeout.count() > 0 ? static_cast<int>(timeout.count()) : 5000);
    } catch (const std::runtime_error& e) {
        return FetchResult::failure(SourceErrorKind::CONNECTION, e.what());
    }

    Deadline deadline{std::chrono::steady_clock::now() + timeout};
    if (timeout.count() > 0) {
        sqlite3_progress_handler(db->handle(), 1000, &progress_callback, &deadline);
    }

    try {
        SqliteStatement stmt(db->handle(), query_text);

        const int ncols = stmt.column_count();
        if (ncols == 0) {
            return FetchResult::failure(SourceErrorKind::QUERY, "Statement returned no result set");
        }

        std::vector<std::string> columns;
        columns.reserve(ncols);
        for (int c = 0; c < ncols; ++c) {
            columns.push_back(stmt.column_name(c));
        }

        std::vector<Row> rows;
        while (stmt.step()) {
            Row row;
            for (int c = 0; c < ncols; ++c) {
                switch (stmt.column_type(c)) {
                    case SQLITE_NULL:    row.set(columns[c], std::monostate{}); break;
                    case SQLITE_INTEGER: row.set(columns[c], stmt.int64(c)); break;
                    case SQLITE_FLOAT:   row.set(columns[c], stmt.real(c)); break;
                    default:             row.set(columns[c], stmt.text(c)); break;
                }
            }
            rows.push_back(std::move(row));
        }

        return FetchResult::ok(std::move(columns), std::move(rows));
    } catch (const std::runtime_error& e) {
        if (deadline.expired) {
            return FetchResult::failure(SourceErrorKind::TIMEOUT,
                std::format("query exceeded {}ms", timeout.count()));
        }
        return FetchResult::failure(SourceErrorKind::QUERY, e.what());
    }
}

} // namespace errorengine
