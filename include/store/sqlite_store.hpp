#pragma once

#include "store/istate_store.hpp"
#include "store/sqlite_db.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace errorengine {

/**
 * @brief SQLite-backed persistent store.
 *
 * One connection guarded by a mutex. Times are stored as epoch
 * milliseconds, lists and row snapshots as JSON text. Unresolved
 * signatures are unique per query via a partial unique index.
 *
 * Use ":memory:" as path for a throwaway database.
 */
class SqliteStore : public IStateStore {
public:
    explicit SqliteStore(const std::string& path);
    ~SqliteStore() override = default;

    QueryId save_query(const MonitoredQuery& query) override;
    [[nodiscard]] std::optional<MonitoredQuery> get_query(QueryId id) const override;
    [[nodiscard]] std::optional<MonitoredQuery> find_query_by_name(const std::string& name) const override;
    [[nodiscard]] std::vector<MonitoredQuery> list_queries() const override;
    bool delete_query(QueryId id) override;

    void replace_rules(QueryId query_id, const std::vector<RoutingRule>& rules) override;
    [[nodiscard]] std::vector<RoutingRule> get_rules(QueryId query_id) const override;

    [[nodiscard]] std::vector<ActiveError> unresolved_errors(QueryId query_id) const override;
    [[nodiscard]] std::vector<ActiveError> list_active_errors(std::optional<QueryId> query_id) const override;
    [[nodiscard]] std::optional<ActiveError> get_error(ErrorId id) const override;
    AppliedDiff apply_diff(QueryId query_id, const LifecycleDiff& diff) override;
    bool resolve_error(ErrorId id, TimePoint at) override;
    void mark_notified(const std::vector<ErrorId>& ids, NotificationKind kind, TimePoint at) override;

    bool try_lock_query(QueryId id, TimePoint now, std::chrono::seconds ttl) override;
    void unlock_query(QueryId id) override;
    size_t clear_all_locks() override;
    void record_check(QueryId id, TimePoint checked_at,
                      size_t new_errors, size_t notifications_sent) override;

    void append_execution(const ExecutionLogEntry& entry) override;
    [[nodiscard]] std::vector<ExecutionLogEntry> recent_executions(
        std::optional<QueryId> query_id, size_t limit) const override;

    /// Unresolved and resolved errors of a query, by id
    [[nodiscard]] std::vector<ActiveError> all_errors(QueryId query_id) const;

    [[nodiscard]] int schema_version() const;

private:
    void migrate();

    using Binder = std::function<void(SqliteStatement&)>;

    std::vector<MonitoredQuery> select_queries(const std::string& where, const Binder& bind) const;
    std::vector<ActiveError> select_errors(const std::string& where, const Binder& bind) const;

    std::unique_ptr<SqliteDb> db_;
    mutable std::mutex mutex_;
};

} // namespace errorengine
