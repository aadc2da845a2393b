#pragma once

#include "store/istate_store.hpp"

#include <map>
#include <mutex>
#include <unordered_map>

namespace errorengine {

/**
 * @brief Non-persistent store (tests, `type = "memory"`).
 */
class MemoryStore : public IStateStore {
public:
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

    /// All errors including resolved ones
    [[nodiscard]] std::vector<ActiveError> all_errors(QueryId query_id) const;

private:
    MonitoredQuery& require_query(QueryId id);

    mutable std::mutex mutex_;
    std::map<QueryId, MonitoredQuery> queries_;
    std::unordered_map<QueryId, std::vector<RoutingRule>> rules_;
    std::map<ErrorId, ActiveError> errors_;
    std::vector<ExecutionLogEntry> log_;
    QueryId next_query_id_ = 1;
    ErrorId next_error_id_ = 1;
    int64_t next_rule_id_ = 1;
    int64_t next_log_id_ = 1;
};

} // namespace errorengine
