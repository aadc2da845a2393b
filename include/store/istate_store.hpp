#pragma once

#include "lifecycle/error_lifecycle.hpp"
#include "monitor/monitor_types.hpp"
#include "notify/notification_types.hpp"
#include "routing/routing_types.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace errorengine {

/// Outcome of applying one cycle's lifecycle diff
struct AppliedDiff {
    std::vector<ActiveError> created;   // With assigned ids, in diff order
    size_t resolved = 0;
    // Updated or resolved targets that were already resolved when the diff
    // landed (manual resolution racing the cycle); left untouched
    std::vector<ErrorId> stale;
};

/**
 * @brief Persistent state used by the orchestrator.
 *
 * Implementations throw std::runtime_error on storage failure. Every method
 * is safe to call concurrently; writes are scoped to one query's records.
 */
class IStateStore {
public:
    virtual ~IStateStore() = default;

    // ---- Query definitions ------------------------------------------------

    /// Insert (id == 0, id assigned) or update definition fields. Runtime
    /// state (last check, lock, totals) is never overwritten here.
    virtual QueryId save_query(const MonitoredQuery& query) = 0;
    [[nodiscard]] virtual std::optional<MonitoredQuery> get_query(QueryId id) const = 0;
    [[nodiscard]] virtual std::optional<MonitoredQuery> find_query_by_name(const std::string& name) const = 0;
    [[nodiscard]] virtual std::vector<MonitoredQuery> list_queries() const = 0;
    /// Removes the query with its rules, errors and log
    virtual bool delete_query(QueryId id) = 0;

    /// Replace the query's rule set; ids are (re)assigned in list order
    virtual void replace_rules(QueryId query_id, const std::vector<RoutingRule>& rules) = 0;
    [[nodiscard]] virtual std::vector<RoutingRule> get_rules(QueryId query_id) const = 0;

    // ---- Errors -----------------------------------------------------------

    [[nodiscard]] virtual std::vector<ActiveError> unresolved_errors(QueryId query_id) const = 0;
    /// Unresolved errors of one query, or of all queries
    [[nodiscard]] virtual std::vector<ActiveError> list_active_errors(std::optional<QueryId> query_id) const = 0;
    [[nodiscard]] virtual std::optional<ActiveError> get_error(ErrorId id) const = 0;

    /**
     * @brief Apply one cycle's lifecycle diff atomically.
     *
     * Targets already resolved are skipped and reported as stale. A target
     * that is missing or belongs to another query is a storage error.
     */
    virtual AppliedDiff apply_diff(QueryId query_id, const LifecycleDiff& diff) = 0;

    /// false when the error does not exist or is already resolved
    virtual bool resolve_error(ErrorId id, TimePoint at) = 0;

    /// NEW -> notified; REMINDER -> reminder_count + 1. Both stamp last_notified_at.
    virtual void mark_notified(const std::vector<ErrorId>& ids, NotificationKind kind, TimePoint at) = 0;

    // ---- Runtime state ----------------------------------------------------

    /// Conditional set of locked_at; a marker older than ttl is stale
    virtual bool try_lock_query(QueryId id, TimePoint now, std::chrono::seconds ttl) = 0;
    virtual void unlock_query(QueryId id) = 0;
    /// Startup recovery; returns how many markers were cleared
    virtual size_t clear_all_locks() = 0;

    virtual void record_check(QueryId id, TimePoint checked_at,
                              size_t new_errors, size_t notifications_sent) = 0;

    // ---- Execution log ----------------------------------------------------

    virtual void append_execution(const ExecutionLogEntry& entry) = 0;
    /// Newest first
    [[nodiscard]] virtual std::vector<ExecutionLogEntry> recent_executions(
        std::optional<QueryId> query_id, size_t limit) const = 0;
};

} // namespace errorengine
