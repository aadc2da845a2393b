#pragma once

#include "core/error.hpp"
#include "monitor/monitor_types.hpp"
#include "notify/idispatcher.hpp"
#include "scheduler/execution_lock.hpp"
#include "source/source_registry.hpp"
#include "store/istate_store.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace errorengine {

struct OrchestratorConfig {
    std::chrono::seconds default_fetch_timeout{30};
    std::chrono::seconds lock_ttl{300};
};

/// Outcome of applying a whole set of query definitions
struct SyncReport {
    size_t created = 0;
    size_t updated = 0;
    size_t deactivated = 0;
    std::vector<std::string> errors;

    [[nodiscard]] bool ok() const { return errors.empty(); }
};

/**
 * @brief Runs monitoring cycles: eligibility, lock, fetch, diff, route,
 *        aggregate, dispatch, persist.
 *
 * Safe to call concurrently for different queries. For the same query the
 * execution lock admits exactly one cycle; a losing caller gets a SKIPPED
 * result with reason "already running".
 *
 * Every exception inside a cycle becomes an ERROR result. Dispatch
 * failures are logged and never roll back lifecycle changes.
 */
class Orchestrator {
public:
    Orchestrator(std::shared_ptr<IStateStore> store,
                 std::shared_ptr<SourceRegistry> sources,
                 std::shared_ptr<INotificationDispatcher> dispatcher,
                 OrchestratorConfig config = {});

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // ---- Execution ---------------------------------------------------------

    /// Scheduled path: skips without locking when the query is not eligible
    ExecutionResult maybe_run(QueryId id, TimePoint now);

    /// Manual path: bypasses eligibility, still takes the execution lock
    ExecutionResult run_now(QueryId id);
    ExecutionResult run_now(QueryId id, TimePoint now);

    // ---- Lifecycle queries -------------------------------------------------

    /// Force-resolve outside the diff. The key is re-created as new if it
    /// shows up again in a later fetch.
    Result<ActiveError> resolve_manually(ErrorId id);
    Result<ActiveError> resolve_manually(ErrorId id, TimePoint now);

    [[nodiscard]] std::vector<ActiveError> list_active_errors(std::optional<QueryId> query_id = std::nullopt) const;

    /// Soonest eligible run across active queries; nullopt when none can run
    [[nodiscard]] std::optional<NextRun> get_next_scheduled_run(TimePoint now) const;

    [[nodiscard]] Result<QueryStatus> query_status(QueryId id, TimePoint now) const;

    [[nodiscard]] std::vector<ExecutionLogEntry> recent_executions(
        std::optional<QueryId> query_id, size_t limit) const;

    [[nodiscard]] std::vector<MonitoredQuery> list_queries() const;

    // ---- Configuration -----------------------------------------------------

    /// Validate and persist a query with its rules. Matches an existing
    /// query by id, then by name; runtime state is preserved.
    Result<QueryId> upsert_query(const MonitoredQuery& query, const std::vector<RoutingRule>& rules);

    /// Apply a full set of definitions. Stored queries missing from the set
    /// are deactivated, never deleted.
    SyncReport sync_configuration(const std::vector<QueryDefinition>& definitions);

    /// Drop every lock marker left behind by a previous process
    size_t recover_locks();

    [[nodiscard]] const OrchestratorConfig& config() const { return config_; }
    [[nodiscard]] const ExecutionLockRegistry& locks() const { return locks_; }

private:
    // scheduled: re-check eligibility against the stored query once the lock is held
    ExecutionResult execute(const MonitoredQuery& query, TimePoint now, bool scheduled);
    ExecutionResult run_cycle(const MonitoredQuery& query, TimePoint now);

    /// Routes, aggregates and dispatches; fills the notification counters
    void notify(const MonitoredQuery& query,
                const std::vector<ActiveError>& created,
                const std::vector<ActiveError>& reminders,
                TimePoint now,
                ExecutionResult& result);

    void record_outcome(const ExecutionResult& result, bool persist);

    std::shared_ptr<IStateStore> store_;
    std::shared_ptr<SourceRegistry> sources_;
    std::shared_ptr<INotificationDispatcher> dispatcher_;
    OrchestratorConfig config_;

    ExecutionLockRegistry locks_;

    std::unordered_map<QueryId, ExecutionResult> last_outcomes_;
    mutable std::mutex outcomes_mutex_;
};

} // namespace errorengine
