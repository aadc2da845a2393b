#include "scheduler/orchestrator.hpp"
#include "config/query_validator.hpp"
#include "lifecycle/error_lifecycle.hpp"
#include "notify/recipient_aggregator.hpp"
#include "notify/reminder_selector.hpp"
#include "routing/routing_engine.hpp"
#include "scheduler/schedule_policy.hpp"
#include "source/fetch_runner.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <unordered_set>

namespace errorengine {

namespace {

ExecutionResult error_result(QueryId id, std::string name, TimePoint now, std::string message) {
    ExecutionResult r;
    r.query_id = id;
    r.query_name = std::move(name);
    r.status = ExecutionStatus::ERROR;
    r.executed_at = now;
    r.error_message = std::move(message);
    return r;
}

ExecutionLogEntry to_log_entry(const ExecutionResult& r) {
    ExecutionLogEntry e;
    e.query_id = r.query_id;
    e.executed_at = r.executed_at;
    e.status = r.status;
    e.rows_returned = r.rows_returned;
    e.new_errors = r.new_errors;
    e.resolved_errors = r.resolved_errors;
    e.reminders_sent = r.reminders_sent;
    e.notifications_sent = r.notifications_sent;
    e.duration_ms = r.duration.count();
    e.message = r.error_message;
    return e;
}

} // anonymous namespace

Orchestrator::Orchestrator(std::shared_ptr<IStateStore> store,
                           std::shared_ptr<SourceRegistry> sources,
                           std::shared_ptr<INotificationDispatcher> dispatcher,
                           OrchestratorConfig config)
    : store_(std::move(store)),
      sources_(std::move(sources)),
      dispatcher_(std::move(dispatcher)),
      config_(config) {}

// ============================================================================
// Execution
// ============================================================================

ExecutionResult Orchestrator::maybe_run(QueryId id, TimePoint now) {
    std::optional<MonitoredQuery> query;
    try {
        query = store_->get_query(id);
    } catch (const std::exception& e) {
        auto r = error_result(id, {}, now, std::format("store error: {}", e.what()));
        utils::log::error(std::format("Query {}: {}", id, r.error_message));
        record_outcome(r, false);
        return r;
    }
    if (!query) {
        return error_result(id, {}, now, std::format("query {} not found", id));
    }

    const auto eligibility = SchedulePolicy::check(*query, now);
    if (!eligibility.eligible) {
        auto r = ExecutionResult::skipped(query->id, query->name, eligibility.reason);
        r.executed_at = now;
        utils::log::debug(std::format("Query '{}' skipped: {}", query->name, eligibility.reason));
        record_outcome(r, false);
        return r;
    }

    return execute(*query, now, true);
}

ExecutionResult Orchestrator::run_now(QueryId id) {
    return run_now(id, utils::now());
}

ExecutionResult Orchestrator::run_now(QueryId id, TimePoint now) {
    std::optional<MonitoredQuery> query;
    try {
        query = store_->get_query(id);
    } catch (const std::exception& e) {
        return error_result(id, {}, now, std::format("store error: {}", e.what()));
    }
    if (!query) {
        return error_result(id, {}, now, std::format("query {} not found", id));
    }

    utils::log::info(std::format("Query '{}': manual run requested", query->name));
    return execute(*query, now, false);
}

ExecutionResult Orchestrator::execute(const MonitoredQuery& query, TimePoint now, bool scheduled) {
    utils::Timer timer;
    ExecutionResult result;

    try {
        ScopedExecutionLock lock(locks_, store_.get(), query.id, now, config_.lock_ttl);
        if (!lock.acquired()) {
            result = ExecutionResult::skipped(query.id, query.name, std::string(keys::REASON_ALREADY_RUNNING));
            result.executed_at = now;
            utils::log::info(std::format("Query '{}' skipped: {}", query.name, result.error_message));
            record_outcome(result, true);
            return result;
        }

        if (scheduled) {
            // A cycle that finished between the eligibility check and the lock
            // has already moved last_check_at; judge the query as stored now
            const auto fresh = store_->get_query(query.id);
            const auto eligibility = fresh ? SchedulePolicy::check(*fresh, now)
                                           : Eligibility::skip("query was removed");
            if (!eligibility.eligible) {
                result = ExecutionResult::skipped(query.id, query.name, eligibility.reason);
                result.executed_at = now;
                utils::log::debug(std::format("Query '{}' skipped after locking: {}",
                                              query.name, eligibility.reason));
                record_outcome(result, false);
                return result;
            }
            result = run_cycle(*fresh, now);
        } else {
            result = run_cycle(query, now);
        }
    } catch (const std::exception& e) {
        result = error_result(query.id, query.name, now, e.what());
    }

    result.duration = timer.elapsed_ms();

    if (result.status == ExecutionStatus::SUCCESS) {
        utils::log::info(std::format(
            "Query '{}': {} rows, {} new, {} resolved, {} reminders, {} notifications ({}ms)",
            query.name, result.rows_returned, result.new_errors, result.resolved_errors,
            result.reminders_sent, result.notifications_sent, result.duration.count()));
    } else {
        utils::log::error(std::format("Query '{}' failed: {}", query.name, result.error_message));
    }

    record_outcome(result, true);
    return result;
}

ExecutionResult Orchestrator::run_cycle(const MonitoredQuery& query, TimePoint now) {
    ExecutionResult result;
    result.query_id = query.id;
    result.query_name = query.name;
    result.executed_at = now;

    // 1. Fetch
    auto adapter = sources_ ? sources_->get(query.source) : nullptr;
    if (!adapter) {
        return error_result(query.id, query.name, now,
                            std::format("unknown source '{}'", query.source));
    }

    const auto timeout = query.timeout.count() > 0 ? query.timeout : config_.default_fetch_timeout;
    const auto fetch = FetchRunner::run(adapter, query.query_text,
        std::chrono::duration_cast<std::chrono::milliseconds>(timeout));
    if (!fetch.success) {
        return error_result(query.id, query.name, now,
            std::format("source {} error: {}", source_error_kind_to_string(fetch.error_kind),
                        fetch.error_message));
    }
    result.rows_returned = fetch.rows.size();

    // 2. Diff against the unresolved set
    const auto current = store_->unresolved_errors(query.id);
    auto diff = ErrorLifecycleManager::diff(query, fetch.rows, current, now);
    if (diff.is_error()) {
        return error_result(query.id, query.name, now, diff.error_message());
    }

    // 3. Persist lifecycle changes atomically
    const auto applied = store_->apply_diff(query.id, diff.value());
    result.new_errors = applied.created.size();
    result.resolved_errors = applied.resolved;
    if (!applied.stale.empty()) {
        utils::log::info(std::format("Query '{}': {} error(s) resolved manually during the cycle left as is",
                                     query.name, applied.stale.size()));
    }

    // 4. Reminders among the errors that are still open
    const std::unordered_set<ErrorId> stale(applied.stale.begin(), applied.stale.end());
    std::vector<ActiveError> open;
    for (const auto& error : diff.value().updated) {
        if (!stale.contains(error.id)) open.push_back(error);
    }
    std::vector<ActiveError> reminders;
    for (const size_t i : ReminderSelector::select(open, query, now)) {
        reminders.push_back(open[i]);
    }

    // 5. Route, aggregate, dispatch
    notify(query, applied.created, reminders, now, result);

    store_->record_check(query.id, now, result.new_errors, result.notifications_sent);
    return result;
}

void Orchestrator::notify(const MonitoredQuery& query,
                          const std::vector<ActiveError>& created,
                          const std::vector<ActiveError>& reminders,
                          TimePoint now,
                          ExecutionResult& result) {
    if (created.empty() && reminders.empty()) return;

    if (!dispatcher_) {
        utils::log::warn(std::format("Query '{}': no dispatcher configured, notifications dropped",
                                     query.name));
        return;
    }

    const auto rules = query.routing_enabled ? store_->get_rules(query.id) : std::vector<RoutingRule>{};

    RecipientAggregator aggregator(query.aggregation);
    const auto add_all = [&](const std::vector<ActiveError>& errors, NotificationKind kind) {
        for (const auto& error : errors) {
            const auto decision = RoutingEngine::route_for_query(error.row, query, rules);
            if (!decision.should_notify()) {
                utils::log::debug(std::format("Query '{}': error {} [{}] routed to nobody",
                    query.name, error.id, error.signature.display()));
                continue;
            }
            aggregator.add(make_error_context(error), kind, decision.recipients);
        }
    };
    add_all(created, NotificationKind::NEW);
    add_all(reminders, NotificationKind::REMINDER);

    const QueryMetadata metadata{query.id, query.name, query.description};

    std::vector<ErrorId> notified_new;
    std::vector<ErrorId> notified_reminder;
    std::unordered_set<ErrorId> seen_new;
    std::unordered_set<ErrorId> seen_reminder;

    for (const auto& entry : aggregator.build()) {
        DeliveryResult delivery;
        try {
            delivery = dispatcher_->send(entry.destination, entry.kind, entry.errors, metadata);
        } catch (const std::exception& e) {
            delivery = DeliveryResult::failed(e.what());
        }

        if (!delivery.success) {
            utils::log::warn(std::format("Query '{}': {} notification to {} failed: {}",
                query.name, notification_kind_to_string(entry.kind),
                entry.destination.to_string(), delivery.message));
            continue;
        }

        ++result.notifications_sent;
        const bool is_new = entry.kind == NotificationKind::NEW;
        auto& ids = is_new ? notified_new : notified_reminder;
        auto& seen = is_new ? seen_new : seen_reminder;
        for (const auto& ctx : entry.errors) {
            if (seen.insert(ctx.error_id).second) ids.push_back(ctx.error_id);
        }
    }

    if (!notified_new.empty()) {
        store_->mark_notified(notified_new, NotificationKind::NEW, now);
    }
    if (!notified_reminder.empty()) {
        store_->mark_notified(notified_reminder, NotificationKind::REMINDER, now);
    }
    result.reminders_sent = notified_reminder.size();
}

void Orchestrator::record_outcome(const ExecutionResult& result, bool persist) {
    {
        std::lock_guard lock(outcomes_mutex_);
        last_outcomes_[result.query_id] = result;
    }
    if (!persist) return;

    try {
        store_->append_execution(to_log_entry(result));
    } catch (const std::exception& e) {
        utils::log::error(std::format("Query {}: failed to write execution log: {}",
                                      result.query_id, e.what()));
    }
}

// ============================================================================
// Lifecycle queries
// ============================================================================

Result<ActiveError> Orchestrator::resolve_manually(ErrorId id) {
    return resolve_manually(id, utils::now());
}

Result<ActiveError> Orchestrator::resolve_manually(ErrorId id, TimePoint now) {
    try {
        const auto error = store_->get_error(id);
        if (!error) {
            return Result<ActiveError>::error(ErrorCategory::STORE_ERROR,
                                              std::format("error {} not found", id));
        }
        if (error->resolved) {
            return Result<ActiveError>::error(ErrorCategory::CONFIGURATION_ERROR,
                                              std::format("error {} is already resolved", id));
        }
        if (!store_->resolve_error(id, now)) {
            return Result<ActiveError>::error(ErrorCategory::STORE_ERROR,
                                              std::format("error {} could not be resolved", id));
        }

        utils::log::info(std::format("Error {} [{}] resolved manually", id, error->signature.display()));
        auto resolved = store_->get_error(id);
        if (!resolved) {
            return Result<ActiveError>::error(ErrorCategory::STORE_ERROR,
                                              std::format("error {} vanished after resolve", id));
        }
        return Result<ActiveError>::ok(std::move(*resolved));
    } catch (const std::exception& e) {
        return Result<ActiveError>::error(ErrorCategory::STORE_ERROR, e.what());
    }
}

std::vector<ActiveError> Orchestrator::list_active_errors(std::optional<QueryId> query_id) const {
    return store_->list_active_errors(query_id);
}

std::optional<NextRun> Orchestrator::get_next_scheduled_run(TimePoint now) const {
    std::optional<NextRun> best;
    std::optional<TimePoint> best_at;

    for (const auto& query : store_->list_queries()) {
        const auto at = SchedulePolicy::next_eligible_time(query, now);
        if (!at) continue;
        if (!best_at || *at < *best_at) {
            best_at = at;
            const auto remaining = std::chrono::duration_cast<std::chrono::seconds>(*at - now);
            best = NextRun{query.id, query.name, std::max<int64_t>(0, remaining.count())};
        }
    }
    return best;
}

Result<QueryStatus> Orchestrator::query_status(QueryId id, TimePoint now) const {
    const auto query = store_->get_query(id);
    if (!query) {
        return Result<QueryStatus>::error(ErrorCategory::STORE_ERROR, std::format("query {} not found", id));
    }

    QueryStatus status;
    status.query_id = query->id;
    status.name = query->name;
    status.active = query->active;
    status.total_errors_found = query->total_errors_found;
    status.total_notifications_sent = query->total_notifications_sent;
    status.last_check_at = query->last_check_at;
    status.last_error_at = query->last_error_at;

    const auto open = store_->unresolved_errors(id);
    status.active_errors = open.size();
    status.pending_reminders = static_cast<size_t>(std::count_if(open.begin(), open.end(),
        [&](const ActiveError& e) { return ReminderSelector::is_due(e, *query, now); }));

    {
        std::lock_guard lock(outcomes_mutex_);
        const auto it = last_outcomes_.find(id);
        if (it != last_outcomes_.end()) status.last_outcome = it->second;
    }
    return Result<QueryStatus>::ok(std::move(status));
}

std::vector<ExecutionLogEntry> Orchestrator::recent_executions(
    std::optional<QueryId> query_id, size_t limit) const {
    return store_->recent_executions(query_id, limit);
}

std::vector<MonitoredQuery> Orchestrator::list_queries() const {
    return store_->list_queries();
}

// ============================================================================
// Configuration
// ============================================================================

Result<QueryId> Orchestrator::upsert_query(const MonitoredQuery& query,
                                           const std::vector<RoutingRule>& rules) {
    const auto adapter = sources_ ? sources_->get(query.source) : nullptr;
    std::optional<SourceType> source_type;
    if (adapter) source_type = adapter->type();

    auto errors = QueryValidator::validate(query, rules, source_type);
    if (!adapter && !utils::trim(query.source).empty()) {
        errors.push_back(std::format("unknown source '{}'", query.source));
    }
    if (!errors.empty()) {
        std::string msg = std::format("Query '{}' is invalid:", query.name);
        for (const auto& e : errors) msg += "\n  - " + e;
        return Result<QueryId>::error(ErrorCategory::CONFIGURATION_ERROR, std::move(msg));
    }

    try {
        std::optional<MonitoredQuery> existing;
        if (query.id != 0) {
            existing = store_->get_query(query.id);
            if (!existing) {
                return Result<QueryId>::error(ErrorCategory::STORE_ERROR,
                                              std::format("query {} not found", query.id));
            }
        } else {
            existing = store_->find_query_by_name(query.name);
        }

        MonitoredQuery to_save = query;
        to_save.id = existing ? existing->id : 0;
        const QueryId id = store_->save_query(to_save);
        store_->replace_rules(id, rules);

        utils::log::info(std::format("Query '{}' {} (id {}, {} rules)",
            query.name, existing ? "updated" : "created", id, rules.size()));
        return Result<QueryId>::ok(id);
    } catch (const std::exception& e) {
        return Result<QueryId>::error(ErrorCategory::STORE_ERROR, e.what());
    }
}

SyncReport Orchestrator::sync_configuration(const std::vector<QueryDefinition>& definitions) {
    SyncReport report;
    std::unordered_set<std::string> configured;

    for (const auto& def : definitions) {
        configured.insert(def.query.name);

        std::optional<MonitoredQuery> existing;
        try {
            existing = store_->find_query_by_name(def.query.name);
        } catch (const std::exception& e) {
            report.errors.push_back(std::format("query '{}': {}", def.query.name, e.what()));
            continue;
        }

        MonitoredQuery query = def.query;
        query.id = existing ? existing->id : 0;

        const auto r = upsert_query(query, def.rules);
        if (r.is_error()) {
            report.errors.push_back(r.error_message());
            continue;
        }
        if (existing) {
            ++report.updated;
        } else {
            ++report.created;
        }
    }

    try {
        for (auto query : store_->list_queries()) {
            if (!query.active || configured.contains(query.name)) continue;
            query.active = false;
            store_->save_query(query);
            ++report.deactivated;
            utils::log::info(std::format("Query '{}' no longer configured, deactivated", query.name));
        }
    } catch (const std::exception& e) {
        report.errors.push_back(std::format("deactivation failed: {}", e.what()));
    }

    for (const auto& e : report.errors) {
        utils::log::error(e);
    }
    return report;
}

size_t Orchestrator::recover_locks() {
    const size_t cleared = store_->clear_all_locks();
    if (cleared > 0) {
        utils::log::warn(std::format("Cleared {} stale query lock(s) from a previous run", cleared));
    }
    return cleared;
}

} // namespace errorengine
