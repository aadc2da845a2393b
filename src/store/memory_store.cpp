#include "store/memory_store.hpp"

#include <algorithm>
#include <format>
#include <unordered_set>
#include <stdexcept>

namespace errorengine {

MonitoredQuery& MemoryStore::require_query(QueryId id) {
    const auto it = queries_.find(id);
    if (it == queries_.end()) {
        throw std::runtime_error(std::format("query {} not found", id));
    }
    return it->second;
}

QueryId MemoryStore::save_query(const MonitoredQuery& query) {
    std::lock_guard<std::mutex> lock(mutex_);

    for (const auto& [id, q] : queries_) {
        if (q.name == query.name && id != query.id) {
            throw std::runtime_error(std::format("query name '{}' already exists", query.name));
        }
    }

    if (query.id == 0) {
        MonitoredQuery stored = query;
        stored.id = next_query_id_++;
        stored.last_check_at.reset();
        stored.locked_at.reset();
        stored.last_error_at.reset();
        stored.total_errors_found = 0;
        stored.total_notifications_sent = 0;
        queries_[stored.id] = stored;
        return stored.id;
    }

    MonitoredQuery& existing = require_query(query.id);
    MonitoredQuery updated = query;
    updated.last_check_at = existing.last_check_at;
    updated.locked_at = existing.locked_at;
    updated.last_error_at = existing.last_error_at;
    updated.total_errors_found = existing.total_errors_found;
    updated.total_notifications_sent = existing.total_notifications_sent;
    existing = std::move(updated);
    return query.id;
}

std::optional<MonitoredQuery> MemoryStore::get_query(QueryId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = queries_.find(id);
    if (it == queries_.end()) return std::nullopt;
    return it->second;
}

std::optional<MonitoredQuery> MemoryStore::find_query_by_name(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [_, q] : queries_) {
        if (q.name == name) return q;
    }
    return std::nullopt;
}

std::vector<MonitoredQuery> MemoryStore::list_queries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<MonitoredQuery> out;
    out.reserve(queries_.size());
    for (const auto& [_, q] : queries_) {
        out.push_back(q);
    }
    return out;
}

bool MemoryStore::delete_query(QueryId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queries_.erase(id) == 0) return false;

    rules_.erase(id);
    std::erase_if(errors_, [id](const auto& kv) { return kv.second.query_id == id; });
    std::erase_if(log_, [id](const ExecutionLogEntry& e) { return e.query_id == id; });
    return true;
}

void MemoryStore::replace_rules(QueryId query_id, const std::vector<RoutingRule>& rules) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_query(query_id);

    std::vector<RoutingRule> stored = rules;
    for (auto& r : stored) {
        r.id = next_rule_id_++;
    }
    rules_[query_id] = std::move(stored);
}

std::vector<RoutingRule> MemoryStore::get_rules(QueryId query_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = rules_.find(query_id);
    if (it == rules_.end()) return {};
    return it->second;
}

std::vector<ActiveError> MemoryStore::unresolved_errors(QueryId query_id) const {
    return list_active_errors(query_id);
}

std::vector<ActiveError> MemoryStore::list_active_errors(std::optional<QueryId> query_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ActiveError> out;
    for (const auto& [_, e] : errors_) {
        if (e.resolved) continue;
        if (query_id && e.query_id != *query_id) continue;
        out.push_back(e);
    }
    return out;
}

std::vector<ActiveError> MemoryStore::all_errors(QueryId query_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ActiveError> out;
    for (const auto& [_, e] : errors_) {
        if (e.query_id == query_id) out.push_back(e);
    }
    return out;
}

std::optional<ActiveError> MemoryStore::get_error(ErrorId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = errors_.find(id);
    if (it == errors_.end()) return std::nullopt;
    return it->second;
}

AppliedDiff MemoryStore::apply_diff(QueryId query_id, const LifecycleDiff& diff) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_query(query_id);

    // Validate everything before mutating so the diff applies all-or-nothing
    std::unordered_set<ErrorId> stale;
    for (const auto* group : {&diff.updated, &diff.resolved}) {
        for (const auto& e : *group) {
            const auto it = errors_.find(e.id);
            if (it == errors_.end() || it->second.query_id != query_id) {
                throw std::runtime_error(std::format("error {} is not an error of query {}",
                                                     e.id, query_id));
            }
            if (it->second.resolved) stale.insert(e.id);
        }
    }
    for (const auto& e : diff.created) {
        for (const auto& [_, existing] : errors_) {
            if (existing.query_id == query_id && !existing.resolved && existing.signature == e.signature) {
                throw std::runtime_error(std::format("duplicate unresolved signature '{}' for query {}",
                                                     e.signature.display(), query_id));
            }
        }
    }

    AppliedDiff applied;
    for (const auto& e : diff.resolved) {
        if (stale.contains(e.id)) continue;
        auto& stored = errors_[e.id];
        stored.resolved = true;
        stored.resolved_at = e.resolved_at;
        ++applied.resolved;
    }
    for (const auto& e : diff.updated) {
        if (stale.contains(e.id)) continue;
        auto& stored = errors_[e.id];
        stored.last_seen = e.last_seen;
        stored.occurrence_count = e.occurrence_count;
        stored.row = e.row;
    }
    applied.stale.assign(stale.begin(), stale.end());

    applied.created.reserve(diff.created.size());
    for (const auto& e : diff.created) {
        ActiveError stored = e;
        stored.id = next_error_id_++;
        stored.query_id = query_id;
        errors_[stored.id] = stored;
        applied.created.push_back(std::move(stored));
    }

    if (!applied.created.empty()) {
        require_query(query_id).total_errors_found += applied.created.size();
    }
    return applied;
}

bool MemoryStore::resolve_error(ErrorId id, TimePoint at) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = errors_.find(id);
    if (it == errors_.end() || it->second.resolved) return false;
    it->second.resolved = true;
    it->second.resolved_at = std::max(at, it->second.last_seen);
    return true;
}

void MemoryStore::mark_notified(const std::vector<ErrorId>& ids, NotificationKind kind, TimePoint at) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto id : ids) {
        const auto it = errors_.find(id);
        if (it == errors_.end()) continue;
        if (kind == NotificationKind::REMINDER) {
            ++it->second.reminder_count;
        } else {
            it->second.notified = true;
        }
        it->second.last_notified_at = at;
    }
}

bool MemoryStore::try_lock_query(QueryId id, TimePoint now, std::chrono::seconds ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& q = require_query(id);
    if (q.locked_at && *q.locked_at >= now - ttl) return false;
    q.locked_at = now;
    return true;
}

void MemoryStore::unlock_query(QueryId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = queries_.find(id);
    if (it != queries_.end()) it->second.locked_at.reset();
}

size_t MemoryStore::clear_all_locks() {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t cleared = 0;
    for (auto& [_, q] : queries_) {
        if (q.locked_at) {
            q.locked_at.reset();
            ++cleared;
        }
    }
    return cleared;
}

void MemoryStore::record_check(QueryId id, TimePoint checked_at,
                               size_t new_errors, size_t notifications_sent) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& q = require_query(id);
    q.last_check_at = checked_at;
    if (new_errors > 0) q.last_error_at = checked_at;
    q.total_notifications_sent += notifications_sent;
}

void MemoryStore::append_execution(const ExecutionLogEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    ExecutionLogEntry stored = entry;
    stored.id = next_log_id_++;
    log_.push_back(std::move(stored));
}

std::vector<ExecutionLogEntry> MemoryStore::recent_executions(
    std::optional<QueryId> query_id, size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ExecutionLogEntry> out;
    for (auto it = log_.rbegin(); it != log_.rend() && out.size() < limit; ++it) {
        if (query_id && it->query_id != *query_id) continue;
        out.push_back(*it);
    }
    return out;
}

} // namespace errorengine
