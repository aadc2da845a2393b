#include "scheduler/execution_lock.hpp"
#include "store/istate_store.hpp"
#include "core/utils.hpp"

#include <format>

namespace errorengine {

// ============================================================================
// ExecutionLockRegistry
// ============================================================================

std::atomic<bool>& ExecutionLockRegistry::flag_for(QueryId id) {
    // Fast path: shared lock (read-only)
    {
        std::shared_lock lock(mutex_);
        const auto it = flags_.find(id);
        if (it != flags_.end()) {
            return *it->second;
        }
    }

    // Slow path: unique lock + try_emplace
    std::unique_lock lock(mutex_);
    auto [it, inserted] = flags_.try_emplace(id, nullptr);
    if (inserted) {
        it->second = std::make_unique<std::atomic<bool>>(false);
    }
    return *it->second;
}

bool ExecutionLockRegistry::try_acquire(QueryId id) {
    bool expected = false;
    return flag_for(id).compare_exchange_strong(expected, true, std::memory_order_acq_rel);
}

void ExecutionLockRegistry::release(QueryId id) {
    flag_for(id).store(false, std::memory_order_release);
}

bool ExecutionLockRegistry::is_held(QueryId id) const {
    std::shared_lock lock(mutex_);
    const auto it = flags_.find(id);
    return it != flags_.end() && it->second->load(std::memory_order_acquire);
}

size_t ExecutionLockRegistry::held_count() const {
    std::shared_lock lock(mutex_);
    size_t n = 0;
    for (const auto& [_, flag] : flags_) {
        if (flag->load(std::memory_order_acquire)) ++n;
    }
    return n;
}

// ============================================================================
// ScopedExecutionLock
// ============================================================================

ScopedExecutionLock::ScopedExecutionLock(ExecutionLockRegistry& registry,
                                         IStateStore* store,
                                         QueryId id,
                                         TimePoint now,
                                         std::chrono::seconds ttl)
    : registry_(registry), store_(store), id_(id) {
    local_held_ = registry_.try_acquire(id_);
    if (!local_held_ || store_ == nullptr) return;

    try {
        store_held_ = store_->try_lock_query(id_, now, ttl);
    } catch (...) {
        registry_.release(id_);
        local_held_ = false;
        throw;
    }
}

ScopedExecutionLock::~ScopedExecutionLock() {
    if (store_held_) {
        try {
            store_->unlock_query(id_);
        } catch (const std::exception& e) {
            // Marker goes stale after the TTL and is cleared at next startup
            utils::log::error(std::format("Query {}: failed to clear lock marker: {}", id_, e.what()));
        }
    }
    if (local_held_) {
        registry_.release(id_);
    }
}

} // namespace errorengine
