#pragma once

#include "core/types.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <shared_mutex>
#include <unordered_map>

namespace errorengine {

class IStateStore;

/**
 * @brief In-process per-query execution flags.
 *
 * Flags are created lazily with double-checked locking (shared_lock for the
 * lookup, unique_lock + try_emplace for creation). Acquisition is a single
 * compare-and-set: a second caller is rejected, never queued.
 */
class ExecutionLockRegistry {
public:
    [[nodiscard]] bool try_acquire(QueryId id);
    void release(QueryId id);

    [[nodiscard]] bool is_held(QueryId id) const;
    [[nodiscard]] size_t held_count() const;

private:
    std::atomic<bool>& flag_for(QueryId id);

    std::unordered_map<QueryId, std::unique_ptr<std::atomic<bool>>> flags_;
    mutable std::shared_mutex mutex_;
};

/**
 * @brief RAII holder of both lock levels for one cycle.
 *
 * Takes the in-process flag first, then (when a store is given) the
 * store's locked_at marker. Whatever was taken is released on destruction,
 * including during stack unwinding.
 */
class ScopedExecutionLock {
public:
    ScopedExecutionLock(ExecutionLockRegistry& registry,
                        IStateStore* store,
                        QueryId id,
                        TimePoint now,
                        std::chrono::seconds ttl);
    ~ScopedExecutionLock();

    ScopedExecutionLock(const ScopedExecutionLock&) = delete;
    ScopedExecutionLock& operator=(const ScopedExecutionLock&) = delete;

    [[nodiscard]] bool acquired() const { return local_held_ && (store_ == nullptr || store_held_); }

private:
    ExecutionLockRegistry& registry_;
    IStateStore* store_;
    QueryId id_;
    bool local_held_ = false;
    bool store_held_ = false;
};

} // namespace errorengine
