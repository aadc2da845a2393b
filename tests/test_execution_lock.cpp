#include <catch2/catch_test_macros.hpp>
#include "scheduler/execution_lock.hpp"
#include "store/memory_store.hpp"
#include "core/utils.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace errorengine;

TEST_CASE("ExecutionLockRegistry: exactly one concurrent winner", "[lock]") {
    ExecutionLockRegistry registry;
    std::atomic<int> winners{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 16; ++i) {
        threads.emplace_back([&] {
            if (registry.try_acquire(7)) winners.fetch_add(1);
        });
    }
    for (auto& t : threads) t.join();

    CHECK(winners.load() == 1);
    CHECK(registry.is_held(7));
    CHECK(registry.held_count() == 1);

    registry.release(7);
    CHECK_FALSE(registry.is_held(7));
    CHECK(registry.try_acquire(7));
}

TEST_CASE("ExecutionLockRegistry: queries lock independently", "[lock]") {
    ExecutionLockRegistry registry;
    CHECK(registry.try_acquire(1));
    CHECK(registry.try_acquire(2));
    CHECK_FALSE(registry.try_acquire(1));
    CHECK(registry.held_count() == 2);
}

TEST_CASE("ScopedExecutionLock: takes and releases both levels", "[lock]") {
    MemoryStore store;
    MonitoredQuery q;
    q.name = "locked";
    const auto id = store.save_query(q);
    const auto now = utils::make_local_time(2025, 6, 4, 10, 0);

    ExecutionLockRegistry registry;
    {
        ScopedExecutionLock lock(registry, &store, id, now, std::chrono::seconds(300));
        REQUIRE(lock.acquired());
        CHECK(registry.is_held(id));
        CHECK(store.get_query(id)->locked_at.has_value());

        ScopedExecutionLock second(registry, &store, id, now, std::chrono::seconds(300));
        CHECK_FALSE(second.acquired());
    }

    CHECK_FALSE(registry.is_held(id));
    CHECK_FALSE(store.get_query(id)->locked_at.has_value());
}

TEST_CASE("ScopedExecutionLock: a fresh store marker blocks another process", "[lock]") {
    MemoryStore store;
    MonitoredQuery q;
    q.name = "marker";
    const auto id = store.save_query(q);
    const auto now = utils::make_local_time(2025, 6, 4, 10, 0);

    // Marker left by another process
    REQUIRE(store.try_lock_query(id, now, std::chrono::seconds(300)));

    ExecutionLockRegistry registry;
    {
        ScopedExecutionLock lock(registry, &store, id, now + std::chrono::seconds(10), std::chrono::seconds(300));
        CHECK_FALSE(lock.acquired());
    }
    // The in-process flag is released even though the marker was not ours
    CHECK_FALSE(registry.is_held(id));

    // Past the TTL the marker is stale and can be taken over
    ScopedExecutionLock later(registry, &store, id, now + std::chrono::seconds(301), std::chrono::seconds(300));
    CHECK(later.acquired());
}

TEST_CASE("ScopedExecutionLock: store failure releases the local flag", "[lock]") {
    MemoryStore store;
    ExecutionLockRegistry registry;
    const auto now = utils::make_local_time(2025, 6, 4, 10, 0);

    CHECK_THROWS(ScopedExecutionLock(registry, &store, 99, now, std::chrono::seconds(300)));
    CHECK_FALSE(registry.is_held(99));
}
