#pragma once

#include "scheduler/drain_coordinator.hpp"
#include "scheduler/orchestrator.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace errorengine {

struct SchedulerConfig {
    std::chrono::seconds tick{30};
    std::chrono::milliseconds shutdown_timeout{30000};
};

/**
 * @brief Single periodic driver over all configured queries.
 *
 * Every tick walks the stored queries; each eligible one runs its cycle on
 * its own worker thread so a slow source never delays the others. A query
 * whose previous cycle is still in flight is not launched again.
 *
 * stop() halts the driver, refuses new cycles and waits (bounded by
 * shutdown_timeout) for in-flight ones to finish.
 */
class Scheduler {
public:
    Scheduler(std::shared_ptr<Orchestrator> orchestrator, SchedulerConfig config = {});
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    void start();
    void stop();

    /// One pass; returns the number of cycles launched
    size_t tick(TimePoint now);

    /// Evaluate every query once and wait for all cycles to finish
    std::vector<ExecutionResult> run_once(TimePoint now);

    [[nodiscard]] bool is_running() const { return running_.load(std::memory_order_acquire); }
    [[nodiscard]] uint64_t tick_count() const { return tick_count_.load(std::memory_order_relaxed); }
    [[nodiscard]] size_t in_flight_count() const { return cycles_->in_flight_count(); }

private:
    void driver_loop();
    bool launch(QueryId id, const std::string& name, TimePoint now);

    std::shared_ptr<Orchestrator> orchestrator_;
    SchedulerConfig config_;
    // Shared with detached workers so it outlives a timed-out drain
    std::shared_ptr<DrainCoordinator> cycles_;

    std::thread driver_thread_;
    std::atomic<bool> running_{false};
    std::mutex cv_mutex_;
    std::condition_variable cv_;

    std::atomic<uint64_t> tick_count_{0};
};

} // namespace errorengine
