#include "scheduler/scheduler.hpp"
#include "scheduler/schedule_policy.hpp"
#include "core/utils.hpp"

#include <format>
#include <string>
#include <system_error>

namespace errorengine {

Scheduler::Scheduler(std::shared_ptr<Orchestrator> orchestrator, SchedulerConfig config)
    : orchestrator_(std::move(orchestrator)),
      config_(config),
      cycles_(std::make_shared<DrainCoordinator>(config.shutdown_timeout)) {}

Scheduler::~Scheduler() {
    stop();
}

void Scheduler::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) return;

    driver_thread_ = std::thread(&Scheduler::driver_loop, this);
    utils::log::info(std::format("Scheduler started (tick {}s)", config_.tick.count()));
}

void Scheduler::stop() {
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false)) return;

    {
        std::lock_guard lock(cv_mutex_);
        cv_.notify_one();
    }
    if (driver_thread_.joinable()) {
        driver_thread_.join();
    }

    cycles_->begin_drain();
    const auto pending = cycles_->in_flight_count();
    if (pending > 0) {
        utils::log::info(std::format("Scheduler stopping, waiting for {} in-flight cycle(s)", pending));
    }
    if (!cycles_->await_drained()) {
        std::string stuck;
        for (const auto id : cycles_->in_flight()) {
            if (!stuck.empty()) stuck += ", ";
            stuck += std::to_string(id);
        }
        utils::log::warn(std::format("Scheduler drain timed out, still running: queries {}", stuck));
    }
    utils::log::info("Scheduler stopped");
}

void Scheduler::driver_loop() {
    while (running_.load(std::memory_order_acquire)) {
        try {
            tick(utils::now());
        } catch (const std::exception& e) {
            utils::log::error(std::format("Scheduler tick failed: {}", e.what()));
        }

        std::unique_lock lock(cv_mutex_);
        cv_.wait_for(lock, config_.tick, [this] {
            return !running_.load(std::memory_order_acquire);
        });
    }
}

size_t Scheduler::tick(TimePoint now) {
    tick_count_.fetch_add(1, std::memory_order_relaxed);

    size_t launched = 0;
    for (const auto& query : orchestrator_->list_queries()) {
        if (!SchedulePolicy::check(query, now).eligible) {
            // Records the skip reason as the query's last outcome
            orchestrator_->maybe_run(query.id, now);
            continue;
        }
        if (launch(query.id, query.name, now)) ++launched;
    }
    return launched;
}

bool Scheduler::launch(QueryId id, const std::string& name, TimePoint now) {
    const auto admission = cycles_->admit(id);
    if (admission != DrainCoordinator::Admission::ADMITTED) {
        utils::log::debug(std::format("Query '{}' not launched: {}", name, admission_to_string(admission)));
        return false;
    }

    auto cycles = cycles_;
    auto orchestrator = orchestrator_;
    try {
        std::thread([cycles, orchestrator, id, now] {
            try {
                orchestrator->maybe_run(id, now);
            } catch (const std::exception& e) {
                utils::log::error(std::format("Query {}: cycle aborted: {}", id, e.what()));
            }
            cycles->complete(id);
        }).detach();
    } catch (const std::system_error& e) {
        cycles_->complete(id);
        utils::log::error(std::format("Query '{}': cannot start worker: {}", name, e.what()));
        return false;
    }
    return true;
}

std::vector<ExecutionResult> Scheduler::run_once(TimePoint now) {
    const auto queries = orchestrator_->list_queries();
    std::vector<ExecutionResult> results(queries.size());
    std::vector<std::thread> workers;
    workers.reserve(queries.size());

    for (size_t i = 0; i < queries.size(); ++i) {
        workers.emplace_back([this, &results, &queries, i, now] {
            try {
                results[i] = orchestrator_->maybe_run(queries[i].id, now);
            } catch (const std::exception& e) {
                results[i].query_id = queries[i].id;
                results[i].query_name = queries[i].name;
                results[i].status = ExecutionStatus::ERROR;
                results[i].error_message = e.what();
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }
    return results;
}

} // namespace errorengine
