#include "scheduler/drain_coordinator.hpp"

#include <algorithm>

namespace errorengine {

DrainCoordinator::DrainCoordinator(std::chrono::milliseconds drain_timeout)
    : drain_timeout_(drain_timeout) {}

DrainCoordinator::Admission DrainCoordinator::admit(QueryId id) {
    std::lock_guard lock(mutex_);
    if (draining_) return Admission::DRAINING;
    const auto [_, inserted] = started_.try_emplace(id, std::chrono::steady_clock::now());
    return inserted ? Admission::ADMITTED : Admission::ALREADY_IN_FLIGHT;
}

void DrainCoordinator::complete(QueryId id) {
    std::lock_guard lock(mutex_);
    if (started_.erase(id) > 0 && started_.empty()) {
        drained_cv_.notify_all();
    }
}

void DrainCoordinator::begin_drain() {
    std::lock_guard lock(mutex_);
    draining_ = true;
}

bool DrainCoordinator::await_drained() {
    std::unique_lock lock(mutex_);
    return drained_cv_.wait_for(lock, drain_timeout_, [this] { return started_.empty(); });
}

bool DrainCoordinator::is_draining() const {
    std::lock_guard lock(mutex_);
    return draining_;
}

bool DrainCoordinator::is_in_flight(QueryId id) const {
    std::lock_guard lock(mutex_);
    return started_.contains(id);
}

size_t DrainCoordinator::in_flight_count() const {
    std::lock_guard lock(mutex_);
    return started_.size();
}

std::vector<QueryId> DrainCoordinator::in_flight() const {
    std::vector<std::pair<std::chrono::steady_clock::time_point, QueryId>> running;
    {
        std::lock_guard lock(mutex_);
        running.reserve(started_.size());
        for (const auto& [id, at] : started_) running.emplace_back(at, id);
    }
    std::sort(running.begin(), running.end());

    std::vector<QueryId> ids;
    ids.reserve(running.size());
    for (const auto& entry : running) ids.push_back(entry.second);
    return ids;
}

std::string_view admission_to_string(DrainCoordinator::Admission admission) {
    switch (admission) {
        case DrainCoordinator::Admission::ADMITTED:          return "admitted";
        case DrainCoordinator::Admission::ALREADY_IN_FLIGHT: return "already in flight";
        case DrainCoordinator::Admission::DRAINING:          return "draining";
    }
    return "unknown";
}

} // namespace errorengine
