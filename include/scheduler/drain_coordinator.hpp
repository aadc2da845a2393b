#pragma once

#include "core/types.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace errorengine {

/**
 * @brief Registry of the monitoring cycles the scheduler has launched.
 *
 * A query has at most one scheduled cycle in flight. Once draining starts
 * no cycle is admitted, and await_drained() blocks until the running
 * ones complete or the drain timeout expires.
 */
class DrainCoordinator {
public:
    enum class Admission {
        ADMITTED,
        ALREADY_IN_FLIGHT,
        DRAINING
    };

    explicit DrainCoordinator(std::chrono::milliseconds drain_timeout = std::chrono::seconds{30});

    [[nodiscard]] Admission admit(QueryId id);

    /// Ends the cycle of query id; unknown ids are ignored
    void complete(QueryId id);

    void begin_drain();

    /// True once no cycle is in flight, false if the timeout expired first
    [[nodiscard]] bool await_drained();

    [[nodiscard]] bool is_draining() const;
    [[nodiscard]] bool is_in_flight(QueryId id) const;
    [[nodiscard]] size_t in_flight_count() const;

    /// Queries with a cycle in flight, longest running first
    [[nodiscard]] std::vector<QueryId> in_flight() const;

private:
    std::chrono::milliseconds drain_timeout_;

    mutable std::mutex mutex_;
    std::condition_variable drained_cv_;
    bool draining_ = false;
    std::unordered_map<QueryId, std::chrono::steady_clock::time_point> started_;
};

[[nodiscard]] std::string_view admission_to_string(DrainCoordinator::Admission admission);

} // namespace errorengine
