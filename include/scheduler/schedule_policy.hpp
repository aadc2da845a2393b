#pragma once

#include "monitor/monitor_types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace errorengine {

struct Eligibility {
    bool eligible = false;
    std::string reason;   // First failing check when not eligible

    static Eligibility ok() { return {true, {}}; }
    static Eligibility skip(std::string reason) { return {false, std::move(reason)}; }
};

/**
 * @brief When may a query run.
 *
 * Checks, in order: active flag, ISO weekday, daily window (start
 * inclusive, end exclusive, local time), interval since last check. A
 * query that never ran passes the interval check.
 */
class SchedulePolicy {
public:
    [[nodiscard]] static Eligibility check(const MonitoredQuery& query, TimePoint now);

    /**
     * @brief Earliest instant >= now at which check() would pass.
     * nullopt for inactive queries or an empty weekday set.
     */
    [[nodiscard]] static std::optional<TimePoint> next_eligible_time(
        const MonitoredQuery& query, TimePoint now);

    /// Edit-time check of the scheduling fields; empty when valid
    [[nodiscard]] static std::vector<std::string> validate(const MonitoredQuery& query);
};

} // namespace errorengine
