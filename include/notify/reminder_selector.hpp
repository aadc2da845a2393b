#pragma once

#include "monitor/monitor_types.hpp"

#include <vector>

namespace errorengine {

/**
 * @brief Picks unresolved, already-notified errors whose reminder is due.
 *
 * Due when reminders are enabled on the query, the error was notified at
 * least once, the reminder cap is not reached and at least
 * reminder_interval_minutes of wall-clock time passed since the last
 * delivered notification.
 */
class ReminderSelector {
public:
    [[nodiscard]] static bool is_due(const ActiveError& error,
                                     const MonitoredQuery& query,
                                     TimePoint now);

    /// Indices into errors of the ones due, in input order
    [[nodiscard]] static std::vector<size_t> select(const std::vector<ActiveError>& errors,
                                                    const MonitoredQuery& query,
                                                    TimePoint now);

    /// Earliest time the error's next reminder becomes due, if any
    [[nodiscard]] static std::optional<TimePoint> next_due(const ActiveError& error,
                                                           const MonitoredQuery& query);
};

} // namespace errorengine
