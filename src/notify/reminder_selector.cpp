#include "notify/reminder_selector.hpp"

namespace errorengine {

std::optional<TimePoint> ReminderSelector::next_due(const ActiveError& error,
                                                    const MonitoredQuery& query) {
    if (!query.reminders_enabled()) return std::nullopt;
    if (error.resolved || !error.notified) return std::nullopt;
    if (query.reminder_max_count > 0 && error.reminder_count >= query.reminder_max_count) {
        return std::nullopt;
    }

    const TimePoint last = error.last_notified_at.value_or(error.first_seen);
    return last + std::chrono::minutes(query.reminder_interval_minutes);
}

bool ReminderSelector::is_due(const ActiveError& error,
                              const MonitoredQuery& query,
                              TimePoint now) {
    const auto due = next_due(error, query);
    return due.has_value() && now >= *due;
}

std::vector<size_t> ReminderSelector::select(const std::vector<ActiveError>& errors,
                                             const MonitoredQuery& query,
                                             TimePoint now) {
    std::vector<size_t> due;
    if (!query.reminders_enabled()) return due;

    for (size_t i = 0; i < errors.size(); ++i) {
        if (is_due(errors[i], query, now)) due.push_back(i);
    }
    return due;
}

} // namespace errorengine
