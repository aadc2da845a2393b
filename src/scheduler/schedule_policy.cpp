#include "scheduler/schedule_policy.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace errorengine {

namespace {

constexpr std::string_view kDayNames[] = {"", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat", "Sun"};

// Local midnight of the day after tp's day (DST-safe)
TimePoint next_day_start(TimePoint tp) {
    return utils::start_of_day(utils::start_of_day(tp) + std::chrono::hours(36));
}

TimePoint at_minute_of_day(TimePoint day, int minute_of_day) {
    auto tm_buf = utils::local_tm(day);
    return utils::make_local_time(tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
                                  minute_of_day / 60, minute_of_day % 60);
}

} // anonymous namespace

Eligibility SchedulePolicy::check(const MonitoredQuery& query, TimePoint now) {
    if (!query.active) {
        return Eligibility::skip("query is inactive");
    }

    const int weekday = utils::iso_weekday(now);
    if (!query.active_days.contains(weekday)) {
        return Eligibility::skip(std::format("{} is not an active day", kDayNames[weekday]));
    }

    if (query.window && !query.window->contains(utils::minutes_of_day(now))) {
        return Eligibility::skip(std::format("outside time window {}-{}",
            format_time_of_day(query.window->start), format_time_of_day(query.window->end)));
    }

    if (query.last_check_at) {
        const auto elapsed = now - *query.last_check_at;
        const auto interval = std::chrono::minutes(query.interval_minutes);
        if (elapsed < interval) {
            const auto remaining = std::chrono::duration_cast<std::chrono::seconds>(interval - elapsed);
            return Eligibility::skip(std::format("interval not elapsed (next run in {}s)", remaining.count()));
        }
    }

    return Eligibility::ok();
}

std::optional<TimePoint> SchedulePolicy::next_eligible_time(const MonitoredQuery& query, TimePoint now) {
    if (!query.active || query.active_days.empty()) return std::nullopt;
    if (query.window && query.window->start.minutes() >= query.window->end.minutes()) return std::nullopt;

    TimePoint candidate = now;
    if (query.last_check_at) {
        candidate = std::max(now, *query.last_check_at + std::chrono::minutes(query.interval_minutes));
    }

    // A week plus one day covers every weekday/window combination
    for (int i = 0; i < 8; ++i) {
        if (query.active_days.contains(utils::iso_weekday(candidate))) {
            if (!query.window) return candidate;

            const int minute = utils::minutes_of_day(candidate);
            if (minute < query.window->start.minutes()) {
                return at_minute_of_day(candidate, query.window->start.minutes());
            }
            if (query.window->contains(minute)) {
                return candidate;
            }
        }
        candidate = next_day_start(candidate);
    }
    return std::nullopt;
}

std::vector<std::string> SchedulePolicy::validate(const MonitoredQuery& query) {
    std::vector<std::string> errors;

    if (!utils::in_range<1, 1440>(query.interval_minutes)) {
        errors.push_back(std::format("interval_minutes must be between 1 and 1440 (got {})",
                                     query.interval_minutes));
    }

    if (query.active_days.empty()) {
        errors.push_back("active_days must contain at least one day");
    }
    for (const int d : query.active_days) {
        if (!utils::in_range<1, 7>(d)) {
            errors.push_back(std::format("active_days: {} is not an ISO weekday (1-7)", d));
        }
    }

    if (query.window) {
        if (query.window->start.hour == 24) {
            errors.push_back("time window start must be before 24:00");
        }
        if (query.window->start.minutes() >= query.window->end.minutes()) {
            errors.push_back(std::format(
                "time window {}-{} must not wrap midnight (start must be before end)",
                format_time_of_day(query.window->start), format_time_of_day(query.window->end)));
        }
    }

    return errors;
}

} // namespace errorengine
