#include "monitor/monitor_types.hpp"
#include "core/utils.hpp"

#include <format>

namespace errorengine {

std::optional<TimeOfDay> parse_time_of_day(std::string_view s) {
    const auto colon = s.find(':');
    if (colon == std::string_view::npos) return std::nullopt;

    const auto hour = utils::try_parse_int<int>(s.substr(0, colon));
    const auto minute = utils::try_parse_int<int>(s.substr(colon + 1));
    if (!hour || !minute) return std::nullopt;
    if (!utils::in_range<0, 24>(*hour) || !utils::in_range<0, 59>(*minute)) return std::nullopt;
    // "24:00" is accepted as end-of-day for window ends
    if (*hour == 24 && *minute != 0) return std::nullopt;

    return TimeOfDay{*hour, *minute};
}

std::string format_time_of_day(const TimeOfDay& t) {
    return std::format("{:02d}:{:02d}", t.hour, t.minute);
}

} // namespace errorengine
