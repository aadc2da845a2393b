#include <catch2/catch_test_macros.hpp>
#include "scheduler/schedule_policy.hpp"
#include "core/utils.hpp"

using namespace errorengine;

namespace {

// 2025-06-04 is a Wednesday
MonitoredQuery office_hours_query() {
    MonitoredQuery q;
    q.id = 1;
    q.name = "office hours";
    q.interval_minutes = 15;
    q.active_days = {1, 2, 3, 4, 5};
    q.window = TimeWindow{TimeOfDay{8, 0}, TimeOfDay{18, 0}};
    return q;
}

} // namespace

TEST_CASE("SchedulePolicy: inside the window a fresh query is eligible", "[schedule]") {
    const auto q = office_hours_query();
    CHECK(SchedulePolicy::check(q, utils::make_local_time(2025, 6, 4, 8, 0)).eligible);
    CHECK(SchedulePolicy::check(q, utils::make_local_time(2025, 6, 4, 17, 59)).eligible);
}

TEST_CASE("SchedulePolicy: outside the window is skipped", "[schedule]") {
    const auto q = office_hours_query();
    const auto e = SchedulePolicy::check(q, utils::make_local_time(2025, 6, 4, 19, 0));
    CHECK_FALSE(e.eligible);
    CHECK(e.reason.find("time window") != std::string::npos);

    // End is exclusive
    CHECK_FALSE(SchedulePolicy::check(q, utils::make_local_time(2025, 6, 4, 18, 0)).eligible);
}

TEST_CASE("SchedulePolicy: next eligible time after the window is next morning", "[schedule]") {
    const auto q = office_hours_query();
    const auto next = SchedulePolicy::next_eligible_time(q, utils::make_local_time(2025, 6, 4, 19, 0));
    REQUIRE(next.has_value());
    CHECK(*next == utils::make_local_time(2025, 6, 5, 8, 0));
}

TEST_CASE("SchedulePolicy: weekend is skipped until Monday", "[schedule]") {
    const auto q = office_hours_query();
    const auto saturday = utils::make_local_time(2025, 6, 7, 10, 0);

    const auto e = SchedulePolicy::check(q, saturday);
    CHECK_FALSE(e.eligible);
    CHECK(e.reason.find("Sat") != std::string::npos);

    const auto next = SchedulePolicy::next_eligible_time(q, saturday);
    REQUIRE(next.has_value());
    CHECK(*next == utils::make_local_time(2025, 6, 9, 8, 0));
}

TEST_CASE("SchedulePolicy: interval gates repeat runs", "[schedule]") {
    auto q = office_hours_query();
    const auto t = utils::make_local_time(2025, 6, 4, 10, 0);
    q.last_check_at = t;

    CHECK_FALSE(SchedulePolicy::check(q, t + std::chrono::minutes(14)).eligible);
    CHECK(SchedulePolicy::check(q, t + std::chrono::minutes(15)).eligible);

    const auto next = SchedulePolicy::next_eligible_time(q, t + std::chrono::minutes(1));
    REQUIRE(next.has_value());
    CHECK(*next == t + std::chrono::minutes(15));
}

TEST_CASE("SchedulePolicy: inactive query is never eligible", "[schedule]") {
    auto q = office_hours_query();
    q.active = false;
    const auto t = utils::make_local_time(2025, 6, 4, 10, 0);
    CHECK_FALSE(SchedulePolicy::check(q, t).eligible);
    CHECK_FALSE(SchedulePolicy::next_eligible_time(q, t).has_value());
}

TEST_CASE("SchedulePolicy: validate rejects bad scheduling fields", "[schedule]") {
    auto q = office_hours_query();
    CHECK(SchedulePolicy::validate(q).empty());

    q.interval_minutes = 0;
    q.active_days = {0, 3};
    q.window = TimeWindow{TimeOfDay{18, 0}, TimeOfDay{8, 0}};
    CHECK(SchedulePolicy::validate(q).size() == 3);

    q = office_hours_query();
    q.active_days.clear();
    CHECK(SchedulePolicy::validate(q).size() == 1);
}

TEST_CASE("SchedulePolicy: time of day parsing", "[schedule]") {
    const auto t = parse_time_of_day("08:30");
    REQUIRE(t.has_value());
    CHECK(t->minutes() == 8 * 60 + 30);
    CHECK(format_time_of_day(*t) == "08:30");
    CHECK_FALSE(parse_time_of_day("25:00").has_value());
    CHECK_FALSE(parse_time_of_day("8h30").has_value());
}
