#include <catch2/catch_test_macros.hpp>
#include "lifecycle/error_lifecycle.hpp"
#include "core/utils.hpp"

#include <algorithm>

using namespace errorengine;

namespace {

MonitoredQuery orders_query() {
    MonitoredQuery q;
    q.id = 1;
    q.name = "Failed orders";
    q.key_fields = {"ORDER_ID"};
    return q;
}

Row order_row(int64_t id, const std::string& status = "FAILED") {
    Row r;
    r.set("ORDER_ID", id);
    r.set("STATUS", status);
    return r;
}

// Persist a diff the way a store would: ids for new errors, drop resolved
void apply(std::vector<ActiveError>& unresolved, const LifecycleDiff& diff, ErrorId& next_id) {
    for (const auto& r : diff.resolved) {
        std::erase_if(unresolved, [&](const ActiveError& e) { return e.id == r.id; });
    }
    for (const auto& u : diff.updated) {
        for (auto& e : unresolved) {
            if (e.id == u.id) e = u;
        }
    }
    for (auto c : diff.created) {
        c.id = next_id++;
        unresolved.push_back(std::move(c));
    }
}

const ActiveError* find_key(const std::vector<ActiveError>& errors, const std::string& key) {
    for (const auto& e : errors) {
        if (e.signature.display() == key) return &e;
    }
    return nullptr;
}

} // namespace

TEST_CASE("ErrorLifecycle: ORDER_ID create, update and resolve across cycles", "[lifecycle]") {
    const auto q = orders_query();
    const auto t1 = utils::make_local_time(2025, 6, 4, 10, 0);
    const auto t2 = t1 + std::chrono::minutes(15);
    std::vector<ActiveError> unresolved;
    ErrorId next_id = 1;

    auto cycle1 = ErrorLifecycleManager::diff(q, {order_row(1), order_row(2), order_row(3)}, unresolved, t1);
    REQUIRE(cycle1.is_ok());
    CHECK(cycle1.value().created.size() == 3);
    CHECK(cycle1.value().updated.empty());
    CHECK(cycle1.value().resolved.empty());
    apply(unresolved, cycle1.value(), next_id);

    auto cycle2 = ErrorLifecycleManager::diff(q, {order_row(2), order_row(3), order_row(4)}, unresolved, t2);
    REQUIRE(cycle2.is_ok());
    const auto& d = cycle2.value();

    REQUIRE(d.resolved.size() == 1);
    CHECK(d.resolved[0].signature.display() == "1");
    CHECK(d.resolved[0].resolved);
    REQUIRE(d.resolved[0].resolved_at.has_value());
    CHECK(*d.resolved[0].resolved_at >= d.resolved[0].last_seen);

    REQUIRE(d.created.size() == 1);
    CHECK(d.created[0].signature.display() == "4");
    CHECK(d.created[0].occurrence_count == 1);
    CHECK(d.created[0].first_seen == t2);

    REQUIRE(d.updated.size() == 2);
    for (const auto& u : d.updated) {
        CHECK(u.occurrence_count == 2);
        CHECK(u.first_seen == t1);
        CHECK(u.last_seen == t2);
    }
}

TEST_CASE("ErrorLifecycle: unchanged rows are idempotent", "[lifecycle]") {
    const auto q = orders_query();
    const auto t1 = utils::make_local_time(2025, 6, 4, 10, 0);
    std::vector<ActiveError> unresolved;
    ErrorId next_id = 1;
    const std::vector<Row> rows = {order_row(10), order_row(11)};

    auto first = ErrorLifecycleManager::diff(q, rows, unresolved, t1);
    REQUIRE(first.is_ok());
    apply(unresolved, first.value(), next_id);

    for (int i = 1; i <= 2; ++i) {
        auto again = ErrorLifecycleManager::diff(q, rows, unresolved, t1 + std::chrono::minutes(i));
        REQUIRE(again.is_ok());
        CHECK(again.value().created.empty());
        CHECK(again.value().resolved.empty());
        CHECK(again.value().updated.size() == 2);
        apply(unresolved, again.value(), next_id);
    }

    const auto* e = find_key(unresolved, "10");
    REQUIRE(e != nullptr);
    CHECK(e->occurrence_count == 3);
}

TEST_CASE("ErrorLifecycle: update refreshes the row snapshot", "[lifecycle]") {
    const auto q = orders_query();
    const auto t1 = utils::make_local_time(2025, 6, 4, 10, 0);
    std::vector<ActiveError> unresolved;
    ErrorId next_id = 1;

    auto first = ErrorLifecycleManager::diff(q, {order_row(5, "FAILED")}, unresolved, t1);
    REQUIRE(first.is_ok());
    apply(unresolved, first.value(), next_id);

    auto second = ErrorLifecycleManager::diff(q, {order_row(5, "STUCK")}, unresolved, t1 + std::chrono::minutes(1));
    REQUIRE(second.is_ok());
    REQUIRE(second.value().updated.size() == 1);
    CHECK(second.value().updated[0].row.get_string("STATUS") == "STUCK");
    CHECK(second.value().updated[0].id == 1);
}

TEST_CASE("ErrorLifecycle: duplicate signature in one fetch keeps last row", "[lifecycle]") {
    const auto q = orders_query();
    const auto t1 = utils::make_local_time(2025, 6, 4, 10, 0);

    auto d = ErrorLifecycleManager::diff(q, {order_row(1, "A"), order_row(1, "B")}, {}, t1);
    REQUIRE(d.is_ok());
    CHECK(d.value().duplicate_rows == 1);
    REQUIRE(d.value().created.size() == 1);
    CHECK(d.value().created[0].row.get_string("STATUS") == "B");
}

TEST_CASE("ErrorLifecycle: missing key field rejects the whole fetch", "[lifecycle]") {
    const auto q = orders_query();
    Row bad;
    bad.set("STATUS", std::string("FAILED"));

    auto d = ErrorLifecycleManager::diff(q, {order_row(1), bad}, {}, utils::now());
    REQUIRE(d.is_error());
    CHECK(d.error_category() == ErrorCategory::CONFIGURATION_ERROR);
}

TEST_CASE("ErrorLifecycle: empty fetch resolves everything", "[lifecycle]") {
    const auto q = orders_query();
    const auto t1 = utils::make_local_time(2025, 6, 4, 10, 0);
    std::vector<ActiveError> unresolved;
    ErrorId next_id = 1;

    auto first = ErrorLifecycleManager::diff(q, {order_row(1), order_row(2)}, unresolved, t1);
    REQUIRE(first.is_ok());
    apply(unresolved, first.value(), next_id);

    auto d = ErrorLifecycleManager::diff(q, {}, unresolved, t1 + std::chrono::minutes(5));
    REQUIRE(d.is_ok());
    CHECK(d.value().resolved.size() == 2);
    CHECK(d.value().created.empty());
}
