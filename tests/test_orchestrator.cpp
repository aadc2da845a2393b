#include <catch2/catch_test_macros.hpp>
#include "scheduler/orchestrator.hpp"
#include "store/memory_store.hpp"
#include "core/utils.hpp"
#include "mocks/mock_dispatcher.hpp"
#include "mocks/mock_source_adapter.hpp"

#include <thread>

using namespace errorengine;
using errorengine::testing::MockSourceAdapter;
using errorengine::testing::RecordingDispatcher;

namespace {

// 2025-06-04 is a Wednesday
const TimePoint kT1 = utils::make_local_time(2025, 6, 4, 10, 0);

struct Harness {
    std::shared_ptr<MemoryStore> store;
    std::shared_ptr<MockSourceAdapter> source = std::make_shared<MockSourceAdapter>("warehouse");
    std::shared_ptr<SourceRegistry> sources = std::make_shared<SourceRegistry>();
    std::shared_ptr<RecordingDispatcher> dispatcher = std::make_shared<RecordingDispatcher>();
    std::unique_ptr<Orchestrator> orchestrator;

    explicit Harness(std::shared_ptr<MemoryStore> s = std::make_shared<MemoryStore>())
        : store(std::move(s)) {
        sources->add("warehouse", source);
        orchestrator = std::make_unique<Orchestrator>(store, sources, dispatcher);
    }

    QueryId add(const MonitoredQuery& q, const std::vector<RoutingRule>& rules = {}) {
        auto r = orchestrator->upsert_query(q, rules);
        REQUIRE(r.is_ok());
        return r.value();
    }
};

MonitoredQuery orders_query(const std::string& name = "Failed orders") {
    MonitoredQuery q;
    q.name = name;
    q.source = "warehouse";
    q.query_text = "SELECT ORDER_ID, WAREHOUSE FROM orders WHERE status = 'FAILED'";
    q.key_fields = {"ORDER_ID"};
    q.interval_minutes = 15;
    q.recipients = {"ops@x.com"};
    return q;
}

Row order(int64_t id, const std::string& warehouse = "EU-NORTH") {
    Row r;
    r.set("ORDER_ID", id);
    r.set("WAREHOUSE", warehouse);
    return r;
}

const ActiveError* find_key(const std::vector<ActiveError>& errors, const std::string& key) {
    for (const auto& e : errors) {
        if (e.signature.display() == key) return &e;
    }
    return nullptr;
}

// Resolves one error by hand after the cycle has read the open set
class ManualResolveStore : public MemoryStore {
public:
    std::optional<ErrorId> resolve_before_apply;
    TimePoint resolved_at{};

    AppliedDiff apply_diff(QueryId query_id, const LifecycleDiff& diff) override {
        if (resolve_before_apply) {
            resolve_error(*resolve_before_apply, resolved_at);
            resolve_before_apply.reset();
        }
        return MemoryStore::apply_diff(query_id, diff);
    }
};

// Completes another cycle of the query just before the lock is taken
class CompetingCycleStore : public MemoryStore {
public:
    bool complete_before_lock = false;

    bool try_lock_query(QueryId id, TimePoint now, std::chrono::seconds ttl) override {
        if (complete_before_lock) {
            complete_before_lock = false;
            record_check(id, now, 0, 0);
        }
        return MemoryStore::try_lock_query(id, now, ttl);
    }
};

} // namespace

TEST_CASE("Orchestrator: ORDER_ID errors are created, updated and resolved", "[orchestrator]") {
    Harness h;
    const auto id = h.add(orders_query());

    h.source->set_rows({order(1), order(2), order(3)});
    const auto first = h.orchestrator->maybe_run(id, kT1);
    REQUIRE(first.status == ExecutionStatus::SUCCESS);
    CHECK(first.rows_returned == 3);
    CHECK(first.new_errors == 3);
    CHECK(first.notifications_sent == 1);

    auto sent = h.dispatcher->sent();
    REQUIRE(sent.size() == 1);
    CHECK(sent[0].destination.id == "ops@x.com");
    CHECK(sent[0].kind == NotificationKind::NEW);
    CHECK(sent[0].errors.size() == 3);
    CHECK(sent[0].query.name == "Failed orders");

    h.source->set_rows({order(2), order(3), order(4)});
    const auto second = h.orchestrator->maybe_run(id, kT1 + std::chrono::minutes(15));
    REQUIRE(second.status == ExecutionStatus::SUCCESS);
    CHECK(second.new_errors == 1);
    CHECK(second.resolved_errors == 1);

    const auto open = h.orchestrator->list_active_errors(id);
    REQUIRE(open.size() == 3);
    CHECK(find_key(open, "1") == nullptr);
    REQUIRE(find_key(open, "2") != nullptr);
    CHECK(find_key(open, "2")->occurrence_count == 2);
    CHECK(find_key(open, "2")->notified);
    REQUIRE(find_key(open, "4") != nullptr);
    CHECK(find_key(open, "4")->notified);

    // Only the new error is announced
    sent = h.dispatcher->sent();
    REQUIRE(sent.size() == 2);
    REQUIRE(sent[1].errors.size() == 1);
    CHECK(sent[1].errors[0].signature == "4");

    const auto q = *h.store->get_query(id);
    CHECK(q.total_errors_found == 4);
    CHECK(q.total_notifications_sent == 2);
    CHECK(q.last_check_at == kT1 + std::chrono::minutes(15));
}

TEST_CASE("Orchestrator: query outside its window is skipped without fetching", "[orchestrator]") {
    Harness h;
    auto q = orders_query();
    q.window = TimeWindow{TimeOfDay{8, 0}, TimeOfDay{18, 0}};
    const auto id = h.add(q);

    const auto r = h.orchestrator->maybe_run(id, utils::make_local_time(2025, 6, 4, 19, 0));
    CHECK(r.status == ExecutionStatus::SKIPPED);
    CHECK(r.error_message.find("time window") != std::string::npos);
    CHECK(h.source->fetch_count() == 0);
    CHECK(h.orchestrator->recent_executions(id, 10).empty());

    const auto status = h.orchestrator->query_status(id, kT1);
    REQUIRE(status.is_ok());
    REQUIRE(status.value().last_outcome.has_value());
    CHECK(status.value().last_outcome->status == ExecutionStatus::SKIPPED);
}

TEST_CASE("Orchestrator: interval not elapsed skips the scheduled path only", "[orchestrator]") {
    Harness h;
    const auto id = h.add(orders_query());
    h.source->set_rows({order(1)});

    REQUIRE(h.orchestrator->maybe_run(id, kT1).status == ExecutionStatus::SUCCESS);
    CHECK(h.orchestrator->maybe_run(id, kT1 + std::chrono::minutes(5)).status == ExecutionStatus::SKIPPED);
    CHECK(h.orchestrator->run_now(id, kT1 + std::chrono::minutes(5)).status == ExecutionStatus::SUCCESS);
    CHECK(h.source->fetch_count() == 2);
}

TEST_CASE("Orchestrator: concurrent runs of one query execute once", "[orchestrator]") {
    Harness h;
    const auto id = h.add(orders_query());
    h.source->set_rows({order(1)});
    h.source->block();

    ExecutionResult first;
    std::thread worker([&] { first = h.orchestrator->run_now(id, kT1); });
    REQUIRE(h.source->wait_until_entered(std::chrono::seconds(5)));

    const auto second = h.orchestrator->run_now(id, kT1);
    CHECK(second.status == ExecutionStatus::SKIPPED);
    CHECK(second.error_message == "already running");

    h.source->release();
    worker.join();

    CHECK(first.status == ExecutionStatus::SUCCESS);
    CHECK(h.source->fetch_count() == 1);
    CHECK(h.orchestrator->list_active_errors(id).size() == 1);
    CHECK_FALSE(h.orchestrator->locks().is_held(id));
    CHECK_FALSE(h.store->get_query(id)->locked_at.has_value());
}

TEST_CASE("Orchestrator: source failure leaves state untouched", "[orchestrator]") {
    Harness h;
    const auto id = h.add(orders_query());
    h.source->set_rows({order(1), order(2)});
    REQUIRE(h.orchestrator->run_now(id, kT1).status == ExecutionStatus::SUCCESS);

    h.source->set_failure(SourceErrorKind::CONNECTION, "connection refused");
    const auto later = kT1 + std::chrono::minutes(30);
    const auto r = h.orchestrator->run_now(id, later);

    CHECK(r.status == ExecutionStatus::ERROR);
    CHECK(r.error_message.find("connection refused") != std::string::npos);
    // Failed fetch must not resolve anything
    CHECK(h.orchestrator->list_active_errors(id).size() == 2);
    CHECK(h.store->get_query(id)->last_check_at == kT1);
    CHECK_FALSE(h.orchestrator->locks().is_held(id));
    CHECK_FALSE(h.store->get_query(id)->locked_at.has_value());

    const auto log = h.orchestrator->recent_executions(id, 10);
    REQUIRE(log.size() == 2);
    CHECK(log[0].status == ExecutionStatus::ERROR);
    CHECK(log[1].status == ExecutionStatus::SUCCESS);
}

TEST_CASE("Orchestrator: timed-out fetch releases the lock and changes nothing", "[orchestrator]") {
    Harness h;
    auto q = orders_query();
    q.timeout = std::chrono::seconds(1);
    const auto id = h.add(q);
    h.source->set_rows({order(1), order(2)});
    REQUIRE(h.orchestrator->run_now(id, kT1).status == ExecutionStatus::SUCCESS);

    // Fetch hangs past the deadline; the rows it would return are gone
    h.source->set_rows({order(3)});
    h.source->block();
    const auto later = kT1 + std::chrono::minutes(30);
    const auto r = h.orchestrator->run_now(id, later);

    CHECK(r.status == ExecutionStatus::ERROR);
    CHECK(r.error_message.find("timeout") != std::string::npos);
    CHECK(h.orchestrator->list_active_errors(id).size() == 2);
    CHECK(h.store->get_query(id)->last_check_at == kT1);
    CHECK_FALSE(h.orchestrator->locks().is_held(id));
    CHECK_FALSE(h.store->get_query(id)->locked_at.has_value());

    // The abandoned worker finishes on its own; the next run is not blocked by it
    h.source->set_rows({order(1), order(2)});
    h.source->release();
    const auto next = h.orchestrator->run_now(id, later + std::chrono::minutes(1));
    CHECK(next.status == ExecutionStatus::SUCCESS);
    CHECK(next.error_message.find("already running") == std::string::npos);
    CHECK(next.new_errors == 0);
    CHECK(h.orchestrator->list_active_errors(id).size() == 2);
}

TEST_CASE("Orchestrator: error resolved by hand during a cycle stays resolved", "[orchestrator]") {
    auto store = std::make_shared<ManualResolveStore>();
    Harness h(store);
    auto q = orders_query();
    q.reminder_interval_minutes = 60;
    const auto id = h.add(q);

    h.source->set_rows({order(1), order(2)});
    REQUIRE(h.orchestrator->run_now(id, kT1).status == ExecutionStatus::SUCCESS);
    const auto open = h.orchestrator->list_active_errors(id);
    const auto* first = find_key(open, "1");
    REQUIRE(first != nullptr);
    const auto first_id = first->id;

    const auto manual_at = kT1 + std::chrono::minutes(90);
    store->resolve_before_apply = first_id;
    store->resolved_at = manual_at;
    const auto r = h.orchestrator->run_now(id, kT1 + std::chrono::hours(2));
    REQUIRE(r.status == ExecutionStatus::SUCCESS);
    CHECK(r.new_errors == 0);
    CHECK(r.resolved_errors == 0);

    // Only the error still open is reminded about
    const auto sent = h.dispatcher->sent();
    REQUIRE(sent.size() == 2);
    CHECK(sent[1].kind == NotificationKind::REMINDER);
    REQUIRE(sent[1].errors.size() == 1);
    CHECK(sent[1].errors[0].signature == "2");

    const auto resolved = h.store->get_error(first_id);
    REQUIRE(resolved.has_value());
    CHECK(resolved->resolved);
    CHECK(resolved->occurrence_count == 1);
    CHECK(resolved->resolved_at == manual_at);
    CHECK(h.orchestrator->list_active_errors(id).size() == 1);
}

TEST_CASE("Orchestrator: scheduled run re-checks the interval once locked", "[orchestrator]") {
    auto store = std::make_shared<CompetingCycleStore>();
    Harness h(store);
    const auto id = h.add(orders_query());
    h.source->set_rows({order(1)});

    store->complete_before_lock = true;
    const auto r = h.orchestrator->maybe_run(id, kT1);
    CHECK(r.status == ExecutionStatus::SKIPPED);
    CHECK(r.error_message.find("interval") != std::string::npos);
    CHECK(h.source->fetch_count() == 0);
    CHECK_FALSE(h.orchestrator->locks().is_held(id));
    CHECK_FALSE(h.store->get_query(id)->locked_at.has_value());

    // Once the interval has passed the query runs normally
    const auto next = h.orchestrator->maybe_run(id, kT1 + std::chrono::minutes(15));
    CHECK(next.status == ExecutionStatus::SUCCESS);
    CHECK(h.source->fetch_count() == 1);
}

TEST_CASE("Orchestrator: missing key field fails the cycle", "[orchestrator]") {
    Harness h;
    const auto id = h.add(orders_query());

    Row bad;
    bad.set("ID", int64_t{1});
    h.source->set_rows({bad});

    const auto r = h.orchestrator->run_now(id, kT1);
    CHECK(r.status == ExecutionStatus::ERROR);
    CHECK(r.error_message.find("ORDER_ID") != std::string::npos);
    CHECK(h.orchestrator->list_active_errors(id).empty());
}

TEST_CASE("Orchestrator: unknown source is an error result", "[orchestrator]") {
    Harness h;
    auto q = orders_query();
    q.source = "elsewhere";
    const auto id = h.store->save_query(q);

    const auto r = h.orchestrator->run_now(id, kT1);
    CHECK(r.status == ExecutionStatus::ERROR);
    CHECK(r.error_message == "unknown source 'elsewhere'");
}

TEST_CASE("Orchestrator: failed delivery does not roll back lifecycle", "[orchestrator]") {
    Harness h;
    const auto id = h.add(orders_query());
    h.dispatcher->fail_for("ops@x.com");
    h.source->set_rows({order(1), order(2)});

    const auto r = h.orchestrator->run_now(id, kT1);
    CHECK(r.status == ExecutionStatus::SUCCESS);
    CHECK(r.new_errors == 2);
    CHECK(r.notifications_sent == 0);

    const auto open = h.orchestrator->list_active_errors(id);
    REQUIRE(open.size() == 2);
    CHECK_FALSE(open[0].notified);
    CHECK_FALSE(open[1].notified);
}

TEST_CASE("Orchestrator: rules route errors to different recipients", "[orchestrator]") {
    Harness h;
    auto q = orders_query();
    q.routing_enabled = true;
    q.default_recipients = {"support@x.com"};
    q.channels = {"alerts"};

    RoutingRule eu;
    eu.name = "EU warehouses";
    eu.priority = 1;
    eu.conditions = {Condition{"WAREHOUSE", ConditionOperator::CONTAINS, "EU", false}};
    eu.recipients = {"eu-team@x.com"};
    eu.stop_on_match = true;

    const auto id = h.add(q, {eu});
    h.source->set_rows({order(1, "EU-NORTH"), order(2, "US-EAST")});

    const auto r = h.orchestrator->run_now(id, kT1);
    REQUIRE(r.status == ExecutionStatus::SUCCESS);
    CHECK(r.notifications_sent == 3);

    const auto sent = h.dispatcher->sent();
    REQUIRE(sent.size() == 3);
    CHECK(sent[0].destination.to_string() == "eu-team@x.com");
    REQUIRE(sent[0].errors.size() == 1);
    CHECK(sent[0].errors[0].signature == "1");

    CHECK(sent[1].destination.to_string() == "channel:alerts");
    CHECK(sent[1].errors.size() == 2);

    CHECK(sent[2].destination.to_string() == "support@x.com");
    REQUIRE(sent[2].errors.size() == 1);
    CHECK(sent[2].errors[0].signature == "2");
}

TEST_CASE("Orchestrator: reminders follow the interval and cap", "[orchestrator]") {
    Harness h;
    auto q = orders_query();
    q.reminder_interval_minutes = 60;
    q.reminder_max_count = 1;
    const auto id = h.add(q);
    h.source->set_rows({order(1)});

    REQUIRE(h.orchestrator->run_now(id, kT1).notifications_sent == 1);

    const auto early = h.orchestrator->run_now(id, kT1 + std::chrono::minutes(30));
    CHECK(early.reminders_sent == 0);
    CHECK(early.notifications_sent == 0);

    const auto due = h.orchestrator->run_now(id, kT1 + std::chrono::minutes(60));
    CHECK(due.reminders_sent == 1);
    CHECK(due.notifications_sent == 1);
    CHECK(h.dispatcher->sent().back().kind == NotificationKind::REMINDER);

    const auto capped = h.orchestrator->run_now(id, kT1 + std::chrono::minutes(180));
    CHECK(capped.reminders_sent == 0);

    const auto open = h.orchestrator->list_active_errors(id);
    REQUIRE(open.size() == 1);
    CHECK(open[0].reminder_count == 1);
}

TEST_CASE("Orchestrator: manual resolution and re-creation", "[orchestrator]") {
    Harness h;
    const auto id = h.add(orders_query());
    h.source->set_rows({order(1)});
    REQUIRE(h.orchestrator->run_now(id, kT1).new_errors == 1);

    const auto error_id = h.orchestrator->list_active_errors(id).front().id;
    const auto resolved = h.orchestrator->resolve_manually(error_id, kT1 + std::chrono::minutes(1));
    REQUIRE(resolved.is_ok());
    CHECK(resolved.value().resolved);
    CHECK(h.orchestrator->list_active_errors(id).empty());

    const auto again = h.orchestrator->resolve_manually(error_id, kT1 + std::chrono::minutes(2));
    REQUIRE(again.is_error());
    CHECK(again.error_category() == ErrorCategory::CONFIGURATION_ERROR);

    const auto missing = h.orchestrator->resolve_manually(9999, kT1);
    REQUIRE(missing.is_error());
    CHECK(missing.error_category() == ErrorCategory::STORE_ERROR);

    // Still failing at the source: tracked again as a brand new error
    const auto r = h.orchestrator->run_now(id, kT1 + std::chrono::minutes(15));
    CHECK(r.new_errors == 1);
    const auto open = h.orchestrator->list_active_errors(id);
    REQUIRE(open.size() == 1);
    CHECK(open[0].id != error_id);
    CHECK(h.dispatcher->count() == 2);
}

TEST_CASE("Orchestrator: next scheduled run picks the soonest query", "[orchestrator]") {
    Harness h;
    CHECK_FALSE(h.orchestrator->get_next_scheduled_run(kT1).has_value());

    auto fast = orders_query("fast query");
    fast.interval_minutes = 15;
    auto slow = orders_query("slow query");
    slow.interval_minutes = 60;
    const auto fast_id = h.add(fast);
    const auto slow_id = h.add(slow);
    h.source->set_rows({});

    REQUIRE(h.orchestrator->run_now(fast_id, kT1).status == ExecutionStatus::SUCCESS);
    REQUIRE(h.orchestrator->run_now(slow_id, kT1).status == ExecutionStatus::SUCCESS);

    const auto next = h.orchestrator->get_next_scheduled_run(kT1 + std::chrono::minutes(1));
    REQUIRE(next.has_value());
    CHECK(next->query_id == fast_id);
    CHECK(next->query_name == "fast query");
    CHECK(next->seconds_remaining == 14 * 60);
}

TEST_CASE("Orchestrator: upsert rejects invalid definitions", "[orchestrator]") {
    Harness h;

    auto q = orders_query();
    q.key_fields.clear();
    q.query_text = "DELETE FROM orders";
    q.recipients = {"not-an-email"};

    const auto r = h.orchestrator->upsert_query(q, {});
    REQUIRE(r.is_error());
    CHECK(r.error_category() == ErrorCategory::CONFIGURATION_ERROR);
    CHECK(r.error_message().find("Query 'Failed orders' is invalid") != std::string::npos);
    CHECK(r.error_message().find("key field") != std::string::npos);
    CHECK(r.error_message().find("SELECT") != std::string::npos);
    CHECK(r.error_message().find("not-an-email") != std::string::npos);

    auto unknown = orders_query();
    unknown.source = "nowhere";
    const auto u = h.orchestrator->upsert_query(unknown, {});
    REQUIRE(u.is_error());
    CHECK(u.error_message().find("unknown source 'nowhere'") != std::string::npos);

    CHECK(h.orchestrator->list_queries().empty());
}

TEST_CASE("Orchestrator: upsert by name keeps runtime state", "[orchestrator]") {
    Harness h;
    const auto id = h.add(orders_query());
    h.source->set_rows({order(1)});
    REQUIRE(h.orchestrator->run_now(id, kT1).status == ExecutionStatus::SUCCESS);

    auto edited = orders_query();
    edited.description = "edited";
    const auto again = h.add(edited);
    CHECK(again == id);

    const auto q = *h.store->get_query(id);
    CHECK(q.description == "edited");
    CHECK(q.last_check_at == kT1);
    CHECK(h.orchestrator->list_active_errors(id).size() == 1);
}

TEST_CASE("Orchestrator: sync deactivates queries dropped from config", "[orchestrator]") {
    Harness h;
    const std::vector<QueryDefinition> both = {{orders_query("query one"), {}},
                                               {orders_query("query two"), {}}};
    const auto first = h.orchestrator->sync_configuration(both);
    CHECK(first.ok());
    CHECK(first.created == 2);

    const std::vector<QueryDefinition> one = {{orders_query("query one"), {}}};
    const auto second = h.orchestrator->sync_configuration(one);
    CHECK(second.ok());
    CHECK(second.updated == 1);
    CHECK(second.deactivated == 1);

    const auto dropped = h.store->find_query_by_name("query two");
    REQUIRE(dropped.has_value());
    CHECK_FALSE(dropped->active);
    CHECK(h.store->find_query_by_name("query one")->active);

    auto broken = orders_query("query one");
    broken.key_fields.clear();
    const std::vector<QueryDefinition> invalid = {{broken, {}}};
    const auto third = h.orchestrator->sync_configuration(invalid);
    CHECK_FALSE(third.ok());
    CHECK(third.errors.size() == 1);
}

TEST_CASE("Orchestrator: query status summarises state", "[orchestrator]") {
    Harness h;
    auto q = orders_query();
    q.reminder_interval_minutes = 30;
    const auto id = h.add(q);
    h.source->set_rows({order(1), order(2)});
    REQUIRE(h.orchestrator->run_now(id, kT1).status == ExecutionStatus::SUCCESS);

    const auto status = h.orchestrator->query_status(id, kT1 + std::chrono::minutes(45));
    REQUIRE(status.is_ok());
    const auto& s = status.value();
    CHECK(s.name == "Failed orders");
    CHECK(s.active);
    CHECK(s.active_errors == 2);
    CHECK(s.pending_reminders == 2);
    CHECK(s.total_errors_found == 2);
    CHECK(s.total_notifications_sent == 1);
    REQUIRE(s.last_outcome.has_value());
    CHECK(s.last_outcome->status == ExecutionStatus::SUCCESS);

    CHECK(h.orchestrator->query_status(9999, kT1).is_error());
}

TEST_CASE("Orchestrator: recover_locks clears stale markers", "[orchestrator]") {
    Harness h;
    const auto id = h.add(orders_query());
    REQUIRE(h.store->try_lock_query(id, kT1, std::chrono::seconds(300)));

    CHECK(h.orchestrator->run_now(id, kT1).status == ExecutionStatus::SKIPPED);
    CHECK(h.orchestrator->recover_locks() == 1);
    CHECK(h.orchestrator->run_now(id, kT1).status == ExecutionStatus::SUCCESS);
}
