#include <catch2/catch_test_macros.hpp>
#include "scheduler/scheduler.hpp"
#include "store/memory_store.hpp"
#include "core/utils.hpp"
#include "mocks/mock_dispatcher.hpp"
#include "mocks/mock_source_adapter.hpp"

#include <thread>
#include <vector>

using namespace errorengine;
using errorengine::testing::MockSourceAdapter;
using errorengine::testing::RecordingDispatcher;

namespace {

const TimePoint kNow = utils::make_local_time(2025, 6, 4, 10, 0);

MonitoredQuery query_on(const std::string& name, const std::string& source) {
    MonitoredQuery q;
    q.name = name;
    q.source = source;
    q.query_text = "SELECT ID FROM failures";
    q.key_fields = {"ID"};
    q.recipients = {"ops@x.com"};
    return q;
}

Row failure(int64_t id) {
    Row r;
    r.set("ID", id);
    return r;
}

bool wait_for_idle(const Scheduler& scheduler, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (scheduler.in_flight_count() > 0) {
        if (std::chrono::steady_clock::now() > deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
}

struct Fixture {
    std::shared_ptr<MemoryStore> store = std::make_shared<MemoryStore>();
    std::shared_ptr<MockSourceAdapter> good = std::make_shared<MockSourceAdapter>("good");
    std::shared_ptr<MockSourceAdapter> bad = std::make_shared<MockSourceAdapter>("bad");
    std::shared_ptr<SourceRegistry> sources = std::make_shared<SourceRegistry>();
    std::shared_ptr<Orchestrator> orchestrator;

    Fixture() {
        sources->add("good", good);
        sources->add("bad", bad);
        orchestrator = std::make_shared<Orchestrator>(store, sources,
                                                      std::make_shared<RecordingDispatcher>());
    }
};

} // namespace

TEST_CASE("DrainCoordinator: one cycle per query until draining", "[scheduler]") {
    using Admission = DrainCoordinator::Admission;
    DrainCoordinator cycles(std::chrono::milliseconds(50));

    CHECK(cycles.admit(1) == Admission::ADMITTED);
    CHECK(cycles.admit(2) == Admission::ADMITTED);
    CHECK(cycles.admit(1) == Admission::ALREADY_IN_FLIGHT);
    CHECK(cycles.in_flight_count() == 2);
    CHECK(cycles.is_in_flight(1));

    cycles.complete(1);
    CHECK_FALSE(cycles.is_in_flight(1));
    cycles.complete(1);
    CHECK(cycles.in_flight_count() == 1);

    cycles.begin_drain();
    CHECK(cycles.is_draining());
    CHECK(cycles.admit(3) == Admission::DRAINING);
    CHECK(cycles.in_flight() == std::vector<QueryId>{2});

    // Query 2 is still running: the bounded wait gives up
    CHECK_FALSE(cycles.await_drained());

    cycles.complete(2);
    CHECK(cycles.await_drained());
    CHECK(admission_to_string(Admission::DRAINING) == "draining");
}

TEST_CASE("DrainCoordinator: in_flight lists the longest running first", "[scheduler]") {
    DrainCoordinator cycles;
    REQUIRE(cycles.admit(7) == DrainCoordinator::Admission::ADMITTED);
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    REQUIRE(cycles.admit(3) == DrainCoordinator::Admission::ADMITTED);
    CHECK(cycles.in_flight() == std::vector<QueryId>{7, 3});
}

TEST_CASE("DrainCoordinator: drain completes once the last cycle ends", "[scheduler]") {
    DrainCoordinator cycles(std::chrono::milliseconds(5000));
    REQUIRE(cycles.admit(1) == DrainCoordinator::Admission::ADMITTED);
    cycles.begin_drain();

    std::thread worker([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        cycles.complete(1);
    });
    CHECK(cycles.await_drained());
    worker.join();
}

TEST_CASE("Scheduler: run_once evaluates every query independently", "[scheduler]") {
    Fixture f;
    f.good->set_rows({failure(1), failure(2)});
    f.bad->set_failure(SourceErrorKind::TIMEOUT, "took too long");

    const auto good_id = f.store->save_query(query_on("good query", "good"));
    const auto bad_id = f.store->save_query(query_on("bad query", "bad"));
    auto idle = query_on("idle query", "good");
    idle.active = false;
    const auto idle_id = f.store->save_query(idle);

    Scheduler scheduler(f.orchestrator);
    const auto results = scheduler.run_once(kNow);
    REQUIRE(results.size() == 3);

    for (const auto& r : results) {
        if (r.query_id == good_id) {
            CHECK(r.status == ExecutionStatus::SUCCESS);
            CHECK(r.new_errors == 2);
        } else if (r.query_id == bad_id) {
            CHECK(r.status == ExecutionStatus::ERROR);
            CHECK(r.error_message.find("took too long") != std::string::npos);
        } else {
            CHECK(r.query_id == idle_id);
            CHECK(r.status == ExecutionStatus::SKIPPED);
        }
    }
}

TEST_CASE("Scheduler: a query still in flight is not launched again", "[scheduler]") {
    Fixture f;
    f.good->set_rows({failure(1)});
    f.good->block();
    const auto id = f.store->save_query(query_on("slow query", "good"));

    Scheduler scheduler(f.orchestrator);
    CHECK(scheduler.tick(kNow) == 1);
    REQUIRE(f.good->wait_until_entered(std::chrono::seconds(5)));
    CHECK(scheduler.in_flight_count() == 1);

    CHECK(scheduler.tick(kNow) == 0);
    CHECK(scheduler.tick_count() == 2);

    f.good->release();
    REQUIRE(wait_for_idle(scheduler, std::chrono::seconds(5)));
    CHECK(f.good->fetch_count() == 1);
    CHECK(f.store->get_query(id)->last_check_at == kNow);

    // Interval not elapsed yet: nothing to launch
    CHECK(scheduler.tick(kNow + std::chrono::minutes(1)) == 0);
}

TEST_CASE("Scheduler: a slow source does not hold back other queries", "[scheduler]") {
    Fixture f;
    f.good->set_rows({failure(1)});
    f.bad->set_rows({failure(2)});
    f.bad->block();
    const auto fast_id = f.store->save_query(query_on("fast query", "good"));
    f.store->save_query(query_on("stuck query", "bad"));

    Scheduler scheduler(f.orchestrator);
    CHECK(scheduler.tick(kNow) == 2);

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!f.store->get_query(fast_id)->last_check_at && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    CHECK(f.store->get_query(fast_id)->last_check_at == kNow);
    CHECK(scheduler.in_flight_count() == 1);

    f.bad->release();
    CHECK(wait_for_idle(scheduler, std::chrono::seconds(5)));
}

TEST_CASE("Scheduler: start and stop the driver", "[scheduler]") {
    Fixture f;
    f.store->save_query(query_on("driven query", "good"));

    SchedulerConfig cfg;
    cfg.tick = std::chrono::seconds(3600);
    cfg.shutdown_timeout = std::chrono::milliseconds(2000);
    Scheduler scheduler(f.orchestrator, cfg);

    scheduler.start();
    CHECK(scheduler.is_running());
    scheduler.stop();
    CHECK_FALSE(scheduler.is_running());
    CHECK(scheduler.in_flight_count() == 0);

    // Stopped scheduler refuses new cycles
    CHECK(scheduler.tick(utils::now() + std::chrono::hours(24)) == 0);
}
