#include "core/utils.hpp"
#include "config/config_loader.hpp"
#include "config/config_watcher.hpp"
#include "notify/channel_dispatcher.hpp"
#include "notify/outbox_dispatcher.hpp"
#include "notify/routing_dispatcher.hpp"
#include "scheduler/orchestrator.hpp"
#include "scheduler/scheduler.hpp"
#include "source/http_source.hpp"
#include "source/source_registry.hpp"
#include "source/sqlite_source.hpp"
#include "store/memory_store.hpp"
#include "store/sqlite_store.hpp"

// Optional SQL source adapters
#ifdef ERRORENGINE_ENABLE_POSTGRESQL
#include "source/postgresql/pg_source.hpp"
#endif
#ifdef ERRORENGINE_ENABLE_MYSQL
#include "source/mysql/mysql_source.hpp"
#endif

#include <atomic>
#include <csignal>
#include <cstring>
#include <format>
#include <iostream>
#include <memory>
#include <thread>

using namespace errorengine;

namespace {

std::atomic<bool> g_stop_requested{false};

// =========================================================================
// Explicit source registration (ensures linker includes adapter objects)
// =========================================================================

void register_sources() {
    auto& registry = SourceFactoryRegistry::instance();

    #ifdef ERRORENGINE_ENABLE_POSTGRESQL
    registry.register_factory(SourceType::POSTGRESQL,
        [](const SourceConfig& cfg) { return std::make_shared<PgSource>(cfg); });
    #endif

    #ifdef ERRORENGINE_ENABLE_MYSQL
    registry.register_factory(SourceType::MYSQL,
        [](const SourceConfig& cfg) { return std::make_shared<MysqlSource>(cfg); });
    #endif

    registry.register_factory(SourceType::SQLITE,
        [](const SourceConfig& cfg) { return std::make_shared<SqliteSource>(cfg); });
    registry.register_factory(SourceType::HTTP,
        [](const SourceConfig& cfg) { return std::make_shared<HttpSource>(cfg); });
}

void signal_handler(int) {
    g_stop_requested.store(true);
}

void print_usage(const char* prog) {
    std::cerr << std::format("Usage: {} --config <path> [--once]\n", prog);
}

void log_sync_report(const SyncReport& report) {
    utils::log::info(std::format("Queries synced: {} created, {} updated, {} deactivated, {} rejected",
        report.created, report.updated, report.deactivated, report.errors.size()));
}

void apply_sources(SourceRegistry& sources, const std::vector<SourceConfig>& configs) {
    for (const auto& problem : sources.rebuild(configs)) {
        utils::log::warn(std::format("Source unavailable: {}", problem));
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::string config_file = "config/errorengine.toml";
    bool once = false;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_file = argv[++i];
        } else if (std::strcmp(argv[i], "--once") == 0) {
            once = true;
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            print_usage(argv[0]);
            return 0;
        } else {
            print_usage(argv[0]);
            return 2;
        }
    }

    try {
        register_sources();

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        utils::log::info(std::format("[1/6] Loading configuration from {}", config_file));
        auto config_result = ConfigLoader::load_from_file(config_file);
        if (!config_result.success) {
            utils::log::error(config_result.error_message);
            return 1;
        }
        const auto& cfg = config_result.config;
        utils::log::set_level(utils::log::parse_level(cfg.logging.level));
        utils::log::info(std::format("Config loaded: {} sources, {} channels, {} queries",
            cfg.sources.size(), cfg.channels.size(), cfg.queries.size()));

        utils::log::info(std::format("[2/6] Opening {} store", cfg.store.type));
        std::shared_ptr<IStateStore> store;
        if (cfg.store.type == "memory") {
            store = std::make_shared<MemoryStore>();
        } else {
            store = std::make_shared<SqliteStore>(cfg.store.path);
        }

        utils::log::info("[3/6] Building sources and transports");
        auto sources = std::make_shared<SourceRegistry>();
        apply_sources(*sources, cfg.sources);

        auto channels = std::make_shared<ChannelDispatcher>(cfg.channels);
        auto outbox = std::make_shared<OutboxDispatcher>(cfg.outbox.path);
        auto dispatcher = std::make_shared<RoutingDispatcher>(outbox, channels);

        OrchestratorConfig orch_cfg;
        orch_cfg.default_fetch_timeout = std::chrono::seconds(cfg.scheduler.fetch_timeout_seconds);
        orch_cfg.lock_ttl = std::chrono::seconds(cfg.scheduler.lock_ttl_seconds);
        auto orchestrator = std::make_shared<Orchestrator>(store, sources, dispatcher, orch_cfg);

        utils::log::info("[4/6] Recovering locks and syncing queries");
        orchestrator->recover_locks();
        log_sync_report(orchestrator->sync_configuration(cfg.queries));

        SchedulerConfig sched_cfg;
        sched_cfg.tick = std::chrono::seconds(cfg.scheduler.tick_seconds);
        sched_cfg.shutdown_timeout = std::chrono::milliseconds(cfg.scheduler.shutdown_timeout_ms);
        auto scheduler = std::make_shared<Scheduler>(orchestrator, sched_cfg);

        if (once) {
            utils::log::info("[5/6] Evaluating every query once");
            size_t failures = 0;
            for (const auto& r : scheduler->run_once(utils::now())) {
                if (r.status == ExecutionStatus::ERROR) ++failures;
                std::cout << std::format("{}\t{}\trows={}\tnew={}\tresolved={}\t{}\n",
                    r.query_name, execution_status_to_string(r.status),
                    r.rows_returned, r.new_errors, r.resolved_errors, r.error_message);
            }
            utils::log::info("[6/6] Done");
            return failures == 0 ? 0 : 1;
        }

        utils::log::info("[5/6] Starting scheduler");
        scheduler->start();

        std::unique_ptr<ConfigWatcher> watcher;
        if (cfg.config_watcher.enabled) {
            watcher = std::make_unique<ConfigWatcher>(
                config_file, std::chrono::seconds(cfg.config_watcher.poll_interval_seconds));
            watcher->set_callback([sources, channels, orchestrator](const EngineConfig& new_cfg) {
                utils::log::set_level(utils::log::parse_level(new_cfg.logging.level));
                apply_sources(*sources, new_cfg.sources);
                channels->set_channels(new_cfg.channels);
                log_sync_report(orchestrator->sync_configuration(new_cfg.queries));
            });
            watcher->start();
        } else {
            utils::log::info("Config watcher: disabled");
        }

        if (const auto next = orchestrator->get_next_scheduled_run(utils::now())) {
            utils::log::info(std::format("[6/6] Running; next query '{}' in {}s",
                                         next->query_name, next->seconds_remaining));
        } else {
            utils::log::info("[6/6] Running; no query is currently schedulable");
        }

        while (!g_stop_requested.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds{200});
        }

        utils::log::info("Shutdown requested");
        if (watcher) watcher->stop();
        scheduler->stop();

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }

    return 0;
}
