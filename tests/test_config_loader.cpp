#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"
#include "config/config_watcher.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace errorengine;

namespace {

namespace fs = std::filesystem;

const char* kFullConfig = R"(
[logging]
level = "debug"

[scheduler]
tick_seconds = 10
fetch_timeout_seconds = 20
lock_ttl_seconds = 120
shutdown_timeout_ms = 5000

[store]
type = "memory"

[outbox]
path = "/tmp/errorengine-outbox.jsonl"

[config_watcher]
enabled = false
poll_interval_seconds = 2

[[sources]]
name = "warehouse"
type = "postgresql"
connection_string = "host=localhost dbname=wh"

[[sources]]
name = "tickets"
type = "http"
url = "https://api.example.com/tickets"
method = "post"
body = '{"status":"open"}'
response_path = "data.items"
headers = { Accept = "application/json" }

[sources.auth]
type = "api_key"
key_name = "X-Token"
key_value = "abc"
in = "query"

[[channels]]
name = "alerts"
type = "webhook"
url = "https://hooks.example.com/alerts"
secret = "s3cret"

[[channels]]
name = "ops-chat"
type = "telegram"
bot_token = "123:ABC"
chat_id = "-100"

[[queries]]
name = "Failed orders"
description = "Orders stuck in FAILED"
source = "warehouse"
query = "SELECT ORDER_ID, WAREHOUSE FROM orders WHERE status = 'FAILED'"
key_fields = ["ORDER_ID"]
interval_minutes = 5
active_days = [1, 2, 3, 4, 5]
window_start = "08:00"
window_end = "18:00"
channels = ["alerts"]
reminder_interval_minutes = 60
reminder_max_count = 3
aggregation = "per_error"

[queries.routing]
enabled = true
default_recipients = ["support@x.com", "channel:ops-chat"]
no_match_action = "send_default"

[[queries.rules]]
name = "EU"
priority = 1
stop_on_match = true
recipients = ["eu@x.com"]

[[queries.rules.conditions]]
field = "WAREHOUSE"
operator = "contains"
value = "EU"

[[queries.rules]]
name = "Big"
priority = 2
logic = "or"
recipients = ["big@x.com"]

[[queries.rules.conditions]]
field = "AMOUNT"
operator = "gt"
value = 1000
)";

fs::path write_temp(const std::string& name, const std::string& content) {
    const auto dir = fs::temp_directory_path() / "errorengine_config_tests";
    fs::create_directories(dir);
    const auto path = dir / name;
    std::ofstream(path) << content;
    return path;
}

} // namespace

TEST_CASE("ConfigLoader: full configuration is extracted", "[config]") {
    const auto result = ConfigLoader::load_from_string(kFullConfig);
    INFO(result.error_message);
    REQUIRE(result.success);
    const auto& cfg = result.config;

    CHECK(cfg.logging.level == "debug");
    CHECK(cfg.scheduler.tick_seconds == 10);
    CHECK(cfg.scheduler.fetch_timeout_seconds == 20);
    CHECK(cfg.scheduler.lock_ttl_seconds == 120);
    CHECK(cfg.scheduler.shutdown_timeout_ms == 5000);
    CHECK(cfg.store.type == "memory");
    CHECK(cfg.outbox.path == "/tmp/errorengine-outbox.jsonl");
    CHECK_FALSE(cfg.config_watcher.enabled);

    REQUIRE(cfg.sources.size() == 2);
    CHECK(cfg.sources[0].type == SourceType::POSTGRESQL);
    const auto& http = cfg.sources[1].http;
    CHECK(cfg.sources[1].type == SourceType::HTTP);
    CHECK(http.method == "POST");
    CHECK(http.response_path == "data.items");
    CHECK(http.headers.at("Accept") == "application/json");
    CHECK(http.auth.type == HttpAuthType::API_KEY);
    CHECK(http.auth.key_name == "X-Token");
    CHECK(http.auth.key_in_query);

    REQUIRE(cfg.channels.size() == 2);
    CHECK(cfg.channels[0].secret == "s3cret");
    CHECK(cfg.channels[1].type == ChannelType::TELEGRAM);

    REQUIRE(cfg.queries.size() == 1);
    const auto& q = cfg.queries[0].query;
    CHECK(q.name == "Failed orders");
    CHECK(q.key_fields == std::vector<std::string>{"ORDER_ID"});
    CHECK(q.interval_minutes == 5);
    CHECK(q.active_days == std::set<int>{1, 2, 3, 4, 5});
    REQUIRE(q.window.has_value());
    CHECK(q.window->start == TimeOfDay{8, 0});
    CHECK(q.aggregation == AggregationMode::PER_ERROR);
    CHECK(q.routing_enabled);
    CHECK(q.default_recipients.size() == 2);
    CHECK(q.reminder_max_count == 3);

    const auto& rules = cfg.queries[0].rules;
    REQUIRE(rules.size() == 2);
    CHECK(rules[0].id == 1);
    CHECK(rules[0].stop_on_match);
    REQUIRE(rules[0].conditions.size() == 1);
    CHECK(rules[0].conditions[0].op == ConditionOperator::CONTAINS);
    CHECK(rules[1].logic == ConditionLogic::OR);
    REQUIRE(rules[1].conditions.size() == 1);
    CHECK(rules[1].conditions[0].value == "1000");
}

TEST_CASE("ConfigLoader: defaults apply to an empty file", "[config]") {
    const auto result = ConfigLoader::load_from_string("");
    REQUIRE(result.success);
    CHECK(result.config.logging.level == "info");
    CHECK(result.config.scheduler.tick_seconds == 30);
    CHECK(result.config.store.type == "sqlite");
    CHECK(result.config.store.path == "errorengine.db");
    CHECK(result.config.config_watcher.enabled);
    CHECK(result.config.queries.empty());
}

TEST_CASE("ConfigLoader: environment variables are expanded", "[config]") {
    ::setenv("ERRORENGINE_TEST_DSN", "host=db.internal", 1);
    const auto result = ConfigLoader::load_from_string(R"(
[[sources]]
name = "wh"
type = "postgresql"
connection_string = "${ERRORENGINE_TEST_DSN} dbname=wh"
)");
    REQUIRE(result.success);
    REQUIRE(result.config.sources.size() == 1);
    CHECK(result.config.sources[0].connection_string == "host=db.internal dbname=wh");
    ::unsetenv("ERRORENGINE_TEST_DSN");
}

TEST_CASE("ConfigLoader: every problem is reported at once", "[config]") {
    const auto result = ConfigLoader::load_from_string(R"(
[logging]
level = "loud"

[scheduler]
tick_seconds = 0

[[sources]]
name = "wh"
type = "oracle"

[[queries]]
name = "q1"
source = "nowhere"
query = "DELETE FROM x"
key_fields = []
channels = ["missing"]
)");
    REQUIRE_FALSE(result.success);
    const auto& msg = result.error_message;
    CHECK(msg.starts_with("Config validation failed:\n  - "));
    CHECK(msg.find("unknown type 'oracle'") != std::string::npos);
    CHECK(msg.find("logging.level") != std::string::npos);
    CHECK(msg.find("tick_seconds") != std::string::npos);
    CHECK(msg.find("unknown source 'nowhere'") != std::string::npos);
    CHECK(msg.find("at least one key field") != std::string::npos);
    CHECK(msg.find("unknown channel 'missing'") != std::string::npos);
    CHECK(msg.find("SELECT") != std::string::npos);
}

TEST_CASE("ConfigLoader: channel references in rules must exist", "[config]") {
    const auto result = ConfigLoader::load_from_string(R"(
[[sources]]
name = "wh"
type = "sqlite"
connection_string = "wh.db"

[[queries]]
name = "orders"
source = "wh"
query = "SELECT ID FROM orders"
key_fields = ["ID"]

[queries.routing]
enabled = true

[[queries.rules]]
recipients = ["channel:nope"]
)");
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.find("unknown channel 'nope'") != std::string::npos);
}

TEST_CASE("ConfigLoader: half-open time window is rejected", "[config]") {
    const auto result = ConfigLoader::load_from_string(R"(
[[sources]]
name = "wh"
type = "sqlite"
connection_string = "wh.db"

[[queries]]
name = "orders"
source = "wh"
query = "SELECT ID FROM orders"
key_fields = ["ID"]
recipients = ["ops@x.com"]
window_start = "08:00"
)");
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.find("must be set together") != std::string::npos);
}

TEST_CASE("ConfigLoader: malformed TOML is a parse error", "[config]") {
    const auto result = ConfigLoader::load_from_string("[logging\nlevel = ");
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.starts_with("Failed to parse config"));
}

TEST_CASE("ConfigLoader: missing file is a load error", "[config]") {
    const auto result = ConfigLoader::load_from_file("/nonexistent/errorengine.toml");
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.starts_with("Failed to load config"));
}

TEST_CASE("ConfigLoader: includes merge with the including file winning", "[config]") {
    write_temp("sources.toml", R"(
[logging]
level = "warn"

[[sources]]
name = "wh"
type = "sqlite"
connection_string = "wh.db"
)");
    const auto main = write_temp("main.toml", R"(
include = ["sources.toml"]

[logging]
level = "error"

[[queries]]
name = "orders"
source = "wh"
query = "SELECT ID FROM orders"
key_fields = ["ID"]
recipients = ["ops@x.com"]
)");

    const auto result = ConfigLoader::load_from_file(main.string());
    INFO(result.error_message);
    REQUIRE(result.success);
    CHECK(result.config.logging.level == "error");
    REQUIRE(result.config.sources.size() == 1);
    CHECK(result.config.sources[0].name == "wh");
    CHECK(result.config.queries.size() == 1);
}

TEST_CASE("ConfigLoader: circular includes are rejected", "[config]") {
    write_temp("loop_a.toml", "include = [\"loop_b.toml\"]\n");
    const auto b = write_temp("loop_b.toml", "include = [\"loop_a.toml\"]\n");

    const auto result = ConfigLoader::load_from_file(b.string());
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.find("Circular config include") != std::string::npos);
}

TEST_CASE("ConfigWatcher: reloads only when the file changes", "[config]") {
    const auto path = write_temp("watched.toml", "[logging]\nlevel = \"info\"\n");
    ConfigWatcher watcher(path.string(), std::chrono::seconds(1));

    std::string seen_level;
    watcher.set_callback([&](const EngineConfig& cfg) { seen_level = cfg.logging.level; });

    CHECK_FALSE(watcher.poll_once());

    std::ofstream(path) << "[logging]\nlevel = \"debug\"\n";
    fs::last_write_time(path, fs::last_write_time(path) + std::chrono::seconds(5));
    CHECK(watcher.poll_once());
    CHECK(seen_level == "debug");
    CHECK(watcher.reload_count() == 1);

    // Broken edit keeps the running config
    std::ofstream(path) << "[logging]\nlevel = \"nonsense\"\n";
    fs::last_write_time(path, fs::last_write_time(path) + std::chrono::seconds(10));
    CHECK_FALSE(watcher.poll_once());
    CHECK(seen_level == "debug");
    CHECK(watcher.reload_count() == 1);
    CHECK(watcher.rejected_count() == 1);

    // Same broken revision is not retried
    CHECK_FALSE(watcher.poll_once());
    CHECK(watcher.rejected_count() == 1);
}

TEST_CASE("ConfigWatcher: edits to an included file trigger a reload", "[config]") {
    const auto inc = write_temp("watched_inc.toml", "[logging]\nlevel = \"warn\"\n");
    const auto main = write_temp("watched_main.toml", "include = [\"watched_inc.toml\"]\n");
    ConfigWatcher watcher(main.string(), std::chrono::seconds(1));
    CHECK(watcher.watched_files().size() == 1);

    std::string seen_level;
    watcher.set_callback([&](const EngineConfig& cfg) { seen_level = cfg.logging.level; });

    // First change resolves the include set
    fs::last_write_time(main, fs::last_write_time(main) + std::chrono::seconds(5));
    REQUIRE(watcher.poll_once());
    CHECK(seen_level == "warn");
    CHECK(watcher.watched_files().size() == 2);

    std::ofstream(inc) << "[logging]\nlevel = \"debug\"\n";
    fs::last_write_time(inc, fs::last_write_time(inc) + std::chrono::seconds(5));
    CHECK(watcher.poll_once());
    CHECK(seen_level == "debug");
    CHECK(watcher.reload_count() == 2);
}
