#pragma once

#include "monitor/monitor_types.hpp"
#include "notify/notification_types.hpp"
#include "source/isource_adapter.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace errorengine {

// ============================================================================
// Configuration Types
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

struct SchedulerSettings {
    int tick_seconds = 30;
    int fetch_timeout_seconds = 30;      // Default for queries without timeout_seconds
    int lock_ttl_seconds = 300;          // Store lock markers older than this are stale
    uint32_t shutdown_timeout_ms = 30000;
};

struct StoreConfig {
    std::string type = "sqlite";         // sqlite | memory
    std::string path = "errorengine.db";
};

struct OutboxConfig {
    std::string path = "outbox.jsonl";   // JSONL handed to an external mailer
};

struct ConfigWatcherConfig {
    bool enabled = true;
    int poll_interval_seconds = 5;
};

/// Complete parsed configuration
struct EngineConfig {
    LoggingConfig logging;
    SchedulerSettings scheduler;
    StoreConfig store;
    OutboxConfig outbox;
    ConfigWatcherConfig config_watcher;
    std::vector<SourceConfig> sources;
    std::vector<ChannelConfig> channels;
    std::vector<QueryDefinition> queries;
};

} // namespace errorengine
