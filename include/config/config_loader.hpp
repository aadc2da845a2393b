#pragma once

#include "config/config_types.hpp"

#include <toml.hpp>

#include <string>
#include <vector>

namespace errorengine {

/**
 * @brief Typed configuration from a TOML file.
 *
 * Strings support ${ENV_VAR} expansion. A top-level `include = [...]`
 * pulls in other files relative to the including one; tables are merged
 * deeply with the including file winning, arrays of tables are appended.
 *
 * Every problem found is reported at once:
 * "Config validation failed:\n  - first\n  - second".
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        EngineConfig config;
        std::vector<std::string> source_files;   // Main file plus resolved includes

        static LoadResult ok(EngineConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /// Cross-section checks on an extracted config
    [[nodiscard]] static std::vector<std::string> validate_config(const EngineConfig& config);

private:
    using Problems = std::vector<std::string>;

    static EngineConfig extract_all_sections(const toml::table& root, Problems& problems);
    static LoadResult validate_and_return(EngineConfig config, Problems problems);

    static LoggingConfig extract_logging(const toml::table& root);
    static SchedulerSettings extract_scheduler(const toml::table& root);
    static StoreConfig extract_store(const toml::table& root);
    static OutboxConfig extract_outbox(const toml::table& root);
    static ConfigWatcherConfig extract_config_watcher(const toml::table& root);
    static std::vector<SourceConfig> extract_sources(const toml::table& root, Problems& problems);
    static std::vector<ChannelConfig> extract_channels(const toml::table& root, Problems& problems);
    static std::vector<QueryDefinition> extract_queries(const toml::table& root, Problems& problems);
    static std::vector<RoutingRule> extract_rules(const toml::table& query, const std::string& query_name,
                                                  Problems& problems);
};

} // namespace errorengine
