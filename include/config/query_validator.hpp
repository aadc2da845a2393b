#pragma once

#include "monitor/monitor_types.hpp"
#include "source/isource_adapter.hpp"

#include <optional>
#include <string>
#include <vector>

namespace errorengine {

/**
 * @brief Edit-time validation of a monitored query and its rules.
 *
 * Every problem is reported, not just the first. A running cycle never
 * re-validates: whatever passed here is trusted by the orchestrator.
 */
class QueryValidator {
public:
    /**
     * @param source_type Type of the referenced source, when known; SQL
     *        text checks apply to SQL sources only
     */
    [[nodiscard]] static std::vector<std::string> validate(
        const MonitoredQuery& query,
        const std::vector<RoutingRule>& rules,
        std::optional<SourceType> source_type);

    [[nodiscard]] static std::vector<std::string> validate_rules(
        const std::vector<RoutingRule>& rules);

    [[nodiscard]] static bool is_valid_email(const std::string& email);
    [[nodiscard]] static bool is_valid_key_field(const std::string& field);
    [[nodiscard]] static bool is_valid_name(const std::string& name);

    /// nullopt when the SQL is an acceptable read-only query
    [[nodiscard]] static std::optional<std::string> check_sql(const std::string& sql);

    /// Email address or "channel:<name>"
    [[nodiscard]] static std::optional<std::string> check_recipient(const std::string& recipient);
};

/// "Config validation failed:\n  - a\n  - b"
[[nodiscard]] std::string format_validation_errors(const std::vector<std::string>& errors);

} // namespace errorengine
