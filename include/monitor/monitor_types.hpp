#pragma once

#include "core/types.hpp"
#include "lifecycle/key_signature.hpp"
#include "routing/routing_types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace errorengine {

namespace keys {
    inline constexpr std::string_view PER_RECIPIENT = "per_recipient";
    inline constexpr std::string_view PER_ERROR     = "per_error";

    inline constexpr std::string_view STATUS_SUCCESS = "success";
    inline constexpr std::string_view STATUS_SKIPPED = "skipped";
    inline constexpr std::string_view STATUS_ERROR   = "error";

    inline constexpr std::string_view REASON_ALREADY_RUNNING = "already running";
}

// ============================================================================
// Scheduling
// ============================================================================

struct TimeOfDay {
    int hour = 0;
    int minute = 0;

    [[nodiscard]] constexpr int minutes() const { return hour * 60 + minute; }

    bool operator==(const TimeOfDay&) const = default;
};

/// "HH:MM" (24h). nullopt on malformed or out-of-range input.
[[nodiscard]] std::optional<TimeOfDay> parse_time_of_day(std::string_view s);
[[nodiscard]] std::string format_time_of_day(const TimeOfDay& t);

/**
 * @brief Daily execution window: start inclusive, end exclusive.
 * Windows never wrap midnight; start < end is enforced at edit time.
 */
struct TimeWindow {
    TimeOfDay start;
    TimeOfDay end;

    [[nodiscard]] bool contains(int minute_of_day) const {
        return minute_of_day >= start.minutes() && minute_of_day < end.minutes();
    }
};

enum class AggregationMode {
    PER_RECIPIENT,  // One notification per destination with all its errors
    PER_ERROR       // One notification per (destination, error)
};

[[nodiscard]] constexpr std::string_view aggregation_mode_to_string(AggregationMode m) {
    return m == AggregationMode::PER_ERROR ? keys::PER_ERROR : keys::PER_RECIPIENT;
}

[[nodiscard]] inline std::optional<AggregationMode> parse_aggregation_mode(std::string_view s) {
    if (s == keys::PER_RECIPIENT) return AggregationMode::PER_RECIPIENT;
    if (s == keys::PER_ERROR) return AggregationMode::PER_ERROR;
    return std::nullopt;
}

// ============================================================================
// MonitoredQuery
// ============================================================================

struct MonitoredQuery {
    QueryId id = 0;
    std::string name;
    std::string description;

    // Source
    std::string source;                       // Name of a configured source
    std::string query_text;
    std::vector<std::string> key_fields;      // Ordered
    std::chrono::seconds timeout{0};          // 0 = scheduler default

    // Scheduling
    int interval_minutes = 15;
    std::set<int> active_days{1, 2, 3, 4, 5, 6, 7};   // ISO weekday
    std::optional<TimeWindow> window;
    bool active = true;

    // Notification
    std::vector<std::string> recipients;      // Used when routing is disabled
    std::vector<std::string> channels;        // Notified for every delivery
    AggregationMode aggregation = AggregationMode::PER_RECIPIENT;

    // Routing
    bool routing_enabled = false;
    std::vector<std::string> default_recipients;
    NoMatchAction no_match_action = NoMatchAction::SEND_DEFAULT;

    // Reminders
    int reminder_interval_minutes = 0;        // 0 = disabled
    int reminder_max_count = 5;               // 0 = unlimited

    // Runtime state (owned by the orchestrator)
    std::optional<TimePoint> last_check_at;
    std::optional<TimePoint> locked_at;
    std::optional<TimePoint> last_error_at;
    uint64_t total_errors_found = 0;
    uint64_t total_notifications_sent = 0;

    [[nodiscard]] bool reminders_enabled() const { return reminder_interval_minutes > 0; }
};

/// A query together with its routing rules, as edited or loaded from config
struct QueryDefinition {
    MonitoredQuery query;
    std::vector<RoutingRule> rules;
};

// ============================================================================
// ActiveError
// ============================================================================

struct ActiveError {
    ErrorId id = 0;
    QueryId query_id = 0;
    KeySignature signature;
    Row row;

    TimePoint first_seen;
    TimePoint last_seen;
    uint64_t occurrence_count = 1;

    bool resolved = false;
    std::optional<TimePoint> resolved_at;

    bool notified = false;                    // First notification delivered
    std::optional<TimePoint> last_notified_at;
    int reminder_count = 0;
};

// ============================================================================
// Execution results
// ============================================================================

enum class ExecutionStatus {
    SUCCESS,
    SKIPPED,
    ERROR
};

[[nodiscard]] constexpr std::string_view execution_status_to_string(ExecutionStatus s) {
    switch (s) {
        case ExecutionStatus::SUCCESS: return keys::STATUS_SUCCESS;
        case ExecutionStatus::SKIPPED: return keys::STATUS_SKIPPED;
        case ExecutionStatus::ERROR:   return keys::STATUS_ERROR;
        default: return "unknown";
    }
}

[[nodiscard]] inline ExecutionStatus parse_execution_status(std::string_view s) {
    if (s == keys::STATUS_SUCCESS) return ExecutionStatus::SUCCESS;
    if (s == keys::STATUS_SKIPPED) return ExecutionStatus::SKIPPED;
    return ExecutionStatus::ERROR;
}

/**
 * @brief Outcome of one maybe_run / run_now call.
 *
 * error_message carries the skip reason for SKIPPED and the failure for ERROR.
 */
struct ExecutionResult {
    QueryId query_id = 0;
    std::string query_name;
    ExecutionStatus status = ExecutionStatus::SUCCESS;
    size_t rows_returned = 0;
    size_t new_errors = 0;
    size_t resolved_errors = 0;
    size_t reminders_sent = 0;
    size_t notifications_sent = 0;
    std::string error_message;
    TimePoint executed_at;
    std::chrono::milliseconds duration{0};

    static ExecutionResult skipped(QueryId id, std::string name, std::string reason) {
        ExecutionResult r;
        r.query_id = id;
        r.query_name = std::move(name);
        r.status = ExecutionStatus::SKIPPED;
        r.error_message = std::move(reason);
        return r;
    }
};

/// Persisted execution log row
struct ExecutionLogEntry {
    int64_t id = 0;
    QueryId query_id = 0;
    TimePoint executed_at;
    ExecutionStatus status = ExecutionStatus::SUCCESS;
    size_t rows_returned = 0;
    size_t new_errors = 0;
    size_t resolved_errors = 0;
    size_t reminders_sent = 0;
    size_t notifications_sent = 0;
    int64_t duration_ms = 0;
    std::string message;
};

struct QueryStatus {
    QueryId query_id = 0;
    std::string name;
    bool active = false;
    size_t active_errors = 0;
    size_t pending_reminders = 0;
    uint64_t total_errors_found = 0;
    uint64_t total_notifications_sent = 0;
    std::optional<TimePoint> last_check_at;
    std::optional<TimePoint> last_error_at;
    std::optional<ExecutionResult> last_outcome;
};

struct NextRun {
    QueryId query_id = 0;
    std::string query_name;
    int64_t seconds_remaining = 0;
};

} // namespace errorengine
