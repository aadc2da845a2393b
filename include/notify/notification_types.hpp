#pragma once

#include "core/types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace errorengine {

namespace keys {
    inline constexpr std::string_view KIND_NEW      = "new";
    inline constexpr std::string_view KIND_REMINDER = "reminder";

    inline constexpr std::string_view CHANNEL_WEBHOOK  = "webhook";
    inline constexpr std::string_view CHANNEL_TEAMS    = "teams";
    inline constexpr std::string_view CHANNEL_TELEGRAM = "telegram";
}

enum class NotificationKind {
    NEW,
    REMINDER
};

[[nodiscard]] constexpr std::string_view notification_kind_to_string(NotificationKind k) {
    return k == NotificationKind::REMINDER ? keys::KIND_REMINDER : keys::KIND_NEW;
}

enum class DestinationKind {
    EMAIL,
    CHANNEL
};

/**
 * @brief Where a notification goes: an email address or a named channel.
 *
 * Recipient strings of the form "channel:<name>" are channels.
 */
struct Destination {
    DestinationKind kind = DestinationKind::EMAIL;
    std::string id;

    [[nodiscard]] static Destination parse(const std::string& recipient);
    [[nodiscard]] std::string to_string() const;

    bool operator==(const Destination&) const = default;
};

struct DestinationHash {
    size_t operator()(const Destination& d) const {
        return std::hash<std::string>{}(d.id) ^ (d.kind == DestinationKind::CHANNEL ? 0x9e3779b9U : 0U);
    }
};

/// Snapshot of one error handed to a transport
struct ErrorContext {
    ErrorId error_id = 0;
    std::string signature;        // Display form, e.g. "42|EU"
    Row row;
    TimePoint first_seen;
    TimePoint last_seen;
    uint64_t occurrence_count = 1;
    int reminder_count = 0;
};

struct QueryMetadata {
    QueryId id = 0;
    std::string name;
    std::string description;
};

/// One notification to send: destination + kind + the errors it carries
struct DeliveryPlanEntry {
    Destination destination;
    NotificationKind kind = NotificationKind::NEW;
    std::vector<ErrorContext> errors;
};

struct DeliveryResult {
    bool success = false;
    std::string message;

    static DeliveryResult ok(std::string msg = {}) { return {true, std::move(msg)}; }
    static DeliveryResult failed(std::string msg) { return {false, std::move(msg)}; }
};

// ============================================================================
// Channels
// ============================================================================

enum class ChannelType {
    WEBHOOK,
    TEAMS,
    TELEGRAM
};

[[nodiscard]] constexpr std::string_view channel_type_to_string(ChannelType t) {
    switch (t) {
        case ChannelType::WEBHOOK:  return keys::CHANNEL_WEBHOOK;
        case ChannelType::TEAMS:    return keys::CHANNEL_TEAMS;
        case ChannelType::TELEGRAM: return keys::CHANNEL_TELEGRAM;
        default: return "unknown";
    }
}

[[nodiscard]] inline std::optional<ChannelType> parse_channel_type(std::string_view s) {
    if (s == keys::CHANNEL_WEBHOOK) return ChannelType::WEBHOOK;
    if (s == keys::CHANNEL_TEAMS) return ChannelType::TEAMS;
    if (s == keys::CHANNEL_TELEGRAM) return ChannelType::TELEGRAM;
    return std::nullopt;
}

struct ChannelConfig {
    std::string name;
    ChannelType type = ChannelType::WEBHOOK;
    bool enabled = true;

    // webhook / teams
    std::string url;
    std::string secret;                                     // HMAC key, webhook only
    std::unordered_map<std::string, std::string> headers;

    // telegram
    std::string bot_token;
    std::string chat_id;
    std::string api_base = "https://api.telegram.org";

    std::chrono::milliseconds timeout{10000};
};

} // namespace errorengine
