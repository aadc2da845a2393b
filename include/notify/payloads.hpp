#pragma once

#include "notify/notification_types.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace errorengine::payloads {

/// Rows carried by one channel payload
inline constexpr size_t kMaxErrorsPerPayload = 50;

[[nodiscard]] nlohmann::ordered_json error_to_json(const ErrorContext& error);

/// Generic webhook body (errors truncated to kMaxErrorsPerPayload)
[[nodiscard]] nlohmann::ordered_json webhook_payload(
    NotificationKind kind,
    const std::vector<ErrorContext>& errors,
    const QueryMetadata& query);

/// Microsoft Teams MessageCard
[[nodiscard]] nlohmann::ordered_json teams_payload(
    NotificationKind kind,
    const std::vector<ErrorContext>& errors,
    const QueryMetadata& query);

/// Plain-text Telegram message
[[nodiscard]] std::string telegram_text(
    NotificationKind kind,
    const std::vector<ErrorContext>& errors,
    const QueryMetadata& query);

/// "sha256=<lowercase hex HMAC-SHA256(secret, body)>"
[[nodiscard]] std::string hmac_signature(const std::string& secret, const std::string& body);

} // namespace errorengine::payloads
