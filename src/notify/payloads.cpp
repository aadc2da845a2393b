#include "notify/payloads.hpp"
#include "core/row_json.hpp"
#include "core/utils.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <algorithm>
#include <format>

namespace errorengine::payloads {

namespace {

std::string headline(NotificationKind kind, size_t count, const QueryMetadata& query) {
    if (kind == NotificationKind::REMINDER) {
        return std::format("Reminder: {} unresolved error(s) in '{}'", count, query.name);
    }
    return std::format("{} new error(s) in '{}'", count, query.name);
}

nlohmann::ordered_json query_json(const QueryMetadata& query) {
    nlohmann::ordered_json j;
    j["id"] = query.id;
    j["name"] = query.name;
    j["description"] = query.description;
    return j;
}

} // anonymous namespace

nlohmann::ordered_json error_to_json(const ErrorContext& error) {
    nlohmann::ordered_json j;
    j["error_id"] = error.error_id;
    j["key"] = error.signature;
    j["first_seen"] = utils::format_timestamp(error.first_seen);
    j["last_seen"] = utils::format_timestamp(error.last_seen);
    j["occurrence_count"] = error.occurrence_count;
    j["data"] = row_to_json(error.row);
    return j;
}

nlohmann::ordered_json webhook_payload(
    NotificationKind kind,
    const std::vector<ErrorContext>& errors,
    const QueryMetadata& query) {

    nlohmann::ordered_json j;
    j["event"] = kind == NotificationKind::REMINDER ? "error_reminder" : "new_errors";
    j["query"] = query_json(query);
    j["error_count"] = errors.size();

    auto arr = nlohmann::ordered_json::array();
    const size_t n = std::min(errors.size(), kMaxErrorsPerPayload);
    for (size_t i = 0; i < n; ++i) {
        arr.push_back(error_to_json(errors[i]));
    }
    j["errors"] = std::move(arr);
    j["truncated"] = errors.size() > kMaxErrorsPerPayload;
    j["timestamp"] = utils::format_timestamp(utils::now());
    return j;
}

nlohmann::ordered_json teams_payload(
    NotificationKind kind,
    const std::vector<ErrorContext>& errors,
    const QueryMetadata& query) {

    nlohmann::ordered_json card;
    card["@type"] = "MessageCard";
    card["@context"] = "http://schema.org/extensions";
    card["themeColor"] = kind == NotificationKind::REMINDER ? "FFA500" : "D70000";
    card["summary"] = headline(kind, errors.size(), query);

    auto facts = nlohmann::ordered_json::array();
    const size_t n = std::min(errors.size(), kMaxErrorsPerPayload);
    for (size_t i = 0; i < n; ++i) {
        nlohmann::ordered_json fact;
        fact["name"] = errors[i].signature;
        fact["value"] = std::format("seen {}x since {}", errors[i].occurrence_count,
                                    utils::format_timestamp(errors[i].first_seen));
        facts.push_back(std::move(fact));
    }

    nlohmann::ordered_json section;
    section["activityTitle"] = headline(kind, errors.size(), query);
    section["activitySubtitle"] = query.description;
    section["facts"] = std::move(facts);
    if (errors.size() > kMaxErrorsPerPayload) {
        section["text"] = std::format("... and {} more", errors.size() - kMaxErrorsPerPayload);
    }

    card["sections"] = nlohmann::ordered_json::array({std::move(section)});
    return card;
}

std::string telegram_text(
    NotificationKind kind,
    const std::vector<ErrorContext>& errors,
    const QueryMetadata& query) {

    std::string text = headline(kind, errors.size(), query);
    text += '\n';

    const size_t n = std::min(errors.size(), kMaxErrorsPerPayload);
    for (size_t i = 0; i < n; ++i) {
        text += std::format("\n- {} (x{})", errors[i].signature, errors[i].occurrence_count);
    }
    if (errors.size() > n) {
        text += std::format("\n... and {} more", errors.size() - n);
    }
    return text;
}

std::string hmac_signature(const std::string& secret, const std::string& body) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    HMAC(EVP_sha256(),
         secret.data(), static_cast<int>(secret.size()),
         reinterpret_cast<const unsigned char*>(body.data()),
         body.size(),
         digest, &digest_len);

    std::string hex;
    hex.reserve(7 + digest_len * 2);
    hex += "sha256=";
    for (unsigned int i = 0; i < digest_len; ++i) {
        hex += std::format("{:02x}", digest[i]);
    }
    return hex;
}

} // namespace errorengine::payloads
