#include "notify/outbox_dispatcher.hpp"
#include "notify/payloads.hpp"
#include "core/utils.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <cstring>
#include <format>
#include <fstream>

namespace errorengine {

OutboxDispatcher::OutboxDispatcher(std::string path)
    : path_(std::move(path)) {}

std::string OutboxDispatcher::build_subject(
    NotificationKind kind, size_t error_count, const QueryMetadata& query) {
    if (kind == NotificationKind::REMINDER) {
        return std::format("[ErrorEngine] Reminder: {} unresolved error(s) - {}", error_count, query.name);
    }
    return std::format("[ErrorEngine] {} new error(s) - {}", error_count, query.name);
}

std::string OutboxDispatcher::build_line(
    const Destination& destination,
    NotificationKind kind,
    const std::vector<ErrorContext>& errors,
    const QueryMetadata& query) {

    nlohmann::ordered_json j;
    j["to"] = destination.id;
    j["kind"] = notification_kind_to_string(kind);
    j["subject"] = build_subject(kind, errors.size(), query);
    j["query"] = {{"id", query.id}, {"name", query.name}, {"description", query.description}};
    j["error_count"] = errors.size();

    auto arr = nlohmann::ordered_json::array();
    for (const auto& e : errors) {
        arr.push_back(payloads::error_to_json(e));
    }
    j["errors"] = std::move(arr);
    j["created_at"] = utils::format_timestamp(utils::now());

    return j.dump();
}

DeliveryResult OutboxDispatcher::send(
    const Destination& destination,
    NotificationKind kind,
    const std::vector<ErrorContext>& errors,
    const QueryMetadata& query) {

    if (destination.kind != DestinationKind::EMAIL) {
        return DeliveryResult::failed(std::format("outbox cannot deliver to '{}'", destination.to_string()));
    }

    std::string line;
    try {
        line = build_line(destination, kind, errors, query);
    } catch (const nlohmann::json::exception& e) {
        return DeliveryResult::failed(std::format("payload encoding failed: {}", e.what()));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::ofstream out(path_, std::ios::app);
    if (!out.is_open()) {
        return DeliveryResult::failed(std::format("cannot open outbox '{}': {}", path_, std::strerror(errno)));
    }
    out << line << '\n';
    out.flush();
    if (!out) {
        return DeliveryResult::failed(std::format("write to outbox '{}' failed", path_));
    }

    ++lines_written_;
    return DeliveryResult::ok(std::format("queued for {}", destination.id));
}

} // namespace errorengine
