#pragma once

#include "notify/idispatcher.hpp"

#include <cstdint>
#include <mutex>
#include <string>

namespace errorengine {

/**
 * @brief Email transport that appends one JSON line per notification to an
 * outbox file picked up by an external mailer.
 *
 * Line shape:
 *   {"to":..., "kind":"new|reminder", "subject":..., "query":{...},
 *    "error_count":N, "errors":[{...}], "created_at":...}
 */
class OutboxDispatcher : public INotificationDispatcher {
public:
    explicit OutboxDispatcher(std::string path);

    [[nodiscard]] DeliveryResult send(
        const Destination& destination,
        NotificationKind kind,
        const std::vector<ErrorContext>& errors,
        const QueryMetadata& query) override;

    [[nodiscard]] std::string name() const override { return "outbox:" + path_; }

    [[nodiscard]] static std::string build_subject(
        NotificationKind kind, size_t error_count, const QueryMetadata& query);

    [[nodiscard]] static std::string build_line(
        const Destination& destination,
        NotificationKind kind,
        const std::vector<ErrorContext>& errors,
        const QueryMetadata& query);

    [[nodiscard]] uint64_t lines_written() const { return lines_written_; }

private:
    std::string path_;
    std::mutex mutex_;
    uint64_t lines_written_ = 0;
};

} // namespace errorengine
