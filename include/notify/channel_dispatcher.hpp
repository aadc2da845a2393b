#pragma once

#include "notify/idispatcher.hpp"

#include <atomic>
#include <chrono>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace errorengine {

/**
 * @brief HTTP transport for webhook, Teams and Telegram channels.
 *
 * Channels are looked up by name; an unknown or disabled channel is a
 * failed delivery. set_channels() swaps the table on config reload.
 *
 * post() is the only network call and is virtual so tests can capture
 * requests instead of sending them.
 */
class ChannelDispatcher : public INotificationDispatcher {
public:
    using Headers = std::unordered_map<std::string, std::string>;

    struct HttpRequest {
        std::string url;
        Headers headers;
        std::string body;
        std::string content_type = "application/json";
    };

    ChannelDispatcher() = default;
    explicit ChannelDispatcher(const std::vector<ChannelConfig>& channels);
    ~ChannelDispatcher() override = default;

    void set_channels(const std::vector<ChannelConfig>& channels);

    [[nodiscard]] DeliveryResult send(
        const Destination& destination,
        NotificationKind kind,
        const std::vector<ErrorContext>& errors,
        const QueryMetadata& query) override;

    [[nodiscard]] std::string name() const override { return "channels"; }

    /// Request that would be sent for this channel (no I/O)
    [[nodiscard]] static HttpRequest build_request(
        const ChannelConfig& channel,
        NotificationKind kind,
        const std::vector<ErrorContext>& errors,
        const QueryMetadata& query);

    [[nodiscard]] uint64_t send_failures() const { return send_failures_.load(); }

protected:
    virtual DeliveryResult post(const HttpRequest& request, std::chrono::milliseconds timeout);

private:
    std::unordered_map<std::string, ChannelConfig> channels_;
    mutable std::shared_mutex mutex_;
    std::atomic<uint64_t> send_failures_{0};
};

} // namespace errorengine
