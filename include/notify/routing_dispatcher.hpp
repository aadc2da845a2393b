#pragma once

#include "notify/idispatcher.hpp"

#include <memory>

namespace errorengine {

/**
 * @brief Forwards each destination to the transport for its kind:
 * EMAIL -> email transport, CHANNEL -> channel transport.
 * A kind with no transport registered is a failed delivery.
 */
class RoutingDispatcher : public INotificationDispatcher {
public:
    RoutingDispatcher(std::shared_ptr<INotificationDispatcher> email,
                      std::shared_ptr<INotificationDispatcher> channels)
        : email_(std::move(email)), channels_(std::move(channels)) {}

    [[nodiscard]] DeliveryResult send(
        const Destination& destination,
        NotificationKind kind,
        const std::vector<ErrorContext>& errors,
        const QueryMetadata& query) override {

        auto& transport = destination.kind == DestinationKind::CHANNEL ? channels_ : email_;
        if (!transport) {
            return DeliveryResult::failed("no transport for " + destination.to_string());
        }
        return transport->send(destination, kind, errors, query);
    }

    [[nodiscard]] std::string name() const override { return "routing"; }

private:
    std::shared_ptr<INotificationDispatcher> email_;
    std::shared_ptr<INotificationDispatcher> channels_;
};

} // namespace errorengine
