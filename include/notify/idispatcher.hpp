#pragma once

#include "notify/notification_types.hpp"

#include <string>
#include <vector>

namespace errorengine {

/**
 * @brief Transport collaborator for one delivery plan entry.
 *
 * Implementations must not throw: transport failures are reported through
 * DeliveryResult and never touch lifecycle state.
 */
class INotificationDispatcher {
public:
    virtual ~INotificationDispatcher() = default;

    [[nodiscard]] virtual DeliveryResult send(
        const Destination& destination,
        NotificationKind kind,
        const std::vector<ErrorContext>& errors,
        const QueryMetadata& query) = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace errorengine
