#include "notify/notification_types.hpp"
#include "routing/routing_types.hpp"
#include "core/utils.hpp"

namespace errorengine {

Destination Destination::parse(const std::string& recipient) {
    const std::string r = utils::trim(recipient);
    if (r.starts_with(keys::CHANNEL_PREFIX)) {
        return {DestinationKind::CHANNEL, utils::trim(r.substr(keys::CHANNEL_PREFIX.size()))};
    }
    return {DestinationKind::EMAIL, r};
}

std::string Destination::to_string() const {
    if (kind == DestinationKind::CHANNEL) {
        return std::string(keys::CHANNEL_PREFIX) + id;
    }
    return id;
}

} // namespace errorengine
