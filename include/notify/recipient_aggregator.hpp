#pragma once

#include "monitor/monitor_types.hpp"
#include "notify/notification_types.hpp"

#include <unordered_map>
#include <vector>

namespace errorengine {

/// ActiveError -> transport-facing snapshot
[[nodiscard]] ErrorContext make_error_context(const ActiveError& error);

/**
 * @brief Groups routed errors of one cycle into a delivery plan.
 *
 * PER_RECIPIENT: one entry per (destination, kind) carrying every error
 * routed there. PER_ERROR: one entry per (destination, kind, error).
 * New and reminder notifications never share an entry. Entries come out in
 * order of first appearance; errors within an entry in insertion order.
 */
class RecipientAggregator {
public:
    explicit RecipientAggregator(AggregationMode mode = AggregationMode::PER_RECIPIENT)
        : mode_(mode) {}

    void add(const ErrorContext& error, NotificationKind kind,
             const std::vector<std::string>& recipients);

    [[nodiscard]] std::vector<DeliveryPlanEntry> build() const;

    [[nodiscard]] size_t destination_count() const { return plan_.size(); }
    [[nodiscard]] bool empty() const { return plan_.empty(); }

private:
    struct GroupKey {
        Destination destination;
        NotificationKind kind;
        ErrorId error_id;   // 0 in PER_RECIPIENT mode

        bool operator==(const GroupKey&) const = default;
    };

    struct GroupKeyHash {
        size_t operator()(const GroupKey& k) const {
            size_t h = DestinationHash{}(k.destination);
            h ^= std::hash<int>{}(static_cast<int>(k.kind)) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
            h ^= std::hash<ErrorId>{}(k.error_id) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
            return h;
        }
    };

    AggregationMode mode_;
    std::vector<DeliveryPlanEntry> plan_;
    std::unordered_map<GroupKey, size_t, GroupKeyHash> index_;
};

} // namespace errorengine
