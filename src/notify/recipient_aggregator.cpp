#include "notify/recipient_aggregator.hpp"

#include <unordered_set>

namespace errorengine {

ErrorContext make_error_context(const ActiveError& error) {
    ErrorContext ctx;
    ctx.error_id = error.id;
    ctx.signature = error.signature.display();
    ctx.row = error.row;
    ctx.first_seen = error.first_seen;
    ctx.last_seen = error.last_seen;
    ctx.occurrence_count = error.occurrence_count;
    ctx.reminder_count = error.reminder_count;
    return ctx;
}

void RecipientAggregator::add(const ErrorContext& error, NotificationKind kind,
                              const std::vector<std::string>& recipients) {
    // The same destination listed twice for one error still gets it once
    std::unordered_set<Destination, DestinationHash> seen;

    for (const auto& recipient : recipients) {
        Destination dest = Destination::parse(recipient);
        if (dest.id.empty() || !seen.insert(dest).second) continue;

        GroupKey key{dest, kind, mode_ == AggregationMode::PER_ERROR ? error.error_id : 0};
        const auto [it, inserted] = index_.try_emplace(std::move(key), plan_.size());
        if (inserted) {
            DeliveryPlanEntry entry;
            entry.destination = std::move(dest);
            entry.kind = kind;
            plan_.push_back(std::move(entry));
        }
        plan_[it->second].errors.push_back(error);
    }
}

std::vector<DeliveryPlanEntry> RecipientAggregator::build() const {
    return plan_;
}

} // namespace errorengine
