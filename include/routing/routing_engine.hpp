#pragma once

#include "core/types.hpp"
#include "monitor/monitor_types.hpp"
#include "routing/routing_types.hpp"

#include <string>
#include <vector>

namespace errorengine {

/**
 * @brief Conditional routing of one error row through a query's rule set.
 *
 * Algorithm:
 * 1. Active rules sorted by (priority, id), stable
 * 2. Each matching rule contributes its recipients (deduplicated)
 * 3. A matching rule with stop_on_match ends evaluation
 * 4. No match -> default recipients or nothing, per NoMatchAction
 *
 * Condition failures are local: an invalid regex makes that condition false
 * and is reported in RoutingDecision::warnings.
 */
class RoutingEngine {
public:
    [[nodiscard]] static RoutingDecision route(
        const Row& row,
        const std::vector<RoutingRule>& rules,
        const std::vector<std::string>& default_recipients,
        NoMatchAction no_match_action);

    /**
     * @brief Query-level routing.
     *
     * With routing disabled the query's recipients are used as-is. The
     * query's channels are added to every non-empty decision.
     */
    [[nodiscard]] static RoutingDecision route_for_query(
        const Row& row,
        const MonitoredQuery& query,
        const std::vector<RoutingRule>& rules);

    [[nodiscard]] static bool rule_matches(
        const RoutingRule& rule,
        const Row& row,
        std::vector<std::string>* warnings = nullptr);

    /// Active rules in evaluation order
    [[nodiscard]] static std::vector<const RoutingRule*> evaluation_order(
        const std::vector<RoutingRule>& rules);
};

} // namespace errorengine
