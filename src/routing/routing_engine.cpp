#include "routing/routing_engine.hpp"
#include "routing/condition_evaluator.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <unordered_set>

namespace errorengine {

namespace {

class RecipientSet {
public:
    explicit RecipientSet(std::vector<std::string>& out) : out_(out) {}

    void add(const std::string& recipient) {
        std::string r = utils::trim(recipient);
        if (r.empty()) return;
        if (seen_.insert(r).second) {
            out_.push_back(std::move(r));
        }
    }

    void add_all(const std::vector<std::string>& recipients) {
        for (const auto& r : recipients) add(r);
    }

private:
    std::vector<std::string>& out_;
    std::unordered_set<std::string> seen_;
};

std::string rule_label(const RoutingRule& rule) {
    return rule.name.empty() ? std::format("#{}", rule.id) : rule.name;
}

} // anonymous namespace

std::vector<const RoutingRule*> RoutingEngine::evaluation_order(
    const std::vector<RoutingRule>& rules) {

    std::vector<const RoutingRule*> ordered;
    ordered.reserve(rules.size());
    for (const auto& rule : rules) {
        if (rule.active) ordered.push_back(&rule);
    }

    std::stable_sort(ordered.begin(), ordered.end(),
        [](const RoutingRule* a, const RoutingRule* b) {
            if (a->priority != b->priority) return a->priority < b->priority;
            return a->id < b->id;
        });
    return ordered;
}

bool RoutingEngine::rule_matches(
    const RoutingRule& rule,
    const Row& row,
    std::vector<std::string>* warnings) {

    if (rule.conditions.empty()) return true;

    if (rule.logic == ConditionLogic::OR) {
        for (const auto& cond : rule.conditions) {
            if (ConditionEvaluator::evaluate(cond, row, warnings)) return true;
        }
        return false;
    }

    for (const auto& cond : rule.conditions) {
        if (!ConditionEvaluator::evaluate(cond, row, warnings)) return false;
    }
    return true;
}

RoutingDecision RoutingEngine::route(
    const Row& row,
    const std::vector<RoutingRule>& rules,
    const std::vector<std::string>& default_recipients,
    NoMatchAction no_match_action) {

    RoutingDecision decision;
    RecipientSet recipients(decision.recipients);

    for (const RoutingRule* rule : evaluation_order(rules)) {
        if (!rule_matches(*rule, row, &decision.warnings)) continue;

        decision.matched_rules.push_back(rule_label(*rule));
        recipients.add_all(rule->recipients);

        if (rule->stop_on_match) {
            decision.stopped = true;
            break;
        }
    }

    if (decision.matched_rules.empty() && no_match_action == NoMatchAction::SEND_DEFAULT) {
        recipients.add_all(default_recipients);
        decision.used_default = true;
    }

    return decision;
}

RoutingDecision RoutingEngine::route_for_query(
    const Row& row,
    const MonitoredQuery& query,
    const std::vector<RoutingRule>& rules) {

    RoutingDecision decision;
    if (query.routing_enabled) {
        decision = route(row, rules, query.default_recipients, query.no_match_action);
        for (const auto& w : decision.warnings) {
            utils::log::warn(std::format("Query '{}' routing: {}", query.name, w));
        }
    } else {
        RecipientSet(decision.recipients).add_all(query.recipients);
    }

    // Routing said "skip": channels stay quiet too
    if (query.routing_enabled && !decision.should_notify()) {
        return decision;
    }

    std::vector<std::string> channels;
    channels.reserve(query.channels.size());
    for (const auto& ch : query.channels) {
        channels.push_back(std::string(keys::CHANNEL_PREFIX) + utils::trim(ch));
    }

    // Rebuild the set so channel entries dedup against rule-supplied ones
    std::vector<std::string> merged;
    RecipientSet all(merged);
    all.add_all(decision.recipients);
    all.add_all(channels);
    decision.recipients = std::move(merged);

    return decision;
}

} // namespace errorengine
