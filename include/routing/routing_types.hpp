#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace errorengine {

namespace keys {
    inline constexpr std::string_view EQUALS        = "equals";
    inline constexpr std::string_view NOT_EQUALS    = "not_equals";
    inline constexpr std::string_view CONTAINS      = "contains";
    inline constexpr std::string_view NOT_CONTAINS  = "not_contains";
    inline constexpr std::string_view STARTSWITH    = "startswith";
    inline constexpr std::string_view ENDSWITH      = "endswith";
    inline constexpr std::string_view IN            = "in";
    inline constexpr std::string_view NOT_IN        = "not_in";
    inline constexpr std::string_view GT            = "gt";
    inline constexpr std::string_view GTE           = "gte";
    inline constexpr std::string_view LT            = "lt";
    inline constexpr std::string_view LTE           = "lte";
    inline constexpr std::string_view IS_EMPTY      = "is_empty";
    inline constexpr std::string_view IS_NOT_EMPTY  = "is_not_empty";
    inline constexpr std::string_view REGEX         = "regex";
    inline constexpr std::string_view NOT_REGEX     = "not_regex";

    inline constexpr std::string_view LOGIC_AND     = "AND";
    inline constexpr std::string_view LOGIC_OR      = "OR";

    inline constexpr std::string_view SEND_DEFAULT  = "send_default";
    inline constexpr std::string_view SKIP          = "skip";

    inline constexpr std::string_view CHANNEL_PREFIX = "channel:";
}

enum class ConditionOperator {
    EQUALS,
    NOT_EQUALS,
    CONTAINS,
    NOT_CONTAINS,
    STARTSWITH,
    ENDSWITH,
    IN,
    NOT_IN,
    GT,
    GTE,
    LT,
    LTE,
    IS_EMPTY,
    IS_NOT_EMPTY,
    REGEX,
    NOT_REGEX
};

enum class ConditionLogic {
    AND,
    OR
};

enum class NoMatchAction {
    SEND_DEFAULT,
    SKIP
};

struct Condition {
    std::string field;
    ConditionOperator op = ConditionOperator::EQUALS;
    std::string value;
    bool case_sensitive = false;
};

/**
 * @brief Conditional routing rule, owned by one monitored query.
 *
 * Lower priority is evaluated first; ties fall back to id (creation order).
 */
struct RoutingRule {
    int64_t id = 0;
    std::string name;
    int priority = 0;
    ConditionLogic logic = ConditionLogic::AND;
    std::vector<Condition> conditions;   // Empty = catch-all
    std::vector<std::string> recipients; // Email addresses or "channel:<name>"
    bool active = true;
    bool stop_on_match = false;
};

/**
 * @brief Outcome of routing one error through a rule set
 */
struct RoutingDecision {
    std::vector<std::string> recipients;     // Deduplicated, first-seen order
    std::vector<std::string> matched_rules;  // Names (or "#id") of rules that fired
    bool used_default = false;
    bool stopped = false;                    // A stop-on-match rule ended evaluation
    std::vector<std::string> warnings;       // Non-fatal evaluation problems

    [[nodiscard]] bool should_notify() const { return !recipients.empty(); }
};

[[nodiscard]] constexpr std::string_view condition_operator_to_string(ConditionOperator op) {
    switch (op) {
        case ConditionOperator::EQUALS:       return keys::EQUALS;
        case ConditionOperator::NOT_EQUALS:   return keys::NOT_EQUALS;
        case ConditionOperator::CONTAINS:     return keys::CONTAINS;
        case ConditionOperator::NOT_CONTAINS: return keys::NOT_CONTAINS;
        case ConditionOperator::STARTSWITH:   return keys::STARTSWITH;
        case ConditionOperator::ENDSWITH:     return keys::ENDSWITH;
        case ConditionOperator::IN:           return keys::IN;
        case ConditionOperator::NOT_IN:       return keys::NOT_IN;
        case ConditionOperator::GT:           return keys::GT;
        case ConditionOperator::GTE:          return keys::GTE;
        case ConditionOperator::LT:           return keys::LT;
        case ConditionOperator::LTE:          return keys::LTE;
        case ConditionOperator::IS_EMPTY:     return keys::IS_EMPTY;
        case ConditionOperator::IS_NOT_EMPTY: return keys::IS_NOT_EMPTY;
        case ConditionOperator::REGEX:        return keys::REGEX;
        case ConditionOperator::NOT_REGEX:    return keys::NOT_REGEX;
        default: return "unknown";
    }
}

[[nodiscard]] inline std::optional<ConditionOperator> parse_condition_operator(std::string_view s) {
    static const std::unordered_map<std::string_view, ConditionOperator> lookup = {
        {keys::EQUALS,       ConditionOperator::EQUALS},
        {keys::NOT_EQUALS,   ConditionOperator::NOT_EQUALS},
        {keys::CONTAINS,     ConditionOperator::CONTAINS},
        {keys::NOT_CONTAINS, ConditionOperator::NOT_CONTAINS},
        {keys::STARTSWITH,   ConditionOperator::STARTSWITH},
        {keys::ENDSWITH,     ConditionOperator::ENDSWITH},
        {keys::IN,           ConditionOperator::IN},
        {keys::NOT_IN,       ConditionOperator::NOT_IN},
        {keys::GT,           ConditionOperator::GT},
        {keys::GTE,          ConditionOperator::GTE},
        {keys::LT,           ConditionOperator::LT},
        {keys::LTE,          ConditionOperator::LTE},
        {keys::IS_EMPTY,     ConditionOperator::IS_EMPTY},
        {keys::IS_NOT_EMPTY, ConditionOperator::IS_NOT_EMPTY},
        {keys::REGEX,        ConditionOperator::REGEX},
        {keys::NOT_REGEX,    ConditionOperator::NOT_REGEX},
    };

    const auto it = lookup.find(s);
    if (it == lookup.end()) return std::nullopt;
    return it->second;
}

[[nodiscard]] constexpr bool operator_needs_value(ConditionOperator op) {
    return op != ConditionOperator::IS_EMPTY && op != ConditionOperator::IS_NOT_EMPTY;
}

[[nodiscard]] constexpr std::string_view condition_logic_to_string(ConditionLogic l) {
    return l == ConditionLogic::OR ? keys::LOGIC_OR : keys::LOGIC_AND;
}

// Anything other than "OR" (any case) is AND
[[nodiscard]] inline ConditionLogic parse_condition_logic(std::string_view s) {
    if (s.size() == 2 && (s[0] == 'O' || s[0] == 'o') && (s[1] == 'R' || s[1] == 'r')) {
        return ConditionLogic::OR;
    }
    return ConditionLogic::AND;
}

[[nodiscard]] constexpr std::string_view no_match_action_to_string(NoMatchAction a) {
    return a == NoMatchAction::SKIP ? keys::SKIP : keys::SEND_DEFAULT;
}

[[nodiscard]] inline std::optional<NoMatchAction> parse_no_match_action(std::string_view s) {
    if (s == keys::SEND_DEFAULT) return NoMatchAction::SEND_DEFAULT;
    if (s == keys::SKIP) return NoMatchAction::SKIP;
    return std::nullopt;
}

} // namespace errorengine
