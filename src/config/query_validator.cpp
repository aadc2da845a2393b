#include "config/query_validator.hpp"
#include "routing/condition_evaluator.hpp"
#include "scheduler/schedule_policy.hpp"
#include "core/utils.hpp"

#include <format>
#include <regex>

namespace errorengine {

namespace {

constexpr size_t kMaxSqlLength = 10000;

const std::regex& email_pattern() {
    static const std::regex re(R"(^[a-zA-Z0-9._%+\-]+@[a-zA-Z0-9.\-]+\.[a-zA-Z]{2,}$)");
    return re;
}

const std::regex& key_field_pattern() {
    static const std::regex re(R"(^[a-zA-Z_][a-zA-Z0-9_]*$)");
    return re;
}

const std::regex& name_pattern() {
    static const std::regex re(R"(^[\w\s\-]+$)");
    return re;
}

const std::vector<std::regex>& dangerous_sql_patterns() {
    static const std::vector<std::regex> patterns = [] {
        const auto flags = std::regex::ECMAScript | std::regex::icase;
        return std::vector<std::regex>{
            std::regex(R"(;\s*DROP\s+)", flags),
            std::regex(R"(;\s*DELETE\s+)", flags),
            std::regex(R"(;\s*UPDATE\s+)", flags),
            std::regex(R"(;\s*INSERT\s+)", flags),
            std::regex(R"(;\s*ALTER\s+)", flags),
            std::regex(R"(;\s*CREATE\s+)", flags),
            std::regex(R"(;\s*TRUNCATE\s+)", flags),
            std::regex(R"(--)", flags),
            std::regex(R"(/\*[\s\S]*\*/)", flags),
        };
    }();
    return patterns;
}

} // anonymous namespace

bool QueryValidator::is_valid_email(const std::string& email) {
    return std::regex_match(email, email_pattern());
}

bool QueryValidator::is_valid_key_field(const std::string& field) {
    return std::regex_match(field, key_field_pattern());
}

bool QueryValidator::is_valid_name(const std::string& name) {
    const std::string n = utils::trim(name);
    return n.size() >= 3 && n.size() <= 100 && std::regex_match(n, name_pattern());
}

std::optional<std::string> QueryValidator::check_sql(const std::string& sql) {
    const std::string s = utils::trim(sql);
    if (s.empty()) return "query text is required";
    if (s.size() > kMaxSqlLength) {
        return std::format("query text too long (max {} characters)", kMaxSqlLength);
    }

    const std::string upper = utils::to_upper(s);
    if (!upper.starts_with("SELECT") && !upper.starts_with("WITH")) {
        return "query must be a SELECT";
    }
    for (const auto& re : dangerous_sql_patterns()) {
        if (std::regex_search(s, re)) {
            return "query contains a disallowed pattern (statement chaining or comment)";
        }
    }
    return std::nullopt;
}

std::optional<std::string> QueryValidator::check_recipient(const std::string& recipient) {
    const std::string r = utils::trim(recipient);
    if (r.starts_with(keys::CHANNEL_PREFIX)) {
        if (utils::trim(r.substr(keys::CHANNEL_PREFIX.size())).empty()) {
            return std::format("recipient '{}' names no channel", r);
        }
        return std::nullopt;
    }
    if (!is_valid_email(r)) {
        return std::format("invalid email address '{}'", r);
    }
    return std::nullopt;
}

std::vector<std::string> QueryValidator::validate_rules(const std::vector<RoutingRule>& rules) {
    std::vector<std::string> errors;

    for (size_t i = 0; i < rules.size(); ++i) {
        const auto& rule = rules[i];
        const std::string label = rule.name.empty() ? std::format("rule #{}", i + 1)
                                                    : std::format("rule '{}'", rule.name);

        if (rule.recipients.empty()) {
            errors.push_back(std::format("{}: at least one recipient is required", label));
        }
        for (const auto& r : rule.recipients) {
            if (auto err = check_recipient(r)) {
                errors.push_back(std::format("{}: {}", label, *err));
            }
        }
        for (size_t c = 0; c < rule.conditions.size(); ++c) {
            if (auto err = ConditionEvaluator::validate(rule.conditions[c])) {
                errors.push_back(std::format("{} condition {}: {}", label, c + 1, *err));
            }
        }
    }
    return errors;
}

std::vector<std::string> QueryValidator::validate(
    const MonitoredQuery& query,
    const std::vector<RoutingRule>& rules,
    std::optional<SourceType> source_type) {

    std::vector<std::string> errors;

    if (!is_valid_name(query.name)) {
        errors.push_back(std::format(
            "name '{}' must be 3-100 characters of letters, digits, spaces, '_' or '-'", query.name));
    }

    if (utils::trim(query.source).empty()) {
        errors.push_back("source is required");
    }

    if (query.key_fields.empty()) {
        errors.push_back("at least one key field is required");
    }
    for (const auto& f : query.key_fields) {
        if (!is_valid_key_field(f)) {
            errors.push_back(std::format("invalid key field '{}'", f));
        }
    }

    if (!source_type || is_sql_source(*source_type)) {
        if (auto err = check_sql(query.query_text)) {
            errors.push_back(*err);
        }
    }

    if (query.timeout.count() < 0) {
        errors.push_back("timeout must not be negative");
    }

    for (auto& e : SchedulePolicy::validate(query)) {
        errors.push_back(std::move(e));
    }

    if (query.reminder_interval_minutes < 0) {
        errors.push_back("reminder_interval_minutes must not be negative");
    }
    if (query.reminder_max_count < 0) {
        errors.push_back("reminder_max_count must not be negative");
    }

    for (const auto& r : query.recipients) {
        if (!is_valid_email(utils::trim(r))) {
            errors.push_back(std::format("invalid email address '{}'", r));
        }
    }
    for (const auto& r : query.default_recipients) {
        if (auto err = check_recipient(r)) {
            errors.push_back(std::format("default recipients: {}", *err));
        }
    }
    for (const auto& ch : query.channels) {
        if (utils::trim(ch).empty()) {
            errors.push_back("channel names must not be empty");
        }
    }

    if (!query.routing_enabled && query.recipients.empty() && query.channels.empty()) {
        errors.push_back("recipients or channels are required when routing is disabled");
    }

    for (auto& e : validate_rules(rules)) {
        errors.push_back(std::move(e));
    }

    return errors;
}

std::string format_validation_errors(const std::vector<std::string>& errors) {
    std::string msg = "Config validation failed:";
    for (const auto& e : errors) {
        msg += "\n  - " + e;
    }
    return msg;
}

} // namespace errorengine
