#include "routing/condition_evaluator.hpp"
#include "core/utils.hpp"

#include <format>
#include <memory>
#include <regex>
#include <shared_mutex>
#include <unordered_map>

namespace errorengine {

namespace {

// ============================================================================
// Compiled regex cache (pattern + case flag -> regex or compile error)
// ============================================================================

struct CompiledPattern {
    std::shared_ptr<const std::regex> regex;   // null when invalid
    std::string error;
};

class RegexCache {
public:
    static RegexCache& instance() {
        static RegexCache cache;
        return cache;
    }

    CompiledPattern get(const std::string& pattern, bool case_sensitive) {
        std::string key = (case_sensitive ? "s:" : "i:") + pattern;
        {
            std::shared_lock lock(mutex_);
            const auto it = entries_.find(key);
            if (it != entries_.end()) return it->second;
        }

        CompiledPattern compiled;
        try {
            auto flags = std::regex::ECMAScript;
            if (!case_sensitive) flags |= std::regex::icase;
            compiled.regex = std::make_shared<const std::regex>(pattern, flags);
        } catch (const std::regex_error& e) {
            compiled.error = e.what();
        }

        std::unique_lock lock(mutex_);
        if (entries_.size() >= kMaxEntries) entries_.clear();
        entries_.try_emplace(std::move(key), compiled);
        return compiled;
    }

private:
    static constexpr size_t kMaxEntries = 512;

    std::unordered_map<std::string, CompiledPattern> entries_;
    std::shared_mutex mutex_;
};

std::string fold(const std::string& s, bool case_sensitive) {
    return case_sensitive ? s : utils::to_lower(s);
}

} // anonymous namespace

bool ConditionEvaluator::evaluate(
    const Condition& condition,
    const Row& row,
    std::vector<std::string>* warnings) {

    const FieldValue* value = row.find(condition.field);
    const bool null_or_missing = (value == nullptr) || is_null(*value);
    const std::string raw = value ? field_value_to_string(*value) : std::string{};

    switch (condition.op) {
        case ConditionOperator::IS_EMPTY:
            return null_or_missing || utils::trim(raw).empty();
        case ConditionOperator::IS_NOT_EMPTY:
            return !null_or_missing && !utils::trim(raw).empty();
        case ConditionOperator::REGEX:
            return regex_search(raw, condition.field, condition.value,
                                condition.case_sensitive, warnings).value_or(false);
        case ConditionOperator::NOT_REGEX: {
            // Unevaluable fails closed for the negated form too
            const auto matched = regex_search(raw, condition.field, condition.value,
                                              condition.case_sensitive, warnings);
            return matched.has_value() && !*matched;
        }
        case ConditionOperator::GT:
        case ConditionOperator::GTE:
        case ConditionOperator::LT:
        case ConditionOperator::LTE:
            return compare_ordered(raw, condition.value, condition.op, condition.case_sensitive);
        default:
            break;
    }

    const std::string field = fold(raw, condition.case_sensitive);
    const std::string literal = fold(condition.value, condition.case_sensitive);

    switch (condition.op) {
        case ConditionOperator::EQUALS:       return field == literal;
        case ConditionOperator::NOT_EQUALS:   return field != literal;
        case ConditionOperator::CONTAINS:     return field.find(literal) != std::string::npos;
        case ConditionOperator::NOT_CONTAINS: return field.find(literal) == std::string::npos;
        case ConditionOperator::STARTSWITH:   return field.starts_with(literal);
        case ConditionOperator::ENDSWITH:     return field.ends_with(literal);
        case ConditionOperator::IN:
        case ConditionOperator::NOT_IN: {
            const std::string needle = utils::trim(field);
            bool found = false;
            for (const auto& item : utils::split(literal, ',')) {
                if (utils::trim(item) == needle) {
                    found = true;
                    break;
                }
            }
            return condition.op == ConditionOperator::IN ? found : !found;
        }
        default:
            if (warnings) {
                warnings->push_back(std::format("unsupported operator on field '{}'", condition.field));
            }
            return false;
    }
}

bool ConditionEvaluator::compare_ordered(const std::string& field, const std::string& literal,
                                         ConditionOperator op, bool case_sensitive) {
    const std::string f = utils::trim(field);
    const std::string v = utils::trim(literal);

    // Nothing to order: an empty or missing field never satisfies gt/gte/lt/lte
    if (f.empty()) return false;

    const auto fnum = utils::try_parse_double(f);
    const auto vnum = utils::try_parse_double(v);

    int cmp = 0;
    if (fnum && vnum) {
        cmp = (*fnum < *vnum) ? -1 : (*fnum > *vnum ? 1 : 0);
    } else if (fnum && !vnum) {
        // Numeric-looking field against a non-numeric literal fails closed
        return false;
    } else {
        const auto lhs = fold(f, case_sensitive);
        const auto rhs = fold(v, case_sensitive);
        cmp = lhs.compare(rhs);
        cmp = (cmp < 0) ? -1 : (cmp > 0 ? 1 : 0);
    }

    switch (op) {
        case ConditionOperator::GT:  return cmp > 0;
        case ConditionOperator::GTE: return cmp >= 0;
        case ConditionOperator::LT:  return cmp < 0;
        case ConditionOperator::LTE: return cmp <= 0;
        default: return false;
    }
}

std::optional<bool> ConditionEvaluator::regex_search(const std::string& field,
                                                     const std::string& field_name,
                                                     const std::string& pattern,
                                                     bool case_sensitive,
                                                     std::vector<std::string>* warnings) {
    const auto compiled = RegexCache::instance().get(pattern, case_sensitive);
    if (!compiled.regex) {
        if (warnings) {
            warnings->push_back(std::format("invalid regex '{}' on field '{}': {}",
                                            pattern, field_name, compiled.error));
        }
        return std::nullopt;
    }
    if (field.size() > kMaxRegexSubject) {
        if (warnings) {
            warnings->push_back(std::format("value on field '{}' exceeds {} bytes, regex '{}' not evaluated",
                                            field_name, kMaxRegexSubject, pattern));
        }
        return std::nullopt;
    }
    try {
        return std::regex_search(field, *compiled.regex);
    } catch (const std::regex_error& e) {
        if (warnings) {
            warnings->push_back(std::format("regex '{}' on field '{}' failed: {}",
                                            pattern, field_name, e.what()));
        }
        return std::nullopt;
    }
}

std::optional<std::string> ConditionEvaluator::validate(const Condition& condition) {
    if (utils::trim(condition.field).empty()) {
        return "condition field must not be empty";
    }

    if (condition.op == ConditionOperator::REGEX || condition.op == ConditionOperator::NOT_REGEX) {
        const auto compiled = RegexCache::instance().get(condition.value, condition.case_sensitive);
        if (!compiled.regex) {
            return std::format("invalid regex '{}': {}", condition.value, compiled.error);
        }
    }

    if (operator_needs_value(condition.op) && condition.value.empty()
        && condition.op != ConditionOperator::EQUALS
        && condition.op != ConditionOperator::NOT_EQUALS) {
        return std::format("operator '{}' requires a value",
                           condition_operator_to_string(condition.op));
    }

    return std::nullopt;
}

} // namespace errorengine
