#pragma once

#include "core/types.hpp"
#include "routing/routing_types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace errorengine {

/**
 * @brief Evaluates a single routing condition against a row.
 *
 * Every failure mode is closed: a condition that cannot be evaluated
 * (invalid regex, non-numeric literal against a numeric field) is simply
 * false and, where useful, a warning is appended for the caller to log.
 *
 * Regex operators only look at values up to kMaxRegexSubject bytes; the
 * std::regex matcher recurses per character, so a longer value fails
 * closed (both regex and not_regex are false) with a warning.
 *
 * Missing columns read as empty/NULL. Text operators fold case unless the
 * condition is case_sensitive.
 *
 * Thread-safe; compiled regexes are cached process-wide.
 */
class ConditionEvaluator {
public:
    static constexpr size_t kMaxRegexSubject = 4 * 1024;

    [[nodiscard]] static bool evaluate(
        const Condition& condition,
        const Row& row,
        std::vector<std::string>* warnings = nullptr);

    /**
     * @brief Edit-time check of a condition's literal.
     * @return Error message, or nullopt when the condition is usable
     */
    [[nodiscard]] static std::optional<std::string> validate(const Condition& condition);

private:
    static bool compare_ordered(const std::string& field, const std::string& literal,
                                ConditionOperator op, bool case_sensitive);
    /// nullopt when the pattern is invalid or the subject too long to match
    static std::optional<bool> regex_search(const std::string& field, const std::string& field_name,
                                            const std::string& pattern, bool case_sensitive,
                                            std::vector<std::string>* warnings);
};

} // namespace errorengine
