#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <initializer_list>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace errorengine {

using TimePoint = std::chrono::system_clock::time_point;

using QueryId = int64_t;
using ErrorId = int64_t;

// ============================================================================
// Dynamic Row Values
// ============================================================================

/**
 * @brief Scalar column value as produced by a source adapter.
 *
 * monostate is SQL NULL / JSON null.
 */
using FieldValue = std::variant<std::monostate, bool, int64_t, double, std::string>;

[[nodiscard]] inline bool is_null(const FieldValue& v) {
    return std::holds_alternative<std::monostate>(v);
}

/**
 * @brief Canonical text form used for key signatures and condition evaluation.
 *
 * NULL -> "", bool -> "true"/"false", integers in decimal, doubles in the
 * shortest round-trip form (3.0 -> "3", 0.5 -> "0.5").
 */
[[nodiscard]] inline std::string field_value_to_string(const FieldValue& v) {
    return std::visit([](const auto& x) -> std::string {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return {};
        } else if constexpr (std::is_same_v<T, bool>) {
            return x ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::string>) {
            return x;
        } else {
            return std::format("{}", x);
        }
    }, v);
}

/**
 * @brief Ordered column-name -> value mapping for one fetched row.
 *
 * Column order is the order the source produced. Lookup is exact first,
 * then case-insensitive, since SQL dialects disagree on identifier case.
 */
class Row {
public:
    using Entry = std::pair<std::string, FieldValue>;
    using const_iterator = std::vector<Entry>::const_iterator;

    Row() = default;
    Row(std::initializer_list<Entry> entries) {
        for (const auto& [name, value] : entries) {
            set(name, value);
        }
    }

    /// Insert or overwrite (exact name match)
    void set(const std::string& name, FieldValue value);

    /// Exact match, then case-insensitive; nullptr when absent
    [[nodiscard]] const FieldValue* find(const std::string& name) const;

    [[nodiscard]] bool contains(const std::string& name) const { return find(name) != nullptr; }

    /// Text form of a column; empty when absent or NULL
    [[nodiscard]] std::string get_string(const std::string& name) const;

    [[nodiscard]] std::vector<std::string> columns() const;

    [[nodiscard]] size_t size() const { return entries_.size(); }
    [[nodiscard]] bool empty() const { return entries_.empty(); }
    [[nodiscard]] const_iterator begin() const { return entries_.begin(); }
    [[nodiscard]] const_iterator end() const { return entries_.end(); }

    bool operator==(const Row& other) const { return entries_ == other.entries_; }

private:
    std::vector<Entry> entries_;
};

} // namespace errorengine
