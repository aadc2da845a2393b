#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <compare>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace errorengine {

/**
 * @brief Identity of one logical error across cycles.
 *
 * Ordered tuple of the row's key-field values (trimmed, case preserved).
 * Equality is exact tuple equality. encode() is a length-prefixed form
 * ("2:42|2:EU") so that distinct tuples never collide when stored as text.
 */
class KeySignature {
public:
    KeySignature() = default;
    explicit KeySignature(std::vector<std::string> parts) : parts_(std::move(parts)) {}

    [[nodiscard]] const std::vector<std::string>& parts() const { return parts_; }
    [[nodiscard]] bool empty() const { return parts_.empty(); }

    [[nodiscard]] std::string encode() const;
    [[nodiscard]] static std::optional<KeySignature> decode(std::string_view encoded);

    /// Human-readable form for logs ("42|EU")
    [[nodiscard]] std::string display() const;

    bool operator==(const KeySignature&) const = default;
    auto operator<=>(const KeySignature&) const = default;

private:
    std::vector<std::string> parts_;
};

struct KeySignatureHash {
    size_t operator()(const KeySignature& sig) const {
        size_t h = 0;
        for (const auto& part : sig.parts()) {
            h ^= std::hash<std::string>{}(part) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        }
        return h;
    }
};

/**
 * @brief Extract the key signature of a row.
 *
 * A NULL key value normalizes to "". A column that is missing entirely is a
 * CONFIGURATION_ERROR naming the field: the query's key fields do not match
 * what the source returns.
 */
[[nodiscard]] Result<KeySignature> compute_key_signature(
    const Row& row, const std::vector<std::string>& key_fields);

} // namespace errorengine
