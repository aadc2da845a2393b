#include "lifecycle/key_signature.hpp"
#include "core/utils.hpp"

#include <format>

namespace errorengine {

std::string KeySignature::encode() const {
    std::string out;
    for (size_t i = 0; i < parts_.size(); ++i) {
        if (i > 0) out += '|';
        out += std::format("{}:", parts_[i].size());
        out += parts_[i];
    }
    return out;
}

std::optional<KeySignature> KeySignature::decode(std::string_view encoded) {
    std::vector<std::string> parts;
    size_t pos = 0;
    while (pos < encoded.size()) {
        const size_t colon = encoded.find(':', pos);
        if (colon == std::string_view::npos) return std::nullopt;

        const auto len = utils::try_parse_int<size_t>(encoded.substr(pos, colon - pos));
        if (!len || colon + 1 + *len > encoded.size()) return std::nullopt;

        parts.emplace_back(encoded.substr(colon + 1, *len));
        pos = colon + 1 + *len;

        if (pos < encoded.size()) {
            if (encoded[pos] != '|') return std::nullopt;
            ++pos;
            // Trailing separator with nothing after it is malformed
            if (pos == encoded.size()) return std::nullopt;
        }
    }
    return KeySignature(std::move(parts));
}

std::string KeySignature::display() const {
    std::string out;
    for (size_t i = 0; i < parts_.size(); ++i) {
        if (i > 0) out += '|';
        out += parts_[i];
    }
    return out;
}

Result<KeySignature> compute_key_signature(
    const Row& row, const std::vector<std::string>& key_fields) {

    if (key_fields.empty()) {
        return Result<KeySignature>::error(ErrorCategory::CONFIGURATION_ERROR,
            "No key fields configured");
    }

    std::vector<std::string> parts;
    parts.reserve(key_fields.size());

    for (const auto& field : key_fields) {
        const auto* value = row.find(field);
        if (!value) {
            return Result<KeySignature>::error(ErrorCategory::CONFIGURATION_ERROR,
                std::format("Key field '{}' not present in fetched row", field));
        }
        parts.push_back(utils::trim(field_value_to_string(*value)));
    }

    return Result<KeySignature>::ok(KeySignature(std::move(parts)));
}

} // namespace errorengine
