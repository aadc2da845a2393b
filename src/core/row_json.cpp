#include "core/row_json.hpp"

#include <limits>
#include <stdexcept>

namespace errorengine {

nlohmann::ordered_json row_to_json(const Row& row) {
    auto j = nlohmann::ordered_json::object();
    for (const auto& [name, value] : row) {
        std::visit([&](const auto& x) {
            using T = std::decay_t<decltype(x)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                j[name] = nullptr;
            } else {
                j[name] = x;
            }
        }, value);
    }
    return j;
}

FieldValue field_value_from_json(const nlohmann::ordered_json& j) {
    switch (j.type()) {
        case nlohmann::json::value_t::null:
            return std::monostate{};
        case nlohmann::json::value_t::boolean:
            return j.get<bool>();
        case nlohmann::json::value_t::number_integer:
            return j.get<int64_t>();
        case nlohmann::json::value_t::number_unsigned: {
            const auto u = j.get<uint64_t>();
            if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                return static_cast<double>(u);
            }
            return static_cast<int64_t>(u);
        }
        case nlohmann::json::value_t::number_float:
            return j.get<double>();
        case nlohmann::json::value_t::string:
            return j.get<std::string>();
        default:
            return j.dump();
    }
}

Row row_from_json(const nlohmann::ordered_json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("expected JSON object for row");
    }
    Row row;
    for (const auto& [key, value] : j.items()) {
        row.set(key, field_value_from_json(value));
    }
    return row;
}

} // namespace errorengine
