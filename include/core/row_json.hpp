#pragma once

#include "core/types.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace errorengine {

/// Row -> JSON object, column order kept. NULL -> null.
[[nodiscard]] nlohmann::ordered_json row_to_json(const Row& row);

/**
 * @brief JSON object -> Row.
 *
 * Scalars map to the matching FieldValue alternative; nested objects and
 * arrays are stored as their serialized JSON text.
 * @throws std::invalid_argument if j is not an object
 */
[[nodiscard]] Row row_from_json(const nlohmann::ordered_json& j);

/// Single JSON scalar or container -> FieldValue
[[nodiscard]] FieldValue field_value_from_json(const nlohmann::ordered_json& j);

} // namespace errorengine
