#include "core/types.hpp"
#include "core/utils.hpp"

namespace errorengine {

void Row::set(const std::string& name, FieldValue value) {
    for (auto& [key, existing] : entries_) {
        if (key == name) {
            existing = std::move(value);
            return;
        }
    }
    entries_.emplace_back(name, std::move(value));
}

const FieldValue* Row::find(const std::string& name) const {
    for (const auto& [key, value] : entries_) {
        if (key == name) return &value;
    }
    for (const auto& [key, value] : entries_) {
        if (utils::iequals(key, name)) return &value;
    }
    return nullptr;
}

std::string Row::get_string(const std::string& name) const {
    const auto* v = find(name);
    return v ? field_value_to_string(*v) : std::string{};
}

std::vector<std::string> Row::columns() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& [key, value] : entries_) {
        result.push_back(key);
    }
    return result;
}

} // namespace errorengine
