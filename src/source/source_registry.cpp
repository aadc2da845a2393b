#include "source/source_registry.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace errorengine {

void SourceRegistry::add(const std::string& name, std::shared_ptr<ISourceAdapter> adapter) {
    std::unique_lock lock(mutex_);
    adapters_[name] = std::move(adapter);
}

std::vector<std::string> SourceRegistry::rebuild(const std::vector<SourceConfig>& configs) {
    std::vector<std::string> problems;
    std::unordered_map<std::string, std::shared_ptr<ISourceAdapter>> table;

    for (const auto& cfg : configs) {
        try {
            table[cfg.name] = SourceFactoryRegistry::instance().create(cfg);
        } catch (const std::exception& e) {
            problems.push_back(std::format("source '{}': {}", cfg.name, e.what()));
        }
    }

    for (const auto& p : problems) {
        utils::log::warn(p);
    }

    std::unique_lock lock(mutex_);
    adapters_ = std::move(table);
    return problems;
}

std::shared_ptr<ISourceAdapter> SourceRegistry::get(const std::string& name) const {
    std::shared_lock lock(mutex_);
    const auto it = adapters_.find(name);
    return it == adapters_.end() ? nullptr : it->second;
}

bool SourceRegistry::contains(const std::string& name) const {
    std::shared_lock lock(mutex_);
    return adapters_.contains(name);
}

std::vector<std::string> SourceRegistry::names() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> out;
    out.reserve(adapters_.size());
    for (const auto& [name, _] : adapters_) {
        out.push_back(name);
    }
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace errorengine
