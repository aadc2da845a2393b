#pragma once

#include "source/isource_adapter.hpp"

#include <functional>
#include <memory>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace errorengine {

/**
 * @brief Per-type adapter factories.
 *
 * Usage:
 *   SourceFactoryRegistry::instance().register_factory(
 *       SourceType::POSTGRESQL,
 *       [](const SourceConfig& c) { return std::make_shared<PgSource>(c); });
 */
class SourceFactoryRegistry {
public:
    using Factory = std::function<std::shared_ptr<ISourceAdapter>(const SourceConfig&)>;

    static SourceFactoryRegistry& instance() {
        static SourceFactoryRegistry registry;
        return registry;
    }

    void register_factory(SourceType type, Factory factory) {
        std::unique_lock lock(mutex_);
        factories_[type] = std::move(factory);
    }

    /// @throws std::runtime_error when no factory is registered for the type
    [[nodiscard]] std::shared_ptr<ISourceAdapter> create(const SourceConfig& config) const {
        std::shared_lock lock(mutex_);
        const auto it = factories_.find(config.type);
        if (it == factories_.end()) {
            throw std::runtime_error(
                std::string("No adapter registered for source type: ") +
                std::string(source_type_to_string(config.type)));
        }
        return it->second(config);
    }

    [[nodiscard]] bool has_factory(SourceType type) const {
        std::shared_lock lock(mutex_);
        return factories_.contains(type);
    }

private:
    SourceFactoryRegistry() = default;

    struct SourceTypeHash {
        size_t operator()(SourceType t) const {
            return std::hash<int>()(static_cast<int>(t));
        }
    };

    std::unordered_map<SourceType, Factory, SourceTypeHash> factories_;
    mutable std::shared_mutex mutex_;
};

/**
 * @brief Named source adapters used by monitored queries.
 */
class SourceRegistry {
public:
    void add(const std::string& name, std::shared_ptr<ISourceAdapter> adapter);

    /// Replace the whole table (config reload). Unbuildable sources are
    /// skipped and reported in the returned list.
    std::vector<std::string> rebuild(const std::vector<SourceConfig>& configs);

    [[nodiscard]] std::shared_ptr<ISourceAdapter> get(const std::string& name) const;
    [[nodiscard]] bool contains(const std::string& name) const;
    [[nodiscard]] std::vector<std::string> names() const;

private:
    std::unordered_map<std::string, std::shared_ptr<ISourceAdapter>> adapters_;
    mutable std::shared_mutex mutex_;
};

} // namespace errorengine
