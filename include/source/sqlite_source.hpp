#pragma once

#include "source/isource_adapter.hpp"

namespace errorengine {

/**
 * @brief SQLite file source, opened read-only per fetch.
 *
 * The fetch timeout is enforced in-engine with a progress handler that
 * interrupts the statement once the deadline passes.
 */
class SqliteSource : public ISourceAdapter {
public:
    explicit SqliteSource(SourceConfig config);

    [[nodiscard]] FetchResult fetch(const std::string& query_text,
                                    std::chrono::milliseconds timeout) override;

    [[nodiscard]] SourceType type() const override { return SourceType::SQLITE; }
    [[nodiscard]] std::string name() const override { return config_.name; }

private:
    SourceConfig config_;
};

} // namespace errorengine
