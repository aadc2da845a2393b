#pragma once

#include "source/isource_adapter.hpp"

#include <libpq-fe.h>

namespace errorengine {

/**
 * @brief PostgreSQL source over libpq.
 *
 * One connection per fetch; statement_timeout is set from the fetch
 * timeout so the server cancels runaway queries on its side too.
 */
class PgSource : public ISourceAdapter {
public:
    explicit PgSource(SourceConfig config);

    [[nodiscard]] FetchResult fetch(const std::string& query_text,
                                    std::chrono::milliseconds timeout) override;

    [[nodiscard]] SourceType type() const override { return SourceType::POSTGRESQL; }
    [[nodiscard]] std::string name() const override { return config_.name; }

    /// Text value + type OID -> FieldValue (bool/int/float OIDs typed, rest text)
    [[nodiscard]] static FieldValue convert_value(const char* text, Oid type_oid);

private:
    SourceConfig config_;
};

} // namespace errorengine
