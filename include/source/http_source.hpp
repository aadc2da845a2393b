#pragma once

#include "source/isource_adapter.hpp"

#include <string>

namespace errorengine {

/**
 * @brief JSON-over-HTTP source.
 *
 * The response (optionally narrowed by a dotted response_path) must be an
 * array of objects or a single object (one row). Nested values are kept as
 * serialized JSON text. Query text, when set, is appended to the base URL.
 */
class HttpSource : public ISourceAdapter {
public:
    explicit HttpSource(SourceConfig config);

    [[nodiscard]] FetchResult fetch(const std::string& query_text,
                                    std::chrono::milliseconds timeout) override;

    [[nodiscard]] SourceType type() const override { return SourceType::HTTP; }
    [[nodiscard]] std::string name() const override { return config_.name; }

    /// JSON body -> rows; RESPONSE error on invalid JSON or shape
    [[nodiscard]] static FetchResult parse_response(const std::string& body,
                                                    const std::string& response_path);

    /// Full URL for a fetch: base + query text + api_key query parameter
    [[nodiscard]] static std::string build_url(const HttpSourceOptions& options,
                                               const std::string& query_text);

private:
    SourceConfig config_;
};

} // namespace errorengine
