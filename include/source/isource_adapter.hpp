#pragma once

#include "core/types.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace errorengine {

namespace keys {
    inline constexpr std::string_view SOURCE_POSTGRESQL = "postgresql";
    inline constexpr std::string_view SOURCE_MYSQL      = "mysql";
    inline constexpr std::string_view SOURCE_SQLITE     = "sqlite";
    inline constexpr std::string_view SOURCE_HTTP       = "http";
}

enum class SourceType {
    POSTGRESQL,
    MYSQL,
    SQLITE,
    HTTP
};

[[nodiscard]] constexpr std::string_view source_type_to_string(SourceType t) {
    switch (t) {
        case SourceType::POSTGRESQL: return keys::SOURCE_POSTGRESQL;
        case SourceType::MYSQL:      return keys::SOURCE_MYSQL;
        case SourceType::SQLITE:     return keys::SOURCE_SQLITE;
        case SourceType::HTTP:       return keys::SOURCE_HTTP;
        default: return "unknown";
    }
}

[[nodiscard]] inline std::optional<SourceType> parse_source_type(std::string_view s) {
    if (s == keys::SOURCE_POSTGRESQL || s == "postgres") return SourceType::POSTGRESQL;
    if (s == keys::SOURCE_MYSQL || s == "mariadb") return SourceType::MYSQL;
    if (s == keys::SOURCE_SQLITE) return SourceType::SQLITE;
    if (s == keys::SOURCE_HTTP) return SourceType::HTTP;
    return std::nullopt;
}

[[nodiscard]] constexpr bool is_sql_source(SourceType t) {
    return t != SourceType::HTTP;
}

enum class SourceErrorKind {
    CONNECTION,
    QUERY,
    TIMEOUT,
    RESPONSE,
    CONFIGURATION
};

[[nodiscard]] constexpr std::string_view source_error_kind_to_string(SourceErrorKind k) {
    switch (k) {
        case SourceErrorKind::CONNECTION:    return "connection";
        case SourceErrorKind::QUERY:         return "query";
        case SourceErrorKind::TIMEOUT:       return "timeout";
        case SourceErrorKind::RESPONSE:      return "response";
        case SourceErrorKind::CONFIGURATION: return "configuration";
        default: return "unknown";
    }
}

enum class HttpAuthType {
    NONE,
    BEARER,
    BASIC,
    API_KEY
};

struct HttpAuth {
    HttpAuthType type = HttpAuthType::NONE;
    std::string token;          // bearer
    std::string username;       // basic
    std::string password;       // basic
    std::string key_name = "X-API-Key";  // api_key
    std::string key_value;      // api_key
    bool key_in_query = false;  // api_key: query string instead of header
};

struct HttpSourceOptions {
    std::string base_url;
    std::string method = "GET";
    std::unordered_map<std::string, std::string> headers;
    std::string body;                // Sent as JSON for POST
    HttpAuth auth;
    std::string response_path;       // Dotted path to the row array, e.g. "data.items"
};

struct SourceConfig {
    std::string name;
    SourceType type = SourceType::POSTGRESQL;
    std::string connection_string;   // libpq conninfo, mysql:// URI or SQLite path
    HttpSourceOptions http;
};

/**
 * @brief Normalized output of a source fetch: ordered rows or an error.
 */
struct FetchResult {
    bool success = false;
    std::vector<std::string> columns;
    std::vector<Row> rows;
    SourceErrorKind error_kind = SourceErrorKind::QUERY;
    std::string error_message;

    static FetchResult ok(std::vector<std::string> columns, std::vector<Row> rows) {
        FetchResult r;
        r.success = true;
        r.columns = std::move(columns);
        r.rows = std::move(rows);
        return r;
    }

    static FetchResult failure(SourceErrorKind kind, std::string message) {
        FetchResult r;
        r.success = false;
        r.error_kind = kind;
        r.error_message = std::move(message);
        return r;
    }
};

/**
 * @brief Row-producing source contract.
 *
 * fetch() must not throw; every failure is a FetchResult with an error
 * kind. Adapters may block for up to roughly the timeout; the caller
 * enforces the hard bound (see FetchRunner).
 */
class ISourceAdapter {
public:
    virtual ~ISourceAdapter() = default;

    [[nodiscard]] virtual FetchResult fetch(const std::string& query_text,
                                            std::chrono::milliseconds timeout) = 0;

    [[nodiscard]] virtual SourceType type() const = 0;
    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace errorengine
