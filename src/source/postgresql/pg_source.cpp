#include "source/postgresql/pg_source.hpp"
#include "core/utils.hpp"

#include <format>
#include <memory>

namespace errorengine {

namespace {

// Built-in type OIDs (pg_type.h)
constexpr Oid kBoolOid   = 16;
constexpr Oid kInt8Oid   = 20;
constexpr Oid kInt2Oid   = 21;
constexpr Oid kInt4Oid   = 23;
constexpr Oid kOidOid    = 26;
constexpr Oid kFloat4Oid = 700;
constexpr Oid kFloat8Oid = 701;

using ConnPtr = std::unique_ptr<PGconn, decltype(&PQfinish)>;
using ResultPtr = std::unique_ptr<PGresult, decltype(&PQclear)>;

std::string last_error(PGconn* conn) {
    return utils::trim(PQerrorMessage(conn));
}

} // anonymous namespace

PgSource::PgSource(SourceConfig config)
    : config_(std::move(config)) {}

FieldValue PgSource::convert_value(const char* text, Oid type_oid) {
    if (!text) return std::monostate{};
    const std::string_view sv(text);

    switch (type_oid) {
        case kBoolOid:
            return sv == "t" || sv == "true";
        case kInt2Oid:
        case kInt4Oid:
        case kInt8Oid:
        case kOidOid:
            if (auto v = utils::try_parse_int<int64_t>(sv)) return *v;
            break;
        case kFloat4Oid:
        case kFloat8Oid:
            if (auto v = utils::try_parse_double(sv)) return *v;
            break;
        default:
            break;
    }
    return std::string(sv);
}

FetchResult PgSource::fetch(const std::string& query_text, std::chrono::milliseconds timeout) {
    ConnPtr conn(PQconnectdb(config_.connection_string.c_str()), &PQfinish);
    if (!conn) {
        return FetchResult::failure(SourceErrorKind::CONNECTION, "Failed to allocate PGconn");
    }
    if (PQstatus(conn.get()) != CONNECTION_OK) {
        return FetchResult::failure(SourceErrorKind::CONNECTION,
            std::format("Failed to connect: {}", last_error(conn.get())));
    }

    if (timeout.count() > 0) {
        const auto timeout_sql = std::format("SET statement_timeout = {}", timeout.count());
        ResultPtr res(PQexec(conn.get(), timeout_sql.c_str()), &PQclear);
        if (!res || PQresultStatus(res.get()) != PGRES_COMMAND_OK) {
            utils::log::warn(std::format("Source '{}': could not set statement_timeout: {}",
                config_.name, last_error(conn.get())));
        }
    }

    ResultPtr res(PQexec(conn.get(), query_text.c_str()), &PQclear);
    if (!res) {
        return FetchResult::failure(SourceErrorKind::QUERY, last_error(conn.get()));
    }

    const ExecStatusType status = PQresultStatus(res.get());
    if (status != PGRES_TUPLES_OK) {
        const char* sqlstate = PQresultErrorField(res.get(), PG_DIAG_SQLSTATE);
        // 57014 = query_canceled (statement_timeout)
        if (sqlstate && std::string_view(sqlstate) == "57014") {
            return FetchResult::failure(SourceErrorKind::TIMEOUT, last_error(conn.get()));
        }
        if (status == PGRES_COMMAND_OK) {
            return FetchResult::failure(SourceErrorKind::QUERY, "Statement returned no result set");
        }
        return FetchResult::failure(SourceErrorKind::QUERY, last_error(conn.get()));
    }

    const int ncols = PQnfields(res.get());
    std::vector<std::string> columns;
    std::vector<Oid> types;
    columns.reserve(ncols);
    types.reserve(ncols);
    for (int c = 0; c < ncols; ++c) {
        columns.emplace_back(PQfname(res.get(), c));
        types.push_back(PQftype(res.get(), c));
    }

    const int nrows = PQntuples(res.get());
    std::vector<Row> rows;
    rows.reserve(nrows);
    for (int r = 0; r < nrows; ++r) {
        Row row;
        for (int c = 0; c < ncols; ++c) {
            const char* text = PQgetisnull(res.get(), r, c) ? nullptr : PQgetvalue(res.get(), r, c);
            row.set(columns[c], convert_value(text, types[c]));
        }
        rows.push_back(std::move(row));
    }

    return FetchResult::ok(std::move(columns), std::move(rows));
}

} // namespace errorengine
