#include "source/mysql/mysql_source.hpp"
#include "core/utils.hpp"

#include <mysql/mysql.h>

#include <format>
#include <memory>

namespace errorengine {

namespace {

using MysqlPtr = std::unique_ptr<MYSQL, decltype(&mysql_close)>;
using MysqlResPtr = std::unique_ptr<MYSQL_RES, decltype(&mysql_free_result)>;

// ER_QUERY_TIMEOUT / ER_QUERY_INTERRUPTED
constexpr unsigned int kQueryTimeoutErrno = 3024;
constexpr unsigned int kQueryInterruptedErrno = 1317;

FieldValue convert_value(const char* data, unsigned long length, enum_field_types type) {
    if (!data) return std::monostate{};
    const std::string_view sv(data, length);

    switch (type) {
        case MYSQL_TYPE_TINY:
        case MYSQL_TYPE_SHORT:
        case MYSQL_TYPE_LONG:
        case MYSQL_TYPE_INT24:
        case MYSQL_TYPE_LONGLONG:
            if (auto v = utils::try_parse_int<int64_t>(sv)) return *v;
            break;
        case MYSQL_TYPE_FLOAT:
        case MYSQL_TYPE_DOUBLE:
            if (auto v = utils::try_parse_double(sv)) return *v;
            break;
        default:
            break;
    }
    return std::string(sv);
}

} // anonymous namespace

MysqlSource::MysqlSource(SourceConfig config)
    : config_(std::move(config)) {}

MysqlSource::ConnParams MysqlSource::parse_connection_string(const std::string& conn_str) {
    ConnParams params;
    std::string_view sv(conn_str);

    if (sv.starts_with("mysql://")) {
        sv.remove_prefix(8);
    } else if (sv.starts_with("mariadb://")) {
        sv.remove_prefix(10);
    }

    // user:password@
    const size_t at_pos = sv.rfind('@');
    if (at_pos != std::string_view::npos) {
        const std::string_view creds = sv.substr(0, at_pos);
        sv.remove_prefix(at_pos + 1);

        const size_t colon_pos = creds.find(':');
        if (colon_pos != std::string_view::npos) {
            params.user = std::string(creds.substr(0, colon_pos));
            params.password = std::string(creds.substr(colon_pos + 1));
        } else {
            params.user = std::string(creds);
        }
    }

    // host:port/database
    std::string_view host_port = sv;
    const size_t slash_pos = sv.find('/');
    if (slash_pos != std::string_view::npos) {
        host_port = sv.substr(0, slash_pos);
        params.database = std::string(sv.substr(slash_pos + 1));
    }

    const size_t colon_pos = host_port.find(':');
    if (colon_pos != std::string_view::npos) {
        params.host = std::string(host_port.substr(0, colon_pos));
        params.port = utils::parse_int<unsigned int>(host_port.substr(colon_pos + 1), 3306);
    } else if (!host_port.empty()) {
        params.host = std::string(host_port);
    }

    return params;
}

FetchResult MysqlSource::fetch(const std::string& query_text, std::chrono::milliseconds timeout) {
    const auto params = parse_connection_string(config_.connection_string);

    MysqlPtr conn(mysql_init(nullptr), &mysql_close);
    if (!conn) {
        return FetchResult::failure(SourceErrorKind::CONNECTION, "mysql_init failed");
    }

    const unsigned int seconds = timeout.count() > 0
        ? static_cast<unsigned int>((timeout.count() + 999) / 1000) : 30;
    mysql_options(conn.get(), MYSQL_OPT_CONNECT_TIMEOUT, &seconds);
    mysql_options(conn.get(), MYSQL_OPT_READ_TIMEOUT, &seconds);
    mysql_options(conn.get(), MYSQL_SET_CHARSET_NAME, "utf8mb4");

    if (!mysql_real_connect(conn.get(), params.host.c_str(), params.user.c_str(),
                            params.password.c_str(), params.database.c_str(),
                            params.port, nullptr, 0)) {
        return FetchResult::failure(SourceErrorKind::CONNECTION,
            std::format("MySQL connection failed: {}", mysql_error(conn.get())));
    }

    if (timeout.count() > 0) {
        const auto sql = std::format("SET SESSION max_execution_time = {}", timeout.count());
        if (mysql_query(conn.get(), sql.c_str()) != 0) {
            utils::log::warn(std::format("Source '{}': could not set max_execution_time: {}",
                config_.name, mysql_error(conn.get())));
        }
    }

    if (mysql_query(conn.get(), query_text.c_str()) != 0) {
        const unsigned int code = mysql_errno(conn.get());
        const auto kind = (code == kQueryTimeoutErrno || code == kQueryInterruptedErrno)
            ? SourceErrorKind::TIMEOUT : SourceErrorKind::QUERY;
        return FetchResult::failure(kind, mysql_error(conn.get()));
    }

    MysqlResPtr res(mysql_store_result(conn.get()), &mysql_free_result);
    if (!res) {
        if (mysql_field_count(conn.get()) == 0) {
            return FetchResult::failure(SourceErrorKind::QUERY, "Statement returned no result set");
        }
        return FetchResult::failure(SourceErrorKind::QUERY, mysql_error(conn.get()));
    }

    const unsigned int num_fields = mysql_num_fields(res.get());
    MYSQL_FIELD* fields = mysql_fetch_fields(res.get());

    std::vector<std::string> columns;
    columns.reserve(num_fields);
    for (unsigned int i = 0; i < num_fields; ++i) {
        columns.emplace_back(fields[i].name);
    }

    std::vector<Row> rows;
    MYSQL_ROW mrow;
    while ((mrow = mysql_fetch_row(res.get())) != nullptr) {
        const unsigned long* lengths = mysql_fetch_lengths(res.get());
        Row row;
        for (unsigned int i = 0; i < num_fields; ++i) {
            row.set(columns[i], convert_value(mrow[i], lengths[i], fields[i].type));
        }
        rows.push_back(std::move(row));
    }

    return FetchResult::ok(std::move(columns), std::move(rows));
}

} // namespace errorengine
