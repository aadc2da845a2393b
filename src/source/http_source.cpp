#include "source/http_source.hpp"
#include "core/http_url.hpp"
#include "core/row_json.hpp"
#include "core/utils.hpp"

// https:// endpoints need the OpenSSL-backed client
#define CPPHTTPLIB_OPENSSL_SUPPORT
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop
#include <nlohmann/json.hpp>

#include <format>
#include <unordered_set>

namespace errorengine {

HttpSource::HttpSource(SourceConfig config)
    : config_(std::move(config)) {}

std::string HttpSource::build_url(const HttpSourceOptions& options, const std::string& query_text) {
    std::string url = options.base_url;

    const std::string suffix = utils::trim(query_text);
    if (!suffix.empty()) {
        if (url.ends_with('/') && suffix.starts_with('/')) {
            url.pop_back();
        } else if (!url.ends_with('/') && !suffix.starts_with('/') && !suffix.starts_with('?')) {
            url += '/';
        }
        url += suffix;
    }

    if (options.auth.type == HttpAuthType::API_KEY && options.auth.key_in_query) {
        url += url.find('?') == std::string::npos ? '?' : '&';
        url += url_encode(options.auth.key_name);
        url += '=';
        url += url_encode(options.auth.key_value);
    }
    return url;
}

FetchResult HttpSource::parse_response(const std::string& body, const std::string& response_path) {
    nlohmann::ordered_json data;
    try {
        data = nlohmann::ordered_json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        return FetchResult::failure(SourceErrorKind::RESPONSE,
            std::format("Invalid JSON response: {}", e.what()));
    }

    for (const auto& key : utils::split(response_path, '.')) {
        if (key.empty()) continue;
        if (!data.is_object() || !data.contains(key)) {
            return FetchResult::failure(SourceErrorKind::RESPONSE,
                std::format("response_path '{}': key '{}' not found", response_path, key));
        }
        nlohmann::ordered_json next = data[key];
        data = std::move(next);
    }

    if (data.is_object()) {
        data = nlohmann::ordered_json::array({std::move(data)});
    } else if (!data.is_array()) {
        return FetchResult::failure(SourceErrorKind::RESPONSE,
            std::format("Invalid response: expected array or object, got {}", data.type_name()));
    }

    std::vector<std::string> columns;
    std::unordered_set<std::string> seen;
    std::vector<Row> rows;
    rows.reserve(data.size());

    for (size_t i = 0; i < data.size(); ++i) {
        const auto& item = data[i];
        if (!item.is_object()) {
            return FetchResult::failure(SourceErrorKind::RESPONSE,
                std::format("Invalid response: element {} is {}, expected object", i, item.type_name()));
        }
        for (const auto& [key, _] : item.items()) {
            if (seen.insert(key).second) columns.push_back(key);
        }
        rows.push_back(row_from_json(item));
    }

    return FetchResult::ok(std::move(columns), std::move(rows));
}

FetchResult HttpSource::fetch(const std::string& query_text, std::chrono::milliseconds timeout) {
    const auto& opts = config_.http;
    const std::string full_url = build_url(opts, query_text);

    const auto url = parse_http_url(full_url);
    if (!url) {
        return FetchResult::failure(SourceErrorKind::CONFIGURATION,
            std::format("Invalid URL '{}'", full_url));
    }

    const std::string method = utils::to_upper(opts.method);
    if (method != "GET" && method != "POST") {
        return FetchResult::failure(SourceErrorKind::CONFIGURATION,
            std::format("Unsupported HTTP method '{}'", opts.method));
    }

    try {
        httplib::Client client(url->scheme_host_port());
        if (timeout.count() > 0) {
            client.set_connection_timeout(timeout);
            client.set_read_timeout(timeout);
            client.set_write_timeout(timeout);
        }

        httplib::Headers headers;
        for (const auto& [k, v] : opts.headers) {
            headers.emplace(k, v);
        }
        headers.emplace("Accept", "application/json");

        switch (opts.auth.type) {
            case HttpAuthType::BEARER:
                client.set_bearer_token_auth(opts.auth.token);
                break;
            case HttpAuthType::BASIC:
                client.set_basic_auth(opts.auth.username, opts.auth.password);
                break;
            case HttpAuthType::API_KEY:
                if (!opts.auth.key_in_query) {
                    headers.emplace(opts.auth.key_name, opts.auth.key_value);
                }
                break;
            case HttpAuthType::NONE:
                break;
        }

        auto res = method == "POST"
            ? client.Post(url->path, headers, opts.body.empty() ? std::string("{}") : opts.body, "application/json")
            : client.Get(url->path, headers);

        if (!res) {
            const auto err = res.error();
            const auto kind = (err == httplib::Error::Read || err == httplib::Error::Write)
                ? SourceErrorKind::TIMEOUT : SourceErrorKind::CONNECTION;
            return FetchResult::failure(kind, std::format("HTTP error: {}", httplib::to_string(err)));
        }
        if (res->status < 200 || res->status >= 300) {
            return FetchResult::failure(SourceErrorKind::RESPONSE,
                std::format("HTTP {} from {}", res->status, url->host));
        }

        return parse_response(res->body, opts.response_path);
    } catch (const std::exception& e) {
        return FetchResult::failure(SourceErrorKind::CONNECTION, e.what());
    }
}

} // namespace errorengine
