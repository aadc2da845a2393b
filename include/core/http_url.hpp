#pragma once

#include <optional>
#include <string>

namespace errorengine {

/**
 * @brief Split "http[s]://host[:port]/path?query" for httplib::Client.
 */
struct HttpUrl {
    bool use_ssl = true;
    std::string host;
    int port = 443;
    std::string path = "/";   // Includes any query string

    /// "https://host:port", suitable for httplib::Client
    [[nodiscard]] std::string scheme_host_port() const;
};

/// nullopt when the scheme is not http/https or the host is empty
[[nodiscard]] std::optional<HttpUrl> parse_http_url(const std::string& url);

/// Percent-encode for query string values
[[nodiscard]] std::string url_encode(const std::string& s);

} // namespace errorengine
