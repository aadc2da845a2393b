#include "core/http_url.hpp"
#include "core/utils.hpp"

#include <cctype>
#include <format>

namespace errorengine {

std::string HttpUrl::scheme_host_port() const {
    return std::format("{}{}:{}", use_ssl ? "https://" : "http://", host, port);
}

std::optional<HttpUrl> parse_http_url(const std::string& url) {
    HttpUrl out;
    std::string rest;

    if (url.starts_with("https://")) {
        out.use_ssl = true;
        out.port = 443;
        rest = url.substr(8);
    } else if (url.starts_with("http://")) {
        out.use_ssl = false;
        out.port = 80;
        rest = url.substr(7);
    } else {
        return std::nullopt;
    }

    const auto path_pos = rest.find_first_of("/?");
    if (path_pos != std::string::npos) {
        out.host = rest.substr(0, path_pos);
        out.path = rest.substr(path_pos);
        if (out.path.starts_with('?')) out.path.insert(0, "/");
    } else {
        out.host = rest;
    }

    // Explicit port
    const auto port_pos = out.host.find(':');
    if (port_pos != std::string::npos) {
        const auto port = utils::try_parse_int<int>(out.host.substr(port_pos + 1));
        if (!port || !utils::in_range<1, 65535>(*port)) return std::nullopt;
        out.port = *port;
        out.host = out.host.substr(0, port_pos);
    }

    if (out.host.empty()) return std::nullopt;
    return out;
}

std::string url_encode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (const unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += std::format("%{:02X}", static_cast<unsigned>(c));
        }
    }
    return out;
}

} // namespace errorengine
