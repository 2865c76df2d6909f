#include "etcdpp/transport/http_types.hpp"

#include <ada.h>

namespace etcdpp {

// ─────────────────────────────────────────────────────────────────────────────
// Endpoint parsing (ada-url)
// ─────────────────────────────────────────────────────────────────────────────
// ada handles IPv6 literals, default ports and normalization; we only map its
// result onto Endpoint and reject non-HTTP schemes.

std::optional<Endpoint> parse_endpoint(const std::string& uri) {
    auto parsed = ada::parse<ada::url>(uri);
    const bool parse_failed = (parsed.has_value() == false);
    if (parse_failed) {
        return std::nullopt;
    }

    const auto& url = parsed.value();

    // ada returns "https:" - drop the colon
    std::string scheme = std::string(url.get_protocol());
    const bool has_colon = (scheme.empty() == false) && (scheme.back() == ':');
    if (has_colon) {
        scheme.pop_back();
    }

    const bool is_http = (scheme == "http");
    const bool is_https = (scheme == "https");
    if ((is_http || is_https) == false) {
        return std::nullopt;
    }

    std::string host = std::string(url.get_hostname());
    if (host.empty()) {
        return std::nullopt;
    }
    // Bracketed IPv6 literal: the resolver wants the bare address
    const bool is_bracketed = host.size() > 2 && host.front() == '[' && host.back() == ']';
    if (is_bracketed) {
        host = host.substr(1, host.size() - 2);
    }

    std::uint16_t port = 0;
    const auto port_str = url.get_port();
    const bool has_explicit_port = (port_str.empty() == false);
    if (has_explicit_port) {
        port = static_cast<std::uint16_t>(std::stoi(std::string(port_str)));
    } else {
        port = is_https ? 443 : 80;
    }

    std::string path = std::string(url.get_pathname());
    if (path.empty()) {
        path = "/";
    }

    Endpoint result;
    result.scheme = std::move(scheme);
    result.host = std::move(host);
    result.port = port;
    result.path = std::move(path);
    result.query = std::string(url.get_search());
    return result;
}

}  // namespace etcdpp
