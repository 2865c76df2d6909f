#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace etcdpp {

// ─────────────────────────────────────────────────────────────────────────────
// Headers
// ─────────────────────────────────────────────────────────────────────────────
// Header names are case-insensitive (RFC 7230), so lookups go through
// find_header() rather than HeaderMap::find().

using HeaderMap = std::unordered_map<std::string, std::string>;

[[nodiscard]] inline bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::ranges::equal(a, b, [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

inline HeaderMap::const_iterator find_header(
    const HeaderMap& headers,
    std::string_view name
) {
    return std::ranges::find_if(headers, [&name](const auto& pair) {
        return iequals(pair.first, name);
    });
}

inline std::optional<std::string> get_header(
    const HeaderMap& headers,
    std::string_view name
) {
    const auto it = find_header(headers, name);
    const bool found = (it != headers.end());
    if (found) {
        return it->second;
    }
    return std::nullopt;
}

// ─────────────────────────────────────────────────────────────────────────────
// HTTP Method
// ─────────────────────────────────────────────────────────────────────────────

enum class HttpMethod {
    Get,
    Head,
    Post,
    Put,
    Delete
};

inline std::string to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::Get:    return "GET";
        case HttpMethod::Head:   return "HEAD";
        case HttpMethod::Post:   return "POST";
        case HttpMethod::Put:    return "PUT";
        case HttpMethod::Delete: return "DELETE";
    }
    return "UNKNOWN";
}

// ─────────────────────────────────────────────────────────────────────────────
// Request Parameters
// ─────────────────────────────────────────────────────────────────────────────
// Key/value pairs in encounter order. Setting an existing key replaces its
// value in place so the original position is kept.

class RequestParams {
public:
    using value_type = std::pair<std::string, std::string>;
    using const_iterator = std::vector<value_type>::const_iterator;

    RequestParams() = default;
    RequestParams(std::initializer_list<value_type> pairs) {
        for (const auto& [key, value] : pairs) {
            set(key, value);
        }
    }

    RequestParams& set(const std::string& key, std::string value) {
        const auto it = std::ranges::find_if(pairs_, [&key](const value_type& p) {
            return p.first == key;
        });
        if (it != pairs_.end()) {
            it->second = std::move(value);
        } else {
            pairs_.emplace_back(key, std::move(value));
        }
        return *this;
    }

    bool erase(const std::string& key) {
        const auto removed = std::erase_if(pairs_, [&key](const value_type& p) {
            return p.first == key;
        });
        return removed > 0;
    }

    [[nodiscard]] std::optional<std::string> get(const std::string& key) const {
        for (const auto& [k, v] : pairs_) {
            if (k == key) {
                return v;
            }
        }
        return std::nullopt;
    }

    [[nodiscard]] bool empty() const noexcept { return pairs_.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return pairs_.size(); }
    [[nodiscard]] const_iterator begin() const noexcept { return pairs_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return pairs_.end(); }

private:
    std::vector<value_type> pairs_;
};

// ─────────────────────────────────────────────────────────────────────────────
// WireRequest
// ─────────────────────────────────────────────────────────────────────────────
// A request ready for serialization: parameters are already folded into the
// target (query string) or the body (form encoding).

struct WireRequest {
    HttpMethod method{HttpMethod::Get};
    std::string target;   // origin-form: "/v2/keys/foo?recursive=true"
    HeaderMap headers;
    std::string body;
};

// ─────────────────────────────────────────────────────────────────────────────
// HttpResponse
// ─────────────────────────────────────────────────────────────────────────────
// A fully aggregated response as produced by HttpResponseDecoder.

struct HttpResponse {
    int status_code{0};
    std::string reason;
    HeaderMap headers;
    std::string body;

    [[nodiscard]] bool is_success() const {
        return (status_code >= 200) && (status_code < 300);
    }

    [[nodiscard]] bool is_redirect() const {
        return status_code == 301 || status_code == 302 ||
               status_code == 307 || status_code == 308;
    }

    [[nodiscard]] std::optional<std::string> header(std::string_view name) const {
        return get_header(headers, name);
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// Endpoint
// ─────────────────────────────────────────────────────────────────────────────
// One candidate server address. Parsed with ada-url (WHATWG URL parser); only
// http and https are accepted.

struct Endpoint {
    std::string scheme;   // "http" or "https"
    std::string host;     // "10.0.0.1", "etcd.example.com"
    std::uint16_t port{0};
    std::string path;     // "/" unless the URI carried one
    std::string query;    // "?x=y" (includes ?), usually empty

    [[nodiscard]] bool is_secure() const {
        return scheme == "https";
    }

    [[nodiscard]] std::string host_with_port() const {
        const bool ipv6 = (host.find(':') != std::string::npos);
        return (ipv6 ? "[" + host + "]" : host) + ":" + std::to_string(port);
    }

    [[nodiscard]] std::string path_with_query() const {
        return query.empty() ? path : path + query;
    }

    [[nodiscard]] std::string to_string() const {
        return scheme + "://" + host_with_port();
    }
};

/// Parse "scheme://host[:port][/path]". Returns nullopt for invalid input or
/// schemes other than http/https.
std::optional<Endpoint> parse_endpoint(const std::string& uri);

}  // namespace etcdpp
