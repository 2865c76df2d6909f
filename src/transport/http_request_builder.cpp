#include "etcdpp/transport/http_request_builder.hpp"

#include "etcdpp/log/logger.hpp"
#include "etcdpp/requests/etcd_request.hpp"

#include <optional>
#include <stdexcept>

namespace etcdpp {

namespace {

constexpr char kHexDigits[] = "0123456789ABCDEF";

[[nodiscard]] bool is_unreserved(unsigned char c) noexcept {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
           c == '-' || c == '.' || c == '_' || c == '~';
}

void append_escaped(std::string& out, unsigned char c) {
    out += '%';
    out += kHexDigits[c >> 4];
    out += kHexDigits[c & 0x0F];
}

void set_header(HeaderMap& headers, const std::string& name, std::string value) {
    const auto it = find_header(headers, name);
    if (it != headers.end()) {
        headers.erase(it);
    }
    headers[name] = std::move(value);
}

// Name of the first header that cannot go on the wire, if any
[[nodiscard]] std::optional<std::string> unsafe_header(const HeaderMap& headers) {
    for (const auto& [name, value] : headers) {
        if (name.empty() || has_line_break(name) || has_line_break(value) ||
            name.find(':') != std::string::npos) {
            return name;
        }
    }
    return std::nullopt;
}

[[nodiscard]] std::optional<TransportError> check_wire(const WireRequest& wire) {
    if (has_line_break(wire.target)) {
        return TransportError::request_build_failed(
            "Request target contains a line break: " + percent_encode(wire.target)
        );
    }
    if (auto name = unsafe_header(wire.headers)) {
        return TransportError::request_build_failed(
            "Header '" + percent_encode(*name) + "' contains a line break or is malformed"
        );
    }
    return std::nullopt;
}

}  // namespace

bool has_line_break(std::string_view value) noexcept {
    return value.find_first_of(std::string_view("\r\n\0", 3)) != std::string_view::npos;
}

std::string percent_encode_path(std::string_view path) {
    std::string out;
    out.reserve(path.size());
    for (;;) {
        const auto slash = path.find('/');
        out += percent_encode(path.substr(0, slash));
        if (slash == std::string_view::npos) {
            break;
        }
        out += '/';
        path.remove_prefix(slash + 1);
    }
    return out;
}

std::string percent_encode(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (const char ch : value) {
        const auto c = static_cast<unsigned char>(ch);
        if (is_unreserved(c)) {
            out += ch;
        } else {
            append_escaped(out, c);
        }
    }
    return out;
}

// ─────────────────────────────────────────────────────────────────────────────
// FormBodyEncoder
// ─────────────────────────────────────────────────────────────────────────────

FormBodyEncoder::FormBodyEncoder()
    : buffer_(std::string{})
{}

FormBodyEncoder::~FormBodyEncoder() {
    close();
}

std::string FormBodyEncoder::encode_component(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (const char ch : value) {
        const auto c = static_cast<unsigned char>(ch);
        if (is_unreserved(c)) {
            out += ch;
        } else if (c == ' ') {
            out += '+';
        } else {
            append_escaped(out, c);
        }
    }
    return out;
}

void FormBodyEncoder::add(std::string_view key, std::string_view value) {
    if (is_closed()) {
        throw std::logic_error("FormBodyEncoder: add() after close()");
    }
    if (buffer_->empty() == false) {
        *buffer_ += '&';
    }
    *buffer_ += encode_component(key);
    *buffer_ += '=';
    *buffer_ += encode_component(value);
}

std::string FormBodyEncoder::finish() {
    if (is_closed()) {
        throw std::logic_error("FormBodyEncoder: finish() after close()");
    }
    std::string body = std::move(*buffer_);
    close();
    return body;
}

void FormBodyEncoder::close() noexcept {
    buffer_.reset();
}

// ─────────────────────────────────────────────────────────────────────────────
// Request building
// ─────────────────────────────────────────────────────────────────────────────

EtcdResult<WireRequest> build_http_request(
    const std::string& target,
    EtcdRequestBase& request,
    const HeaderMap& extra_headers
) {
    try {
        WireRequest wire;
        wire.method = request.method();
        wire.target = target;
        wire.headers = extra_headers;
        set_header(wire.headers, "Connection", "keep-alive");

        const RequestParams& params = request.params();
        if (params.empty() == false) {
            if (wire.method == HttpMethod::Post) {
                FormBodyEncoder encoder;
                for (const auto& [key, value] : params) {
                    encoder.add(key, value);
                }
                wire.body = encoder.finish();
                set_header(wire.headers, "Content-Type", "application/x-www-form-urlencoded");
                set_header(wire.headers, "Content-Length", std::to_string(wire.body.size()));
            } else {
                // An existing query keeps its pairs; ours follow after '&'
                const bool has_query = (wire.target.find('?') != std::string::npos);
                char separator = has_query ? '&' : '?';
                for (const auto& [key, value] : params) {
                    wire.target += separator;
                    wire.target += key;
                    wire.target += '=';
                    wire.target += value;
                    separator = '&';
                }
            }
        }

        if (auto invalid = check_wire(wire)) {
            get_logger()->warn_fmt("Refusing to build {} request: {}", to_string(wire.method), invalid->message);
            return tl::unexpected(*invalid);
        }

        get_logger()->trace_fmt("Built {} {}", to_string(wire.method), wire.target);
        request.record_wire_request(wire);
        return wire;
    } catch (const std::exception& e) {
        return tl::unexpected(TransportError::request_build_failed(
            std::string("Failed to build request for ") + target + ": " + e.what()
        ));
    }
}

EtcdResult<std::string> serialize_request(const WireRequest& wire, const Endpoint& endpoint) {
    if (auto invalid = check_wire(wire)) {
        return tl::unexpected(*invalid);
    }

    std::string out;
    out.reserve(256 + wire.target.size() + wire.body.size());

    out += to_string(wire.method);
    out += ' ';
    out += wire.target.empty() ? "/" : wire.target;
    out += " HTTP/1.1\r\n";

    if (find_header(wire.headers, "Host") == wire.headers.end()) {
        out += "Host: " + endpoint.host_with_port() + "\r\n";
    }
    for (const auto& [name, value] : wire.headers) {
        out += name;
        out += ": ";
        out += value;
        out += "\r\n";
    }
    const bool needs_length = (wire.body.empty() == false) &&
                              (find_header(wire.headers, "Content-Length") == wire.headers.end());
    if (needs_length) {
        out += "Content-Length: " + std::to_string(wire.body.size()) + "\r\n";
    }
    out += "\r\n";
    out += wire.body;
    return out;
}

}  // namespace etcdpp
