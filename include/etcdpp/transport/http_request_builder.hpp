#ifndef ETCDPP_TRANSPORT_HTTP_REQUEST_BUILDER_HPP
#define ETCDPP_TRANSPORT_HTTP_REQUEST_BUILDER_HPP

#include "etcdpp/transport/http_types.hpp"
#include "etcdpp/transport/transport_error.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace etcdpp {

class EtcdRequestBase;

// ─────────────────────────────────────────────────────────────────────────────
// Encoding helpers
// ─────────────────────────────────────────────────────────────────────────────

/// RFC 3986: unreserved bytes literal, everything else %XX.
[[nodiscard]] std::string percent_encode(std::string_view value);

/// percent_encode() for a path: '/' separators are kept, every segment is
/// encoded ("a b/c?" -> "a%20b/c%3F").
[[nodiscard]] std::string percent_encode_path(std::string_view path);

/// True if `value` holds CR, LF or NUL, which would split a request line or
/// header.
[[nodiscard]] bool has_line_break(std::string_view value) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// FormBodyEncoder
// ─────────────────────────────────────────────────────────────────────────────
// application/x-www-form-urlencoded body writer. The working buffer is
// released by close() or by the destructor, whichever comes first; add()
// after close() throws std::logic_error.
//
//   FormBodyEncoder encoder;
//   encoder.add("value", "x y");
//   encoder.add("ttl", "5");
//   std::string body = encoder.finish();   // "value=x+y&ttl=5", closes

class FormBodyEncoder {
public:
    FormBodyEncoder();
    ~FormBodyEncoder();

    FormBodyEncoder(const FormBodyEncoder&) = delete;
    FormBodyEncoder& operator=(const FormBodyEncoder&) = delete;

    void add(std::string_view key, std::string_view value);

    /// Hand out the encoded body and close the encoder.
    [[nodiscard]] std::string finish();

    void close() noexcept;

    [[nodiscard]] bool is_closed() const noexcept { return buffer_.has_value() == false; }

    /// Form-encode one key or value (space becomes '+').
    [[nodiscard]] static std::string encode_component(std::string_view value);

private:
    std::optional<std::string> buffer_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Request building
// ─────────────────────────────────────────────────────────────────────────────

/// Translate `request` into a wire request for `target` and record it on the
/// request. Parameters go into a form body for POST and into the query
/// string (as given, no encoding) for every other method. `extra_headers`
/// are added before the builder's own headers.
/// Any failure is a RequestBuildFailed error, including a target or header
/// carrying CR or LF.
[[nodiscard]] EtcdResult<WireRequest> build_http_request(
    const std::string& target,
    EtcdRequestBase& request,
    const HeaderMap& extra_headers = {}
);

/// HTTP/1.1 bytes for `wire`, with Host taken from `endpoint`.
/// A target or header with CR or LF fails with RequestBuildFailed.
[[nodiscard]] EtcdResult<std::string> serialize_request(const WireRequest& wire, const Endpoint& endpoint);

}  // namespace etcdpp

#endif  // ETCDPP_TRANSPORT_HTTP_REQUEST_BUILDER_HPP
