#pragma once

#include "etcdpp/transport/http_types.hpp"
#include "etcdpp/transport/transport_error.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

// Forward declare llhttp types to keep llhttp.h out of public headers
typedef struct llhttp__internal_s llhttp_t;
typedef struct llhttp_settings_s llhttp_settings_t;

namespace etcdpp {

// ─────────────────────────────────────────────────────────────────────────────
// HttpResponseDecoder
// ─────────────────────────────────────────────────────────────────────────────
// Aggregates one HTTP/1.x response from bytes read off a connection. Framing
// (status line, headers, Content-Length, chunked encoding, close-delimited
// bodies) is done by llhttp; this class collects the pieces into an
// HttpResponse and enforces the body size limit.
//
// Interim 1xx responses are skipped and the header section is capped at
// 64 KiB. For a HEAD request the body is never expected, whatever
// Content-Length says.
//
//   HttpResponseDecoder decoder(max_body, false);
//   auto done = decoder.feed(bytes);        // EtcdResult<bool>
//   ...on EOF: decoder.finish()
//   HttpResponse response = decoder.take_response();

class HttpResponseDecoder {
public:
    HttpResponseDecoder(std::size_t max_body_size, bool head_request);
    ~HttpResponseDecoder();

    HttpResponseDecoder(const HttpResponseDecoder&) = delete;
    HttpResponseDecoder& operator=(const HttpResponseDecoder&) = delete;

    /// True once a final response is complete; later bytes are ignored.
    /// Malformed framing and oversized bodies fail with Protocol.
    [[nodiscard]] EtcdResult<bool> feed(std::string_view data);

    /// The peer closed the connection. True if that completed the response
    /// (a body delimited by close), or it was already complete.
    [[nodiscard]] bool finish();

    [[nodiscard]] bool is_complete() const noexcept { return complete_; }

    /// Any byte received yet
    [[nodiscard]] bool has_started() const noexcept { return started_; }

    /// Only meaningful once complete.
    [[nodiscard]] HttpResponse take_response();

private:
    static int on_message_begin(llhttp_t* parser);
    static int on_status(llhttp_t* parser, const char* at, std::size_t length);
    static int on_header_field(llhttp_t* parser, const char* at, std::size_t length);
    static int on_header_value(llhttp_t* parser, const char* at, std::size_t length);
    static int on_headers_complete(llhttp_t* parser);
    static int on_body(llhttp_t* parser, const char* at, std::size_t length);
    static int on_message_complete(llhttp_t* parser);

    void store_header();
    [[nodiscard]] bool count_header_bytes(std::size_t length);

    std::size_t max_body_size_;
    bool head_request_;

    std::unique_ptr<llhttp_settings_t> settings_;
    std::unique_ptr<llhttp_t> parser_;

    HttpResponse response_;
    std::string field_;
    std::string value_;
    bool reading_value_{false};
    std::size_t header_bytes_{0};

    std::string failure_;
    bool started_{false};
    bool complete_{false};
};

}  // namespace etcdpp
