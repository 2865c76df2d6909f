#include <catch2/catch_test_macros.hpp>

#include "etcdpp/transport/http_response_decoder.hpp"

#include <string>

using namespace etcdpp;

namespace {

constexpr std::size_t kDefaultBodyLimit = 100 * 1024;

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Content-Length framing
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Decoder reads a Content-Length response", "[decoder]") {
    HttpResponseDecoder decoder(kDefaultBodyLimit, false);
    auto complete = decoder.feed(
        "HTTP/1.1 200 OK\r\n"
        "Content-Type: application/json\r\n"
        "X-Etcd-Index: 7\r\n"
        "Content-Length: 2\r\n"
        "\r\n"
        "{}"
    );

    REQUIRE(complete.has_value());
    REQUIRE(*complete);
    auto response = decoder.take_response();
    REQUIRE(response.status_code == 200);
    REQUIRE(response.reason == "OK");
    REQUIRE(response.body == "{}");
    REQUIRE(response.header("x-etcd-index") == "7");
}

TEST_CASE("Decoder accepts bytes one at a time", "[decoder]") {
    const std::string raw =
        "HTTP/1.1 404 Not Found\r\n"
        "Content-Length: 11\r\n"
        "\r\n"
        "hello world";

    HttpResponseDecoder decoder(kDefaultBodyLimit, false);
    bool complete = false;
    for (const char c : raw) {
        REQUIRE(complete == false);
        auto step = decoder.feed(std::string_view(&c, 1));
        REQUIRE(step.has_value());
        complete = *step;
    }

    REQUIRE(complete);
    auto response = decoder.take_response();
    REQUIRE(response.status_code == 404);
    REQUIRE(response.reason == "Not Found");
    REQUIRE(response.body == "hello world");
}

TEST_CASE("Decoder waits for the full body", "[decoder]") {
    HttpResponseDecoder decoder(kDefaultBodyLimit, false);
    REQUIRE(decoder.has_started() == false);
    REQUIRE(decoder.feed("HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\n12345") == false);
    REQUIRE(decoder.has_started());
    REQUIRE(decoder.is_complete() == false);
    // EOF now leaves the response short
    REQUIRE(decoder.finish() == false);
}

TEST_CASE("EOF before any byte is not a response", "[decoder]") {
    HttpResponseDecoder decoder(kDefaultBodyLimit, false);
    REQUIRE(decoder.finish() == false);
    REQUIRE(decoder.has_started() == false);
}

TEST_CASE("Decoder ignores bytes after a complete response", "[decoder]") {
    HttpResponseDecoder decoder(kDefaultBodyLimit, false);
    REQUIRE(decoder.feed("HTTP/1.1 200 OK\r\nContent-Length: 1\r\n\r\nxGARBAGE") == true);
    REQUIRE(decoder.feed("more garbage") == true);
    REQUIRE(decoder.take_response().body == "x");
}

TEST_CASE("Repeated headers are folded", "[decoder]") {
    HttpResponseDecoder decoder(kDefaultBodyLimit, false);
    REQUIRE(decoder.feed(
        "HTTP/1.1 200 OK\r\n"
        "Set-Cookie: a=1\r\n"
        "set-cookie: b=2\r\n"
        "Content-Length: 0\r\n"
        "\r\n"
    ) == true);
    REQUIRE(decoder.take_response().header("Set-Cookie") == "a=1, b=2");
}

// ═══════════════════════════════════════════════════════════════════════════
// Chunked and close-delimited bodies
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Decoder aggregates a chunked body", "[decoder][chunked]") {
    HttpResponseDecoder decoder(kDefaultBodyLimit, false);
    auto complete = decoder.feed(
        "HTTP/1.1 200 OK\r\n"
        "Transfer-Encoding: chunked\r\n"
        "\r\n"
        "5\r\nhello\r\n"
        "1;ext=1\r\n \r\n"
        "5\r\nworld\r\n"
        "0\r\n"
        "X-Trailer: ignored\r\n"
        "\r\n"
    );

    REQUIRE(complete == true);
    REQUIRE(decoder.take_response().body == "hello world");
}

TEST_CASE("Decoder rejects bad chunk framing", "[decoder][chunked]") {
    SECTION("Invalid size") {
        HttpResponseDecoder decoder(kDefaultBodyLimit, false);
        auto result = decoder.feed("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\nzz\r\n");
        REQUIRE(result.has_value() == false);
        REQUIRE(result.error().code == TransportError::Code::Protocol);
    }

    SECTION("Size that overflows 64 bits") {
        HttpResponseDecoder decoder(kDefaultBodyLimit, false);
        auto result = decoder.feed(
            "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
            "fffffffffffffffffff\r\n"
        );
        REQUIRE(result.has_value() == false);
        REQUIRE(result.error().code == TransportError::Code::Protocol);
    }

    SECTION("Missing CRLF after data") {
        HttpResponseDecoder decoder(kDefaultBodyLimit, false);
        auto result = decoder.feed("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n2\r\nabXX\r\n");
        REQUIRE(result.has_value() == false);
    }
}

TEST_CASE("A body without framing ends when the connection closes", "[decoder]") {
    HttpResponseDecoder decoder(kDefaultBodyLimit, false);
    REQUIRE(decoder.feed("HTTP/1.0 200 OK\r\n\r\npart one, ") == false);
    REQUIRE(decoder.feed("part two") == false);
    REQUIRE(decoder.finish());
    REQUIRE(decoder.take_response().body == "part one, part two");
}

// ═══════════════════════════════════════════════════════════════════════════
// Responses without a body
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Interim 1xx responses are skipped", "[decoder]") {
    HttpResponseDecoder decoder(kDefaultBodyLimit, false);
    REQUIRE(decoder.feed(
        "HTTP/1.1 100 Continue\r\n\r\n"
        "HTTP/1.1 201 Created\r\nContent-Length: 2\r\n\r\n{}"
    ) == true);
    auto response = decoder.take_response();
    REQUIRE(response.status_code == 201);
    REQUIRE(response.reason == "Created");
    REQUIRE(response.body == "{}");
}

TEST_CASE("204, 304 and HEAD responses complete after the headers", "[decoder]") {
    SECTION("204") {
        HttpResponseDecoder decoder(kDefaultBodyLimit, false);
        REQUIRE(decoder.feed("HTTP/1.1 204 No Content\r\n\r\n") == true);
    }

    SECTION("304") {
        HttpResponseDecoder decoder(kDefaultBodyLimit, false);
        REQUIRE(decoder.feed("HTTP/1.1 304 Not Modified\r\nContent-Length: 10\r\n\r\n") == true);
    }

    SECTION("HEAD") {
        HttpResponseDecoder decoder(kDefaultBodyLimit, true);
        REQUIRE(decoder.feed("HTTP/1.1 200 OK\r\nContent-Length: 1000\r\n\r\n") == true);
        REQUIRE(decoder.take_response().body.empty());
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Limits and malformed input
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Decoder enforces the body size limit", "[decoder][limits]") {
    SECTION("Declared Content-Length too large") {
        HttpResponseDecoder decoder(8, false);
        auto result = decoder.feed("HTTP/1.1 200 OK\r\nContent-Length: 9\r\n\r\n");
        REQUIRE(result.has_value() == false);
        REQUIRE(result.error().code == TransportError::Code::Protocol);
        REQUIRE(result.error().message.find("exceeds limit of 8") != std::string::npos);
    }

    SECTION("Chunks add up past the limit") {
        HttpResponseDecoder decoder(8, false);
        auto result = decoder.feed(
            "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
            "5\r\n12345\r\n5\r\n6789"
        );
        REQUIRE(result.has_value() == false);
        REQUIRE(result.error().message.find("exceeds limit of 8") != std::string::npos);
    }

    SECTION("Close-delimited body grows past the limit") {
        HttpResponseDecoder decoder(8, false);
        auto result = decoder.feed("HTTP/1.1 200 OK\r\n\r\n123456789");
        REQUIRE(result.has_value() == false);
    }

    SECTION("A body exactly at the limit is accepted") {
        HttpResponseDecoder decoder(8, false);
        REQUIRE(decoder.feed("HTTP/1.1 200 OK\r\nContent-Length: 8\r\n\r\n12345678") == true);
    }
}

TEST_CASE("Decoder caps the header section", "[decoder][limits]") {
    HttpResponseDecoder decoder(kDefaultBodyLimit, false);
    auto result = decoder.feed("HTTP/1.1 200 OK\r\nX-Long: " + std::string(70 * 1024, 'a') + "\r\n");
    REQUIRE(result.has_value() == false);
    REQUIRE(result.error().code == TransportError::Code::Protocol);
}

TEST_CASE("Decoder rejects malformed heads", "[decoder]") {
    SECTION("Not HTTP") {
        HttpResponseDecoder decoder(kDefaultBodyLimit, false);
        REQUIRE(decoder.feed("SSH-2.0-OpenSSH\r\n").has_value() == false);
    }

    SECTION("Bad status code") {
        HttpResponseDecoder decoder(kDefaultBodyLimit, false);
        REQUIRE(decoder.feed("HTTP/1.1 2x0 OK\r\n").has_value() == false);
    }

    SECTION("Header without colon") {
        HttpResponseDecoder decoder(kDefaultBodyLimit, false);
        REQUIRE(decoder.feed("HTTP/1.1 200 OK\r\nbroken\r\n").has_value() == false);
    }

    SECTION("Bad Content-Length") {
        HttpResponseDecoder decoder(kDefaultBodyLimit, false);
        auto result = decoder.feed("HTTP/1.1 200 OK\r\nContent-Length: ten\r\n\r\n");
        REQUIRE(result.has_value() == false);
        REQUIRE(result.error().message.find("Malformed HTTP response") != std::string::npos);
    }

    SECTION("A failed decoder stays failed at EOF") {
        HttpResponseDecoder decoder(kDefaultBodyLimit, false);
        REQUIRE(decoder.feed("garbage").has_value() == false);
        REQUIRE(decoder.finish() == false);
    }
}
