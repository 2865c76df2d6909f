#include <catch2/catch_test_macros.hpp>

#include "etcdpp/requests/etcd_key_request.hpp"
#include "etcdpp/requests/etcd_version_request.hpp"
#include "etcdpp/transport/http_request_builder.hpp"

#include <stdexcept>
#include <string>
#include <string_view>

using namespace etcdpp;

namespace {

// Minimal request type with free-form parameters
class RawRequest final : public EtcdRequest<std::string> {
public:
    RawRequest(HttpMethod method, std::string url)
        : EtcdRequest<std::string>(method, std::move(url), TextDecoding{})
    {}
};

Endpoint local_endpoint() {
    return *parse_endpoint("http://127.0.0.1:2379");
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Encoding helpers
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("percent_encode keeps unreserved characters", "[builder][encoding]") {
    REQUIRE(percent_encode("abcXYZ019-._~") == "abcXYZ019-._~");
}

TEST_CASE("percent_encode escapes everything else", "[builder][encoding]") {
    REQUIRE(percent_encode("a b") == "a%20b");
    REQUIRE(percent_encode("x=1&y") == "x%3D1%26y");
    REQUIRE(percent_encode("/") == "%2F");
    REQUIRE(percent_encode("\xC3\xA9") == "%C3%A9");
    REQUIRE(percent_encode("").empty());
}

// ═══════════════════════════════════════════════════════════════════════════
// FormBodyEncoder
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("FormBodyEncoder joins pairs with '&'", "[builder][form]") {
    FormBodyEncoder encoder;
    encoder.add("value", "x y");
    encoder.add("ttl", "5");

    REQUIRE(encoder.finish() == "value=x+y&ttl=5");
    REQUIRE(encoder.is_closed());
}

TEST_CASE("FormBodyEncoder escapes reserved characters", "[builder][form]") {
    FormBodyEncoder encoder;
    encoder.add("a&b", "1=2");
    REQUIRE(encoder.finish() == "a%26b=1%3D2");
}

TEST_CASE("FormBodyEncoder rejects use after close", "[builder][form]") {
    FormBodyEncoder encoder;
    encoder.add("k", "v");
    encoder.close();

    REQUIRE(encoder.is_closed());
    REQUIRE_THROWS_AS(encoder.add("k2", "v2"), std::logic_error);
    REQUIRE_THROWS_AS(encoder.finish(), std::logic_error);

    // Closing twice is harmless
    encoder.close();
    REQUIRE(encoder.is_closed());
}

TEST_CASE("FormBodyEncoder with no pairs yields an empty body", "[builder][form]") {
    FormBodyEncoder encoder;
    REQUIRE(encoder.is_closed() == false);
    REQUIRE(encoder.finish().empty());
}

TEST_CASE("percent_encode_path keeps separators and encodes segments", "[builder][encoding]") {
    REQUIRE(percent_encode_path("config/leader") == "config/leader");
    REQUIRE(percent_encode_path("a b/c?d#e") == "a%20b/c%3Fd%23e");
    REQUIRE(percent_encode_path("dir/") == "dir/");
    REQUIRE(percent_encode_path("x\r\nHost: evil") == "x%0D%0AHost%3A%20evil");
    REQUIRE(percent_encode_path("").empty());
}

TEST_CASE("has_line_break spots CR, LF and NUL", "[builder][encoding]") {
    REQUIRE(has_line_break("plain") == false);
    REQUIRE(has_line_break("a\rb"));
    REQUIRE(has_line_break("a\nb"));
    REQUIRE(has_line_break(std::string_view("a\0b", 3)));
}

// ═══════════════════════════════════════════════════════════════════════════
// build_http_request
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("GET without parameters uses the target as is", "[builder]") {
    auto request = EtcdVersionRequest::create();
    auto wire = build_http_request("/version", *request);

    REQUIRE(wire.has_value());
    REQUIRE(wire->method == HttpMethod::Get);
    REQUIRE(wire->target == "/version");
    REQUIRE(wire->body.empty());
    REQUIRE(get_header(wire->headers, "Connection") == "keep-alive");
}

TEST_CASE("Non-POST parameters form the query string in order", "[builder]") {
    RawRequest request(HttpMethod::Get, "/v2/keys/dir");
    request.params().set("recursive", "true");
    request.params().set("sorted", "true");
    request.params().set("wait", "false");

    auto wire = build_http_request("/v2/keys/dir", request);

    REQUIRE(wire.has_value());
    REQUIRE(wire->target == "/v2/keys/dir?recursive=true&sorted=true&wait=false");
    REQUIRE(wire->body.empty());
    REQUIRE(find_header(wire->headers, "Content-Type") == wire->headers.end());
}

TEST_CASE("Query parameters are passed through without encoding", "[builder]") {
    RawRequest request(HttpMethod::Put, "/v2/keys/k");
    request.params().set("value", "a%20b");
    request.params().set("raw", "x y");

    auto wire = build_http_request("/v2/keys/k", request);

    REQUIRE(wire.has_value());
    REQUIRE(wire->target == "/v2/keys/k?value=a%20b&raw=x y");
}

TEST_CASE("A target that already has a query gets parameters after '&'", "[builder]") {
    RawRequest request(HttpMethod::Get, "/v2/keys/k?quorum=true");
    request.params().set("recursive", "true");

    auto wire = build_http_request("/v2/keys/k?quorum=true", request);

    REQUIRE(wire.has_value());
    REQUIRE(wire->target == "/v2/keys/k?quorum=true&recursive=true");
}

TEST_CASE("POST parameters become a form body", "[builder]") {
    RawRequest request(HttpMethod::Post, "/v2/keys/queue");
    request.params().set("value", "job 1");
    request.params().set("ttl", "60");

    auto wire = build_http_request("/v2/keys/queue", request);

    REQUIRE(wire.has_value());
    REQUIRE(wire->target == "/v2/keys/queue");
    REQUIRE(wire->body == "value=job+1&ttl=60");
    REQUIRE(get_header(wire->headers, "Content-Type") == "application/x-www-form-urlencoded");
    REQUIRE(get_header(wire->headers, "Content-Length") == std::to_string(wire->body.size()));
}

TEST_CASE("Extra headers are copied and Connection is forced", "[builder]") {
    RawRequest request(HttpMethod::Get, "/version");
    HeaderMap extra{{"Authorization", "Basic dTpw"}, {"connection", "close"}};

    auto wire = build_http_request("/version", request, extra);

    REQUIRE(wire.has_value());
    REQUIRE(get_header(wire->headers, "Authorization") == "Basic dTpw");
    REQUIRE(get_header(wire->headers, "Connection") == "keep-alive");
    // Only one Connection header survives
    std::size_t connection_headers = 0;
    for (const auto& [name, value] : wire->headers) {
        if (iequals(name, "Connection")) {
            ++connection_headers;
        }
    }
    REQUIRE(connection_headers == 1);
}

TEST_CASE("The built request is recorded on the logical request", "[builder]") {
    auto request = EtcdKeyRequest::get("foo");
    request->recursive();
    REQUIRE(request->wire_request().has_value() == false);

    auto wire = build_http_request("/v2/keys/foo", *request);

    REQUIRE(wire.has_value());
    const auto recorded = request->wire_request();
    REQUIRE(recorded.has_value());
    REQUIRE(recorded->target == "/v2/keys/foo?recursive=true");
}

// ═══════════════════════════════════════════════════════════════════════════
// serialize_request
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("serialize_request writes an HTTP/1.1 request", "[builder][serialize]") {
    WireRequest wire;
    wire.method = HttpMethod::Get;
    wire.target = "/v2/keys/foo";
    wire.headers["Connection"] = "keep-alive";

    const std::string bytes = serialize_request(wire, local_endpoint()).value();

    REQUIRE(bytes.starts_with("GET /v2/keys/foo HTTP/1.1\r\n"));
    REQUIRE(bytes.find("Host: 127.0.0.1:2379\r\n") != std::string::npos);
    REQUIRE(bytes.find("Connection: keep-alive\r\n") != std::string::npos);
    REQUIRE(bytes.ends_with("\r\n\r\n"));
    REQUIRE(bytes.find("Content-Length") == std::string::npos);
}

TEST_CASE("serialize_request adds Content-Length for bodies", "[builder][serialize]") {
    WireRequest wire;
    wire.method = HttpMethod::Post;
    wire.target = "/v2/keys/q";
    wire.body = "value=1";

    const std::string bytes = serialize_request(wire, local_endpoint()).value();

    REQUIRE(bytes.starts_with("POST /v2/keys/q HTTP/1.1\r\n"));
    REQUIRE(bytes.find("Content-Length: 7\r\n") != std::string::npos);
    REQUIRE(bytes.ends_with("\r\n\r\nvalue=1"));
}

TEST_CASE("serialize_request keeps a caller-supplied Host", "[builder][serialize]") {
    WireRequest wire;
    wire.target = "/version";
    wire.headers["host"] = "etcd.internal";

    const std::string bytes = serialize_request(wire, local_endpoint()).value();

    REQUIRE(bytes.find("host: etcd.internal\r\n") != std::string::npos);
    REQUIRE(bytes.find("Host: 127.0.0.1") == std::string::npos);
}

TEST_CASE("serialize_request uses '/' for an empty target", "[builder][serialize]") {
    WireRequest wire;
    const std::string bytes = serialize_request(wire, local_endpoint()).value();
    REQUIRE(bytes.starts_with("GET / HTTP/1.1\r\n"));
}

// ═══════════════════════════════════════════════════════════════════════════
// Header injection
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("A target with CR or LF is not built", "[builder][injection]") {
    SECTION("In the target") {
        RawRequest request(HttpMethod::Get, "/v2/keys/x");
        auto wire = build_http_request("/v2/keys/x HTTP/1.1\r\nX-Injected: 1\r\n", request);
        REQUIRE(wire.has_value() == false);
        REQUIRE(wire.error().code == TransportError::Code::RequestBuildFailed);
        REQUIRE(request.wire_request().has_value() == false);
    }

    SECTION("In a query parameter") {
        RawRequest request(HttpMethod::Get, "/v2/keys/x");
        request.params().set("wait", "true\nX-Injected: 1");
        auto wire = build_http_request("/v2/keys/x", request);
        REQUIRE(wire.has_value() == false);
        REQUIRE(wire.error().code == TransportError::Code::RequestBuildFailed);
    }

    SECTION("In a header value") {
        RawRequest request(HttpMethod::Get, "/version");
        HeaderMap extra{{"Authorization", "Basic x\r\nX-Injected: 1"}};
        auto wire = build_http_request("/version", request, extra);
        REQUIRE(wire.has_value() == false);
        REQUIRE(wire.error().code == TransportError::Code::RequestBuildFailed);
    }

    SECTION("A POST body may hold line breaks") {
        RawRequest request(HttpMethod::Post, "/v2/keys/queue");
        request.params().set("value", "line 1\nline 2");
        auto wire = build_http_request("/v2/keys/queue", request);
        REQUIRE(wire.has_value());
        REQUIRE(wire->body == "value=line+1%0Aline+2");
    }
}

TEST_CASE("serialize_request refuses line breaks in the head", "[builder][injection]") {
    WireRequest wire;
    wire.target = "/v2/keys/a\r\nX-Injected: 1";
    auto bytes = serialize_request(wire, local_endpoint());
    REQUIRE(bytes.has_value() == false);
    REQUIRE(bytes.error().code == TransportError::Code::RequestBuildFailed);

    wire.target = "/v2/keys/a";
    wire.headers["X-Trace"] = "1\nX-Injected: 1";
    REQUIRE(serialize_request(wire, local_endpoint()).has_value() == false);

    wire.headers.clear();
    wire.headers["Bad:Name"] = "1";
    REQUIRE(serialize_request(wire, local_endpoint()).has_value() == false);
}

TEST_CASE("Key paths reach the wire percent-encoded", "[builder][injection]") {
    auto request = EtcdKeyRequest::get("dir name/key?x#y\r\nX-Injected: 1");
    auto wire = build_http_request(request->url(), *request);

    REQUIRE(wire.has_value());
    REQUIRE(wire->target == "/v2/keys/dir%20name/key%3Fx%23y%0D%0AX-Injected%3A%201");

    auto bytes = serialize_request(*wire, local_endpoint());
    REQUIRE(bytes.has_value());
    REQUIRE(bytes->starts_with("GET /v2/keys/dir%20name/key%3Fx%23y%0D%0AX-Injected%3A%201 HTTP/1.1\r\n"));
    REQUIRE(bytes->find("\r\nX-Injected") == std::string::npos);
}
