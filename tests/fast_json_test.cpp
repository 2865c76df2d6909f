#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "etcdpp/json/fast_json.hpp"

#include <cstdint>
#include <string>

using namespace etcdpp;
using Json = nlohmann::json;

// ─────────────────────────────────────────────────────────────────────────────
// Basic Parsing Tests
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("fast_parse handles an etcd node document", "[json][simdjson]") {
    auto result = fast_parse(R"({
        "action": "get",
        "node": {
            "key": "/config",
            "dir": true,
            "nodes": [
                {"key": "/config/a", "value": "1", "modifiedIndex": 7, "createdIndex": 7},
                {"key": "/config/b", "value": "2", "modifiedIndex": 8, "createdIndex": 8}
            ],
            "modifiedIndex": 3,
            "createdIndex": 3
        }
    })");

    REQUIRE(result.has_value());
    REQUIRE((*result)["action"] == "get");
    REQUIRE((*result)["node"]["dir"] == true);
    REQUIRE((*result)["node"]["nodes"].size() == 2);
    REQUIRE((*result)["node"]["nodes"][1]["value"] == "2");
    REQUIRE((*result)["node"]["nodes"][1]["modifiedIndex"] == 8);
}

TEST_CASE("fast_parse handles mixed arrays", "[json][simdjson]") {
    auto result = fast_parse(R"([1, "two", true, null, 3.14])");

    REQUIRE(result.has_value());
    REQUIRE(result->size() == 5);
    REQUIRE((*result)[0] == 1);
    REQUIRE((*result)[1] == "two");
    REQUIRE((*result)[2] == true);
    REQUIRE((*result)[3].is_null());
    REQUIRE_THAT((*result)[4].get<double>(), Catch::Matchers::WithinRel(3.14, 1e-9));
}

TEST_CASE("fast_parse handles escaped strings", "[json][simdjson]") {
    auto result = fast_parse(R"({"message": "Key not found \"x\"\n", "cause": "\/foo"})");

    REQUIRE(result.has_value());
    REQUIRE((*result)["message"] == "Key not found \"x\"\n");
    REQUIRE((*result)["cause"] == "/foo");
}

TEST_CASE("fast_parse keeps large indices as integers", "[json][simdjson]") {
    auto result = fast_parse(R"({"signed": -5, "big": 18446744073709551615})");

    REQUIRE(result.has_value());
    REQUIRE((*result)["signed"].is_number_integer());
    REQUIRE((*result)["signed"].get<std::int64_t>() == -5);
    REQUIRE((*result)["big"].is_number_unsigned());
    REQUIRE((*result)["big"].get<std::uint64_t>() == 18446744073709551615ULL);
}

TEST_CASE("fast_parse handles scalar documents", "[json][simdjson]") {
    REQUIRE(fast_parse("42").value() == 42);
    REQUIRE(fast_parse(R"("2.3.8")").value() == "2.3.8");
    REQUIRE(fast_parse("null").value().is_null());
}

TEST_CASE("fast_parse handles empty containers", "[json][simdjson]") {
    REQUIRE(fast_parse("{}").value() == Json::object());
    REQUIRE(fast_parse("[]").value() == Json::array());
}

// ─────────────────────────────────────────────────────────────────────────────
// Error Handling Tests
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("fast_parse rejects malformed documents", "[json][simdjson][error]") {
    SECTION("Truncated object") {
        auto result = fast_parse(R"({"key": "value")");
        REQUIRE(result.has_value() == false);
        REQUIRE(result.error().message.empty() == false);
    }

    SECTION("HTML error page") {
        REQUIRE(fast_parse("<html><body>502 Bad Gateway</body></html>").has_value() == false);
    }

    SECTION("Empty input") {
        REQUIRE(fast_parse("").has_value() == false);
    }

    SECTION("Trailing content") {
        REQUIRE(fast_parse(R"({"a": 1} {"b": 2})").has_value() == false);
    }
}

TEST_CASE("FastJsonParser enforces the depth limit", "[json][simdjson][error]") {
    FastJsonConfig config;
    config.max_depth = 3;
    FastJsonParser parser(config);

    REQUIRE(parser.config().max_depth == 3);
    REQUIRE(parser.parse(R"({"a": {"b": {"c": 1}}})").has_value());

    auto too_deep = parser.parse(R"({"a": {"b": {"c": {"d": {"e": 1}}}}})");
    REQUIRE(too_deep.has_value() == false);
    REQUIRE(too_deep.error().message.find("depth") != std::string::npos);
}

TEST_CASE("FastJsonParser is reusable after an error", "[json][simdjson]") {
    FastJsonParser parser;

    REQUIRE(parser.parse("{not json").has_value() == false);

    auto result = parser.parse(R"({"etcdserver": "2.3.8", "etcdcluster": "2.3.0"})");
    REQUIRE(result.has_value());
    REQUIRE((*result)["etcdcluster"] == "2.3.0");
}

TEST_CASE("fast_json_implementation names a kernel", "[json][simdjson]") {
    REQUIRE(fast_json_implementation().empty() == false);
}
