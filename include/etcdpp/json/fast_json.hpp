#pragma once

// ─────────────────────────────────────────────────────────────────────────────
// Fast JSON parsing
// ─────────────────────────────────────────────────────────────────────────────
// Response bodies are parsed with simdjson (on-demand API) and materialized
// as nlohmann::json, which the rest of the library uses for field access and
// for producing output.
//
//   auto doc = etcdpp::fast_parse(body);
//   if (doc.has_value() == false) { ... doc.error().message ... }
//   const std::string action = doc->value("action", "");

#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <tl/expected.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace etcdpp {

struct JsonParseError {
    std::string message;

    JsonParseError() = default;
    explicit JsonParseError(std::string msg)
        : message(std::move(msg))
    {}
};

using JsonResult = tl::expected<nlohmann::json, JsonParseError>;

// Directory listings nest one level per directory, so the default leaves
// plenty of room for recursive gets.
struct FastJsonConfig {
    std::size_t max_depth{128};
};

class FastJsonParser {
public:
    FastJsonParser() = default;
    explicit FastJsonParser(FastJsonConfig config) : config_(config) {}

    /// Not thread-safe; use one parser per thread.
    [[nodiscard]] JsonResult parse(std::string_view json_str);

    [[nodiscard]] const FastJsonConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] JsonResult convert(simdjson::ondemand::value value, std::size_t depth);

    simdjson::ondemand::parser parser_;
    FastJsonConfig config_;
};

/// Parse with a thread-local FastJsonParser.
[[nodiscard]] JsonResult fast_parse(std::string_view json_str);

/// Active simdjson kernel ("haswell", "arm64", "fallback", ...).
[[nodiscard]] std::string fast_json_implementation();

}  // namespace etcdpp
