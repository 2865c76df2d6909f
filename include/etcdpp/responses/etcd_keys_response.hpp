#ifndef ETCDPP_RESPONSES_ETCD_KEYS_RESPONSE_HPP
#define ETCDPP_RESPONSES_ETCD_KEYS_RESPONSE_HPP

#include "etcdpp/responses/etcd_server_error.hpp"
#include "etcdpp/transport/http_types.hpp"
#include "etcdpp/transport/transport_error.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace etcdpp {

// ─────────────────────────────────────────────────────────────────────────────
// EtcdNode
// ─────────────────────────────────────────────────────────────────────────────
// One entry of the key space. Directories carry child nodes when listed.

struct EtcdNode {
    std::string key;
    std::optional<std::string> value;
    bool dir{false};
    std::uint64_t created_index{0};
    std::uint64_t modified_index{0};
    std::optional<std::int64_t> ttl;
    std::optional<std::string> expiration;  // RFC 3339, as sent
    std::vector<EtcdNode> nodes;
};

// ─────────────────────────────────────────────────────────────────────────────
// EtcdKeysResponse
// ─────────────────────────────────────────────────────────────────────────────
// Result of a key operation. The index fields come from response headers
// (X-Etcd-Index, X-Raft-Index, X-Raft-Term) and are absent when the server
// did not send them.

struct EtcdKeysResponse {
    std::string action;  // "get", "set", "create", "delete", "expire", ...
    EtcdNode node;
    std::optional<EtcdNode> prev_node;

    std::optional<std::uint64_t> etcd_index;
    std::optional<std::uint64_t> raft_index;
    std::optional<std::uint64_t> raft_term;
};

/// Decode a complete key response. 2xx bodies become an EtcdKeysResponse;
/// malformed 2xx bodies are Protocol errors; any other status is a
/// ServerError, with the service's error document attached when it has one.
[[nodiscard]] EtcdResult<EtcdKeysResponse> parse_keys_response(const HttpResponse& response);

/// Parse {"errorCode":...,"message":...}. nullopt if `body` is not one.
[[nodiscard]] std::optional<EtcdServerError> parse_server_error(std::string_view body);

/// ServerError for a non-2xx response, using the error document if present.
[[nodiscard]] TransportError error_from_response(const HttpResponse& response);

// JSON output (CLI)
void to_json(nlohmann::json& j, const EtcdNode& node);
void to_json(nlohmann::json& j, const EtcdKeysResponse& response);
void to_json(nlohmann::json& j, const EtcdServerError& error);

}  // namespace etcdpp

#endif  // ETCDPP_RESPONSES_ETCD_KEYS_RESPONSE_HPP
