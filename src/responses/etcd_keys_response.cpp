#include "etcdpp/responses/etcd_keys_response.hpp"

#include "etcdpp/json/fast_json.hpp"
#include "etcdpp/log/logger.hpp"

#include <charconv>

namespace etcdpp {

namespace {

constexpr std::size_t kMaxErrorSnippet = 256;

[[nodiscard]] std::optional<std::uint64_t> index_header(
    const HttpResponse& response,
    std::string_view name
) {
    const auto raw = response.header(name);
    if (raw.has_value() == false) {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    const auto* first = raw->data();
    const auto* last = raw->data() + raw->size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    const bool valid = (ec == std::errc{}) && (ptr == last);
    if (valid == false) {
        get_logger()->warn_fmt("Ignoring malformed {} header: '{}'", name, *raw);
        return std::nullopt;
    }
    return value;
}

// Throws nlohmann::json::exception on type mismatches
EtcdNode node_from_json(const nlohmann::json& j) {
    EtcdNode node;
    node.key = j.value("key", "");
    node.dir = j.value("dir", false);
    node.created_index = j.value<std::uint64_t>("createdIndex", 0);
    node.modified_index = j.value<std::uint64_t>("modifiedIndex", 0);

    if (const auto it = j.find("value"); it != j.end() && it->is_string()) {
        node.value = it->get<std::string>();
    }
    if (const auto it = j.find("ttl"); it != j.end() && it->is_number_integer()) {
        node.ttl = it->get<std::int64_t>();
    }
    if (const auto it = j.find("expiration"); it != j.end() && it->is_string()) {
        node.expiration = it->get<std::string>();
    }
    if (const auto it = j.find("nodes"); it != j.end() && it->is_array()) {
        node.nodes.reserve(it->size());
        for (const auto& child : *it) {
            node.nodes.push_back(node_from_json(child));
        }
    }
    return node;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Decoding
// ─────────────────────────────────────────────────────────────────────────────

std::optional<EtcdServerError> parse_server_error(std::string_view body) {
    auto doc = fast_parse(body);
    if (doc.has_value() == false || doc->is_object() == false) {
        return std::nullopt;
    }
    const auto code = doc->find("errorCode");
    if (code == doc->end() || code->is_number_integer() == false) {
        return std::nullopt;
    }

    EtcdServerError error;
    error.error_code = code->get<int>();
    if (const auto it = doc->find("message"); it != doc->end() && it->is_string()) {
        error.message = it->get<std::string>();
    }
    if (const auto it = doc->find("cause"); it != doc->end() && it->is_string()) {
        error.cause = it->get<std::string>();
    }
    if (const auto it = doc->find("index"); it != doc->end() && it->is_number_integer()) {
        error.index = it->get<std::uint64_t>();
    }
    return error;
}

TransportError error_from_response(const HttpResponse& response) {
    if (auto server_error = parse_server_error(response.body)) {
        return TransportError::from_server_error(response.status_code, std::move(*server_error));
    }

    std::string message = "HTTP " + std::to_string(response.status_code);
    if (response.reason.empty() == false) {
        message += " " + response.reason;
    }
    if (response.body.empty() == false) {
        message += ": " + response.body.substr(0, kMaxErrorSnippet);
    }
    return TransportError::server_error_status(response.status_code, message);
}

EtcdResult<EtcdKeysResponse> parse_keys_response(const HttpResponse& response) {
    if (response.is_success() == false) {
        return tl::unexpected(error_from_response(response));
    }

    auto doc = fast_parse(response.body);
    if (doc.has_value() == false) {
        return tl::unexpected(TransportError::protocol(
            "Invalid JSON in key response: " + doc.error().message
        ));
    }
    if (doc->is_object() == false) {
        return tl::unexpected(TransportError::protocol("Key response is not a JSON object"));
    }

    EtcdKeysResponse result;
    try {
        result.action = doc->value("action", "");
        if (const auto it = doc->find("node"); it != doc->end() && it->is_object()) {
            result.node = node_from_json(*it);
        }
        if (const auto it = doc->find("prevNode"); it != doc->end() && it->is_object()) {
            result.prev_node = node_from_json(*it);
        }
    } catch (const nlohmann::json::exception& e) {
        return tl::unexpected(TransportError::protocol(
            std::string("Unexpected key response layout: ") + e.what()
        ));
    }

    result.etcd_index = index_header(response, "X-Etcd-Index");
    result.raft_index = index_header(response, "X-Raft-Index");
    result.raft_term = index_header(response, "X-Raft-Term");
    return result;
}

// ─────────────────────────────────────────────────────────────────────────────
// JSON output
// ─────────────────────────────────────────────────────────────────────────────

void to_json(nlohmann::json& j, const EtcdNode& node) {
    j = nlohmann::json{
        {"key", node.key},
        {"createdIndex", node.created_index},
        {"modifiedIndex", node.modified_index}
    };
    if (node.dir) {
        j["dir"] = true;
    }
    if (node.value.has_value()) {
        j["value"] = *node.value;
    }
    if (node.ttl.has_value()) {
        j["ttl"] = *node.ttl;
    }
    if (node.expiration.has_value()) {
        j["expiration"] = *node.expiration;
    }
    if (node.nodes.empty() == false) {
        j["nodes"] = node.nodes;
    }
}

void to_json(nlohmann::json& j, const EtcdKeysResponse& response) {
    j = nlohmann::json{
        {"action", response.action},
        {"node", response.node}
    };
    if (response.prev_node.has_value()) {
        j["prevNode"] = *response.prev_node;
    }
    if (response.etcd_index.has_value()) {
        j["etcdIndex"] = *response.etcd_index;
    }
    if (response.raft_index.has_value()) {
        j["raftIndex"] = *response.raft_index;
    }
    if (response.raft_term.has_value()) {
        j["raftTerm"] = *response.raft_term;
    }
}

void to_json(nlohmann::json& j, const EtcdServerError& error) {
    j = nlohmann::json{
        {"errorCode", error.error_code},
        {"message", error.message},
        {"cause", error.cause},
        {"index", error.index}
    };
}

}  // namespace etcdpp
