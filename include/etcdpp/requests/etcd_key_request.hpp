#pragma once

#include "etcdpp/requests/etcd_request.hpp"
#include "etcdpp/responses/etcd_keys_response.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace etcdpp {

// ─────────────────────────────────────────────────────────────────────────────
// EtcdKeyRequest
// ─────────────────────────────────────────────────────────────────────────────
// Operations on /v2/keys/<key>. Factories pick the method, modifiers add
// query or form parameters:
//
//   auto req = EtcdKeyRequest::put("config/leader", "node-1");
//   req->ttl(30).prev_exist(false);
//   auto result = transport.send(req)->get();
//
// Values are percent-encoded here for every method except POST, whose
// parameters the builder form-encodes. Each segment of the key path is
// percent-encoded, so "a b/c?d" goes out as /v2/keys/a%20b/c%3Fd.

class EtcdKeyRequest final : public EtcdRequest<EtcdKeysResponse> {
public:
    static constexpr std::string_view kKeysPrefix = "/v2/keys/";

    EtcdKeyRequest(HttpMethod method, std::string_view key);

    [[nodiscard]] static std::shared_ptr<EtcdKeyRequest> get(std::string_view key);
    [[nodiscard]] static std::shared_ptr<EtcdKeyRequest> put(std::string_view key, std::string_view value);
    /// In-order key creation under `dir`
    [[nodiscard]] static std::shared_ptr<EtcdKeyRequest> post(std::string_view dir, std::string_view value);
    [[nodiscard]] static std::shared_ptr<EtcdKeyRequest> remove(std::string_view key);

    // ─────────────────────────────────────────────────────────────────────────
    // Modifiers
    // ─────────────────────────────────────────────────────────────────────────

    EtcdKeyRequest& recursive();
    EtcdKeyRequest& sorted();
    /// Long-poll until the key changes, optionally from `index` onwards
    EtcdKeyRequest& wait_for_change(std::optional<std::uint64_t> index = std::nullopt);
    EtcdKeyRequest& ttl(std::int64_t seconds);
    EtcdKeyRequest& prev_exist(bool exists);
    EtcdKeyRequest& prev_value(std::string_view value);
    EtcdKeyRequest& prev_index(std::uint64_t index);
    EtcdKeyRequest& dir();
    EtcdKeyRequest& quorum();
    EtcdKeyRequest& timeout(std::chrono::milliseconds timeout);
    EtcdKeyRequest& retry_policy(std::shared_ptr<IRetryPolicy> policy);

    using EtcdRequestBase::retry_policy;
    using EtcdRequestBase::timeout;

    [[nodiscard]] const std::string& key() const noexcept { return key_; }

private:
    void set_value_param(const std::string& name, std::string_view value);

    std::string key_;
};

}  // namespace etcdpp
