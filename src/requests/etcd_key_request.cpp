#include "etcdpp/requests/etcd_key_request.hpp"

#include "etcdpp/transport/http_request_builder.hpp"

namespace etcdpp {

namespace {

std::string keys_url(std::string_view key) {
    while (key.empty() == false && key.front() == '/') {
        key.remove_prefix(1);
    }
    return std::string(EtcdKeyRequest::kKeysPrefix) + percent_encode_path(key);
}

}  // namespace

EtcdKeyRequest::EtcdKeyRequest(HttpMethod method, std::string_view key)
    : EtcdRequest<EtcdKeysResponse>(
          method,
          keys_url(key),
          HandlerDecoding<EtcdKeysResponse>{&parse_keys_response}
      )
    , key_(key)
{}

// ─────────────────────────────────────────────────────────────────────────────
// Factories
// ─────────────────────────────────────────────────────────────────────────────

std::shared_ptr<EtcdKeyRequest> EtcdKeyRequest::get(std::string_view key) {
    return std::make_shared<EtcdKeyRequest>(HttpMethod::Get, key);
}

std::shared_ptr<EtcdKeyRequest> EtcdKeyRequest::put(std::string_view key, std::string_view value) {
    auto request = std::make_shared<EtcdKeyRequest>(HttpMethod::Put, key);
    request->set_value_param("value", value);
    return request;
}

std::shared_ptr<EtcdKeyRequest> EtcdKeyRequest::post(std::string_view dir, std::string_view value) {
    auto request = std::make_shared<EtcdKeyRequest>(HttpMethod::Post, dir);
    request->set_value_param("value", value);
    return request;
}

std::shared_ptr<EtcdKeyRequest> EtcdKeyRequest::remove(std::string_view key) {
    return std::make_shared<EtcdKeyRequest>(HttpMethod::Delete, key);
}

// ─────────────────────────────────────────────────────────────────────────────
// Modifiers
// ─────────────────────────────────────────────────────────────────────────────

void EtcdKeyRequest::set_value_param(const std::string& name, std::string_view value) {
    // The builder form-encodes POST bodies; query strings go out as given
    if (method() == HttpMethod::Post) {
        params().set(name, std::string(value));
    } else {
        params().set(name, percent_encode(value));
    }
}

EtcdKeyRequest& EtcdKeyRequest::recursive() {
    params().set("recursive", "true");
    return *this;
}

EtcdKeyRequest& EtcdKeyRequest::sorted() {
    params().set("sorted", "true");
    return *this;
}

EtcdKeyRequest& EtcdKeyRequest::wait_for_change(std::optional<std::uint64_t> index) {
    params().set("wait", "true");
    if (index.has_value()) {
        params().set("waitIndex", std::to_string(*index));
    }
    return *this;
}

EtcdKeyRequest& EtcdKeyRequest::ttl(std::int64_t seconds) {
    params().set("ttl", std::to_string(seconds));
    return *this;
}

EtcdKeyRequest& EtcdKeyRequest::prev_exist(bool exists) {
    params().set("prevExist", exists ? "true" : "false");
    return *this;
}

EtcdKeyRequest& EtcdKeyRequest::prev_value(std::string_view value) {
    set_value_param("prevValue", value);
    return *this;
}

EtcdKeyRequest& EtcdKeyRequest::prev_index(std::uint64_t index) {
    params().set("prevIndex", std::to_string(index));
    return *this;
}

EtcdKeyRequest& EtcdKeyRequest::dir() {
    params().set("dir", "true");
    return *this;
}

EtcdKeyRequest& EtcdKeyRequest::quorum() {
    params().set("quorum", "true");
    return *this;
}

EtcdKeyRequest& EtcdKeyRequest::timeout(std::chrono::milliseconds timeout) {
    set_timeout(timeout);
    return *this;
}

EtcdKeyRequest& EtcdKeyRequest::retry_policy(std::shared_ptr<IRetryPolicy> policy) {
    set_retry_policy(std::move(policy));
    return *this;
}

}  // namespace etcdpp
