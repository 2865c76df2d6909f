#ifndef ETCDPP_TRANSPORT_ETCD_TRANSPORT_CONFIG_HPP
#define ETCDPP_TRANSPORT_ETCD_TRANSPORT_CONFIG_HPP

#include "etcdpp/transport/http_types.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace etcdpp {

class IRetryPolicy;

// ─────────────────────────────────────────────────────────────────────────────
// TLS Configuration
// ─────────────────────────────────────────────────────────────────────────────
// Used for https:// endpoints. Never disable verification in production.

struct TlsConfig {
    // CA bundle for server verification. Empty = system default store.
    std::string ca_cert_path;

    // Client certificate and key for mutual TLS
    std::optional<std::string> client_cert_path;
    std::optional<std::string> client_key_path;

    bool verify_peer{true};
    bool verify_hostname{true};
};

// ─────────────────────────────────────────────────────────────────────────────
// EtcdTransportConfig
// ─────────────────────────────────────────────────────────────────────────────

struct EtcdTransportConfig {
    // ─────────────────────────────────────────────────────────────────────────
    // Endpoints
    // ─────────────────────────────────────────────────────────────────────────

    // Candidate servers, e.g. "http://10.0.0.1:2379". Required, non-empty;
    // fixed for the transport's lifetime.
    std::vector<std::string> endpoints;

    // Sent with every request (Authorization, User-Agent, ...)
    HeaderMap default_headers;

    // ─────────────────────────────────────────────────────────────────────────
    // Timeouts
    // ─────────────────────────────────────────────────────────────────────────

    // Resolve + TCP connect + TLS handshake, per attempt
    std::chrono::milliseconds connect_timeout{300};

    // Response timeout for requests that do not set their own. 0 = none.
    std::chrono::milliseconds read_timeout{0};

    // ─────────────────────────────────────────────────────────────────────────
    // Engine
    // ─────────────────────────────────────────────────────────────────────────

    std::size_t worker_threads{2};

    // ─────────────────────────────────────────────────────────────────────────
    // Responses
    // ─────────────────────────────────────────────────────────────────────────

    std::size_t max_response_body_size{100 * 1024};

    // Redirect hops followed per attempt before failing with Protocol
    std::size_t max_redirects{5};

    // ─────────────────────────────────────────────────────────────────────────
    // Retry
    // ─────────────────────────────────────────────────────────────────────────

    // For requests without their own policy. Null = default_retry_policy().
    std::shared_ptr<IRetryPolicy> retry_policy;

    // ─────────────────────────────────────────────────────────────────────────
    // TLS
    // ─────────────────────────────────────────────────────────────────────────

    // Used to build the SSL context when any endpoint is https://. Unset
    // means verification against the system store.
    std::optional<TlsConfig> tls;

    // ─────────────────────────────────────────────────────────────────────────
    // Builder-Style Helpers
    // ─────────────────────────────────────────────────────────────────────────
    //   EtcdTransportConfig{}
    //       .with_endpoint("http://127.0.0.1:2379")
    //       .with_connect_timeout(std::chrono::milliseconds{500});

    EtcdTransportConfig& with_endpoint(const std::string& uri);
    EtcdTransportConfig& with_header(const std::string& name, const std::string& value);
    /// Authorization: Basic <base64(user:password)>
    EtcdTransportConfig& with_basic_auth(const std::string& user, const std::string& password);
    EtcdTransportConfig& with_connect_timeout(std::chrono::milliseconds timeout);
    EtcdTransportConfig& with_read_timeout(std::chrono::milliseconds timeout);
    EtcdTransportConfig& with_worker_threads(std::size_t threads);
    EtcdTransportConfig& with_max_response_body_size(std::size_t bytes);
    EtcdTransportConfig& with_max_redirects(std::size_t redirects);
    EtcdTransportConfig& with_retry_policy(std::shared_ptr<IRetryPolicy> policy);
    EtcdTransportConfig& with_tls(TlsConfig config);
};

/// Exponential backoff from 20ms, two retries, delays capped at 10s.
[[nodiscard]] std::shared_ptr<IRetryPolicy> default_retry_policy();

}  // namespace etcdpp

#endif  // ETCDPP_TRANSPORT_ETCD_TRANSPORT_CONFIG_HPP
