#pragma once

#include "etcdpp/transport/etcd_transport_config.hpp"

#include <asio/ssl/context.hpp>

#include <memory>

namespace etcdpp {

/// Build a client SSL context (TLS 1.2+) from `config`.
/// Throws std::invalid_argument when a certificate or key cannot be loaded.
[[nodiscard]] std::shared_ptr<asio::ssl::context> make_tls_context(const TlsConfig& config);

}  // namespace etcdpp
