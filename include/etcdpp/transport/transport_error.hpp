#ifndef ETCDPP_TRANSPORT_TRANSPORT_ERROR_HPP
#define ETCDPP_TRANSPORT_TRANSPORT_ERROR_HPP

#include "etcdpp/responses/etcd_server_error.hpp"

#include <optional>
#include <string>
#include <string_view>

#include <tl/expected.hpp>

namespace etcdpp {

// ─────────────────────────────────────────────────────────────────────────────
// Transport Error Types
// ─────────────────────────────────────────────────────────────────────────────
// Every failure a request can end with. Whether a code is retried is decided
// by the retry policy, not here.

struct TransportError {
    enum class Code {
        ConnectionFailed,    // DNS, refused, reset before a response arrived
        Timeout,             // Connect or read timeout
        SslError,            // TLS handshake failed
        Protocol,            // Malformed response, unexpected close, redirect loop
        RequestBuildFailed,  // Parameters could not be encoded
        ServerError,         // Service answered with an error status
        Closed               // Transport was closed
    };

    Code code;
    std::string message;
    std::optional<int> http_status;
    std::optional<EtcdServerError> server_error;

    static TransportError connection_failed(const std::string& msg) {
        return {Code::ConnectionFailed, msg, std::nullopt, std::nullopt};
    }

    static TransportError timeout(const std::string& msg) {
        return {Code::Timeout, msg, std::nullopt, std::nullopt};
    }

    static TransportError ssl_error(const std::string& msg) {
        return {Code::SslError, msg, std::nullopt, std::nullopt};
    }

    static TransportError protocol(const std::string& msg) {
        return {Code::Protocol, msg, std::nullopt, std::nullopt};
    }

    static TransportError request_build_failed(const std::string& msg) {
        return {Code::RequestBuildFailed, msg, std::nullopt, std::nullopt};
    }

    static TransportError server_error_status(int status, const std::string& msg) {
        return {Code::ServerError, msg, status, std::nullopt};
    }

    static TransportError from_server_error(int status, EtcdServerError error) {
        std::string msg = error.message;
        if (error.cause.empty() == false) {
            msg += " (" + error.cause + ")";
        }
        return {Code::ServerError, std::move(msg), status, std::move(error)};
    }

    static TransportError closed() {
        return {Code::Closed, "Transport is closed", std::nullopt, std::nullopt};
    }
};

[[nodiscard]] constexpr std::string_view to_string(TransportError::Code code) noexcept {
    switch (code) {
        case TransportError::Code::ConnectionFailed:   return "ConnectionFailed";
        case TransportError::Code::Timeout:            return "Timeout";
        case TransportError::Code::SslError:           return "SslError";
        case TransportError::Code::Protocol:           return "Protocol";
        case TransportError::Code::RequestBuildFailed: return "RequestBuildFailed";
        case TransportError::Code::ServerError:        return "ServerError";
        case TransportError::Code::Closed:             return "Closed";
    }
    return "Unknown";
}

template <typename T>
using EtcdResult = tl::expected<T, TransportError>;

}  // namespace etcdpp

#endif  // ETCDPP_TRANSPORT_TRANSPORT_ERROR_HPP
