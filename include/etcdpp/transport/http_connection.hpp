#pragma once

#include "etcdpp/transport/http_response_decoder.hpp"
#include "etcdpp/transport/http_types.hpp"
#include "etcdpp/transport/transport_error.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/ssl.hpp>
#include <asio/steady_timer.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace etcdpp {

// ─────────────────────────────────────────────────────────────────────────────
// HttpConnection
// ─────────────────────────────────────────────────────────────────────────────
// One TCP (optionally TLS) connection, used for a single request/response
// exchange and then closed. There is no pooling: every attempt opens its own.
//
// The executor must be a strand: the deadline timer cancels socket
// operations from its own handler.
//
//   auto conn = std::make_shared<HttpConnection>(strand, endpoint, nullptr, options);
//   auto connected = co_await conn->connect();
//   auto response = co_await conn->round_trip(bytes, std::chrono::seconds{5}, false);

class HttpConnection : public std::enable_shared_from_this<HttpConnection> {
public:
    struct Options {
        std::chrono::milliseconds connect_timeout{300};
        std::size_t max_body_size{100 * 1024};
        bool verify_hostname{true};
    };

    /// `tls` is required for https endpoints and ignored for http.
    HttpConnection(
        asio::any_io_executor executor,
        Endpoint endpoint,
        std::shared_ptr<asio::ssl::context> tls,
        Options options
    );

    ~HttpConnection();

    HttpConnection(const HttpConnection&) = delete;
    HttpConnection& operator=(const HttpConnection&) = delete;

    /// Resolve, connect and (for https) handshake, all within connect_timeout.
    /// Fails with ConnectionFailed, Timeout or SslError.
    [[nodiscard]] asio::awaitable<EtcdResult<void>> connect();

    /// Write `request` and read one complete response. A positive
    /// `read_timeout` is armed before writing and bounds the whole exchange;
    /// when it fires the socket is closed and the attempt fails with Timeout.
    [[nodiscard]] asio::awaitable<EtcdResult<HttpResponse>> round_trip(
        std::string request,
        std::chrono::milliseconds read_timeout,
        bool head_request
    );

    /// "127.0.0.1:2379" once connected, empty otherwise.
    [[nodiscard]] std::string remote_address() const;

    [[nodiscard]] const Endpoint& endpoint() const noexcept { return endpoint_; }

    void close() noexcept;

private:
    using TlsStream = asio::ssl::stream<asio::ip::tcp::socket>;

    [[nodiscard]] asio::ip::tcp::socket& tcp_socket() noexcept;
    [[nodiscard]] const asio::ip::tcp::socket& tcp_socket() const noexcept;

    void start_deadline(std::chrono::milliseconds timeout);
    void stop_deadline() noexcept;
    void abort_io() noexcept;

    [[nodiscard]] TransportError connect_timeout_error() const;
    [[nodiscard]] TransportError read_timeout_error() const;
    [[nodiscard]] TransportError connect_error(const char* stage, const std::system_error& e) const;
    [[nodiscard]] TransportError read_error(const std::system_error& e, bool started) const;

    template <typename Stream>
    asio::awaitable<EtcdResult<HttpResponse>> exchange(
        Stream& stream,
        std::string request,
        std::chrono::milliseconds read_timeout,
        bool head_request
    );

    asio::any_io_executor executor_;
    Endpoint endpoint_;
    std::shared_ptr<asio::ssl::context> tls_;
    Options options_;

    asio::ip::tcp::resolver resolver_;
    asio::ip::tcp::socket socket_;
    std::unique_ptr<TlsStream> tls_stream_;
    asio::steady_timer deadline_;

    std::chrono::milliseconds deadline_duration_{0};
    std::uint64_t deadline_generation_{0};
    bool timed_out_{false};
};

}  // namespace etcdpp
