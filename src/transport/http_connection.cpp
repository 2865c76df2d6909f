#include "etcdpp/transport/http_connection.hpp"

#include "etcdpp/log/logger.hpp"

#include <asio/connect.hpp>
#include <asio/ip/address.hpp>
#include <asio/ssl/host_name_verification.hpp>
#include <asio/use_awaitable.hpp>
#include <asio/write.hpp>

#include <openssl/ssl.h>

#include <array>
#include <stdexcept>
#include <string_view>
#include <system_error>

namespace etcdpp {

namespace {

constexpr std::size_t read_chunk_size = 8192;

[[nodiscard]] bool is_ip_literal(const std::string& host) {
    std::error_code ec;
    (void)asio::ip::make_address(host, ec);
    return !ec;
}

[[nodiscard]] bool is_end_of_stream(const std::error_code& ec) {
    return ec == asio::error::eof || ec == asio::ssl::error::stream_truncated;
}

}  // namespace

HttpConnection::HttpConnection(
    asio::any_io_executor executor,
    Endpoint endpoint,
    std::shared_ptr<asio::ssl::context> tls,
    Options options
)
    : executor_(std::move(executor))
    , endpoint_(std::move(endpoint))
    , tls_(std::move(tls))
    , options_(options)
    , resolver_(executor_)
    , socket_(executor_)
    , deadline_(executor_)
{
    if (endpoint_.is_secure()) {
        if (tls_ == nullptr) {
            throw std::invalid_argument("HttpConnection: https endpoint without an SSL context");
        }
        tls_stream_ = std::make_unique<TlsStream>(executor_, *tls_);
    }
}

HttpConnection::~HttpConnection() {
    close();
}

asio::ip::tcp::socket& HttpConnection::tcp_socket() noexcept {
    return tls_stream_ ? tls_stream_->next_layer() : socket_;
}

const asio::ip::tcp::socket& HttpConnection::tcp_socket() const noexcept {
    return tls_stream_ ? tls_stream_->next_layer() : socket_;
}

// ─────────────────────────────────────────────────────────────────────────────
// Deadline
// ─────────────────────────────────────────────────────────────────────────────

void HttpConnection::start_deadline(std::chrono::milliseconds timeout) {
    timed_out_ = false;
    deadline_duration_ = timeout;
    const std::uint64_t generation = ++deadline_generation_;
    deadline_.expires_after(timeout);
    deadline_.async_wait([weak = weak_from_this(), generation](const std::error_code& ec) {
        if (ec) {
            return;  // Cancelled: the operation finished in time
        }
        auto self = weak.lock();
        // A handler queued just before stop_deadline() must not hit the next operation
        if (self == nullptr || self->deadline_generation_ != generation) {
            return;
        }
        self->timed_out_ = true;
        self->abort_io();
    });
}

void HttpConnection::stop_deadline() noexcept {
    ++deadline_generation_;
    deadline_.cancel();
}

// Close, not cancel: cancel() misses an operation that already completed
void HttpConnection::abort_io() noexcept {
    resolver_.cancel();
    std::error_code ec;
    tcp_socket().close(ec);
    if (ec) {
        get_logger()->debug_fmt("Socket close on deadline failed: {}", ec.message());
    }
}

TransportError HttpConnection::connect_timeout_error() const {
    return TransportError::timeout(
        "Connecting to " + endpoint_.to_string() + " timed out after " +
        std::to_string(deadline_duration_.count()) + "ms"
    );
}

TransportError HttpConnection::read_timeout_error() const {
    return TransportError::timeout(
        "No response from " + endpoint_.to_string() + " within " +
        std::to_string(deadline_duration_.count()) + "ms"
    );
}

void HttpConnection::close() noexcept {
    deadline_.cancel();
    auto& socket = tcp_socket();
    if (socket.is_open() == false) {
        return;
    }
    std::error_code ec;
    socket.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    socket.close(ec);
}

std::string HttpConnection::remote_address() const {
    std::error_code ec;
    const auto remote = tcp_socket().remote_endpoint(ec);
    if (ec) {
        return {};
    }
    const auto address = remote.address();
    const std::string host = address.is_v6() ? "[" + address.to_string() + "]" : address.to_string();
    return host + ":" + std::to_string(remote.port());
}

// ─────────────────────────────────────────────────────────────────────────────
// Errors
// ─────────────────────────────────────────────────────────────────────────────

TransportError HttpConnection::connect_error(const char* stage, const std::system_error& e) const {
    if (timed_out_) {
        return connect_timeout_error();
    }
    return TransportError::connection_failed(
        std::string(stage) + " " + endpoint_.to_string() + " failed: " + e.code().message()
    );
}

TransportError HttpConnection::read_error(const std::system_error& e, bool started) const {
    if (timed_out_) {
        return read_timeout_error();
    }
    const std::string detail = endpoint_.to_string() + ": " + e.code().message();
    if (started) {
        return TransportError::protocol("Response interrupted from " + detail);
    }
    return TransportError::connection_failed("Connection lost before response from " + detail);
}

// ─────────────────────────────────────────────────────────────────────────────
// Connect
// ─────────────────────────────────────────────────────────────────────────────

asio::awaitable<EtcdResult<void>> HttpConnection::connect() {
    if (options_.connect_timeout.count() > 0) {
        start_deadline(options_.connect_timeout);
    }

    asio::ip::tcp::resolver::results_type results;
    try {
        results = co_await resolver_.async_resolve(
            endpoint_.host,
            std::to_string(endpoint_.port),
            asio::use_awaitable
        );
    } catch (const std::system_error& e) {
        stop_deadline();
        co_return tl::unexpected(connect_error("Resolving", e));
    }
    if (timed_out_) {
        co_return tl::unexpected(connect_timeout_error());
    }

    try {
        co_await asio::async_connect(tcp_socket(), results, asio::use_awaitable);
    } catch (const std::system_error& e) {
        stop_deadline();
        co_return tl::unexpected(connect_error("Connecting to", e));
    }
    if (timed_out_) {
        co_return tl::unexpected(connect_timeout_error());
    }

    // Requests are small and written in one go
    std::error_code nodelay_ec;
    tcp_socket().set_option(asio::ip::tcp::no_delay(true), nodelay_ec);
    if (nodelay_ec) {
        get_logger()->debug_fmt("TCP_NODELAY not set on {}: {}", endpoint_.to_string(), nodelay_ec.message());
    }

    if (tls_stream_) {
        // SNI is only meaningful for host names
        if (is_ip_literal(endpoint_.host) == false) {
            SSL_set_tlsext_host_name(tls_stream_->native_handle(), endpoint_.host.c_str());
        }
        if (options_.verify_hostname) {
            tls_stream_->set_verify_callback(asio::ssl::host_name_verification(endpoint_.host));
        }

        try {
            co_await tls_stream_->async_handshake(asio::ssl::stream_base::client, asio::use_awaitable);
        } catch (const std::system_error& e) {
            stop_deadline();
            if (timed_out_) {
                co_return tl::unexpected(connect_error("TLS handshake with", e));
            }
            co_return tl::unexpected(TransportError::ssl_error(
                "TLS handshake with " + endpoint_.to_string() + " failed: " + e.code().message()
            ));
        }
        if (timed_out_) {
            co_return tl::unexpected(connect_timeout_error());
        }
    }

    stop_deadline();
    co_return EtcdResult<void>{};
}

// ─────────────────────────────────────────────────────────────────────────────
// Exchange
// ─────────────────────────────────────────────────────────────────────────────

asio::awaitable<EtcdResult<HttpResponse>> HttpConnection::round_trip(
    std::string request,
    std::chrono::milliseconds read_timeout,
    bool head_request
) {
    if (tls_stream_) {
        co_return co_await exchange(*tls_stream_, std::move(request), read_timeout, head_request);
    }
    co_return co_await exchange(socket_, std::move(request), read_timeout, head_request);
}

template <typename Stream>
asio::awaitable<EtcdResult<HttpResponse>> HttpConnection::exchange(
    Stream& stream,
    std::string request,
    std::chrono::milliseconds read_timeout,
    bool head_request
) {
    // Armed before the request goes out, so a server that never answers the
    // write is covered too
    if (read_timeout.count() > 0) {
        start_deadline(read_timeout);
    } else {
        timed_out_ = false;
    }

    HttpResponseDecoder decoder(options_.max_body_size, head_request);

    try {
        co_await asio::async_write(stream, asio::buffer(request), asio::use_awaitable);
    } catch (const std::system_error& e) {
        stop_deadline();
        co_return tl::unexpected(read_error(e, false));
    }

    std::array<char, read_chunk_size> buffer{};
    for (;;) {
        if (timed_out_) {
            co_return tl::unexpected(read_timeout_error());
        }

        std::size_t bytes_read = 0;
        try {
            bytes_read = co_await stream.async_read_some(asio::buffer(buffer), asio::use_awaitable);
        } catch (const std::system_error& e) {
            stop_deadline();
            const bool closed_by_peer = is_end_of_stream(e.code()) && (timed_out_ == false);
            if (closed_by_peer == false) {
                co_return tl::unexpected(read_error(e, decoder.has_started()));
            }
            if (decoder.finish()) {
                co_return decoder.take_response();
            }
            if (decoder.has_started()) {
                co_return tl::unexpected(TransportError::protocol(
                    "Connection to " + endpoint_.to_string() + " closed mid-response"
                ));
            }
            co_return tl::unexpected(TransportError::connection_failed(
                "Connection to " + endpoint_.to_string() + " closed without a response"
            ));
        }

        // A read that completed after the deadline fired still counts as late
        if (timed_out_) {
            co_return tl::unexpected(read_timeout_error());
        }

        auto complete = decoder.feed(std::string_view(buffer.data(), bytes_read));
        if (complete.has_value() == false) {
            stop_deadline();
            co_return tl::unexpected(complete.error());
        }
        if (*complete) {
            stop_deadline();
            co_return decoder.take_response();
        }
    }
}

}  // namespace etcdpp
