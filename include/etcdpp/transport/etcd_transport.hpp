#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// EtcdTransport
// ═══════════════════════════════════════════════════════════════════════════
// Sends logical requests to one of several etcd endpoints over HTTP/1.1.
//
// send() binds the request to a ResponsePromise and starts the first connect
// attempt at the endpoint that last accepted a connection. Each attempt runs
// as one coroutine on the transport's io_context:
//
//   resolve -> connect -> [TLS handshake] -> build -> write -> read -> decode
//
// A failed attempt goes to the promise's retry path; the retry policy picks
// the next endpoint and the delay, and the retry handler calls connect()
// again with the same ConnectionState. Redirects are followed inside one
// attempt.
//
// Usage:
//   etcdpp::EtcdTransport transport(
//       etcdpp::EtcdTransportConfig{}.with_endpoint("http://127.0.0.1:2379"));
//   auto future = transport.send(etcdpp::EtcdKeyRequest::get("foo"));
//   auto result = future->get();
//   if (result.has_value()) { ... result->node.value ... }

#include "etcdpp/log/logger.hpp"
#include "etcdpp/requests/etcd_request.hpp"
#include "etcdpp/transport/connection_state.hpp"
#include "etcdpp/transport/etcd_transport_config.hpp"
#include "etcdpp/transport/http_types.hpp"
#include "etcdpp/transport/response_promise.hpp"
#include "etcdpp/transport/retry_policy.hpp"
#include "etcdpp/transport/transport_error.hpp"

#include <asio/awaitable.hpp>
#include <asio/co_spawn.hpp>
#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>
#include <asio/ssl/context.hpp>
#include <asio/strand.hpp>

#include <atomic>
#include <cstddef>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace etcdpp {

class EtcdTransport {
public:
    /// Throws std::invalid_argument for an empty or unparseable endpoint list
    /// or an unusable TLS configuration.
    explicit EtcdTransport(EtcdTransportConfig config);

    /// `tls` may be null when no endpoint is https.
    EtcdTransport(std::shared_ptr<asio::ssl::context> tls, std::vector<std::string> endpoints);

    ~EtcdTransport();

    EtcdTransport(const EtcdTransport&) = delete;
    EtcdTransport& operator=(const EtcdTransport&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Requests
    // ─────────────────────────────────────────────────────────────────────────

    /// Start sending `request`; never blocks. A request that was already sent
    /// returns its bound future without starting new traffic.
    /// Throws std::logic_error for a null request or one without a response
    /// decoding. After close() the future is already failed with Closed.
    template <typename Request>
    std::shared_ptr<ResponsePromise<typename Request::Result>> send(
        const std::shared_ptr<Request>& request
    ) {
        using T = typename Request::Result;
        static_assert(std::is_base_of_v<EtcdRequest<T>, Request>,
                      "send() takes an EtcdRequest<T>");

        std::shared_ptr<EtcdRequest<T>> base = request;
        return send_request(base);
    }

    /// Close the transport: pending futures fail with Closed, worker threads
    /// are joined (except the calling one, when close() runs on a worker).
    /// Idempotent.
    void close();

    [[nodiscard]] bool is_closed() const noexcept { return closed_.load(); }

    // ─────────────────────────────────────────────────────────────────────────
    // Introspection
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] const std::vector<Endpoint>& endpoints() const noexcept { return endpoints_; }

    /// Index of the endpoint that most recently accepted a connection.
    [[nodiscard]] std::size_t last_working_endpoint() const noexcept {
        return last_working_endpoint_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] const EtcdTransportConfig& config() const noexcept { return config_; }

private:
    template <typename T>
    std::shared_ptr<ResponsePromise<T>> send_request(const std::shared_ptr<EtcdRequest<T>>& request) {
        if (request == nullptr) {
            throw std::logic_error("EtcdTransport::send: null request");
        }
        if (request->has_decoding() == false) {
            throw std::logic_error(
                "EtcdTransport::send: request for " + request->url() + " has no response decoding"
            );
        }

        if (auto bound = request->promise()) {
            get_logger()->debug_fmt("Request for {} is already bound to a future", request->url());
            return bound;
        }

        auto policy = request->retry_policy() ? request->retry_policy() : default_policy_;
        auto state = std::make_shared<ConnectionState>(endpoints_.size(), last_working_endpoint());

        // The handler keeps the request alive between attempts; the promise
        // drops it on completion
        auto created = std::make_shared<ResponsePromise<T>>(
            io_.get_executor(),
            policy,
            state,
            [this, request, state]() { connect(request, state); }
        );
        auto promise = request->bind_promise(created);
        if (promise != created) {
            return promise;  // Lost a race with a concurrent send()
        }

        const bool registered = register_pending(promise);
        if (registered == false) {
            promise->set_failure(TransportError::closed());
            return promise;
        }

        get_logger()->debug_fmt(
            "Sending {} {} starting at endpoint #{}",
            to_string(request->method()), request->url(), state->endpoint_index
        );
        connect(request, state);
        return promise;
    }

    /// One attempt against endpoints_[state->endpoint_index].
    template <typename T>
    void connect(const std::shared_ptr<EtcdRequest<T>>& request, const std::shared_ptr<ConnectionState>& state) {
        auto promise = request->promise();
        if (promise == nullptr || promise->is_done()) {
            return;
        }
        auto attempt = promise->attach_attempt();
        if (closed_.load()) {
            promise->set_failure(TransportError::closed());
            return;
        }

        const std::size_t index = state->endpoint_index;
        asio::co_spawn(
            asio::make_strand(io_),
            run_attempt(request, attempt, index),
            [attempt](std::exception_ptr error) {
                if (error == nullptr) {
                    return;
                }
                try {
                    std::rethrow_exception(error);
                } catch (const std::exception& e) {
                    attempt->set_failure(TransportError::protocol(
                        std::string("Unexpected error during request: ") + e.what()
                    ));
                } catch (...) {
                    attempt->set_failure(TransportError::protocol(
                        "Unexpected non-standard exception during request"
                    ));
                }
            }
        );
    }

    template <typename T>
    asio::awaitable<void> run_attempt(
        std::shared_ptr<EtcdRequest<T>> request,
        std::shared_ptr<AttemptPromise<T>> attempt,
        std::size_t endpoint_index
    ) {
        Endpoint endpoint = endpoints_[endpoint_index];
        std::string target = join_target(endpoint, request->url());
        std::optional<std::size_t> sticky_index = endpoint_index;

        for (std::size_t hops = 0;; ++hops) {
            auto response = co_await exchange(endpoint, target, *request, sticky_index);
            if (response.has_value() == false) {
                attempt->set_failure(response.error());
                co_return;
            }

            const auto location = response->is_redirect() ? response->header("Location") : std::nullopt;
            if (location.has_value()) {
                if (hops >= config_.max_redirects) {
                    attempt->set_failure(TransportError::protocol(
                        "Too many redirects (" + std::to_string(config_.max_redirects) + ") for " +
                        request->url()
                    ));
                    co_return;
                }
                auto next = resolve_redirect(endpoint, *location);
                if (next.has_value() == false) {
                    attempt->set_failure(TransportError::protocol(
                        "Unusable redirect location '" + *location + "'"
                    ));
                    co_return;
                }
                get_logger()->info_fmt(
                    "Following {} redirect to {}{}",
                    response->status_code, next->first.to_string(), next->second
                );
                endpoint = std::move(next->first);
                target = std::move(next->second);
                sticky_index.reset();  // A redirect target is not one of our endpoints
                continue;
            }

            // Decoding failures land here too: the caller's catch-all turns
            // exceptions into Protocol errors
            auto decoded = request->decode(*response);
            if (decoded.has_value()) {
                attempt->set_success(std::move(*decoded));
            } else {
                attempt->set_failure(decoded.error());
            }
            co_return;
        }
    }

    /// Connect, build, write and read one response. Records stickiness as
    /// soon as the connection is up when `sticky_index` is set.
    asio::awaitable<EtcdResult<HttpResponse>> exchange(
        const Endpoint& endpoint,
        const std::string& target,
        EtcdRequestBase& request,
        std::optional<std::size_t> sticky_index
    );

    [[nodiscard]] static std::string join_target(const Endpoint& endpoint, const std::string& url);

    /// Absolute locations switch endpoint; relative ones keep `current`.
    /// Only the location's path is kept as the new target.
    [[nodiscard]] static std::optional<std::pair<Endpoint, std::string>> resolve_redirect(
        const Endpoint& current,
        const std::string& location
    );

    [[nodiscard]] std::shared_ptr<asio::ssl::context> tls_for(const Endpoint& endpoint);

    bool register_pending(const std::shared_ptr<PendingRequest>& pending);
    void start_workers();

    EtcdTransportConfig config_;
    std::vector<Endpoint> endpoints_;
    std::shared_ptr<IRetryPolicy> default_policy_;

    std::mutex tls_mutex_;
    std::shared_ptr<asio::ssl::context> tls_context_;

    asio::io_context io_;
    std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work_guard_;
    std::vector<std::thread> workers_;

    std::atomic<std::size_t> last_working_endpoint_{0};

    std::mutex pending_mutex_;
    std::vector<std::weak_ptr<PendingRequest>> pending_;
    std::atomic<bool> closed_{false};
    std::once_flag close_once_;
};

}  // namespace etcdpp
