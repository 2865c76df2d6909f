#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Logical requests
// ═══════════════════════════════════════════════════════════════════════════
// EtcdRequestBase holds what the wire builder needs (method, target path,
// parameters) plus per-request timeout and retry policy. EtcdRequest<T> adds
// the response decoding and the bound ResponsePromise<T>.
//
// The decoding is a variant dispatched by a single std::visit when the full
// response has arrived:
//   HandlerDecoding<T> - a function turning the HttpResponse into T
//   TextDecoding       - the body itself (bytes taken as UTF-8)
//   std::monostate     - not configured; EtcdTransport::send() rejects it

#include "etcdpp/responses/etcd_keys_response.hpp"
#include "etcdpp/transport/http_types.hpp"
#include "etcdpp/transport/response_promise.hpp"
#include "etcdpp/transport/retry_policy.hpp"
#include "etcdpp/transport/transport_error.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace etcdpp {

class EtcdTransport;

// ─────────────────────────────────────────────────────────────────────────────
// EtcdRequestBase
// ─────────────────────────────────────────────────────────────────────────────

class EtcdRequestBase {
public:
    virtual ~EtcdRequestBase() = default;

    EtcdRequestBase(const EtcdRequestBase&) = delete;
    EtcdRequestBase& operator=(const EtcdRequestBase&) = delete;

    [[nodiscard]] HttpMethod method() const noexcept { return method_; }
    [[nodiscard]] const std::string& url() const noexcept { return url_; }

    [[nodiscard]] const RequestParams& params() const noexcept { return params_; }
    [[nodiscard]] RequestParams& params() noexcept { return params_; }

    /// Response timeout for each attempt. Unset falls back to the transport's
    /// read_timeout.
    [[nodiscard]] std::optional<std::chrono::milliseconds> timeout() const noexcept {
        return timeout_;
    }

    void set_timeout(std::chrono::milliseconds timeout) noexcept {
        timeout_ = timeout;
    }

    /// nullptr means the transport's default policy.
    [[nodiscard]] const std::shared_ptr<IRetryPolicy>& retry_policy() const noexcept {
        return retry_policy_;
    }

    void set_retry_policy(std::shared_ptr<IRetryPolicy> policy) noexcept {
        retry_policy_ = std::move(policy);
    }

    /// The most recently built wire request, if any attempt got that far.
    [[nodiscard]] std::optional<WireRequest> wire_request() const {
        std::lock_guard<std::mutex> lock(wire_mutex_);
        return wire_request_;
    }

    void record_wire_request(WireRequest wire) {
        std::lock_guard<std::mutex> lock(wire_mutex_);
        wire_request_ = std::move(wire);
    }

protected:
    EtcdRequestBase(HttpMethod method, std::string url)
        : method_(method)
        , url_(std::move(url))
    {}

private:
    HttpMethod method_;
    std::string url_;
    RequestParams params_;
    std::optional<std::chrono::milliseconds> timeout_;
    std::shared_ptr<IRetryPolicy> retry_policy_;

    mutable std::mutex wire_mutex_;
    std::optional<WireRequest> wire_request_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Response decodings
// ─────────────────────────────────────────────────────────────────────────────

template <typename T>
struct HandlerDecoding {
    std::function<EtcdResult<T>(const HttpResponse&)> handler;
};

struct TextDecoding {};

// ─────────────────────────────────────────────────────────────────────────────
// EtcdRequest<T>
// ─────────────────────────────────────────────────────────────────────────────

template <typename T>
class EtcdRequest : public EtcdRequestBase {
public:
    using Result = T;
    using Decoding = std::variant<std::monostate, HandlerDecoding<T>, TextDecoding>;

    EtcdRequest(HttpMethod method, std::string url, Decoding decoding = {})
        : EtcdRequestBase(method, std::move(url))
        , decoding_(std::move(decoding))
    {}

    [[nodiscard]] const Decoding& decoding() const noexcept { return decoding_; }

    [[nodiscard]] bool has_decoding() const noexcept {
        return std::holds_alternative<std::monostate>(decoding_) == false;
    }

    /// The future this request delivers into; nullptr until first sent.
    [[nodiscard]] std::shared_ptr<ResponsePromise<T>> promise() const {
        std::lock_guard<std::mutex> lock(promise_mutex_);
        return promise_;
    }

    /// Turn a complete response into the request's result.
    /// Throws std::logic_error when no decoding is configured.
    [[nodiscard]] EtcdResult<T> decode(const HttpResponse& response) const {
        return std::visit(
            [&response](const auto& decoding) -> EtcdResult<T> {
                using D = std::decay_t<decltype(decoding)>;

                if constexpr (std::is_same_v<D, std::monostate>) {
                    throw std::logic_error("Request has no response decoding");
                } else if constexpr (std::is_same_v<D, HandlerDecoding<T>>) {
                    return decoding.handler(response);
                } else if constexpr (std::is_constructible_v<T, std::string>) {
                    if (response.is_success() == false) {
                        return tl::unexpected(error_from_response(response));
                    }
                    return T(response.body);
                } else {
                    throw std::logic_error("Text decoding needs a string result type");
                }
            },
            decoding_
        );
    }

protected:
    void set_decoding(Decoding decoding) {
        decoding_ = std::move(decoding);
    }

private:
    friend class EtcdTransport;

    // Returns the bound promise: `promise` if none was bound yet
    std::shared_ptr<ResponsePromise<T>> bind_promise(std::shared_ptr<ResponsePromise<T>> promise) {
        std::lock_guard<std::mutex> lock(promise_mutex_);
        if (promise_ == nullptr) {
            promise_ = std::move(promise);
        }
        return promise_;
    }

    Decoding decoding_;

    mutable std::mutex promise_mutex_;
    std::shared_ptr<ResponsePromise<T>> promise_;
};

}  // namespace etcdpp
