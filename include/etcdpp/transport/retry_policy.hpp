#ifndef ETCDPP_TRANSPORT_RETRY_POLICY_HPP
#define ETCDPP_TRANSPORT_RETRY_POLICY_HPP

#include "etcdpp/transport/backoff_policy.hpp"
#include "etcdpp/transport/connection_state.hpp"
#include "etcdpp/transport/transport_error.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>

namespace etcdpp {

// ─────────────────────────────────────────────────────────────────────────────
// IRetryPolicy
// ─────────────────────────────────────────────────────────────────────────────
// Consulted by a ResponsePromise whenever an attempt fails. The promise calls,
// in order:
//   should_retry(error, state)  - false completes the request with `error`
//   select_endpoint(state)      - failover: pick the endpoint for the retry
//   next_delay(state)           - wait before reconnecting
// state.retry_count is incremented between select_endpoint() and next_delay(),
// so next_delay() sees 1 for the first retry.

class IRetryPolicy {
public:
    virtual ~IRetryPolicy() = default;

    [[nodiscard]] virtual bool should_retry(
        const TransportError& error,
        const ConnectionState& state
    ) const = 0;

    [[nodiscard]] virtual std::chrono::milliseconds next_delay(const ConnectionState& state) = 0;

    // Round-robin over the endpoint set
    virtual void select_endpoint(ConnectionState& state) const {
        if (state.endpoint_count > 0) {
            state.endpoint_index = (state.endpoint_index + 1) % state.endpoint_count;
        }
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// RetryPolicy
// ─────────────────────────────────────────────────────────────────────────────
// Default policy: retries connection failures and timeouts up to
// max_retries times, optionally bounded by a deadline measured from the
// request's start time. Delays come from an IBackoffPolicy.
//
// Usage:
//   auto policy = std::make_shared<RetryPolicy>(
//       std::make_shared<ConstantBackoff>(std::chrono::milliseconds{50}));
//   policy->with_max_retries(5)
//          .with_deadline(std::chrono::seconds{2});
//
// RequestBuildFailed, ServerError and Closed are never retried.

class RetryPolicy : public IRetryPolicy {
public:
    RetryPolicy()
        : RetryPolicy(std::make_shared<ExponentialBackoff>())
    {}

    explicit RetryPolicy(std::shared_ptr<IBackoffPolicy> backoff)
        : backoff_(std::move(backoff))
    {}

    // ─────────────────────────────────────────────────────────────────────────
    // Configuration (builder)
    // ─────────────────────────────────────────────────────────────────────────

    /// Retries allowed after the first attempt.
    RetryPolicy& with_max_retries(std::size_t retries) {
        max_retries_ = retries;
        return *this;
    }

    RetryPolicy& with_retry_on_connection_error(bool enable) {
        retry_on_connection_error_ = enable;
        return *this;
    }

    RetryPolicy& with_retry_on_timeout(bool enable) {
        retry_on_timeout_ = enable;
        return *this;
    }

    RetryPolicy& with_retry_on_ssl_error(bool enable) {
        retry_on_ssl_error_ = enable;
        return *this;
    }

    RetryPolicy& with_retry_on_protocol_error(bool enable) {
        retry_on_protocol_error_ = enable;
        return *this;
    }

    /// Stop retrying once the request has been running this long.
    RetryPolicy& with_deadline(std::chrono::milliseconds deadline) {
        deadline_ = deadline;
        return *this;
    }

    // ─────────────────────────────────────────────────────────────────────────
    // IRetryPolicy
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] bool should_retry(
        const TransportError& error,
        const ConnectionState& state
    ) const override;

    [[nodiscard]] std::chrono::milliseconds next_delay(const ConnectionState& state) override;

    // ─────────────────────────────────────────────────────────────────────────
    // Queries
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] std::size_t max_retries() const noexcept { return max_retries_; }
    [[nodiscard]] std::optional<std::chrono::milliseconds> deadline() const noexcept { return deadline_; }
    [[nodiscard]] bool retries_code(TransportError::Code code) const noexcept;

private:
    std::shared_ptr<IBackoffPolicy> backoff_;
    std::size_t max_retries_{3};
    bool retry_on_connection_error_{true};
    bool retry_on_timeout_{true};
    bool retry_on_ssl_error_{false};
    bool retry_on_protocol_error_{false};
    std::optional<std::chrono::milliseconds> deadline_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Factories
// ─────────────────────────────────────────────────────────────────────────────

/// Never retry; the first failure is terminal.
[[nodiscard]] std::shared_ptr<RetryPolicy> no_retry();

/// One retry after `delay`.
[[nodiscard]] std::shared_ptr<RetryPolicy> retry_once(std::chrono::milliseconds delay);

/// Up to `times` retries, `delay` apart.
[[nodiscard]] std::shared_ptr<RetryPolicy> retry_n_times(
    std::chrono::milliseconds delay,
    std::size_t times
);

/// Up to `max_retries` retries, delay doubling from `start` and capped at
/// `max_delay` (zero = uncapped).
[[nodiscard]] std::shared_ptr<RetryPolicy> retry_with_exponential_backoff(
    std::chrono::milliseconds start,
    std::size_t max_retries,
    std::chrono::milliseconds max_delay
);

/// Retry every `delay` until `timeout` has elapsed since the request started.
[[nodiscard]] std::shared_ptr<RetryPolicy> retry_with_timeout(
    std::chrono::milliseconds delay,
    std::chrono::milliseconds timeout
);

}  // namespace etcdpp

#endif  // ETCDPP_TRANSPORT_RETRY_POLICY_HPP
