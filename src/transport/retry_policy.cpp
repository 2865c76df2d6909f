#include "etcdpp/transport/retry_policy.hpp"

#include <limits>

namespace etcdpp {

bool RetryPolicy::retries_code(TransportError::Code code) const noexcept {
    switch (code) {
        case TransportError::Code::ConnectionFailed:
            return retry_on_connection_error_;

        case TransportError::Code::Timeout:
            return retry_on_timeout_;

        case TransportError::Code::SslError:
            return retry_on_ssl_error_;

        case TransportError::Code::Protocol:
            return retry_on_protocol_error_;

        case TransportError::Code::RequestBuildFailed:
        case TransportError::Code::ServerError:
        case TransportError::Code::Closed:
            return false;
    }
    return false;
}

bool RetryPolicy::should_retry(
    const TransportError& error,
    const ConnectionState& state
) const {
    if (retries_code(error.code) == false) {
        return false;
    }

    const bool within_limit = (state.retry_count < max_retries_);
    if (within_limit == false) {
        return false;
    }

    if (deadline_.has_value()) {
        const bool expired = (state.elapsed() >= *deadline_);
        if (expired) {
            return false;
        }
    }

    return true;
}

std::chrono::milliseconds RetryPolicy::next_delay(const ConnectionState& state) {
    // retry_count was already bumped for the retry being scheduled
    const std::size_t retry = (state.retry_count > 0) ? state.retry_count - 1 : 0;
    return backoff_->next_delay(retry);
}

// ─────────────────────────────────────────────────────────────────────────────
// Factories
// ─────────────────────────────────────────────────────────────────────────────

std::shared_ptr<RetryPolicy> no_retry() {
    auto policy = std::make_shared<RetryPolicy>(std::make_shared<NoBackoff>());
    policy->with_max_retries(0);
    return policy;
}

std::shared_ptr<RetryPolicy> retry_once(std::chrono::milliseconds delay) {
    return retry_n_times(delay, 1);
}

std::shared_ptr<RetryPolicy> retry_n_times(
    std::chrono::milliseconds delay,
    std::size_t times
) {
    auto policy = std::make_shared<RetryPolicy>(std::make_shared<ConstantBackoff>(delay));
    policy->with_max_retries(times);
    return policy;
}

std::shared_ptr<RetryPolicy> retry_with_exponential_backoff(
    std::chrono::milliseconds start,
    std::size_t max_retries,
    std::chrono::milliseconds max_delay
) {
    auto policy = std::make_shared<RetryPolicy>(
        std::make_shared<ExponentialBackoff>(start, 2.0, max_delay, 0.0)
    );
    policy->with_max_retries(max_retries);
    return policy;
}

std::shared_ptr<RetryPolicy> retry_with_timeout(
    std::chrono::milliseconds delay,
    std::chrono::milliseconds timeout
) {
    auto policy = std::make_shared<RetryPolicy>(std::make_shared<ConstantBackoff>(delay));
    policy->with_max_retries(std::numeric_limits<std::size_t>::max())
           .with_deadline(timeout);
    return policy;
}

}  // namespace etcdpp
