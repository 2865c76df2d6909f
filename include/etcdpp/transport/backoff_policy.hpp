#ifndef ETCDPP_TRANSPORT_BACKOFF_POLICY_HPP
#define ETCDPP_TRANSPORT_BACKOFF_POLICY_HPP

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <random>

namespace etcdpp {

// ─────────────────────────────────────────────────────────────────────────────
// IBackoffPolicy
// ─────────────────────────────────────────────────────────────────────────────
// How long to wait before a retry. A policy instance may be shared by many
// requests, so implementations must be safe to call concurrently.

struct IBackoffPolicy {
    virtual ~IBackoffPolicy() = default;

    // retry: 0-indexed retry number (0 = first retry after the first failure)
    virtual std::chrono::milliseconds next_delay(std::size_t retry) = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// ExponentialBackoff
// ─────────────────────────────────────────────────────────────────────────────
// delay = min(base * multiplier^retry, max), then scaled by a random factor in
// [1 - jitter, 1 + jitter].
//
//   base=20ms, multiplier=2, max=10s, jitter=0:
//     retry 0: 20ms, retry 1: 40ms, retry 2: 80ms ... capped at 10s

class ExponentialBackoff : public IBackoffPolicy {
public:
    ExponentialBackoff()
        : ExponentialBackoff(
              std::chrono::milliseconds{20},
              2.0,
              std::chrono::milliseconds{10'000},
              0.0
          ) {}

    ExponentialBackoff(
        std::chrono::milliseconds base,
        double multiplier,
        std::chrono::milliseconds max,
        double jitter_factor
    )
        : base_(base)
        , multiplier_(multiplier)
        , max_(max)
        , jitter_factor_(jitter_factor)
        , rng_(std::random_device{}())
    {}

    std::chrono::milliseconds next_delay(std::size_t retry) override {
        const double exponent = static_cast<double>(retry);
        const double delay_ms = static_cast<double>(base_.count()) * std::pow(multiplier_, exponent);

        // max of zero means uncapped
        const bool capped = (max_.count() > 0);
        const double bounded_ms = capped
            ? std::min(delay_ms, static_cast<double>(max_.count()))
            : delay_ms;

        const double jittered_ms = add_jitter(bounded_ms);
        const auto result_ms = static_cast<std::int64_t>(std::max(0.0, jittered_ms));
        return std::chrono::milliseconds{result_ms};
    }

private:
    double add_jitter(double value) {
        if (jitter_factor_ <= 0.0) {
            return value;
        }
        std::uniform_real_distribution<double> dist(
            1.0 - jitter_factor_,
            1.0 + jitter_factor_
        );
        std::lock_guard<std::mutex> lock(rng_mutex_);
        return value * dist(rng_);
    }

    std::chrono::milliseconds base_;
    double multiplier_;
    std::chrono::milliseconds max_;
    double jitter_factor_;
    std::mutex rng_mutex_;
    std::mt19937 rng_;
};

// ─────────────────────────────────────────────────────────────────────────────
// ConstantBackoff
// ─────────────────────────────────────────────────────────────────────────────

class ConstantBackoff : public IBackoffPolicy {
public:
    explicit ConstantBackoff(std::chrono::milliseconds delay)
        : delay_(delay) {}

    std::chrono::milliseconds next_delay(std::size_t /*retry*/) override {
        return delay_;
    }

private:
    std::chrono::milliseconds delay_;
};

// ─────────────────────────────────────────────────────────────────────────────
// NoBackoff
// ─────────────────────────────────────────────────────────────────────────────
// Zero delay; used by tests.

class NoBackoff : public IBackoffPolicy {
public:
    std::chrono::milliseconds next_delay(std::size_t /*retry*/) override {
        return std::chrono::milliseconds{0};
    }
};

}  // namespace etcdpp

#endif  // ETCDPP_TRANSPORT_BACKOFF_POLICY_HPP
