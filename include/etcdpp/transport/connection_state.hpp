#ifndef ETCDPP_TRANSPORT_CONNECTION_STATE_HPP
#define ETCDPP_TRANSPORT_CONNECTION_STATE_HPP

#include <chrono>
#include <cstddef>

namespace etcdpp {

// ─────────────────────────────────────────────────────────────────────────────
// ConnectionState
// ─────────────────────────────────────────────────────────────────────────────
// Mutable record for one logical request's attempt sequence. Only the retry
// path of that request touches it, and attempts are sequential, so it needs
// no locking.

struct ConnectionState {
    using Clock = std::chrono::steady_clock;

    explicit ConnectionState(std::size_t endpoints, std::size_t start_index = 0)
        : endpoint_count(endpoints)
        , endpoint_index(endpoints == 0 ? 0 : start_index % endpoints)
    {}

    // Number of endpoints the index rotates over
    std::size_t endpoint_count;

    // Endpoint the next (or current) attempt connects to
    std::size_t endpoint_index;

    // Set once per logical request; retries keep it
    Clock::time_point start_time{Clock::now()};

    // Retries scheduled so far (0 while the first attempt runs)
    std::size_t retry_count{0};

    // Delay used before the most recent retry
    std::chrono::milliseconds delay_before_retry{0};

    [[nodiscard]] std::chrono::milliseconds elapsed() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            Clock::now() - start_time
        );
    }
};

}  // namespace etcdpp

#endif  // ETCDPP_TRANSPORT_CONNECTION_STATE_HPP
