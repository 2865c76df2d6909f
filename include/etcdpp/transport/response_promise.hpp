#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Response Promise
// ═══════════════════════════════════════════════════════════════════════════
// Caller-facing result handle for one logical request.
//
// A ResponsePromise<T> is single-assignment: it moves from pending to either
// a value or a TransportError exactly once, and every later completion is
// ignored. Besides terminal completion it has a retry side-channel,
// handle_retry(), which asks the retry policy whether to reconnect and, if
// so, arms a timer that re-enters the transport's connect loop through the
// RetryHandler. Retries never create a new promise.
//
// Each connect attempt gets its own one-shot AttemptPromise<T>: success
// completes the ResponsePromise, failure goes to handle_retry().
//
// Usage:
//   auto promise = transport.send(request);
//   promise->add_listener([](const EtcdResult<std::string>& r) { ... });
//   auto result = promise->get();   // blocks

#include "etcdpp/log/logger.hpp"
#include "etcdpp/transport/connection_state.hpp"
#include "etcdpp/transport/retry_policy.hpp"
#include "etcdpp/transport/transport_error.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace etcdpp {

// ─────────────────────────────────────────────────────────────────────────────
// PendingRequest
// ─────────────────────────────────────────────────────────────────────────────
// Type-erased view of a promise, used by the transport to fail everything
// still outstanding when it is closed.

class PendingRequest {
public:
    virtual ~PendingRequest() = default;

    [[nodiscard]] virtual bool is_done() const = 0;

    // Complete with `error` without consulting the retry policy
    virtual void abort(const TransportError& error) = 0;
};

template <typename T>
class AttemptPromise;

// ─────────────────────────────────────────────────────────────────────────────
// ResponsePromise
// ─────────────────────────────────────────────────────────────────────────────

template <typename T>
class ResponsePromise final
    : public PendingRequest
    , public std::enable_shared_from_this<ResponsePromise<T>> {
public:
    using Result = EtcdResult<T>;
    using Listener = std::function<void(const Result&)>;
    using RetryHandler = std::function<void()>;

    ResponsePromise(
        asio::any_io_executor executor,
        std::shared_ptr<IRetryPolicy> retry_policy,
        std::shared_ptr<ConnectionState> state,
        RetryHandler retry_handler
    )
        : retry_policy_(std::move(retry_policy))
        , state_(std::move(state))
        , retry_handler_(std::move(retry_handler))
        , executor_(std::move(executor))
    {}

    ResponsePromise(const ResponsePromise&) = delete;
    ResponsePromise& operator=(const ResponsePromise&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Transport side
    // ─────────────────────────────────────────────────────────────────────────

    /// Start a new attempt. The returned completion is one-shot.
    [[nodiscard]] std::shared_ptr<AttemptPromise<T>> attach_attempt() {
        std::lock_guard<std::mutex> lock(mutex_);
        ++attempts_;
        return std::make_shared<AttemptPromise<T>>(this->shared_from_this());
    }

    /// An attempt failed: retry through the policy or fail terminally.
    void handle_retry(const TransportError& error) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (done_) {
                return;
            }

            const bool retry = retry_policy_->should_retry(error, *state_);
            if (retry) {
                retry_policy_->select_endpoint(*state_);
                ++state_->retry_count;
                const auto delay = retry_policy_->next_delay(*state_);
                state_->delay_before_retry = delay;

                get_logger()->info_fmt(
                    "Retrying in {}ms after {}: {} (retry {}, endpoint #{})",
                    delay.count(), to_string(error.code), error.message,
                    state_->retry_count, state_->endpoint_index
                );

                // The pending handler owns the timer, so a promise that
                // outlives the engine never holds an engine object.
                auto timer = std::make_shared<asio::steady_timer>(executor_, delay);
                retry_timer_ = timer;
                timer->async_wait(
                    [self = this->shared_from_this(), timer](const std::error_code& ec) {
                        if (ec) {
                            return;  // Cancelled by completion or close
                        }
                        self->fire_retry();
                    }
                );
                return;
            }
        }

        get_logger()->debug_fmt("Not retrying {}: {}", to_string(error.code), error.message);
        set_failure(error);
    }

    /// Terminal success. Returns false if the promise was already done.
    bool set_success(T value) {
        return complete(Result{std::move(value)});
    }

    /// Terminal failure, bypassing the retry policy.
    bool set_failure(const TransportError& error) {
        return complete(Result{tl::unexpected(error)});
    }

    void abort(const TransportError& error) override {
        set_failure(error);
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Caller side
    // ─────────────────────────────────────────────────────────────────────────

    /// Block until the promise completes.
    [[nodiscard]] Result get() const {
        std::unique_lock<std::mutex> lock(mutex_);
        done_cv_.wait(lock, [this]() { return done_; });
        return *result_;
    }

    /// Block for at most `timeout`. nullopt if still pending.
    template <typename Rep, typename Period>
    [[nodiscard]] std::optional<Result> wait_for(std::chrono::duration<Rep, Period> timeout) const {
        std::unique_lock<std::mutex> lock(mutex_);
        const bool finished = done_cv_.wait_for(lock, timeout, [this]() { return done_; });
        if (finished == false) {
            return std::nullopt;
        }
        return result_;
    }

    /// Result if already completed, without blocking.
    [[nodiscard]] std::optional<Result> now() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return result_;
    }

    [[nodiscard]] bool is_done() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return done_;
    }

    /// Run `listener` once with the result; immediately if already done.
    void add_listener(Listener listener) {
        std::optional<Result> ready;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (done_ == false) {
                listeners_.push_back(std::move(listener));
                return;
            }
            ready = result_;
        }
        notify(listener, *ready);
    }

    /// Number of connect attempts started so far.
    [[nodiscard]] std::size_t attempt_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return attempts_;
    }

    /// Snapshot of the request's connection state.
    [[nodiscard]] ConnectionState connection_state() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return *state_;
    }

    [[nodiscard]] const std::shared_ptr<IRetryPolicy>& retry_policy() const noexcept {
        return retry_policy_;
    }

private:
    bool complete(Result result) {
        std::vector<Listener> listeners;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (done_) {
                return false;
            }
            result_ = std::move(result);
            done_ = true;
            listeners.swap(listeners_);
            // The handler owns the request, which owns this promise
            retry_handler_ = nullptr;
            if (auto timer = retry_timer_.lock()) {
                timer->cancel();
            }
        }
        done_cv_.notify_all();

        for (const auto& listener : listeners) {
            notify(listener, *result_);
        }
        return true;
    }

    void fire_retry() {
        RetryHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (done_) {
                return;
            }
            handler = retry_handler_;
        }
        if (!handler) {
            return;
        }
        try {
            handler();
        } catch (const std::exception& e) {
            get_logger()->error_fmt("Retry handler failed: {}", e.what());
            set_failure(TransportError::connection_failed(e.what()));
        }
    }

    static void notify(const Listener& listener, const Result& result) {
        try {
            listener(result);
        } catch (const std::exception& e) {
            get_logger()->error_fmt("Response listener threw: {}", e.what());
        }
    }

    std::shared_ptr<IRetryPolicy> retry_policy_;
    std::shared_ptr<ConnectionState> state_;
    RetryHandler retry_handler_;
    asio::any_io_executor executor_;
    std::weak_ptr<asio::steady_timer> retry_timer_;

    mutable std::mutex mutex_;
    mutable std::condition_variable done_cv_;
    bool done_{false};
    std::optional<Result> result_;
    std::vector<Listener> listeners_;
    std::size_t attempts_{0};
};

// ─────────────────────────────────────────────────────────────────────────────
// AttemptPromise
// ─────────────────────────────────────────────────────────────────────────────
// Completion for a single connect attempt. Only the first outcome counts, so
// a read timeout racing a late response cannot complete (or retry) twice.

template <typename T>
class AttemptPromise {
public:
    explicit AttemptPromise(std::shared_ptr<ResponsePromise<T>> owner)
        : owner_(std::move(owner))
    {}

    bool set_success(T value) {
        if (done_.exchange(true)) {
            return false;
        }
        return owner_->set_success(std::move(value));
    }

    /// Routes the error to the owner's retry path.
    bool set_failure(const TransportError& error) {
        if (done_.exchange(true)) {
            return false;
        }
        owner_->handle_retry(error);
        return true;
    }

    [[nodiscard]] bool is_done() const noexcept {
        return done_.load();
    }

    [[nodiscard]] const std::shared_ptr<ResponsePromise<T>>& owner() const noexcept {
        return owner_;
    }

private:
    std::shared_ptr<ResponsePromise<T>> owner_;
    std::atomic<bool> done_{false};
};

}  // namespace etcdpp
