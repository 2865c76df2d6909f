#include <catch2/catch_test_macros.hpp>

#include "etcdpp/transport/response_promise.hpp"

#include <asio/io_context.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace etcdpp;
using namespace std::chrono_literals;

namespace {

struct PromiseFixture {
    asio::io_context io;
    std::shared_ptr<ConnectionState> state = std::make_shared<ConnectionState>(3);
    int retries_fired = 0;

    std::shared_ptr<ResponsePromise<std::string>> make(
        std::shared_ptr<IRetryPolicy> policy,
        std::function<void(ResponsePromise<std::string>&)> on_retry = {}
    ) {
        // The handler sees the promise through a slot filled after construction
        auto slot = std::make_shared<std::weak_ptr<ResponsePromise<std::string>>>();
        auto promise = std::make_shared<ResponsePromise<std::string>>(
            io.get_executor(),
            std::move(policy),
            state,
            [this, slot, on_retry]() {
                ++retries_fired;
                if (auto self = slot->lock(); self && on_retry) {
                    on_retry(*self);
                }
            }
        );
        *slot = promise;
        return promise;
    }
};

TransportError refused() {
    return TransportError::connection_failed("Connection refused");
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Terminal completion
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ResponsePromise completes exactly once", "[promise]") {
    PromiseFixture fx;
    auto promise = fx.make(no_retry());

    REQUIRE(promise->is_done() == false);
    REQUIRE(promise->now().has_value() == false);

    REQUIRE(promise->set_success("first") == true);
    REQUIRE(promise->set_success("second") == false);
    REQUIRE(promise->set_failure(TransportError::closed()) == false);

    REQUIRE(promise->is_done());
    auto result = promise->get();
    REQUIRE(result.has_value());
    REQUIRE(*result == "first");
}

TEST_CASE("ResponsePromise failure is terminal", "[promise]") {
    PromiseFixture fx;
    auto promise = fx.make(no_retry());

    REQUIRE(promise->set_failure(TransportError::timeout("slow")));
    REQUIRE(promise->set_success("late") == false);

    auto result = promise->get();
    REQUIRE(result.has_value() == false);
    REQUIRE(result.error().code == TransportError::Code::Timeout);
}

TEST_CASE("wait_for returns nullopt while pending", "[promise]") {
    PromiseFixture fx;
    auto promise = fx.make(no_retry());

    REQUIRE(promise->wait_for(10ms).has_value() == false);

    std::thread completer([promise]() {
        std::this_thread::sleep_for(20ms);
        promise->set_success("done");
    });
    auto result = promise->wait_for(5s);
    completer.join();

    REQUIRE(result.has_value());
    REQUIRE(result->value() == "done");
}

TEST_CASE("Listeners run once, including late ones", "[promise][listener]") {
    PromiseFixture fx;
    auto promise = fx.make(no_retry());

    std::vector<std::string> seen;
    promise->add_listener([&seen](const EtcdResult<std::string>& r) { seen.push_back("early:" + *r); });
    promise->set_success("v");
    promise->set_success("ignored");
    promise->add_listener([&seen](const EtcdResult<std::string>& r) { seen.push_back("late:" + *r); });

    REQUIRE(seen == std::vector<std::string>{"early:v", "late:v"});
}

TEST_CASE("A throwing listener does not stop the others", "[promise][listener]") {
    PromiseFixture fx;
    auto promise = fx.make(no_retry());

    bool second_ran = false;
    promise->add_listener([](const EtcdResult<std::string>&) { throw std::runtime_error("boom"); });
    promise->add_listener([&second_ran](const EtcdResult<std::string>&) { second_ran = true; });

    REQUIRE(promise->set_success("v"));
    REQUIRE(second_ran);
}

// ═══════════════════════════════════════════════════════════════════════════
// Retry side-channel
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("handle_retry without retries left completes with the error", "[promise][retry]") {
    PromiseFixture fx;
    auto promise = fx.make(no_retry());

    promise->handle_retry(refused());
    fx.io.run();

    REQUIRE(fx.retries_fired == 0);
    auto result = promise->get();
    REQUIRE(result.has_value() == false);
    REQUIRE(result.error().code == TransportError::Code::ConnectionFailed);
}

TEST_CASE("handle_retry advances the state and re-enters the handler", "[promise][retry]") {
    PromiseFixture fx;
    auto promise = fx.make(retry_n_times(1ms, 3), [](ResponsePromise<std::string>& self) {
        self.set_success("recovered");
    });

    promise->handle_retry(refused());
    REQUIRE(promise->is_done() == false);
    fx.io.run();

    REQUIRE(fx.retries_fired == 1);
    REQUIRE(promise->get().value() == "recovered");

    const auto state = promise->connection_state();
    REQUIRE(state.retry_count == 1);
    REQUIRE(state.endpoint_index == 1);
    REQUIRE(state.delay_before_retry == 1ms);
}

TEST_CASE("Retries reuse the same promise until the policy gives up", "[promise][retry]") {
    PromiseFixture fx;
    auto promise = fx.make(retry_n_times(0ms, 2), [](ResponsePromise<std::string>& self) {
        self.attach_attempt()->set_failure(refused());
    });

    promise->attach_attempt()->set_failure(refused());
    fx.io.run();

    REQUIRE(fx.retries_fired == 2);
    REQUIRE(promise->attempt_count() == 3);
    auto result = promise->get();
    REQUIRE(result.has_value() == false);
    REQUIRE(result.error().code == TransportError::Code::ConnectionFailed);

    // Round-robin visited endpoints 1 and 2
    REQUIRE(promise->connection_state().endpoint_index == 2);
    REQUIRE(promise->connection_state().retry_count == 2);
}

TEST_CASE("Non-retryable errors skip the policy's retry path", "[promise][retry]") {
    PromiseFixture fx;
    auto promise = fx.make(retry_n_times(0ms, 5));

    promise->handle_retry(TransportError::server_error_status(500, "boom"));
    fx.io.run();

    REQUIRE(fx.retries_fired == 0);
    REQUIRE(promise->get().error().code == TransportError::Code::ServerError);
}

TEST_CASE("Completion cancels a scheduled retry", "[promise][retry]") {
    PromiseFixture fx;
    auto promise = fx.make(retry_n_times(10s, 1));

    promise->handle_retry(refused());
    REQUIRE(promise->is_done() == false);

    promise->abort(TransportError::closed());
    fx.io.run();  // The cancelled timer lets run() return at once

    REQUIRE(fx.retries_fired == 0);
    REQUIRE(promise->get().error().code == TransportError::Code::Closed);
}

TEST_CASE("handle_retry after completion is ignored", "[promise][retry]") {
    PromiseFixture fx;
    auto promise = fx.make(retry_n_times(0ms, 3));

    promise->set_success("v");
    promise->handle_retry(refused());
    fx.io.run();

    REQUIRE(fx.retries_fired == 0);
    REQUIRE(promise->connection_state().retry_count == 0);
}

// ═══════════════════════════════════════════════════════════════════════════
// AttemptPromise
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("AttemptPromise takes only the first outcome", "[promise][attempt]") {
    PromiseFixture fx;
    auto promise = fx.make(retry_n_times(0ms, 3));
    auto attempt = promise->attach_attempt();

    REQUIRE(attempt->set_failure(TransportError::timeout("read timeout")));
    // The late response of the timed-out attempt is dropped
    REQUIRE(attempt->set_success("late") == false);
    REQUIRE(attempt->set_failure(refused()) == false);
    REQUIRE(attempt->is_done());

    fx.io.run();
    REQUIRE(fx.retries_fired == 1);
    REQUIRE(promise->connection_state().retry_count == 1);
}

TEST_CASE("AttemptPromise success completes the owner", "[promise][attempt]") {
    PromiseFixture fx;
    auto promise = fx.make(no_retry());
    auto attempt = promise->attach_attempt();

    REQUIRE(attempt->owner() == promise);
    REQUIRE(attempt->set_success("ok"));
    REQUIRE(promise->get().value() == "ok");
}
