#include "doctest.h"
#include "../../../utils/resilience/resilience.hpp"
#include "../../../utils/error_handling.hpp"
#include <atomic>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace resilience;

namespace {

struct SteadyManualClock {
    std::shared_ptr<std::chrono::steady_clock::time_point> now =
        std::make_shared<std::chrono::steady_clock::time_point>(std::chrono::steady_clock::now());

    CircuitBreaker::Clock source() const {
        auto state = now;
        return [state]() { return *state; };
    }

    void advance(std::chrono::milliseconds by) { *now += by; }
};

CircuitBreakerConfig test_config(int failures = 3, int successes = 2) {
    CircuitBreakerConfig config;
    config.name = "test";
    config.failure_threshold = failures;
    config.success_threshold = successes;
    config.timeout = std::chrono::milliseconds(0);
    config.reset_timeout = std::chrono::milliseconds(1000);
    return config;
}

void fail_once(CircuitBreaker& breaker) {
    CHECK_THROWS_AS(breaker.execute([]() -> int { throw std::runtime_error("boom"); }), std::runtime_error);
}

} // namespace

TEST_CASE("CircuitBreaker - Passes results through while closed") {
    CircuitBreaker breaker(test_config());
    CHECK(breaker.execute([]() { return 42; }) == 42);
    breaker.execute([]() {});

    auto stats = breaker.get_stats();
    CHECK(stats.state == CircuitState::CLOSED);
    CHECK(stats.total_requests == 2);
    CHECK(stats.success_count == 2);
    CHECK(stats.last_success_time.has_value());
    CHECK_FALSE(stats.last_failure_time.has_value());
}

TEST_CASE("CircuitBreaker - Opens after consecutive failures") {
    SteadyManualClock clock;
    CircuitBreaker breaker(test_config(), clock.source());

    fail_once(breaker);
    fail_once(breaker);
    CHECK(breaker.get_state() == CircuitState::CLOSED);

    SUBCASE("A success resets the consecutive count") {
        CHECK(breaker.execute([]() { return 1; }) == 1);
        fail_once(breaker);
        fail_once(breaker);
        CHECK(breaker.get_state() == CircuitState::CLOSED);
    }

    SUBCASE("Open circuit rejects without invoking the call") {
        fail_once(breaker);
        CHECK(breaker.get_state() == CircuitState::OPEN);

        bool invoked = false;
        CHECK_THROWS_AS(breaker.execute([&invoked]() { invoked = true; return 0; }), CircuitBreakerError);
        CHECK_FALSE(invoked);

        auto stats = breaker.get_stats();
        CHECK(stats.total_requests == 3);
        CHECK(stats.total_failures == 3);
        CHECK(stats.failure_rate == doctest::Approx(1.0));
        CHECK(stats.opened_at.has_value());
    }
}

TEST_CASE("CircuitBreaker - Half-open recovery") {
    SteadyManualClock clock;
    CircuitBreaker breaker(test_config(1, 2), clock.source());

    fail_once(breaker);
    REQUIRE(breaker.get_state() == CircuitState::OPEN);

    clock.advance(std::chrono::milliseconds(999));
    CHECK(breaker.get_state() == CircuitState::OPEN);
    clock.advance(std::chrono::milliseconds(1));
    CHECK(breaker.get_state() == CircuitState::HALF_OPEN);

    SUBCASE("Enough successes close the circuit") {
        breaker.execute([]() { return 1; });
        CHECK(breaker.get_state() == CircuitState::HALF_OPEN);
        breaker.execute([]() { return 2; });
        CHECK(breaker.get_state() == CircuitState::CLOSED);
        CHECK(breaker.get_stats().failure_count == 0);
    }

    SUBCASE("Any failure reopens the circuit") {
        breaker.execute([]() { return 1; });
        fail_once(breaker);
        CHECK(breaker.get_state() == CircuitState::OPEN);
    }
}

TEST_CASE("CircuitBreaker - Failure predicate filters exceptions") {
    auto config = test_config(1);
    config.is_failure = [](const std::exception& e) {
        return dynamic_cast<const error_handling::InvalidRequestError*>(&e) == nullptr;
    };
    CircuitBreaker breaker(config);

    CHECK_THROWS_AS(breaker.execute([]() -> int { throw error_handling::InvalidRequestError("bad symbol"); }),
                    error_handling::InvalidRequestError);
    CHECK(breaker.get_state() == CircuitState::CLOSED);
    CHECK(breaker.get_stats().total_failures == 0);

    fail_once(breaker);
    CHECK(breaker.get_state() == CircuitState::OPEN);
}

TEST_CASE("CircuitBreaker - Timeout counts as failure") {
    auto config = test_config(1);
    config.timeout = std::chrono::milliseconds(50);
    CircuitBreaker breaker(config);

    CHECK_THROWS_AS(breaker.execute([]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        return 1;
    }), TimeoutError);
    CHECK(breaker.get_state() == CircuitState::OPEN);

    CHECK(breaker.get_stats().total_failures == 1);
}

TEST_CASE("CircuitBreaker - Fallback") {
    CircuitBreaker breaker(test_config(1));

    int value = breaker.execute_with_fallback([]() -> int { throw std::runtime_error("down"); },
                                              []() { return -1; });
    CHECK(value == -1);
    CHECK(breaker.get_state() == CircuitState::OPEN);

    bool invoked = false;
    value = breaker.execute_with_fallback([&invoked]() { invoked = true; return 5; }, []() { return -2; });
    CHECK(value == -2);
    CHECK_FALSE(invoked);
}

TEST_CASE("CircuitBreaker - Manual control and listener") {
    CircuitBreaker breaker(test_config());
    std::vector<std::pair<CircuitState, CircuitState>> transitions;
    breaker.set_state_listener([&transitions](const std::string& name, CircuitState from, CircuitState to) {
        CHECK(name == "test");
        transitions.emplace_back(from, to);
    });

    breaker.open();
    CHECK(breaker.get_state() == CircuitState::OPEN);
    breaker.reset();
    CHECK(breaker.get_state() == CircuitState::CLOSED);

    REQUIRE(transitions.size() == 2);
    CHECK(transitions[0].first == CircuitState::CLOSED);
    CHECK(transitions[0].second == CircuitState::OPEN);
    CHECK(transitions[1].second == CircuitState::CLOSED);

    SUBCASE("A throwing listener does not break the caller") {
        breaker.set_state_listener([](const std::string&, CircuitState, CircuitState) {
            throw std::runtime_error("listener failure");
        });
        CHECK_NOTHROW(breaker.open());
        CHECK(breaker.get_state() == CircuitState::OPEN);
    }
}

TEST_CASE("CircuitBreaker - Registry") {
    CircuitBreakerRegistry registry;
    std::atomic<int> notifications{0};
    registry.set_state_listener([&notifications](const std::string&, CircuitState, CircuitState) {
        notifications++;
    });

    auto config = test_config();
    auto first = registry.get_or_create("exchange:alpha", config);
    auto again = registry.get_or_create("exchange:alpha", test_config(9));
    CHECK(first == again);
    CHECK(first->name() == "exchange:alpha");
    CHECK(first->config().failure_threshold == 3);
    CHECK(registry.get("exchange:missing") == nullptr);

    registry.get_or_create("exchange:beta", config);
    CHECK(registry.names() == std::vector<std::string>{"exchange:alpha", "exchange:beta"});

    first->open();
    CHECK(notifications == 1);
    auto stats = registry.get_all_stats();
    CHECK(stats["exchange:alpha"].state == CircuitState::OPEN);
    CHECK(stats["exchange:beta"].state == CircuitState::CLOSED);

    registry.reset_all();
    CHECK(first->get_state() == CircuitState::CLOSED);
    CHECK(to_string(CircuitState::HALF_OPEN) == "HALF_OPEN");
}
