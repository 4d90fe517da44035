#include "doctest.h"
#include "../../../utils/ratelimit/rate_limiter.hpp"
#include <memory>
#include <stdexcept>

using namespace ratelimit;

namespace {

struct ManualClock {
    std::shared_ptr<std::chrono::system_clock::time_point> now =
        std::make_shared<std::chrono::system_clock::time_point>(std::chrono::system_clock::now());

    RateLimiter::Clock source() const {
        auto state = now;
        return [state]() { return *state; };
    }

    void advance(std::chrono::seconds by) { *now += by; }
};

} // namespace

TEST_CASE("RateLimiter - Fixed window bucket") {
    ManualClock clock;
    RateLimiter limiter(clock.source());

    auto first = limiter.check_limit("alice", "orders", 2, 60);
    CHECK(first.allowed);
    CHECK(first.limit == 2);
    CHECK(first.remaining == 1);
    CHECK(first.reset_seconds == 60);
    CHECK_FALSE(first.retry_after_seconds.has_value());

    CHECK(limiter.check_limit("alice", "orders", 2, 60).allowed);

    clock.advance(std::chrono::seconds(15));
    auto denied = limiter.check_limit("alice", "orders", 2, 60);
    CHECK_FALSE(denied.allowed);
    CHECK(denied.remaining == 0);
    REQUIRE(denied.retry_after_seconds.has_value());
    CHECK(*denied.retry_after_seconds == 45);

    SUBCASE("Window expiry restores the budget") {
        clock.advance(std::chrono::seconds(45));
        auto renewed = limiter.check_limit("alice", "orders", 2, 60);
        CHECK(renewed.allowed);
        CHECK(renewed.remaining == 1);
    }

    SUBCASE("Buckets are independent per user and category") {
        CHECK(limiter.check_limit("bob", "orders", 2, 60).allowed);
        CHECK(limiter.check_limit("alice", "quotes", 2, 60).allowed);
    }
}

TEST_CASE("RateLimiter - Negative limit is unlimited") {
    RateLimiter limiter;
    for (int i = 0; i < 100; ++i) {
        auto result = limiter.check_limit("alice", "orders", -1, 60);
        REQUIRE(result.allowed);
        CHECK(result.remaining == -1);
    }
    auto status = limiter.get_status("alice");
    REQUIRE(status.count("orders") == 1);
    CHECK(status["orders"].used == 100);
    CHECK(status["orders"].remaining == -1);
}

TEST_CASE("RateLimiter - Bucket status is scoped to the user") {
    RateLimiter limiter;
    limiter.check_limit("alice", "orders", 5, 60);
    limiter.check_limit("alice", "orders", 5, 60);
    limiter.check_limit("alice2", "orders", 5, 60);

    auto status = limiter.get_status("alice");
    REQUIRE(status.size() == 1);
    CHECK(status["orders"].used == 2);
    CHECK(status["orders"].limit == 5);
    CHECK(status["orders"].remaining == 3);
    CHECK(limiter.get_status("carol").empty());
}

TEST_CASE("RateLimiter - Tier limits") {
    auto free = RateLimiter::get_limits_for_tier(UserTier::FREE);
    CHECK(free.backtests_per_day == 5);
    CHECK(free.strategies_max == 1);
    CHECK(free.orders_per_minute == 10);
    CHECK_FALSE(free.live_trading);
    CHECK(free.api_requests_per_minute == 60);

    auto pro = RateLimiter::get_limits_for_tier(UserTier::PRO);
    CHECK(pro.orders_per_minute == 60);
    CHECK(pro.live_trading);
    CHECK_FALSE(pro.priority_execution);

    auto elite = RateLimiter::get_limits_for_tier(UserTier::ELITE);
    CHECK(elite.backtests_per_day == -1);
    CHECK(elite.priority_execution);
    CHECK_FALSE(elite.dedicated_support);

    auto institutional = RateLimiter::get_limits_for_tier(UserTier::INSTITUTIONAL);
    CHECK(institutional.orders_per_minute == -1);
    CHECK(institutional.dedicated_support);

    RateLimiter limiter;
    CHECK(limiter.get_user_tier("nobody") == UserTier::FREE);
    limiter.set_user_tier("alice", UserTier::ELITE);
    CHECK(limiter.get_user_tier("alice") == UserTier::ELITE);

    CHECK(parse_tier("pro") == UserTier::PRO);
    CHECK(to_string(UserTier::INSTITUTIONAL) == "institutional");
    CHECK_THROWS_AS(parse_tier("platinum"), std::invalid_argument);
}

TEST_CASE("RateLimiter - Exchange call budget") {
    ManualClock clock;
    RateLimiter limiter(clock.source());
    limiter.set_exchange_limit("testex", 10);

    CHECK(limiter.get_exchange_limit("binance") == 1200);
    CHECK(limiter.get_exchange_limit("coinbase") == 300);
    CHECK(limiter.get_exchange_limit("unknown") == 100);

    for (int i = 0; i < 7; ++i) {
        limiter.track_exchange_call("alice", "testex");
    }
    auto status = limiter.get_exchange_status("alice", "testex");
    CHECK(status.percent_used == 70);
    CHECK_FALSE(status.warning);
    CHECK(status.remaining == 3);

    limiter.track_exchange_call("alice", "testex");
    status = limiter.get_exchange_status("alice", "testex");
    CHECK(status.warning);
    CHECK(status.percent_used == 80);

    CHECK(limiter.try_exchange_call("alice", "testex").allowed);
    CHECK(limiter.try_exchange_call("alice", "testex").allowed);
    CHECK(limiter.get_exchange_usage("alice", "testex") == 10);

    auto denied = limiter.try_exchange_call("alice", "testex");
    CHECK_FALSE(denied.allowed);
    CHECK(denied.reason.find("Exchange rate limit reached for testex") != std::string::npos);
    REQUIRE(denied.retry_after_seconds.has_value());
    CHECK(*denied.retry_after_seconds >= 1);
    CHECK_FALSE(limiter.can_make_exchange_call("alice", "testex").allowed);
    CHECK(limiter.can_make_exchange_call("bob", "testex").allowed);

    clock.advance(std::chrono::seconds(60));
    CHECK(limiter.get_exchange_usage("alice", "testex") == 0);
    CHECK(limiter.can_make_exchange_call("alice", "testex").allowed);
    CHECK(limiter.try_exchange_call("alice", "testex").allowed);
    CHECK(limiter.get_exchange_usage("alice", "testex") == 1);
}

TEST_CASE("RateLimiter - Negative exchange limit is unlimited") {
    RateLimiter limiter;
    limiter.set_exchange_limit("openex", -1);

    for (int i = 0; i < 500; ++i) {
        REQUIRE(limiter.try_exchange_call("alice", "openex").allowed);
    }
    CHECK(limiter.get_exchange_usage("alice", "openex") == 500);
    CHECK(limiter.can_make_exchange_call("alice", "openex").allowed);

    auto status = limiter.get_exchange_status("alice", "openex");
    CHECK(status.remaining == -1);
    CHECK_FALSE(status.warning);
    CHECK(status.percent_used == 0);
}

TEST_CASE("RateLimiter - Daily usage and actions") {
    ManualClock clock;
    RateLimiter limiter(clock.source());

    for (int i = 0; i < 5; ++i) {
        CHECK(limiter.can_perform_action("alice", "backtest").allowed);
        limiter.track_usage("alice", "backtest");
    }
    auto denied = limiter.can_perform_action("alice", "backtest");
    CHECK_FALSE(denied.allowed);
    CHECK(denied.reason == "Daily limit reached for backtest. Upgrade your plan for higher limits.");
    CHECK(limiter.get_daily_usage("alice")["backtest"] == 5);

    SUBCASE("Higher tiers lift the cap") {
        limiter.set_user_tier("alice", UserTier::ELITE);
        CHECK(limiter.can_perform_action("alice", "backtest").allowed);
    }

    SUBCASE("Unknown actions are never limited") {
        CHECK(limiter.can_perform_action("alice", "export").allowed);
    }

    SUBCASE("Counters roll over with the calendar date") {
        clock.advance(std::chrono::hours(25));
        CHECK(limiter.get_daily_usage("alice").empty());
        CHECK(limiter.can_perform_action("alice", "backtest").allowed);
    }
}

TEST_CASE("RateLimiter - Reset clears all ledgers") {
    RateLimiter limiter;
    limiter.check_limit("alice", "orders", 1, 60);
    limiter.track_exchange_call("alice", "binance");
    limiter.track_usage("alice", "backtest");
    limiter.set_user_tier("alice", UserTier::PRO);

    limiter.reset();
    CHECK(limiter.get_status("alice").empty());
    CHECK(limiter.get_exchange_usage("alice", "binance") == 0);
    CHECK(limiter.get_daily_usage("alice").empty());
    CHECK(limiter.check_limit("alice", "orders", 1, 60).allowed);
    CHECK(limiter.get_user_tier("alice") == UserTier::PRO);
}
