#include "doctest.h"
#include "../../../risk/risk_engine.hpp"
#include <stdexcept>

using namespace risk;

TEST_CASE("RiskEngine - Initial state") {
    RiskEngine engine(10000.0);
    CHECK(engine.current_equity() == doctest::Approx(10000.0));
    CHECK(engine.get_equity_curve() == std::vector<double>{10000.0});
    CHECK(engine.get_positions().empty());
    CHECK(engine.get_trades().empty());

    auto metrics = engine.get_metrics();
    CHECK(metrics.total_equity == doctest::Approx(10000.0));
    CHECK(metrics.realized_pnl == 0.0);
    CHECK(metrics.open_positions == 0);
    CHECK(metrics.var_95 == 0.0);
}

TEST_CASE("RiskEngine - Trade within limits is allowed unchanged") {
    RiskEngine engine(10000.0);
    auto check = engine.check_trade_risk("BTC/USDT", Direction::LONG, 0.01, 50000.0, 49000.0, 52000.0);
    CHECK(check.allowed);
    CHECK(check.reason.empty());
    CHECK_FALSE(check.adjusted_size.has_value());
    CHECK(check.warnings.empty());
}

TEST_CASE("RiskEngine - Oversized trade is clamped, not rejected") {
    RiskEngine engine(10000.0);
    auto check = engine.check_trade_risk("BTC/USDT", Direction::LONG, 1.0, 50000.0, 49000.0, 52000.0);
    CHECK(check.allowed);
    REQUIRE(check.adjusted_size.has_value());
    CHECK(*check.adjusted_size == doctest::Approx(0.02));
    REQUIRE(check.warnings.size() == 1);
    CHECK(check.warnings[0].find("Position size reduced") != std::string::npos);
}

TEST_CASE("RiskEngine - Hard rejections") {
    SUBCASE("Risk reward below minimum") {
        RiskEngine engine(10000.0);
        auto check = engine.check_trade_risk("ETH/USDT", Direction::LONG, 0.1, 2000.0, 1900.0, 2100.0);
        CHECK_FALSE(check.allowed);
        CHECK(check.reason.find("Risk/reward") != std::string::npos);
    }

    SUBCASE("Max open positions") {
        RiskLimits limits;
        limits.max_open_positions = 1;
        RiskEngine engine(10000.0, limits);
        engine.open_position("BTC/USDT", Direction::LONG, 0.01, 50000.0, 49000.0, 52000.0);
        auto check = engine.check_trade_risk("ETH/USDT", Direction::LONG, 0.1, 2000.0, 1900.0, 2200.0);
        CHECK_FALSE(check.allowed);
        CHECK(check.reason.find("Max open positions") != std::string::npos);
    }

    SUBCASE("Drawdown limit") {
        RiskEngine engine(10000.0);
        auto pos = engine.open_position("SOL/USDT", Direction::LONG, 30.0, 100.0, 90.0, 120.0);
        engine.close_position(pos.id, 0.0);
        CHECK(engine.current_equity() == doctest::Approx(7000.0));

        auto check = engine.check_trade_risk("ETH/USDT", Direction::LONG, 0.1, 2000.0, 1900.0, 2200.0);
        CHECK_FALSE(check.allowed);
        CHECK(check.reason.find("drawdown") != std::string::npos);
    }

    SUBCASE("Daily loss limit") {
        RiskEngine engine(10000.0);
        auto pos = engine.open_position("SOL/USDT", Direction::LONG, 10.0, 100.0, 90.0, 120.0);
        engine.close_position(pos.id, 40.0);
        CHECK(engine.current_equity() == doctest::Approx(9400.0));

        auto check = engine.check_trade_risk("ETH/USDT", Direction::LONG, 0.1, 2000.0, 1900.0, 2200.0);
        CHECK_FALSE(check.allowed);
        CHECK(check.reason.find("Daily loss limit") != std::string::npos);
    }
}

TEST_CASE("RiskEngine - Existing position produces a warning") {
    RiskEngine engine(10000.0);
    engine.open_position("BTC/USDT", Direction::LONG, 0.01, 50000.0, 49000.0, 52000.0);
    auto check = engine.check_trade_risk("BTC/USDT", Direction::LONG, 0.01, 50000.0, 49000.0, 52000.0);
    CHECK(check.allowed);
    REQUIRE(check.warnings.size() == 1);
    CHECK(check.warnings[0].find("Already have open position") != std::string::npos);
}

TEST_CASE("RiskEngine - Position lifecycle updates equity curve") {
    RiskEngine engine(10000.0);
    auto long_pos = engine.open_position("BTC/USDT", Direction::LONG, 0.1, 50000.0, 49000.0, 52000.0);
    auto short_pos = engine.open_position("ETH/USDT", Direction::SHORT, 1.0, 2000.0, 2100.0, 1800.0);
    CHECK(engine.get_positions().size() == 2);

    auto updated = engine.update_position(long_pos.id, 51000.0);
    REQUIRE(updated.has_value());
    CHECK(updated->unrealized_pnl == doctest::Approx(100.0));
    CHECK_FALSE(engine.update_position("missing", 1.0).has_value());

    auto win = engine.close_position(long_pos.id, 55000.0);
    REQUIRE(win.has_value());
    CHECK(win->pnl == doctest::Approx(500.0));
    CHECK(win->pnl_percent == doctest::Approx(0.1));

    auto loss = engine.close_position(short_pos.id, 2200.0);
    REQUIRE(loss.has_value());
    CHECK(loss->pnl == doctest::Approx(-200.0));
    CHECK_FALSE(engine.close_position(short_pos.id, 2200.0).has_value());

    auto curve = engine.get_equity_curve();
    REQUIRE(curve.size() == 3);
    CHECK(curve[1] == doctest::Approx(10500.0));
    CHECK(curve[2] == doctest::Approx(10300.0));

    auto metrics = engine.get_metrics();
    CHECK(metrics.realized_pnl == doctest::Approx(300.0));
    CHECK(metrics.daily_pnl == doctest::Approx(300.0));
    CHECK(metrics.trade_stats.total_trades == 2);
    CHECK(metrics.trade_stats.win_rate == doctest::Approx(0.5));
    CHECK(metrics.drawdown.max_drawdown == doctest::Approx(200.0));
    CHECK(engine.get_trades().size() == 2);
}

TEST_CASE("RiskEngine - Reducing a position books partial trades") {
    RiskEngine engine(10000.0);
    auto pos = engine.open_position("BTC/USDT", Direction::LONG, 0.1, 50000.0, 49000.0, 52000.0);

    auto first = engine.reduce_position(pos.id, 0.04, 51000.0);
    REQUIRE(first.has_value());
    CHECK(first->size == doctest::Approx(0.04));
    CHECK(first->pnl == doctest::Approx(40.0));

    auto left = engine.get_position(pos.id);
    REQUIRE(left.has_value());
    CHECK(left->size == doctest::Approx(0.06));
    CHECK(left->unrealized_pnl == doctest::Approx(60.0));
    CHECK(engine.get_metrics().open_positions == 1);

    // Asking for more than is left closes the remainder only
    auto second = engine.reduce_position(pos.id, 1.0, 49000.0);
    REQUIRE(second.has_value());
    CHECK(second->size == doctest::Approx(0.06));
    CHECK(second->pnl == doctest::Approx(-60.0));
    CHECK_FALSE(engine.get_position(pos.id).has_value());
    CHECK_FALSE(engine.reduce_position(pos.id, 0.01, 49000.0).has_value());

    CHECK(engine.get_trades().size() == 2);
    auto curve = engine.get_equity_curve();
    REQUIRE(curve.size() == 3);
    CHECK(curve[1] == doctest::Approx(10040.0));
    CHECK(curve[2] == doctest::Approx(9980.0));
    CHECK_THROWS_AS(engine.reduce_position("any", 0.0, 1.0), std::invalid_argument);
}

TEST_CASE("RiskEngine - Limits update is a partial merge") {
    RiskEngine engine(10000.0);
    RiskLimitsUpdate update;
    update.max_open_positions = 3;
    update.min_risk_reward_ratio = 2.5;
    engine.update_limits(update);

    auto limits = engine.get_limits();
    CHECK(limits.max_open_positions == 3);
    CHECK(limits.min_risk_reward_ratio == doctest::Approx(2.5));
    CHECK(limits.max_position_size == doctest::Approx(0.1));
    CHECK(limits.max_drawdown == doctest::Approx(0.2));
}

TEST_CASE("RiskEngine - Daily returns and sizing") {
    RiskEngine engine(10000.0);
    engine.record_daily_return();
    CHECK(engine.get_daily_returns() == std::vector<double>{0.0});

    auto pos = engine.open_position("BTC/USDT", Direction::LONG, 1.0, 100.0, 95.0, 110.0);
    engine.close_position(pos.id, 200.0);
    engine.record_daily_return();
    auto returns = engine.get_daily_returns();
    REQUIRE(returns.size() == 2);
    CHECK(returns[1] == doctest::Approx(0.01));

    auto sizing = engine.calculate_position(PositionSizingMethod::FIXED_PERCENTAGE, 0.02);
    CHECK(sizing.risk_amount == doctest::Approx(10100.0 * 0.02));

    CHECK(engine.calculate_stop_loss(100.0, Direction::LONG) == doctest::Approx(98.0));
    CHECK(engine.calculate_take_profit(100.0, 98.0, Direction::LONG, 3.0) == doctest::Approx(106.0));
}
