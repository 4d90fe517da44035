#include "doctest.h"
#include "../../../risk/risk_calculations.hpp"
#include <cmath>
#include <limits>

using namespace risk;

TEST_CASE("RiskCalculations - Kelly fraction") {
    CHECK(calculate_kelly_fraction(0.6, 2.0, 1.0) == doctest::Approx(0.4));
    // Negative edge clamps to zero
    CHECK(calculate_kelly_fraction(0.2, 1.0, 1.0) == 0.0);
    CHECK(calculate_kelly_fraction(0.6, 0.0, 1.0) == 0.0);
    CHECK(calculate_kelly_fraction(0.6, 2.0, 0.0) == 0.0);
    CHECK(calculate_kelly_fraction(1.5, 2.0, 1.0) == 0.0);
}

TEST_CASE("RiskCalculations - Position sizing methods") {
    PositionSizeParams params;
    params.account_balance = 10000.0;
    params.risk_percentage = 0.02;

    SUBCASE("Fixed percentage") {
        auto result = calculate_position_size(params);
        CHECK(result.risk_amount == doctest::Approx(200.0));
        CHECK(result.position_size == doctest::Approx(200.0));
        CHECK(result.risk_percentage == doctest::Approx(0.02));
    }

    SUBCASE("Half Kelly capped at 25%") {
        params.method = PositionSizingMethod::KELLY_CRITERION;
        params.win_rate = 0.6;
        params.avg_win = 2.0;
        params.avg_loss = 1.0;
        auto result = calculate_position_size(params);
        CHECK(result.risk_amount == doctest::Approx(2000.0));

        params.win_rate = 0.9;
        params.avg_win = 10.0;
        CHECK(calculate_position_size(params).risk_amount == doctest::Approx(2500.0));
    }

    SUBCASE("Fixed amount capped at 10% of balance") {
        params.method = PositionSizingMethod::FIXED_AMOUNT;
        params.fixed_amount = 500.0;
        CHECK(calculate_position_size(params).risk_amount == doctest::Approx(500.0));
        params.fixed_amount = 5000.0;
        CHECK(calculate_position_size(params).risk_amount == doctest::Approx(1000.0));
    }

    SUBCASE("Volatility adjusted") {
        params.method = PositionSizingMethod::VOLATILITY_ADJUSTED;
        params.avg_volatility = 1.0;
        params.volatility = 2.0;
        CHECK(calculate_position_size(params).risk_amount == doctest::Approx(100.0));
        params.volatility = 0.1;
        CHECK(calculate_position_size(params).risk_amount == doctest::Approx(400.0));
        params.volatility = 0.0;
        CHECK(calculate_position_size(params).risk_amount == doctest::Approx(400.0));
    }
}

TEST_CASE("RiskCalculations - Risk reward") {
    auto rr = calculate_risk_reward(100.0, 95.0, 110.0);
    CHECK(rr.risk_amount == doctest::Approx(5.0));
    CHECK(rr.reward_amount == doctest::Approx(10.0));
    CHECK(rr.risk_reward_ratio == doctest::Approx(2.0));
    CHECK(rr.break_even_win_rate == doctest::Approx(1.0 / 3.0));

    auto flat = calculate_risk_reward(100.0, 100.0, 110.0);
    CHECK(flat.risk_reward_ratio == 0.0);
    CHECK(flat.break_even_win_rate == 1.0);
}

TEST_CASE("RiskCalculations - VaR and CVaR") {
    std::vector<double> returns(18, 0.01);
    returns.push_back(-0.05);
    returns.push_back(-0.10);

    CHECK(calculate_var(returns, 0.95) == doctest::Approx(0.05));
    CHECK(calculate_cvar(returns, 0.95) == doctest::Approx(0.10));

    CHECK(calculate_var({}, 0.95) == 0.0);
    CHECK(calculate_cvar({}, 0.95) == 0.0);
    // A single observation is its own percentile
    CHECK(calculate_var({-0.02}, 0.95) == doctest::Approx(0.02));
}

TEST_CASE("RiskCalculations - Drawdown tracks peak monotonically") {
    auto dd = calculate_drawdown({100.0, 120.0, 90.0, 110.0});
    CHECK(dd.max_drawdown == doctest::Approx(30.0));
    CHECK(dd.max_drawdown_percent == doctest::Approx(0.25));
    CHECK(dd.peak_value == doctest::Approx(120.0));
    CHECK(dd.trough_value == doctest::Approx(90.0));
    CHECK(dd.current_drawdown == doctest::Approx(10.0));
    CHECK(dd.current_drawdown_percent == doctest::Approx(10.0 / 120.0));

    auto empty = calculate_drawdown({});
    CHECK(empty.max_drawdown == 0.0);

    auto rising = calculate_drawdown({100.0, 110.0, 120.0});
    CHECK(rising.max_drawdown_percent == 0.0);
    CHECK(rising.current_drawdown == 0.0);
}

TEST_CASE("RiskCalculations - Sharpe and Sortino") {
    CHECK(calculate_sharpe_ratio({0.01}) == 0.0);
    CHECK(calculate_sharpe_ratio({0.01, 0.01, 0.01}) == 0.0);

    std::vector<double> returns = {0.02, -0.01, 0.03, -0.02, 0.01};
    double sharpe = calculate_sharpe_ratio(returns, 0.02, 252);
    double sortino = calculate_sortino_ratio(returns, 0.02, 252);
    CHECK(sharpe > 0.0);
    // Downside deviation is smaller than full deviation here
    CHECK(sortino > sharpe);

    CHECK(std::isinf(calculate_sortino_ratio({0.01, 0.02, 0.03})));
}

TEST_CASE("RiskCalculations - Trade statistics") {
    auto stats = calculate_trade_stats({100.0, -50.0, 200.0, -50.0});
    CHECK(stats.total_trades == 4);
    CHECK(stats.winning_trades == 2);
    CHECK(stats.losing_trades == 2);
    CHECK(stats.win_rate == doctest::Approx(0.5));
    CHECK(stats.avg_win == doctest::Approx(150.0));
    CHECK(stats.avg_loss == doctest::Approx(50.0));
    CHECK(stats.profit_factor == doctest::Approx(3.0));
    CHECK(stats.expectancy == doctest::Approx(50.0));

    auto only_wins = calculate_trade_stats({10.0, 20.0});
    CHECK(std::isinf(only_wins.profit_factor));

    auto none = calculate_trade_stats({});
    CHECK(none.total_trades == 0);
    CHECK(none.profit_factor == 0.0);
}

TEST_CASE("RiskCalculations - Correlation and beta") {
    std::vector<double> market = {0.01, -0.02, 0.03, 0.00, -0.01};
    std::vector<double> doubled;
    std::vector<double> inverted;
    for (double r : market) {
        doubled.push_back(2.0 * r);
        inverted.push_back(-r);
    }

    CHECK(calculate_correlation(market, market) == doctest::Approx(1.0));
    CHECK(calculate_correlation(market, inverted) == doctest::Approx(-1.0));
    CHECK(calculate_correlation({0.01}, {0.02}) == 0.0);

    CHECK(calculate_beta(doubled, market) == doctest::Approx(2.0));
    CHECK(calculate_beta({0.01}, {0.01}) == 1.0);
    CHECK(calculate_beta(market, {0.01, 0.01, 0.01, 0.01, 0.01}) == 1.0);
}

TEST_CASE("RiskCalculations - Stop loss and take profit") {
    CHECK(calculate_stop_loss(100.0, 0.02, Direction::LONG) == doctest::Approx(98.0));
    CHECK(calculate_stop_loss(100.0, 0.02, Direction::SHORT) == doctest::Approx(102.0));
    CHECK(calculate_stop_loss(100.0, 0.02, Direction::LONG, 1.5) == doctest::Approx(97.0));
    CHECK(calculate_stop_loss(100.0, 0.02, Direction::SHORT, 1.5, 3.0) == doctest::Approx(104.5));

    CHECK(calculate_take_profit(100.0, 98.0, 2.0, Direction::LONG) == doctest::Approx(104.0));
    CHECK(calculate_take_profit(100.0, 102.0, 2.0, Direction::SHORT) == doctest::Approx(96.0));
}

TEST_CASE("RiskCalculations - Returns from equity and parsers") {
    auto returns = returns_from_equity({100.0, 110.0, 99.0});
    REQUIRE(returns.size() == 2);
    CHECK(returns[0] == doctest::Approx(0.1));
    CHECK(returns[1] == doctest::Approx(-0.1));
    CHECK(returns_from_equity({100.0}).empty());

    CHECK(parse_direction("long") == Direction::LONG);
    CHECK_THROWS_AS(parse_direction("sideways"), std::invalid_argument);
    CHECK(parse_sizing_method("kelly") == PositionSizingMethod::KELLY_CRITERION);
    CHECK(to_string(PositionSizingMethod::VOLATILITY_ADJUSTED) == "volatility_adjusted");
}
