#pragma once
#include <string>
#include <vector>

/**
 * Stateless risk and position-sizing formulas.
 *
 * Return series are fractional (0.01 == 1%). Every function tolerates empty or short
 * input and returns a neutral value instead of throwing.
 */
namespace risk {

enum class Direction {
    LONG,
    SHORT
};

std::string to_string(Direction direction);
// Throws std::invalid_argument for anything but "long"/"short"
Direction parse_direction(const std::string& name);

enum class PositionSizingMethod {
    FIXED_PERCENTAGE,
    KELLY_CRITERION,
    FIXED_AMOUNT,
    VOLATILITY_ADJUSTED
};

std::string to_string(PositionSizingMethod method);
PositionSizingMethod parse_sizing_method(const std::string& name);

struct PositionSizeParams {
    PositionSizingMethod method = PositionSizingMethod::FIXED_PERCENTAGE;
    double account_balance = 0.0;
    double risk_percentage = 0.02;
    double win_rate = 0.5;
    double avg_win = 1.0;
    double avg_loss = 1.0;
    double fixed_amount = 0.0;
    double volatility = 0.0;
    double avg_volatility = 1.0;
};

struct PositionSizeResult {
    PositionSizingMethod method = PositionSizingMethod::FIXED_PERCENTAGE;
    double position_size = 0.0;
    double risk_amount = 0.0;
    double risk_percentage = 0.0;
    double max_loss = 0.0;
};

struct RiskRewardResult {
    double risk_amount = 0.0;
    double reward_amount = 0.0;
    double risk_reward_ratio = 0.0;
    double break_even_win_rate = 1.0;
};

struct DrawdownResult {
    double max_drawdown = 0.0;
    double max_drawdown_percent = 0.0;
    double current_drawdown = 0.0;
    double current_drawdown_percent = 0.0;
    double peak_value = 0.0;
    double trough_value = 0.0;
};

struct TradeStats {
    int total_trades = 0;
    int winning_trades = 0;
    int losing_trades = 0;
    double win_rate = 0.0;
    double avg_win = 0.0;
    double avg_loss = 0.0;
    double profit_factor = 0.0;   // +inf with wins and no losses
    double expectancy = 0.0;
};

PositionSizeResult calculate_position_size(const PositionSizeParams& params);

// f* = (b*p - q) / b with b = avg_win / avg_loss; 0 for invalid input, never negative
double calculate_kelly_fraction(double win_rate, double avg_win, double avg_loss);

RiskRewardResult calculate_risk_reward(double entry_price, double stop_loss, double take_profit);

// Historical VaR: negated return at the (1 - confidence) percentile of the sorted series
double calculate_var(const std::vector<double>& returns, double confidence_level = 0.95);
// Negated mean of the tail up to the VaR percentile (at least one element)
double calculate_cvar(const std::vector<double>& returns, double confidence_level = 0.95);

DrawdownResult calculate_drawdown(const std::vector<double>& equity_curve);

// Sample standard deviation; 0 for fewer than two returns or zero deviation
double calculate_sharpe_ratio(const std::vector<double>& returns, double risk_free_rate = 0.02,
                              int periods_per_year = 252);
// Downside deviation over negative returns only; +inf when there are none
double calculate_sortino_ratio(const std::vector<double>& returns, double risk_free_rate = 0.02,
                               int periods_per_year = 252);

TradeStats calculate_trade_stats(const std::vector<double>& trade_pnls);

double calculate_correlation(const std::vector<double>& returns1, const std::vector<double>& returns2);
// 1 when there is not enough data or the market series is flat
double calculate_beta(const std::vector<double>& asset_returns, const std::vector<double>& market_returns);

// ATR-based when atr > 0, percentage-based otherwise
double calculate_stop_loss(double entry_price, double risk_percentage, Direction direction,
                           double atr = 0.0, double atr_multiplier = 2.0);
double calculate_take_profit(double entry_price, double stop_loss, double risk_reward_ratio, Direction direction);

// Period-over-period returns of an equity curve
std::vector<double> returns_from_equity(const std::vector<double>& equity_curve);

} // namespace risk
