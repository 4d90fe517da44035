#include "risk_calculations.hpp"
#include "../utils/constants.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <stdexcept>

namespace risk {

namespace {

double mean(const std::vector<double>& values, size_t n) {
    if (n == 0) return 0.0;
    return std::accumulate(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(n), 0.0) / static_cast<double>(n);
}

size_t percentile_index(size_t size, double confidence_level) {
    double raw = std::floor((1.0 - confidence_level) * static_cast<double>(size));
    if (raw < 0.0) return 0;
    return std::min(static_cast<size_t>(raw), size - 1);
}

} // namespace

std::string to_string(Direction direction) {
    return direction == Direction::LONG ? "long" : "short";
}

Direction parse_direction(const std::string& name) {
    if (name == "long") return Direction::LONG;
    if (name == "short") return Direction::SHORT;
    throw std::invalid_argument("Unknown direction: " + name);
}

std::string to_string(PositionSizingMethod method) {
    switch (method) {
        case PositionSizingMethod::FIXED_PERCENTAGE: return "fixed_percentage";
        case PositionSizingMethod::KELLY_CRITERION: return "kelly_criterion";
        case PositionSizingMethod::FIXED_AMOUNT: return "fixed_amount";
        case PositionSizingMethod::VOLATILITY_ADJUSTED: return "volatility_adjusted";
        default: return "unknown";
    }
}

PositionSizingMethod parse_sizing_method(const std::string& name) {
    if (name == "fixed_percentage") return PositionSizingMethod::FIXED_PERCENTAGE;
    if (name == "kelly_criterion" || name == "kelly") return PositionSizingMethod::KELLY_CRITERION;
    if (name == "fixed_amount") return PositionSizingMethod::FIXED_AMOUNT;
    if (name == "volatility_adjusted") return PositionSizingMethod::VOLATILITY_ADJUSTED;
    throw std::invalid_argument("Unknown position sizing method: " + name);
}

PositionSizeResult calculate_position_size(const PositionSizeParams& params) {
    const double balance = params.account_balance;
    double risk_amount = 0.0;

    switch (params.method) {
        case PositionSizingMethod::FIXED_PERCENTAGE:
            risk_amount = balance * params.risk_percentage;
            break;

        case PositionSizingMethod::KELLY_CRITERION: {
            double kelly = std::clamp(calculate_kelly_fraction(params.win_rate, params.avg_win, params.avg_loss), 0.0, 1.0);
            double half_kelly = kelly * 0.5;
            risk_amount = balance * std::clamp(half_kelly, 0.0, constants::risk::KELLY_CAP);
            break;
        }

        case PositionSizingMethod::FIXED_AMOUNT:
            risk_amount = std::min(params.fixed_amount, balance * constants::risk::FIXED_AMOUNT_CAP);
            break;

        case PositionSizingMethod::VOLATILITY_ADJUSTED: {
            double adjustment = params.avg_volatility > 0.0
                ? params.avg_volatility / std::max(params.volatility, constants::risk::MIN_VOLATILITY)
                : 1.0;
            risk_amount = balance * params.risk_percentage *
                          std::min(adjustment, constants::risk::VOLATILITY_MULTIPLIER_CAP);
            break;
        }
    }

    PositionSizeResult result;
    result.method = params.method;
    result.position_size = risk_amount;
    result.risk_amount = risk_amount;
    result.risk_percentage = balance > 0.0 ? risk_amount / balance : 0.0;
    result.max_loss = risk_amount;
    return result;
}

double calculate_kelly_fraction(double win_rate, double avg_win, double avg_loss) {
    if (avg_loss <= 0.0 || win_rate < 0.0 || win_rate > 1.0 || avg_win <= 0.0) {
        return 0.0;
    }

    const double b = avg_win / avg_loss;
    const double p = win_rate;
    const double q = 1.0 - win_rate;

    return std::max(0.0, (b * p - q) / b);
}

RiskRewardResult calculate_risk_reward(double entry_price, double stop_loss, double take_profit) {
    RiskRewardResult result;
    result.risk_amount = std::abs(entry_price - stop_loss);
    result.reward_amount = std::abs(take_profit - entry_price);
    result.risk_reward_ratio = result.risk_amount > 0.0 ? result.reward_amount / result.risk_amount : 0.0;
    result.break_even_win_rate = result.risk_reward_ratio > 0.0 ? 1.0 / (1.0 + result.risk_reward_ratio) : 1.0;
    return result;
}

double calculate_var(const std::vector<double>& returns, double confidence_level) {
    if (returns.empty()) return 0.0;

    std::vector<double> sorted(returns);
    std::sort(sorted.begin(), sorted.end());
    return -sorted[percentile_index(sorted.size(), confidence_level)];
}

double calculate_cvar(const std::vector<double>& returns, double confidence_level) {
    if (returns.empty()) return 0.0;

    std::vector<double> sorted(returns);
    std::sort(sorted.begin(), sorted.end());
    size_t tail = std::max<size_t>(1, percentile_index(sorted.size(), confidence_level));
    return -mean(sorted, tail);
}

DrawdownResult calculate_drawdown(const std::vector<double>& equity_curve) {
    DrawdownResult result;
    if (equity_curve.empty()) {
        return result;
    }

    double peak = equity_curve.front();
    result.peak_value = peak;
    result.trough_value = peak;

    for (double value : equity_curve) {
        if (value > peak) {
            peak = value;
        }

        const double drawdown = peak - value;
        const double drawdown_percent = peak > 0.0 ? drawdown / peak : 0.0;

        if (drawdown_percent > result.max_drawdown_percent) {
            result.max_drawdown = drawdown;
            result.max_drawdown_percent = drawdown_percent;
            result.peak_value = peak;
            result.trough_value = value;
        }
    }

    // peak is now the running maximum of the whole curve
    const double current = equity_curve.back();
    result.current_drawdown = peak - current;
    result.current_drawdown_percent = peak > 0.0 ? result.current_drawdown / peak : 0.0;
    return result;
}

double calculate_sharpe_ratio(const std::vector<double>& returns, double risk_free_rate, int periods_per_year) {
    if (returns.size() < 2) return 0.0;

    const double avg = mean(returns, returns.size());
    double variance = 0.0;
    for (double r : returns) {
        variance += (r - avg) * (r - avg);
    }
    variance /= static_cast<double>(returns.size() - 1);
    const double std_dev = std::sqrt(variance);

    if (std_dev == 0.0) return 0.0;

    const double annualized_return = avg * periods_per_year;
    const double annualized_std_dev = std_dev * std::sqrt(static_cast<double>(periods_per_year));
    return (annualized_return - risk_free_rate) / annualized_std_dev;
}

double calculate_sortino_ratio(const std::vector<double>& returns, double risk_free_rate, int periods_per_year) {
    if (returns.size() < 2) return 0.0;

    const double avg = mean(returns, returns.size());

    double downside_sum = 0.0;
    size_t negatives = 0;
    for (double r : returns) {
        if (r < 0.0) {
            downside_sum += r * r;
            negatives++;
        }
    }
    if (negatives == 0) return std::numeric_limits<double>::infinity();

    const double downside_deviation = std::sqrt(downside_sum / static_cast<double>(negatives));
    if (downside_deviation == 0.0) return 0.0;

    const double annualized_return = avg * periods_per_year;
    const double annualized_downside = downside_deviation * std::sqrt(static_cast<double>(periods_per_year));
    return (annualized_return - risk_free_rate) / annualized_downside;
}

TradeStats calculate_trade_stats(const std::vector<double>& trade_pnls) {
    TradeStats stats;
    if (trade_pnls.empty()) {
        return stats;
    }

    double total_win = 0.0;
    double total_loss = 0.0;
    for (double pnl : trade_pnls) {
        if (pnl > 0.0) {
            stats.winning_trades++;
            total_win += pnl;
        } else if (pnl < 0.0) {
            stats.losing_trades++;
            total_loss += -pnl;
        }
    }

    stats.total_trades = static_cast<int>(trade_pnls.size());
    stats.avg_win = stats.winning_trades > 0 ? total_win / stats.winning_trades : 0.0;
    stats.avg_loss = stats.losing_trades > 0 ? total_loss / stats.losing_trades : 0.0;
    stats.win_rate = static_cast<double>(stats.winning_trades) / stats.total_trades;

    if (total_loss > 0.0) {
        stats.profit_factor = total_win / total_loss;
    } else {
        stats.profit_factor = total_win > 0.0 ? std::numeric_limits<double>::infinity() : 0.0;
    }
    stats.expectancy = stats.win_rate * stats.avg_win - (1.0 - stats.win_rate) * stats.avg_loss;
    return stats;
}

double calculate_correlation(const std::vector<double>& returns1, const std::vector<double>& returns2) {
    const size_t n = std::min(returns1.size(), returns2.size());
    if (n < 2) return 0.0;

    const double mean1 = mean(returns1, n);
    const double mean2 = mean(returns2, n);

    double covariance = 0.0;
    double variance1 = 0.0;
    double variance2 = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const double d1 = returns1[i] - mean1;
        const double d2 = returns2[i] - mean2;
        covariance += d1 * d2;
        variance1 += d1 * d1;
        variance2 += d2 * d2;
    }

    if (variance1 == 0.0 || variance2 == 0.0) return 0.0;
    return covariance / std::sqrt(variance1 * variance2);
}

double calculate_beta(const std::vector<double>& asset_returns, const std::vector<double>& market_returns) {
    const size_t n = std::min(asset_returns.size(), market_returns.size());
    if (n < 2) return 1.0;

    const double mean_asset = mean(asset_returns, n);
    const double mean_market = mean(market_returns, n);

    double covariance = 0.0;
    double market_variance = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const double da = asset_returns[i] - mean_asset;
        const double dm = market_returns[i] - mean_market;
        covariance += da * dm;
        market_variance += dm * dm;
    }

    if (market_variance == 0.0) return 1.0;
    return covariance / market_variance;
}

double calculate_stop_loss(double entry_price, double risk_percentage, Direction direction,
                           double atr, double atr_multiplier) {
    if (atr > 0.0) {
        const double atr_stop = atr * atr_multiplier;
        return direction == Direction::LONG ? entry_price - atr_stop : entry_price + atr_stop;
    }
    return direction == Direction::LONG ? entry_price * (1.0 - risk_percentage)
                                        : entry_price * (1.0 + risk_percentage);
}

double calculate_take_profit(double entry_price, double stop_loss, double risk_reward_ratio, Direction direction) {
    const double reward = std::abs(entry_price - stop_loss) * risk_reward_ratio;
    return direction == Direction::LONG ? entry_price + reward : entry_price - reward;
}

std::vector<double> returns_from_equity(const std::vector<double>& equity_curve) {
    std::vector<double> returns;
    if (equity_curve.size() < 2) return returns;

    returns.reserve(equity_curve.size() - 1);
    for (size_t i = 1; i < equity_curve.size(); ++i) {
        const double prev = equity_curve[i - 1];
        returns.push_back(prev > 0.0 ? (equity_curve[i] - prev) / prev : 0.0);
    }
    return returns;
}

} // namespace risk
