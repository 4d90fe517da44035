#include "risk_engine.hpp"
#include "../utils/constants.hpp"
#include "../utils/logging/log_helper.hpp"
#include <algorithm>
#include <cstdio>
#include <ctime>
#include <numeric>
#include <stdexcept>

namespace risk {

namespace {

std::string fixed(double value, int decimals) {
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%.*f", decimals, value);
    return buffer;
}

// Shortest representation, so 0.1 * 100 prints as "10"
std::string compact(double value) {
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%g", value);
    return buffer;
}

std::chrono::system_clock::time_point local_midnight(std::chrono::system_clock::time_point t) {
    std::time_t tt = std::chrono::system_clock::to_time_t(t);
    std::tm tm{};
    localtime_r(&tt, &tm);
    tm.tm_hour = 0;
    tm.tm_min = 0;
    tm.tm_sec = 0;
    return std::chrono::system_clock::from_time_t(std::mktime(&tm));
}

} // namespace

RiskEngine::RiskEngine(double initial_equity, RiskLimits limits, double risk_free_rate,
                       int periods_per_year, Clock clock)
    : initial_equity_(initial_equity),
      risk_free_rate_(risk_free_rate),
      periods_per_year_(periods_per_year),
      clock_(std::move(clock)),
      limits_(limits),
      current_equity_(initial_equity) {
    equity_curve_.push_back(initial_equity);
}

std::chrono::system_clock::time_point RiskEngine::now() const {
    return clock_ ? clock_() : std::chrono::system_clock::now();
}

std::string RiskEngine::next_id(const char* prefix) {
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now().time_since_epoch()).count();
    return std::string(prefix) + "_" + std::to_string(millis) + "_" + std::to_string(++sequence_);
}

PositionSizeResult RiskEngine::calculate_position(PositionSizingMethod method, double risk_percentage,
                                                  double fixed_amount, double volatility,
                                                  double avg_volatility) const {
    std::vector<double> pnls;
    double equity;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pnls.reserve(trades_.size());
        for (const auto& trade : trades_) {
            pnls.push_back(trade.pnl);
        }
        equity = current_equity_;
    }

    const TradeStats stats = calculate_trade_stats(pnls);

    PositionSizeParams params;
    params.method = method;
    params.account_balance = equity;
    params.risk_percentage = risk_percentage;
    // Without history the sizing assumes a coin flip with symmetric payoff
    params.win_rate = stats.win_rate > 0.0 ? stats.win_rate : 0.5;
    params.avg_win = stats.avg_win > 0.0 ? stats.avg_win : 1.0;
    params.avg_loss = stats.avg_loss > 0.0 ? stats.avg_loss : 1.0;
    params.fixed_amount = fixed_amount;
    params.volatility = volatility;
    params.avg_volatility = avg_volatility;
    return calculate_position_size(params);
}

TradeRiskCheck RiskEngine::check_trade_risk(const std::string& symbol, Direction direction, double size,
                                            double entry_price, double stop_loss, double take_profit) const {
    std::lock_guard<std::mutex> lock(mutex_);

    TradeRiskCheck result;
    double adjusted_size = size;

    if (static_cast<int>(positions_.size()) >= limits_.max_open_positions) {
        result.reason = "Max open positions (" + std::to_string(limits_.max_open_positions) + ") reached";
        return result;
    }

    const double position_value = size * entry_price;
    const double position_percent = current_equity_ > 0.0 ? position_value / current_equity_ : 0.0;
    if (position_percent > limits_.max_position_size && entry_price > 0.0) {
        adjusted_size = (limits_.max_position_size * current_equity_) / entry_price;
        result.warnings.push_back("Position size reduced from " + fixed(size, 4) + " to " + fixed(adjusted_size, 4) +
                                  " (max " + compact(limits_.max_position_size * 100.0) + "%)");
    }

    const RiskRewardResult rr = calculate_risk_reward(entry_price, stop_loss, take_profit);
    if (rr.risk_reward_ratio < limits_.min_risk_reward_ratio) {
        result.reason = "Risk/reward ratio " + fixed(rr.risk_reward_ratio, 2) + " below minimum " +
                        compact(limits_.min_risk_reward_ratio);
        return result;
    }

    const DrawdownResult drawdown = calculate_drawdown(equity_curve_);
    if (drawdown.current_drawdown_percent >= limits_.max_drawdown) {
        result.reason = "Current drawdown " + fixed(drawdown.current_drawdown_percent * 100.0, 1) +
                        "% exceeds limit " + compact(limits_.max_drawdown * 100.0) + "%";
        return result;
    }

    if (daily_pnl_percent_locked() <= -limits_.max_daily_loss) {
        result.reason = "Daily loss limit (" + compact(limits_.max_daily_loss * 100.0) + "%) reached";
        return result;
    }

    for (const auto& entry : positions_) {
        if (entry.second.symbol == symbol) {
            result.warnings.push_back("Already have open position in " + symbol);
            break;
        }
    }

    result.allowed = true;
    if (adjusted_size != size) {
        result.adjusted_size = adjusted_size;
    }
    LOG_DEBUG_COMP("RISK", "Risk check passed for " + to_string(direction) + " " + symbol + " size " +
                   fixed(adjusted_size, 6) + " with " + std::to_string(result.warnings.size()) + " warning(s)");
    return result;
}

TrackedPosition RiskEngine::open_position(const std::string& symbol, Direction direction, double size,
                                          double entry_price, double stop_loss, double take_profit) {
    TrackedPosition position;
    position.id = next_id("pos");
    position.symbol = symbol;
    position.direction = direction;
    position.entry_price = entry_price;
    position.current_price = entry_price;
    position.size = size;
    position.stop_loss = stop_loss;
    position.take_profit = take_profit;
    position.opened_at = now();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        positions_[position.id] = position;
    }

    LOG_DEBUG_COMP("RISK", "Opened " + to_string(direction) + " " + symbol + " size " + fixed(size, 6) +
                   " @ " + fixed(entry_price, 2) + " as " + position.id);
    return position;
}

std::optional<TrackedPosition> RiskEngine::update_position(const std::string& id, double current_price) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(id);
    if (it == positions_.end()) {
        return std::nullopt;
    }

    TrackedPosition& position = it->second;
    position.current_price = current_price;
    const double diff = position.direction == Direction::LONG ? current_price - position.entry_price
                                                              : position.entry_price - current_price;
    position.unrealized_pnl = diff * position.size;
    return position;
}

ClosedTrade RiskEngine::book_trade_locked(const TrackedPosition& position, double quantity, double exit_price) {
    const double diff = position.direction == Direction::LONG ? exit_price - position.entry_price
                                                              : position.entry_price - exit_price;
    ClosedTrade trade;
    trade.id = next_id("trade");
    trade.symbol = position.symbol;
    trade.direction = position.direction;
    trade.entry_price = position.entry_price;
    trade.exit_price = exit_price;
    trade.size = quantity;
    trade.pnl = diff * quantity;
    trade.pnl_percent = position.entry_price != 0.0 ? diff / position.entry_price : 0.0;
    trade.opened_at = position.opened_at;
    trade.closed_at = now();

    trades_.push_back(trade);
    current_equity_ += trade.pnl;
    equity_curve_.push_back(current_equity_);
    return trade;
}

std::optional<ClosedTrade> RiskEngine::close_position(const std::string& id, double exit_price) {
    ClosedTrade trade;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = positions_.find(id);
        if (it == positions_.end()) {
            return std::nullopt;
        }
        trade = book_trade_locked(it->second, it->second.size, exit_price);
        positions_.erase(it);
    }

    LOG_DEBUG_COMP("RISK", "Closed " + id + " " + trade.symbol + " pnl " + fixed(trade.pnl, 2));
    return trade;
}

std::optional<ClosedTrade> RiskEngine::reduce_position(const std::string& id, double quantity, double exit_price) {
    if (quantity <= 0.0) {
        throw std::invalid_argument("Reduce quantity must be positive");
    }

    ClosedTrade trade;
    double left = 0.0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = positions_.find(id);
        if (it == positions_.end()) {
            return std::nullopt;
        }

        TrackedPosition& position = it->second;
        const double closed = std::min(quantity, position.size);
        trade = book_trade_locked(position, closed, exit_price);

        position.size -= closed;
        left = position.size;
        if (left <= constants::order::FILLED_QTY_EPSILON) {
            positions_.erase(it);
            left = 0.0;
        } else {
            position.current_price = exit_price;
            const double diff = position.direction == Direction::LONG ? exit_price - position.entry_price
                                                                      : position.entry_price - exit_price;
            position.unrealized_pnl = diff * position.size;
        }
    }

    LOG_DEBUG_COMP("RISK", "Reduced " + id + " " + trade.symbol + " by " + fixed(trade.size, 6) + " pnl " +
                   fixed(trade.pnl, 2) + " remaining " + fixed(left, 6));
    return trade;
}

std::vector<TrackedPosition> RiskEngine::get_positions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TrackedPosition> result;
    result.reserve(positions_.size());
    for (const auto& entry : positions_) {
        result.push_back(entry.second);
    }
    return result;
}

std::optional<TrackedPosition> RiskEngine::get_position(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(id);
    if (it == positions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<ClosedTrade> RiskEngine::get_trades() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return trades_;
}

double RiskEngine::calculate_stop_loss(double entry_price, Direction direction, double risk_percent, double atr) const {
    return risk::calculate_stop_loss(entry_price, risk_percent, direction, atr, 2.0);
}

double RiskEngine::calculate_take_profit(double entry_price, double stop_loss, Direction direction,
                                         double risk_reward_ratio) const {
    return risk::calculate_take_profit(entry_price, stop_loss, risk_reward_ratio, direction);
}

RiskMetrics RiskEngine::get_metrics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    RiskMetrics metrics;

    for (const auto& entry : positions_) {
        metrics.unrealized_pnl += entry.second.unrealized_pnl;
        metrics.used_margin += entry.second.size * entry.second.entry_price;
    }

    std::vector<double> pnls;
    pnls.reserve(trades_.size());
    for (const auto& trade : trades_) {
        pnls.push_back(trade.pnl);
    }

    const std::vector<double> returns = returns_from_equity(equity_curve_);

    metrics.total_equity = current_equity_ + metrics.unrealized_pnl;
    metrics.available_capital = current_equity_ - metrics.used_margin;
    metrics.margin_usage_percent = current_equity_ > 0.0 ? metrics.used_margin / current_equity_ : 0.0;
    metrics.realized_pnl = current_equity_ - initial_equity_;
    metrics.daily_pnl = daily_pnl_locked();
    metrics.daily_pnl_percent = daily_pnl_percent_locked();
    metrics.open_positions = static_cast<int>(positions_.size());
    metrics.drawdown = calculate_drawdown(equity_curve_);
    metrics.var_95 = calculate_var(returns, constants::risk::VAR_CONFIDENCE);
    metrics.cvar_95 = calculate_cvar(returns, constants::risk::VAR_CONFIDENCE);
    metrics.sharpe_ratio = calculate_sharpe_ratio(returns, risk_free_rate_, periods_per_year_);
    metrics.sortino_ratio = calculate_sortino_ratio(returns, risk_free_rate_, periods_per_year_);
    metrics.trade_stats = calculate_trade_stats(pnls);
    return metrics;
}

RiskLimits RiskEngine::get_limits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return limits_;
}

void RiskEngine::update_limits(const RiskLimitsUpdate& update) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (update.max_position_size) limits_.max_position_size = *update.max_position_size;
        if (update.max_daily_loss) limits_.max_daily_loss = *update.max_daily_loss;
        if (update.max_drawdown) limits_.max_drawdown = *update.max_drawdown;
        if (update.max_open_positions) limits_.max_open_positions = *update.max_open_positions;
        if (update.max_correlated_positions) limits_.max_correlated_positions = *update.max_correlated_positions;
        if (update.min_risk_reward_ratio) limits_.min_risk_reward_ratio = *update.min_risk_reward_ratio;
    }
    LOG_INFO_COMP("RISK", "Risk limits updated");
}

void RiskEngine::record_daily_return() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (equity_curve_.size() < 2) {
        daily_returns_.push_back(0.0);
        return;
    }

    const double prev = equity_curve_[equity_curve_.size() - 2];
    const double curr = equity_curve_.back();
    daily_returns_.push_back(prev > 0.0 ? (curr - prev) / prev : 0.0);
}

std::vector<double> RiskEngine::get_daily_returns() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return daily_returns_;
}

std::vector<double> RiskEngine::get_equity_curve() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return equity_curve_;
}

double RiskEngine::current_equity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_equity_;
}

// Caller holds mutex_
double RiskEngine::daily_pnl_locked() const {
    const auto midnight = local_midnight(now());
    double total = 0.0;
    for (const auto& trade : trades_) {
        if (trade.closed_at >= midnight) {
            total += trade.pnl;
        }
    }
    return total;
}

// Caller holds mutex_
double RiskEngine::daily_pnl_percent_locked() const {
    return initial_equity_ > 0.0 ? daily_pnl_locked() / initial_equity_ : 0.0;
}

} // namespace risk
