#include "paper_execution_engine.hpp"
#include "../exchanges/gateway_utils.hpp"
#include "../utils/constants.hpp"
#include "../utils/error_handling.hpp"
#include "../utils/logging/log_helper.hpp"
#include "proto/trading_events.pb.h"
#include <algorithm>
#include <stdexcept>

namespace trading {

namespace {

bool matches(const std::optional<std::string>& filter, const std::string& symbol) {
    return !filter || filter->empty() || *filter == symbol;
}

bool is_resting(exchanges::OrderStatus status) {
    return status == exchanges::OrderStatus::PENDING || status == exchanges::OrderStatus::OPEN;
}

// Newest first, at most limit entries
template<typename Record>
std::vector<Record> newest_first(const std::vector<Record>& records, const std::optional<std::string>& symbol, int limit) {
    const size_t cap = limit > 0 ? static_cast<size_t>(limit)
                                 : static_cast<size_t>(constants::paper::DEFAULT_HISTORY_LIMIT);
    std::vector<Record> result;
    for (auto it = records.rbegin(); it != records.rend() && result.size() < cap; ++it) {
        if (matches(symbol, it->symbol)) {
            result.push_back(*it);
        }
    }
    return result;
}

int64_t to_millis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

} // namespace

PaperExecutionEngine::PaperExecutionEngine(std::shared_ptr<exchanges::IExchangeGateway> real, PaperConfig config)
    : real_(std::move(real)), config_(std::move(config)) {
    if (!real_) {
        throw std::invalid_argument("PaperExecutionEngine requires a venue gateway");
    }
    reset_locked();
}

exchanges::Ticker PaperExecutionEngine::get_ticker(const std::string& symbol) {
    return real_->get_ticker(symbol);
}

std::vector<exchanges::Ticker> PaperExecutionEngine::get_tickers(const std::vector<std::string>& symbols) {
    return real_->get_tickers(symbols);
}

exchanges::OrderBook PaperExecutionEngine::get_order_book(const std::string& symbol, int depth) {
    return real_->get_order_book(symbol, depth);
}

std::vector<exchanges::TradingPair> PaperExecutionEngine::get_trading_pairs() {
    return real_->get_trading_pairs();
}

std::vector<exchanges::Balance> PaperExecutionEngine::get_balances() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<exchanges::Balance> result;
    for (const auto& [asset, balance] : balances_) {
        if (balance.available > 0.0 || balance.locked > 0.0) {
            result.push_back({asset, balance.available, balance.locked});
        }
    }
    return result;
}

std::optional<exchanges::Balance> PaperExecutionEngine::get_balance(const std::string& asset) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = balances_.find(asset);
    if (it == balances_.end()) {
        return std::nullopt;
    }
    return exchanges::Balance{asset, it->second.available, it->second.locked};
}

exchanges::Order PaperExecutionEngine::create_order(const exchanges::OrderRequest& request) {
    if (request.quantity <= 0.0) {
        throw error_handling::InvalidRequestError("Order quantity must be positive");
    }
    const auto [base, quote] = exchanges::split_symbol(request.symbol);

    // Real price from the venue, fetched before taking the ledger lock
    const exchanges::Ticker ticker = real_->get_ticker(request.symbol);
    const double execution_price = request.price ? *request.price : ticker.price;
    if (execution_price <= 0.0) {
        throw error_handling::InvalidRequestError("No price available for " + request.symbol);
    }

    std::lock_guard<std::mutex> lock(mutex_);

    exchanges::Order order;
    order.id = next_id("paper");
    order.client_order_id = request.client_order_id ? *request.client_order_id : order.id;
    order.symbol = request.symbol;
    order.side = request.side;
    order.type = request.type;
    order.status = exchanges::OrderStatus::PENDING;
    order.quantity = request.quantity;
    order.price = execution_price;
    order.stop_price = request.stop_price;
    order.fee_currency = quote;
    order.created_at = std::chrono::system_clock::now();
    order.updated_at = order.created_at;

    if (request.type == exchanges::OrderType::MARKET) {
        fill_market_order(order, base, quote);
    } else {
        order.status = exchanges::OrderStatus::OPEN;
        LOG_INFO_COMP("PAPER", "Resting " + exchanges::to_string(order.type) + " " +
                      exchanges::to_string(order.side) + " " + order.symbol + " " + order.id);
    }

    order.updated_at = std::chrono::system_clock::now();
    orders_.push_back(order);
    return order;
}

// Caller holds mutex_. Throws InsufficientBalanceError after recording the order as rejected.
void PaperExecutionEngine::fill_market_order(exchanges::Order& order, const std::string& base, const std::string& quote) {
    const double price = *order.price;
    const double cost = order.quantity * price;
    const double fee = cost * config_.fee_rate;

    auto reject = [&](const std::string& asset, double required, double available) {
        order.status = exchanges::OrderStatus::REJECTED;
        order.updated_at = std::chrono::system_clock::now();
        orders_.push_back(order);
        LOG_INFO_COMP("PAPER", "Rejected " + exchanges::to_string(order.side) + " " + order.symbol +
                      ": insufficient " + asset);
        throw error_handling::InsufficientBalanceError(asset, required, available);
    };

    if (order.side == exchanges::OrderSide::BUY) {
        LedgerBalance& quote_balance = balances_[quote];
        if (quote_balance.available < cost + fee) {
            reject(quote, cost + fee, quote_balance.available);
        }
        quote_balance.available -= cost + fee;
        balances_[base].available += order.quantity;

        LedgerPosition& position = positions_[order.symbol];
        position.quantity += order.quantity;
        position.total_cost += cost;
    } else {
        LedgerBalance& base_balance = balances_[base];
        if (base_balance.available < order.quantity) {
            reject(base, order.quantity, base_balance.available);
        }
        base_balance.available -= order.quantity;
        balances_[quote].available += cost - fee;

        auto it = positions_.find(order.symbol);
        if (it != positions_.end() && it->second.quantity > 0.0) {
            LedgerPosition& position = it->second;
            const double average_entry = position.total_cost / position.quantity;
            position.quantity -= order.quantity;
            position.total_cost -= order.quantity * average_entry;
            if (position.quantity < constants::paper::POSITION_EPSILON) {
                positions_.erase(it);
            }
        }
    }

    order.status = exchanges::OrderStatus::FILLED;
    order.filled_quantity = order.quantity;
    order.average_price = price;
    order.fee = fee;

    exchanges::Trade trade;
    trade.id = next_id("paper_trade");
    trade.order_id = order.id;
    trade.symbol = order.symbol;
    trade.side = order.side;
    trade.quantity = order.quantity;
    trade.price = price;
    trade.fee = fee;
    trade.fee_currency = quote;
    trade.timestamp = std::chrono::system_clock::now();
    trades_.push_back(trade);

    LOG_INFO_COMP("PAPER", "Filled " + exchanges::to_string(order.side) + " " + std::to_string(order.quantity) +
                  " " + order.symbol + " @ " + std::to_string(price));
}

bool PaperExecutionEngine::cancel_order(const std::string& order_id, const std::optional<std::string>& /*symbol*/) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& order : orders_) {
        if (order.id == order_id) {
            if (!is_resting(order.status)) {
                return false;
            }
            order.status = exchanges::OrderStatus::CANCELLED;
            order.updated_at = std::chrono::system_clock::now();
            LOG_INFO_COMP("PAPER", "Cancelled " + order_id);
            return true;
        }
    }
    return false;
}

std::optional<exchanges::Order> PaperExecutionEngine::get_order(const std::string& order_id,
                                                                const std::optional<std::string>& /*symbol*/) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& order : orders_) {
        if (order.id == order_id) {
            return order;
        }
    }
    return std::nullopt;
}

std::vector<exchanges::Order> PaperExecutionEngine::get_open_orders(const std::optional<std::string>& symbol) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<exchanges::Order> result;
    for (const auto& order : orders_) {
        if (is_resting(order.status) && matches(symbol, order.symbol)) {
            result.push_back(order);
        }
    }
    return result;
}

std::vector<exchanges::Order> PaperExecutionEngine::get_order_history(const std::optional<std::string>& symbol, int limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    return newest_first(orders_, symbol, limit);
}

std::vector<exchanges::Position> PaperExecutionEngine::get_positions() {
    std::map<std::string, LedgerPosition> held;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        held = positions_;
    }

    std::vector<exchanges::Position> result;
    for (const auto& [symbol, ledger] : held) {
        if (ledger.quantity <= constants::paper::POSITION_EPSILON) {
            continue;
        }

        const double current_price = real_->get_ticker(symbol).price;
        exchanges::Position position;
        position.symbol = symbol;
        position.side = exchanges::PositionSide::LONG;
        position.quantity = ledger.quantity;
        position.entry_price = ledger.total_cost / ledger.quantity;
        position.current_price = current_price;
        position.unrealized_pnl = (current_price - position.entry_price) * ledger.quantity;
        position.unrealized_pnl_percent = position.entry_price > 0.0
            ? (current_price - position.entry_price) / position.entry_price * 100.0
            : 0.0;
        result.push_back(position);
    }
    return result;
}

std::vector<exchanges::Trade> PaperExecutionEngine::get_trades(const std::optional<std::string>& symbol, int limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    return newest_first(trades_, symbol, limit);
}

void PaperExecutionEngine::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    reset_locked();
    LOG_INFO_COMP("PAPER", "Paper account for " + id() + " reset");
}

void PaperExecutionEngine::reset_locked() {
    balances_.clear();
    positions_.clear();
    orders_.clear();
    trades_.clear();
    for (const auto& asset : config_.quote_assets) {
        balances_[asset] = LedgerBalance{config_.initial_balance, 0.0};
    }
}

std::string PaperExecutionEngine::next_id(const char* prefix) {
    return std::string(prefix) + "_" + std::to_string(exchanges::now_millis()) + "_" + std::to_string(++sequence_);
}

proto::PaperLedgerSnapshot PaperExecutionEngine::snapshot() const {
    proto::PaperLedgerSnapshot snapshot;
    snapshot.set_exchange_id(real_->id());
    snapshot.set_taken_at_ms(exchanges::now_millis());

    std::lock_guard<std::mutex> lock(mutex_);
    snapshot.set_order_sequence(sequence_);

    for (const auto& [asset, balance] : balances_) {
        auto* entry = snapshot.add_balances();
        entry->set_asset(asset);
        entry->set_available(balance.available);
        entry->set_locked(balance.locked);
    }

    for (const auto& [symbol, position] : positions_) {
        auto* entry = snapshot.add_positions();
        entry->set_symbol(symbol);
        entry->set_side(exchanges::to_string(exchanges::PositionSide::LONG));
        entry->set_quantity(position.quantity);
        entry->set_entry_price(position.quantity > 0.0 ? position.total_cost / position.quantity : 0.0);
    }

    for (const auto& order : orders_) {
        auto* entry = snapshot.add_orders();
        entry->set_id(order.id);
        entry->set_client_order_id(order.client_order_id);
        entry->set_symbol(order.symbol);
        entry->set_side(exchanges::to_string(order.side));
        entry->set_type(exchanges::to_string(order.type));
        entry->set_status(exchanges::to_string(order.status));
        entry->set_quantity(order.quantity);
        entry->set_filled_quantity(order.filled_quantity);
        entry->set_has_price(order.price.has_value());
        entry->set_price(order.price.value_or(0.0));
        entry->set_has_stop_price(order.stop_price.has_value());
        entry->set_stop_price(order.stop_price.value_or(0.0));
        entry->set_average_price(order.average_price);
        entry->set_fee(order.fee);
        entry->set_fee_currency(order.fee_currency);
        entry->set_created_at_ms(to_millis(order.created_at));
        entry->set_updated_at_ms(to_millis(order.updated_at));
    }

    for (const auto& trade : trades_) {
        auto* entry = snapshot.add_trades();
        entry->set_id(trade.id);
        entry->set_order_id(trade.order_id);
        entry->set_symbol(trade.symbol);
        entry->set_side(exchanges::to_string(trade.side));
        entry->set_quantity(trade.quantity);
        entry->set_price(trade.price);
        entry->set_fee(trade.fee);
        entry->set_fee_currency(trade.fee_currency);
        entry->set_timestamp_ms(to_millis(trade.timestamp));
    }
    return snapshot;
}

void PaperExecutionEngine::restore(const proto::PaperLedgerSnapshot& snapshot) {
    if (!snapshot.exchange_id().empty() && snapshot.exchange_id() != real_->id()) {
        throw error_handling::InvalidRequestError("Paper snapshot is for " + snapshot.exchange_id() +
                                                  ", not " + real_->id());
    }

    // Parse everything before touching the ledger so a bad snapshot leaves it unchanged
    std::map<std::string, LedgerBalance> balances;
    for (const auto& entry : snapshot.balances()) {
        if (entry.available() < 0.0 || entry.locked() < 0.0) {
            throw error_handling::InvalidRequestError("Negative balance in paper snapshot for " + entry.asset());
        }
        balances[entry.asset()] = LedgerBalance{entry.available(), entry.locked()};
    }

    std::map<std::string, LedgerPosition> positions;
    for (const auto& entry : snapshot.positions()) {
        positions[entry.symbol()] = LedgerPosition{entry.quantity(), entry.quantity() * entry.entry_price()};
    }

    std::vector<exchanges::Order> orders;
    for (const auto& entry : snapshot.orders()) {
        exchanges::Order order;
        order.id = entry.id();
        order.client_order_id = entry.client_order_id();
        order.symbol = entry.symbol();
        order.side = exchanges::parse_order_side(entry.side());
        order.type = exchanges::parse_order_type(entry.type());
        order.status = exchanges::parse_order_status(entry.status());
        order.quantity = entry.quantity();
        order.filled_quantity = entry.filled_quantity();
        if (entry.has_price()) order.price = entry.price();
        if (entry.has_stop_price()) order.stop_price = entry.stop_price();
        order.average_price = entry.average_price();
        order.fee = entry.fee();
        order.fee_currency = entry.fee_currency();
        order.created_at = exchanges::from_millis(entry.created_at_ms());
        order.updated_at = exchanges::from_millis(entry.updated_at_ms());
        orders.push_back(std::move(order));
    }

    std::vector<exchanges::Trade> trades;
    for (const auto& entry : snapshot.trades()) {
        exchanges::Trade trade;
        trade.id = entry.id();
        trade.order_id = entry.order_id();
        trade.symbol = entry.symbol();
        trade.side = exchanges::parse_order_side(entry.side());
        trade.quantity = entry.quantity();
        trade.price = entry.price();
        trade.fee = entry.fee();
        trade.fee_currency = entry.fee_currency();
        trade.timestamp = exchanges::from_millis(entry.timestamp_ms());
        trades.push_back(std::move(trade));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    balances_ = std::move(balances);
    positions_ = std::move(positions);
    orders_ = std::move(orders);
    trades_ = std::move(trades);
    sequence_ = std::max<uint64_t>(sequence_, snapshot.order_sequence());
    LOG_INFO_COMP("PAPER", "Restored paper ledger with " + std::to_string(orders_.size()) + " orders");
}

} // namespace trading
