#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace exchanges {

enum class OrderSide {
    BUY,
    SELL
};

enum class OrderType {
    MARKET,
    LIMIT,
    STOP_LOSS,
    TAKE_PROFIT
};

// pending -> open -> (partially_filled ->) filled | cancelled, or pending -> rejected
enum class OrderStatus {
    PENDING,
    OPEN,
    PARTIALLY_FILLED,
    FILLED,
    CANCELLED,
    REJECTED
};

enum class PositionSide {
    LONG,
    SHORT
};

std::string to_string(OrderSide side);
std::string to_string(OrderType type);
std::string to_string(OrderStatus status);
std::string to_string(PositionSide side);

// Parsers accept the lowercase names produced by to_string; throw InvalidRequestError otherwise
OrderSide parse_order_side(const std::string& value);
OrderType parse_order_type(const std::string& value);
OrderStatus parse_order_status(const std::string& value);

bool is_terminal(OrderStatus status);

// Owned by exactly one user; never logged
struct ExchangeCredentials {
    std::string api_key;
    std::string api_secret;
    std::optional<std::string> passphrase;
    bool sandbox = false;
};

struct Ticker {
    std::string symbol;
    double price = 0.0;
    double bid = 0.0;
    double ask = 0.0;
    double volume_24h = 0.0;
    double change_24h = 0.0;
    double change_percent_24h = 0.0;
    double high_24h = 0.0;
    double low_24h = 0.0;
    std::chrono::system_clock::time_point timestamp;
};

struct PriceLevel {
    double price = 0.0;
    double quantity = 0.0;
};

struct OrderBook {
    std::string symbol;
    std::vector<PriceLevel> bids;   // best first
    std::vector<PriceLevel> asks;   // best first
    std::chrono::system_clock::time_point timestamp;
};

struct TradingPair {
    std::string symbol;             // canonical BASE/QUOTE
    std::string base;
    std::string quote;
    std::string native_symbol;      // venue identifier
    double min_quantity = 0.0;
    double step_size = 0.0;
    double tick_size = 0.0;
};

struct Balance {
    std::string asset;
    double available = 0.0;
    double locked = 0.0;

    double total() const { return available + locked; }
};

struct OrderRequest {
    std::string symbol;
    OrderSide side = OrderSide::BUY;
    OrderType type = OrderType::MARKET;
    double quantity = 0.0;
    std::optional<double> price;
    std::optional<double> stop_price;
    std::optional<std::string> client_order_id;
};

struct Order {
    std::string id;
    std::string client_order_id;
    std::string symbol;
    OrderSide side = OrderSide::BUY;
    OrderType type = OrderType::MARKET;
    OrderStatus status = OrderStatus::PENDING;
    double quantity = 0.0;
    double filled_quantity = 0.0;
    std::optional<double> price;
    std::optional<double> stop_price;
    double average_price = 0.0;
    double fee = 0.0;
    std::string fee_currency;
    std::chrono::system_clock::time_point created_at;
    std::chrono::system_clock::time_point updated_at;
};

// Immutable fill record
struct Trade {
    std::string id;
    std::string order_id;
    std::string symbol;
    OrderSide side = OrderSide::BUY;
    double quantity = 0.0;
    double price = 0.0;
    double fee = 0.0;
    std::string fee_currency;
    std::chrono::system_clock::time_point timestamp;
};

struct Position {
    std::string symbol;
    PositionSide side = PositionSide::LONG;
    double quantity = 0.0;
    double entry_price = 0.0;
    double current_price = 0.0;
    double unrealized_pnl = 0.0;
    double unrealized_pnl_percent = 0.0;
};

// Splits canonical "BASE/QUOTE"; throws InvalidRequestError on anything else
std::pair<std::string, std::string> split_symbol(const std::string& symbol);
std::string join_symbol(const std::string& base, const std::string& quote);

} // namespace exchanges
