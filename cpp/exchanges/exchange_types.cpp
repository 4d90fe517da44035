#include "exchange_types.hpp"
#include "../utils/error_handling.hpp"

namespace exchanges {

std::string to_string(OrderSide side) {
    return side == OrderSide::BUY ? "buy" : "sell";
}

std::string to_string(OrderType type) {
    switch (type) {
        case OrderType::MARKET: return "market";
        case OrderType::LIMIT: return "limit";
        case OrderType::STOP_LOSS: return "stop_loss";
        case OrderType::TAKE_PROFIT: return "take_profit";
        default: return "unknown";
    }
}

std::string to_string(OrderStatus status) {
    switch (status) {
        case OrderStatus::PENDING: return "pending";
        case OrderStatus::OPEN: return "open";
        case OrderStatus::PARTIALLY_FILLED: return "partially_filled";
        case OrderStatus::FILLED: return "filled";
        case OrderStatus::CANCELLED: return "cancelled";
        case OrderStatus::REJECTED: return "rejected";
        default: return "unknown";
    }
}

std::string to_string(PositionSide side) {
    return side == PositionSide::LONG ? "long" : "short";
}

OrderSide parse_order_side(const std::string& value) {
    if (value == "buy") return OrderSide::BUY;
    if (value == "sell") return OrderSide::SELL;
    throw error_handling::InvalidRequestError("Unknown order side: " + value);
}

OrderType parse_order_type(const std::string& value) {
    if (value == "market") return OrderType::MARKET;
    if (value == "limit") return OrderType::LIMIT;
    if (value == "stop_loss") return OrderType::STOP_LOSS;
    if (value == "take_profit") return OrderType::TAKE_PROFIT;
    throw error_handling::InvalidRequestError("Unknown order type: " + value);
}

OrderStatus parse_order_status(const std::string& value) {
    if (value == "pending") return OrderStatus::PENDING;
    if (value == "open") return OrderStatus::OPEN;
    if (value == "partially_filled") return OrderStatus::PARTIALLY_FILLED;
    if (value == "filled") return OrderStatus::FILLED;
    if (value == "cancelled") return OrderStatus::CANCELLED;
    if (value == "rejected") return OrderStatus::REJECTED;
    throw error_handling::InvalidRequestError("Unknown order status: " + value);
}

bool is_terminal(OrderStatus status) {
    return status == OrderStatus::FILLED || status == OrderStatus::CANCELLED ||
           status == OrderStatus::REJECTED;
}

std::pair<std::string, std::string> split_symbol(const std::string& symbol) {
    auto slash = symbol.find('/');
    if (slash == std::string::npos || slash == 0 || slash + 1 >= symbol.size() ||
        symbol.find('/', slash + 1) != std::string::npos) {
        throw error_handling::InvalidRequestError("Symbol must be in BASE/QUOTE form: " + symbol);
    }
    return {symbol.substr(0, slash), symbol.substr(slash + 1)};
}

std::string join_symbol(const std::string& base, const std::string& quote) {
    return base + "/" + quote;
}

} // namespace exchanges
