#include "binance_gateway.hpp"
#include "../../gateway_utils.hpp"
#include "../../../utils/constants.hpp"
#include "../../../utils/error_handling.hpp"
#include "../../../utils/logging/log_helper.hpp"
#include <algorithm>
#include <cstdio>

namespace binance {

namespace {

const char* EXCHANGE = "binance";

// Quote assets tried, longest first, when splitting an unregistered native symbol
const std::vector<std::string>& known_quotes() {
    static const std::vector<std::string> quotes = {
        "FDUSD", "USDT", "USDC", "BUSD", "TUSD", "BTC", "ETH", "BNB", "EUR", "TRY", "USD"
    };
    return quotes;
}

// Balances in these assets are cash, not positions
bool is_cash_asset(const std::string& asset) {
    return asset == "USDT" || asset == "USDC" || asset == "BUSD" || asset == "FDUSD" ||
           asset == "TUSD" || asset == "USD";
}

exchanges::SymbolMap make_symbol_map() {
    return exchanges::SymbolMap(
        EXCHANGE,
        [](const std::string& base, const std::string& quote) { return base + quote; },
        [](const std::string& native) -> std::optional<std::pair<std::string, std::string>> {
            for (const auto& quote : known_quotes()) {
                if (native.size() > quote.size() &&
                    native.compare(native.size() - quote.size(), quote.size(), quote) == 0) {
                    return std::make_pair(native.substr(0, native.size() - quote.size()), quote);
                }
            }
            return std::nullopt;
        });
}

std::string side_to_binance(exchanges::OrderSide side) {
    return side == exchanges::OrderSide::BUY ? "BUY" : "SELL";
}

exchanges::OrderSide side_from_binance(const std::string& side) {
    return side == "SELL" ? exchanges::OrderSide::SELL : exchanges::OrderSide::BUY;
}

} // namespace

BinanceGateway::BinanceGateway(exchanges::ExchangeCredentials credentials, BinanceConfig config,
                               std::shared_ptr<IHttpHandler> http)
    : credentials_(std::move(credentials)),
      config_(std::move(config)),
      http_(std::move(http)),
      symbols_(make_symbol_map()) {
    if (!http_) {
        throw std::invalid_argument("BinanceGateway requires an HTTP handler");
    }

    if (!config_.base_url.empty()) {
        base_url_ = config_.base_url;
    } else {
        base_url_ = credentials_.sandbox ? constants::exchange::binance::TESTNET_HTTP_URL
                                         : constants::exchange::binance::DEFAULT_HTTP_URL;
    }
}

void BinanceGateway::connect() {
    connected_.store(true);
    LOG_INFO_COMP("BINANCE", "Connected to " + base_url_);
}

void BinanceGateway::disconnect() {
    connected_.store(false);
    LOG_INFO_COMP("BINANCE", "Disconnected");
}

bool BinanceGateway::test_connection() {
    try {
        signed_request("GET", "/api/v3/account", {});
        return true;
    } catch (const error_handling::ExchangeError& e) {
        LOG_WARN_COMP("BINANCE", "Connection test failed: " + std::string(e.what()));
        return false;
    }
}

exchanges::Ticker BinanceGateway::get_ticker(const std::string& symbol) {
    Json::Value node = public_get("/api/v3/ticker/24hr", {{"symbol", symbols_.to_native(symbol)}});
    exchanges::Ticker ticker = parse_ticker(node);
    ticker.symbol = symbol;
    return ticker;
}

std::vector<exchanges::Ticker> BinanceGateway::get_tickers(const std::vector<std::string>& symbols) {
    std::vector<exchanges::Ticker> tickers;

    if (symbols.empty()) {
        Json::Value all = public_get("/api/v3/ticker/24hr", {});
        for (const auto& node : all) {
            try {
                exchanges::Ticker ticker = parse_ticker(node);
                ticker.symbol = symbols_.to_canonical(exchanges::json_string(node, "symbol"));
                tickers.push_back(std::move(ticker));
            } catch (const error_handling::InvalidRequestError&) {
                // Native symbols with an unrecognised quote asset are not advertised
                continue;
            }
        }
        return tickers;
    }

    Json::Value natives(Json::arrayValue);
    for (const auto& symbol : symbols) {
        natives.append(symbols_.to_native(symbol));
    }

    Json::Value response = public_get("/api/v3/ticker/24hr", {{"symbols", exchanges::write_json(natives)}});
    for (const auto& node : response) {
        exchanges::Ticker ticker = parse_ticker(node);
        ticker.symbol = symbols_.to_canonical(exchanges::json_string(node, "symbol"));
        tickers.push_back(std::move(ticker));
    }
    return tickers;
}

exchanges::OrderBook BinanceGateway::get_order_book(const std::string& symbol, int depth) {
    Json::Value node = public_get("/api/v3/depth", {{"symbol", symbols_.to_native(symbol)},
                                                   {"limit", std::to_string(depth > 0 ? depth : 20)}});

    exchanges::OrderBook book;
    book.symbol = symbol;
    book.timestamp = std::chrono::system_clock::now();

    auto read_levels = [](const Json::Value& levels, std::vector<exchanges::PriceLevel>& out) {
        for (const auto& level : levels) {
            if (!level.isArray() || level.size() < 2) {
                throw error_handling::ExchangeError(EXCHANGE, "Malformed order book level");
            }
            out.push_back({exchanges::json_number(level[0], EXCHANGE), exchanges::json_number(level[1], EXCHANGE)});
        }
    };
    read_levels(node["bids"], book.bids);
    read_levels(node["asks"], book.asks);
    return book;
}

std::vector<exchanges::TradingPair> BinanceGateway::get_trading_pairs() {
    Json::Value info = public_get("/api/v3/exchangeInfo", {});

    std::vector<exchanges::TradingPair> pairs;
    for (const auto& node : info["symbols"]) {
        if (exchanges::json_string(node, "status") != "TRADING") {
            continue;
        }

        exchanges::TradingPair pair;
        pair.base = exchanges::json_string(node, "baseAsset");
        pair.quote = exchanges::json_string(node, "quoteAsset");
        pair.native_symbol = exchanges::json_string(node, "symbol");
        pair.symbol = exchanges::join_symbol(pair.base, pair.quote);

        for (const auto& filter : node["filters"]) {
            const std::string type = exchanges::json_string(filter, "filterType");
            if (type == "LOT_SIZE") {
                pair.min_quantity = exchanges::json_double(filter, "minQty");
                pair.step_size = exchanges::json_double(filter, "stepSize");
            } else if (type == "PRICE_FILTER") {
                pair.tick_size = exchanges::json_double(filter, "tickSize");
            }
        }

        symbols_.register_pair(pair);
        pairs.push_back(std::move(pair));
    }

    LOG_DEBUG_COMP("BINANCE", "Loaded " + std::to_string(pairs.size()) + " trading pairs");
    return pairs;
}

std::vector<exchanges::Balance> BinanceGateway::get_balances() {
    Json::Value account = signed_request("GET", "/api/v3/account", {});

    std::vector<exchanges::Balance> balances;
    for (const auto& node : account["balances"]) {
        exchanges::Balance balance;
        balance.asset = exchanges::json_string(node, "asset");
        balance.available = exchanges::json_double(node, "free");
        balance.locked = exchanges::json_double(node, "locked");
        if (balance.total() > 0.0) {
            balances.push_back(std::move(balance));
        }
    }
    return balances;
}

std::optional<exchanges::Balance> BinanceGateway::get_balance(const std::string& asset) {
    for (auto& balance : get_balances()) {
        if (balance.asset == asset) {
            return balance;
        }
    }
    return std::nullopt;
}

exchanges::Order BinanceGateway::create_order(const exchanges::OrderRequest& request) {
    if (request.quantity <= 0.0) {
        throw error_handling::InvalidRequestError("Order quantity must be positive");
    }

    const double quantity = symbols_.round_to_step(request.symbol, request.quantity);
    Params params = {
        {"symbol", symbols_.to_native(request.symbol)},
        {"side", side_to_binance(request.side)},
        {"quantity", format_decimal(quantity)},
        {"newOrderRespType", "FULL"},
    };

    auto add_price = [&]() {
        if (!request.price) {
            throw error_handling::InvalidRequestError(exchanges::to_string(request.type) + " order requires a price");
        }
        params.emplace_back("price", format_decimal(symbols_.round_to_tick(request.symbol, *request.price)));
        params.emplace_back("timeInForce", "GTC");
    };
    auto add_stop = [&]() {
        if (!request.stop_price) {
            throw error_handling::InvalidRequestError(exchanges::to_string(request.type) + " order requires a stop price");
        }
        params.emplace_back("stopPrice", format_decimal(symbols_.round_to_tick(request.symbol, *request.stop_price)));
    };

    switch (request.type) {
        case exchanges::OrderType::MARKET:
            params.emplace_back("type", "MARKET");
            break;
        case exchanges::OrderType::LIMIT:
            params.emplace_back("type", "LIMIT");
            add_price();
            break;
        case exchanges::OrderType::STOP_LOSS:
            params.emplace_back("type", request.price ? "STOP_LOSS_LIMIT" : "STOP_LOSS");
            if (request.price) add_price();
            add_stop();
            break;
        case exchanges::OrderType::TAKE_PROFIT:
            params.emplace_back("type", request.price ? "TAKE_PROFIT_LIMIT" : "TAKE_PROFIT");
            if (request.price) add_price();
            add_stop();
            break;
    }

    if (request.client_order_id) {
        params.emplace_back("newClientOrderId", *request.client_order_id);
    }

    Json::Value response = signed_request("POST", "/api/v3/order", params);
    exchanges::Order order = parse_order(response);
    order.symbol = request.symbol;
    LOG_DEBUG_COMP("BINANCE", "Order " + order.id + " " + exchanges::to_string(order.status));
    return order;
}

bool BinanceGateway::cancel_order(const std::string& order_id, const std::optional<std::string>& symbol) {
    const std::string canonical = require_symbol(symbol, "cancel_order");
    Json::Value response = signed_request("DELETE", "/api/v3/order",
                                          {{"symbol", symbols_.to_native(canonical)}, {"orderId", order_id}});
    return map_status(exchanges::json_string(response, "status")) == exchanges::OrderStatus::CANCELLED;
}

std::optional<exchanges::Order> BinanceGateway::get_order(const std::string& order_id,
                                                          const std::optional<std::string>& symbol) {
    const std::string canonical = require_symbol(symbol, "get_order");
    try {
        Json::Value response = signed_request("GET", "/api/v3/order",
                                              {{"symbol", symbols_.to_native(canonical)}, {"orderId", order_id}});
        exchanges::Order order = parse_order(response);
        order.symbol = canonical;
        return order;
    } catch (const error_handling::ExchangeError& e) {
        // -2013: Order does not exist
        if (e.http_status() == 400 && e.raw_message().find("-2013") != std::string::npos) {
            return std::nullopt;
        }
        throw;
    }
}

std::vector<exchanges::Order> BinanceGateway::get_open_orders(const std::optional<std::string>& symbol) {
    Params params;
    if (symbol) {
        params.emplace_back("symbol", symbols_.to_native(*symbol));
    }

    std::vector<exchanges::Order> orders;
    for (const auto& node : signed_request("GET", "/api/v3/openOrders", params)) {
        orders.push_back(parse_order(node));
    }
    return orders;
}

std::vector<exchanges::Order> BinanceGateway::get_order_history(const std::optional<std::string>& symbol, int limit) {
    const std::string canonical = require_symbol(symbol, "get_order_history");
    Json::Value response = signed_request("GET", "/api/v3/allOrders",
                                          {{"symbol", symbols_.to_native(canonical)},
                                           {"limit", std::to_string(limit > 0 ? limit : 50)}});

    std::vector<exchanges::Order> orders;
    for (const auto& node : response) {
        orders.push_back(parse_order(node));
    }
    // Binance returns oldest first
    std::reverse(orders.begin(), orders.end());
    return orders;
}

std::vector<exchanges::Position> BinanceGateway::get_positions() {
    std::vector<exchanges::Position> positions;

    for (const auto& balance : get_balances()) {
        if (is_cash_asset(balance.asset)) {
            continue;
        }

        exchanges::Position position;
        position.symbol = exchanges::join_symbol(balance.asset, "USDT");
        position.side = exchanges::PositionSide::LONG;
        position.quantity = balance.total();
        try {
            position.current_price = get_ticker(position.symbol).price;
        } catch (const error_handling::ExchangeError& e) {
            LOG_DEBUG_COMP("BINANCE", "No USDT market for " + balance.asset + ": " + e.raw_message());
            continue;
        }
        // Spot balances carry no cost basis
        position.entry_price = position.current_price;
        positions.push_back(std::move(position));
    }
    return positions;
}

std::vector<exchanges::Trade> BinanceGateway::get_trades(const std::optional<std::string>& symbol, int limit) {
    const std::string canonical = require_symbol(symbol, "get_trades");
    Json::Value response = signed_request("GET", "/api/v3/myTrades",
                                          {{"symbol", symbols_.to_native(canonical)},
                                           {"limit", std::to_string(limit > 0 ? limit : 50)}});

    std::vector<exchanges::Trade> trades;
    for (const auto& node : response) {
        exchanges::Trade trade;
        trade.id = exchanges::json_string(node, "id");
        trade.order_id = exchanges::json_string(node, "orderId");
        trade.symbol = canonical;
        trade.side = node["isBuyer"].asBool() ? exchanges::OrderSide::BUY : exchanges::OrderSide::SELL;
        trade.quantity = exchanges::json_double(node, "qty");
        trade.price = exchanges::json_double(node, "price");
        trade.fee = exchanges::json_double(node, "commission");
        trade.fee_currency = exchanges::json_string(node, "commissionAsset");
        trade.timestamp = exchanges::from_millis(node["time"].asInt64());
        trades.push_back(std::move(trade));
    }
    std::reverse(trades.begin(), trades.end());
    return trades;
}

Json::Value BinanceGateway::public_get(const std::string& path, const Params& params) {
    HttpRequest request;
    request.method = "GET";
    request.url = base_url_ + path;
    const std::string query = build_query(params);
    if (!query.empty()) {
        request.url += "?" + query;
    }
    request.timeout_ms = config_.timeout_ms;
    return send(request);
}

Json::Value BinanceGateway::signed_request(const std::string& method, const std::string& path, Params params) {
    params.emplace_back("recvWindow", std::to_string(config_.recv_window_ms));
    params.emplace_back("timestamp", std::to_string(exchanges::now_millis()));

    std::string query = build_query(params);
    query += "&signature=" + create_signature(query);

    HttpRequest request;
    request.method = method;
    request.url = base_url_ + path + "?" + query;
    request.headers["X-MBX-APIKEY"] = credentials_.api_key;
    request.timeout_ms = config_.timeout_ms;
    return send(request);
}

Json::Value BinanceGateway::send(const HttpRequest& request) {
    HttpResponse response = http_->make_request(request);

    if (!response.error_message.empty() && response.status_code == 0) {
        throw error_handling::ExchangeError(EXCHANGE, response.error_message);
    }

    if (!response.success) {
        std::string message = "HTTP " + std::to_string(response.status_code);
        Json::Value error;
        Json::CharReaderBuilder builder;
        std::string errors;
        std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
        if (reader->parse(response.body.data(), response.body.data() + response.body.size(), &error, &errors) &&
            error.isObject() && error.isMember("msg")) {
            message = error["msg"].asString() + " (code " + exchanges::json_string(error, "code") + ")";
        } else if (!response.body.empty()) {
            message += ": " + response.body;
        }
        throw error_handling::ExchangeError(EXCHANGE, message, response.status_code);
    }

    return exchanges::parse_json(response.body, EXCHANGE);
}

std::string BinanceGateway::create_signature(const std::string& query_string) const {
    return exchanges::hmac_sha256_hex(credentials_.api_secret, query_string);
}

std::string BinanceGateway::build_query(const Params& params) {
    std::string query;
    for (const auto& [key, value] : params) {
        if (!query.empty()) {
            query += "&";
        }
        query += key + "=" + url_encode(value);
    }
    return query;
}

std::string BinanceGateway::require_symbol(const std::optional<std::string>& symbol, const char* operation) const {
    if (!symbol || symbol->empty()) {
        throw error_handling::InvalidRequestError(std::string("Binance ") + operation + " requires a symbol");
    }
    return *symbol;
}

exchanges::Ticker BinanceGateway::parse_ticker(const Json::Value& node) const {
    exchanges::Ticker ticker;
    ticker.price = exchanges::json_double(node, "lastPrice");
    ticker.bid = exchanges::json_double(node, "bidPrice");
    ticker.ask = exchanges::json_double(node, "askPrice");
    ticker.volume_24h = exchanges::json_double(node, "volume");
    ticker.change_24h = exchanges::json_double(node, "priceChange");
    ticker.change_percent_24h = exchanges::json_double(node, "priceChangePercent");
    ticker.high_24h = exchanges::json_double(node, "highPrice");
    ticker.low_24h = exchanges::json_double(node, "lowPrice");
    ticker.timestamp = node.isMember("closeTime") ? exchanges::from_millis(node["closeTime"].asInt64())
                                                  : std::chrono::system_clock::now();
    return ticker;
}

exchanges::Order BinanceGateway::parse_order(const Json::Value& node) const {
    exchanges::Order order;
    order.id = exchanges::json_string(node, "orderId");
    order.client_order_id = exchanges::json_string(node, "clientOrderId");

    const std::string native = exchanges::json_string(node, "symbol");
    order.symbol = native.empty() ? "" : symbols_.to_canonical(native);
    order.side = side_from_binance(exchanges::json_string(node, "side"));
    order.type = map_type(exchanges::json_string(node, "type"));
    order.status = map_status(exchanges::json_string(node, "status"));
    order.quantity = exchanges::json_double(node, "origQty");
    order.filled_quantity = exchanges::json_double(node, "executedQty");

    const double price = exchanges::json_double(node, "price");
    if (price > 0.0) order.price = price;
    const double stop = exchanges::json_double(node, "stopPrice");
    if (stop > 0.0) order.stop_price = stop;

    const double quote_filled = exchanges::json_double(node, "cummulativeQuoteQty");
    if (order.filled_quantity > 0.0 && quote_filled > 0.0) {
        order.average_price = quote_filled / order.filled_quantity;
    }

    for (const auto& fill : node["fills"]) {
        order.fee += exchanges::json_double(fill, "commission");
        if (order.fee_currency.empty()) {
            order.fee_currency = exchanges::json_string(fill, "commissionAsset");
        }
    }

    int64_t created = node.isMember("time") ? node["time"].asInt64()
                    : node.isMember("transactTime") ? node["transactTime"].asInt64()
                    : exchanges::now_millis();
    int64_t updated = node.isMember("updateTime") ? node["updateTime"].asInt64() : created;
    order.created_at = exchanges::from_millis(created);
    order.updated_at = exchanges::from_millis(updated);
    return order;
}

exchanges::OrderStatus BinanceGateway::map_status(const std::string& status) {
    if (status == "NEW" || status == "PENDING_NEW") return exchanges::OrderStatus::OPEN;
    if (status == "PARTIALLY_FILLED") return exchanges::OrderStatus::PARTIALLY_FILLED;
    if (status == "FILLED") return exchanges::OrderStatus::FILLED;
    if (status == "CANCELED" || status == "PENDING_CANCEL" || status == "EXPIRED" ||
        status == "EXPIRED_IN_MATCH") {
        return exchanges::OrderStatus::CANCELLED;
    }
    if (status == "REJECTED") return exchanges::OrderStatus::REJECTED;
    return exchanges::OrderStatus::PENDING;
}

exchanges::OrderType BinanceGateway::map_type(const std::string& type) {
    if (type == "MARKET") return exchanges::OrderType::MARKET;
    if (type == "STOP_LOSS" || type == "STOP_LOSS_LIMIT") return exchanges::OrderType::STOP_LOSS;
    if (type == "TAKE_PROFIT" || type == "TAKE_PROFIT_LIMIT") return exchanges::OrderType::TAKE_PROFIT;
    return exchanges::OrderType::LIMIT;
}

std::string BinanceGateway::format_decimal(double value) {
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%.8f", value);
    std::string text(buffer);
    while (!text.empty() && text.back() == '0') text.pop_back();
    if (!text.empty() && text.back() == '.') text.pop_back();
    return text;
}

} // namespace binance
