#include "trading_session_controller.hpp"
#include "../exchanges/resilient_gateway.hpp"
#include "../utils/error_handling.hpp"
#include "../utils/logging/log_helper.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace trading {

std::string to_string(TradingMode mode) {
    return mode == TradingMode::LIVE ? "live" : "paper";
}

TradingMode parse_trading_mode(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "paper") return TradingMode::PAPER;
    if (lower == "live") return TradingMode::LIVE;
    throw error_handling::InvalidRequestError("Unknown trading mode: " + value);
}

TradingSessionController::TradingSessionController(std::shared_ptr<ICredentialStore> credential_store,
                                                   std::shared_ptr<ISecretDecryptor> decryptor,
                                                   GatewayBuilder gateway_builder,
                                                   PaperConfig paper_config)
    : credential_store_(std::move(credential_store)),
      decryptor_(std::move(decryptor)),
      gateway_builder_(std::move(gateway_builder)),
      paper_config_(std::move(paper_config)) {
    if (!credential_store_ || !decryptor_ || !gateway_builder_) {
        throw std::invalid_argument("TradingSessionController requires a credential store, decryptor and gateway builder");
    }
}

TradingSessionController::GatewayBuilder TradingSessionController::make_resilient_builder(
    std::shared_ptr<IHttpHandler> http,
    ratelimit::RateLimiter& limiter,
    std::map<std::string, exchanges::VenueSettings> venue_settings,
    std::optional<resilience::CircuitBreakerConfig> breaker_config) {
    return [http, &limiter, venue_settings, breaker_config](const std::string& user_id,
                                                           const std::string& exchange,
                                                           const exchanges::ExchangeCredentials& credentials) {
        auto venue = exchanges::GatewayFactory::normalize_exchange_name(exchange);
        exchanges::VenueSettings settings;
        auto it = venue_settings.find(venue);
        if (it != venue_settings.end()) {
            settings = it->second;
        }

        auto inner = exchanges::GatewayFactory::create(venue, credentials, http, settings);

        auto config = breaker_config ? *breaker_config : exchanges::ResilientGateway::default_breaker_config();
        if (!config.is_failure) {
            config.is_failure = exchanges::ResilientGateway::default_breaker_config().is_failure;
        }
        config.name = exchanges::ResilientGateway::breaker_name(inner->id());
        auto breaker = resilience::CircuitBreakerRegistry::get_instance().get_or_create(config.name, config);

        return std::static_pointer_cast<exchanges::IExchangeGateway>(
            std::make_shared<exchanges::ResilientGateway>(user_id, inner, limiter, breaker));
    };
}

SessionState TradingSessionController::connect_exchange(const std::string& user_id, const std::string& connection_id) {
    auto connection = credential_store_->find_connection_by_id(connection_id);
    // Records owned by another user are indistinguishable from missing ones
    if (!connection || connection->user_id != user_id) {
        LOG_WARN_COMP("SESSION", "Connection " + connection_id + " not found for user " + user_id);
        throw error_handling::ConnectionError("Exchange connection not found");
    }

    auto credentials = decrypt_credentials(*connection, *decryptor_);
    auto live = gateway_builder_(user_id, connection->exchange, credentials);
    if (!live) {
        throw error_handling::ConnectionError("Unsupported exchange: " + connection->exchange);
    }

    live->connect();
    bool verified = false;
    try {
        verified = live->test_connection();
    } catch (const std::exception& e) {
        LOG_WARN_COMP("SESSION", "Connection test against " + live->name() + " failed: " + std::string(e.what()));
        try {
            live->disconnect();
        } catch (const std::exception& disconnect_error) {
            LOG_WARN_COMP("SESSION", "Disconnect after failed test failed: " + std::string(disconnect_error.what()));
        }
        throw;
    }
    if (!verified) {
        live->disconnect();
        LOG_WARN_COMP_META("SESSION", "Credentials rejected by " + live->name(),
                           {{"user", user_id}, {"connection", connection_id},
                            {"api_key", mask_api_key(credentials.api_key)}});
        throw error_handling::ConnectionError("Invalid API credentials for " + live->name());
    }

    Session session;
    session.live = live;
    session.paper = std::make_shared<PaperExecutionEngine>(live, paper_config_);
    session.mode = TradingMode::PAPER;
    session.exchange_id = live->id();
    session.exchange_name = live->name();
    session.connection_id = connection_id;

    std::shared_ptr<exchanges::IExchangeGateway> previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(user_id);
        if (it != sessions_.end()) {
            previous = it->second.live;
        }
        sessions_[user_id] = session;
    }

    if (previous && previous != live) {
        try {
            previous->disconnect();
        } catch (const std::exception& e) {
            LOG_WARN_COMP("SESSION", "Disconnect of replaced session failed: " + std::string(e.what()));
        }
    }

    LOG_INFO_COMP_META("SESSION", "Connected to " + session.exchange_name + " in paper mode",
                       {{"user", user_id}, {"connection", connection_id},
                        {"sandbox", credentials.sandbox ? "true" : "false"}});
    return to_state(session);
}

void TradingSessionController::switch_mode(const std::string& user_id, TradingMode mode, bool acknowledged) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(user_id);
    if (it == sessions_.end()) {
        throw error_handling::NoSessionError();
    }
    if (mode == TradingMode::LIVE && !acknowledged) {
        throw error_handling::AcknowledgmentRequiredError();
    }
    if (it->second.mode != mode) {
        LOG_INFO_COMP("SESSION", "User " + user_id + " switched from " + to_string(it->second.mode) +
                      " to " + to_string(mode));
    }
    it->second.mode = mode;
}

SessionState TradingSessionController::get_state(const std::string& user_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(user_id);
    if (it == sessions_.end()) {
        return SessionState{};
    }
    return to_state(it->second);
}

void TradingSessionController::disconnect_exchange(const std::string& user_id) {
    Session session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(user_id);
        if (it == sessions_.end()) {
            return;
        }
        session = it->second;
        sessions_.erase(it);
    }

    try {
        session.live->disconnect();
    } catch (const std::exception& e) {
        LOG_WARN_COMP("SESSION", "Disconnect from " + session.exchange_name + " failed: " + std::string(e.what()));
    }
    LOG_INFO_COMP("SESSION", "User " + user_id + " disconnected from " + session.exchange_name);
}

void TradingSessionController::disconnect_all() {
    std::vector<std::string> users;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : sessions_) {
            users.push_back(entry.first);
        }
    }
    for (const auto& user : users) {
        disconnect_exchange(user);
    }
}

exchanges::Ticker TradingSessionController::get_ticker(const std::string& user_id, const std::string& symbol) {
    return get_active_gateway(user_id)->get_ticker(symbol);
}

std::vector<exchanges::Ticker> TradingSessionController::get_tickers(const std::string& user_id,
                                                                     const std::vector<std::string>& symbols) {
    return get_active_gateway(user_id)->get_tickers(symbols);
}

exchanges::OrderBook TradingSessionController::get_order_book(const std::string& user_id, const std::string& symbol, int depth) {
    return get_active_gateway(user_id)->get_order_book(symbol, depth);
}

std::vector<exchanges::TradingPair> TradingSessionController::get_trading_pairs(const std::string& user_id) {
    return get_active_gateway(user_id)->get_trading_pairs();
}

std::vector<exchanges::Balance> TradingSessionController::get_balances(const std::string& user_id) {
    return get_active_gateway(user_id)->get_balances();
}

std::optional<exchanges::Balance> TradingSessionController::get_balance(const std::string& user_id, const std::string& asset) {
    return get_active_gateway(user_id)->get_balance(asset);
}

exchanges::Order TradingSessionController::create_order(const std::string& user_id, const exchanges::OrderRequest& request) {
    return get_active_gateway(user_id)->create_order(request);
}

bool TradingSessionController::cancel_order(const std::string& user_id, const std::string& order_id,
                                            const std::optional<std::string>& symbol) {
    return get_active_gateway(user_id)->cancel_order(order_id, symbol);
}

std::optional<exchanges::Order> TradingSessionController::get_order(const std::string& user_id, const std::string& order_id,
                                                                    const std::optional<std::string>& symbol) {
    return get_active_gateway(user_id)->get_order(order_id, symbol);
}

std::vector<exchanges::Order> TradingSessionController::get_open_orders(const std::string& user_id,
                                                                        const std::optional<std::string>& symbol) {
    return get_active_gateway(user_id)->get_open_orders(symbol);
}

std::vector<exchanges::Order> TradingSessionController::get_order_history(const std::string& user_id,
                                                                          const std::optional<std::string>& symbol,
                                                                          int limit) {
    return get_active_gateway(user_id)->get_order_history(symbol, limit);
}

std::vector<exchanges::Position> TradingSessionController::get_positions(const std::string& user_id) {
    return get_active_gateway(user_id)->get_positions();
}

std::vector<exchanges::Trade> TradingSessionController::get_trades(const std::string& user_id,
                                                                   const std::optional<std::string>& symbol,
                                                                   int limit) {
    return get_active_gateway(user_id)->get_trades(symbol, limit);
}

double TradingSessionController::get_portfolio_value(const std::string& user_id) {
    auto gateway = get_active_gateway(user_id);
    const auto& quotes = paper_config_.quote_assets;

    double value = 0.0;
    for (const auto& balance : gateway->get_balances()) {
        if (std::find(quotes.begin(), quotes.end(), balance.asset) != quotes.end()) {
            value += balance.total();
        }
    }
    for (const auto& position : gateway->get_positions()) {
        value += position.quantity * position.current_price;
    }
    return value;
}

void TradingSessionController::reset_paper_account(const std::string& user_id) {
    get_paper_engine(user_id)->reset();
    LOG_INFO_COMP("SESSION", "Paper account reset for user " + user_id);
}

std::shared_ptr<exchanges::IExchangeGateway> TradingSessionController::get_active_gateway(const std::string& user_id) const {
    auto session = require_session(user_id);
    if (session.mode == TradingMode::LIVE) {
        return session.live;
    }
    return session.paper;
}

std::shared_ptr<PaperExecutionEngine> TradingSessionController::get_paper_engine(const std::string& user_id) const {
    return require_session(user_id).paper;
}

size_t TradingSessionController::session_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

TradingSessionController::Session TradingSessionController::require_session(const std::string& user_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(user_id);
    if (it == sessions_.end()) {
        throw error_handling::NoSessionError();
    }
    return it->second;
}

SessionState TradingSessionController::to_state(const Session& session) {
    SessionState state;
    state.mode = session.mode;
    state.exchange_id = session.exchange_id;
    state.exchange_name = session.exchange_name;
    state.is_connected = true;
    state.can_trade = true;
    return state;
}

} // namespace trading
