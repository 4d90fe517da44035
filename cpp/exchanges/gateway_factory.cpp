#include "gateway_factory.hpp"
#include "../utils/error_handling.hpp"
#include "../utils/logging/log_helper.hpp"
#include <algorithm>
#include <cctype>

// Include venue gateway implementations
#include "binance/http/binance_gateway.hpp"
#include "coinbase/http/coinbase_gateway.hpp"

namespace exchanges {

std::shared_ptr<IExchangeGateway> GatewayFactory::create(const std::string& exchange_name,
                                                         const ExchangeCredentials& credentials,
                                                         std::shared_ptr<IHttpHandler> http,
                                                         const VenueSettings& settings) {
    std::string normalized_name = normalize_exchange_name(exchange_name);

    if (normalized_name == "binance") {
        binance::BinanceConfig config;
        config.base_url = settings.base_url;
        config.timeout_ms = settings.timeout_ms;
        config.recv_window_ms = settings.recv_window_ms;
        LOG_INFO_COMP("GATEWAY", "Creating gateway for exchange: binance");
        return std::make_shared<binance::BinanceGateway>(credentials, config, std::move(http));
    } else if (normalized_name == "coinbase") {
        coinbase::CoinbaseConfig config;
        config.base_url = settings.base_url;
        config.timeout_ms = settings.timeout_ms;
        LOG_INFO_COMP("GATEWAY", "Creating gateway for exchange: coinbase");
        return std::make_shared<coinbase::CoinbaseGateway>(credentials, config, std::move(http));
    }

    LOG_ERROR_COMP("GATEWAY", "Unsupported exchange: " + exchange_name);
    throw error_handling::ConnectionError("Unsupported exchange: " + exchange_name);
}

bool GatewayFactory::is_supported(const std::string& exchange_name) {
    std::string normalized_name = normalize_exchange_name(exchange_name);
    return normalized_name == "binance" || normalized_name == "coinbase";
}

std::vector<std::string> GatewayFactory::get_supported_exchanges() {
    return {"binance", "coinbase"};
}

std::string GatewayFactory::normalize_exchange_name(const std::string& exchange_name) {
    std::string normalized = exchange_name;
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    // Handle common variations
    if (normalized == "binance" || normalized == "binance.com" || normalized == "binance_spot") {
        return "binance";
    } else if (normalized == "coinbase" || normalized == "coinbase_advanced" || normalized == "coinbase_pro") {
        return "coinbase";
    }

    return normalized;
}

} // namespace exchanges
