#include "core_config.hpp"
#include "../utils/constants.hpp"
#include "../utils/logging/log_helper.hpp"

namespace trading {

namespace {

const std::map<std::string, int>& default_exchange_limits() {
    static const std::map<std::string, int> limits = {
        {"binance", 1200}, {"coinbase", 300}, {"kraken", 180},
        {"bybit", 600}, {"okx", 600}, {"default", constants::ratelimit::DEFAULT_EXCHANGE_LIMIT},
    };
    return limits;
}

} // namespace

CoreConfig load_core_config(const config::ProcessConfigManager& cfg) {
    CoreConfig core;

    core.process_name = cfg.get_string("process", "name", core.process_name);

    core.logging.level = logging::parse_level(cfg.get_string("logging", "level", "INFO"));
    core.logging.file = cfg.get_string("logging", "file", "");
    core.logging.console = cfg.get_bool("logging", "console", true);

    core.paper.initial_balance = cfg.get_double("paper", "initial_balance", constants::paper::DEFAULT_INITIAL_BALANCE);
    core.paper.quote_assets = cfg.get_list("paper", "quote_assets", core.paper.quote_assets);
    core.paper.fee_rate = cfg.get_double("paper", "fee_rate", constants::paper::DEFAULT_FEE_RATE);

    auto& limits = core.risk.limits;
    limits.max_position_size = cfg.get_double("risk", "max_position_size", constants::risk::MAX_POSITION_SIZE);
    limits.max_daily_loss = cfg.get_double("risk", "max_daily_loss", constants::risk::MAX_DAILY_LOSS);
    limits.max_drawdown = cfg.get_double("risk", "max_drawdown", constants::risk::MAX_DRAWDOWN);
    limits.max_open_positions = cfg.get_int("risk", "max_open_positions", constants::risk::MAX_OPEN_POSITIONS);
    limits.max_correlated_positions = cfg.get_int("risk", "max_correlated_positions",
                                                  constants::risk::MAX_CORRELATED_POSITIONS);
    limits.min_risk_reward_ratio = cfg.get_double("risk", "min_risk_reward_ratio",
                                                  constants::risk::MIN_RISK_REWARD_RATIO);
    core.risk.initial_equity = cfg.get_double("risk", "initial_equity", core.paper.initial_balance);
    core.risk.risk_free_rate = cfg.get_double("risk", "risk_free_rate", constants::risk::RISK_FREE_RATE);
    core.risk.periods_per_year = cfg.get_int("risk", "periods_per_year", constants::risk::PERIODS_PER_YEAR);

    auto& breaker = core.circuit_breaker;
    breaker.failure_threshold = cfg.get_int("circuit_breaker", "failure_threshold", constants::breaker::FAILURE_THRESHOLD);
    breaker.success_threshold = cfg.get_int("circuit_breaker", "success_threshold", constants::breaker::SUCCESS_THRESHOLD);
    breaker.timeout = std::chrono::milliseconds(cfg.get_int("circuit_breaker", "timeout_ms", constants::breaker::TIMEOUT_MS));
    breaker.reset_timeout = std::chrono::milliseconds(
        cfg.get_int("circuit_breaker", "reset_timeout_ms", constants::breaker::RESET_TIMEOUT_MS));

    core.exchange_limits = default_exchange_limits();
    for (const auto& key : cfg.get_keys("exchange_limits")) {
        core.exchange_limits[key] = cfg.get_int("exchange_limits", key, constants::ratelimit::DEFAULT_EXCHANGE_LIMIT);
    }

    for (const auto& venue : exchanges::GatewayFactory::get_supported_exchanges()) {
        const std::string section = "exchange." + venue;
        exchanges::VenueSettings settings;
        settings.base_url = cfg.get_string(section, "base_url", "");
        settings.timeout_ms = cfg.get_int(section, "timeout_ms", settings.timeout_ms);
        settings.recv_window_ms = cfg.get_int(section, "recv_window_ms", settings.recv_window_ms);
        core.venues[venue] = settings;
    }

    core.events.enabled = cfg.get_bool("events", "enabled", false);
    core.events.endpoint = cfg.get_string("events", "endpoint", core.events.endpoint);

    core.cli.user_id = cfg.get_string("cli", "user_id", core.cli.user_id);
    core.cli.tier = cfg.get_string("cli", "tier", core.cli.tier);
    core.cli.connection_id = cfg.get_string("cli", "connection", "");

    core.vault.passphrase = cfg.get_string("vault", "passphrase", "");
    core.vault.salt = cfg.get_string("vault", "salt", "");

    for (const auto& id : cfg.get_sections_with_prefix("connection.")) {
        const std::string section = "connection." + id;
        StoredConnection connection;
        connection.id = id;
        connection.user_id = cfg.get_string(section, "user_id", core.cli.user_id);
        connection.exchange = cfg.get_string(section, "exchange", "");
        connection.encrypted_api_key = cfg.get_string(section, "api_key", "");
        connection.encrypted_api_secret = cfg.get_string(section, "api_secret", "");
        if (cfg.has_key(section, "passphrase")) {
            connection.encrypted_passphrase = cfg.get_string(section, "passphrase", "");
        }
        connection.sandbox = cfg.get_bool(section, "sandbox", false);
        if (connection.exchange.empty()) {
            LOG_WARN_COMP("CONFIG", "Skipping [" + section + "] without exchange");
            continue;
        }
        core.connections.push_back(std::move(connection));
    }

    return core;
}

CoreConfig load_core_config(const std::string& config_file) {
    config::ProcessConfigManager manager;
    manager.load_config(config_file);
    return load_core_config(manager);
}

} // namespace trading
