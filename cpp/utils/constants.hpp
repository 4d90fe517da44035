#pragma once

/**
 * System-wide constants
 *
 * Centralized location for magic numbers and defaults used throughout the trading core.
 * Values here are defaults; most can be overridden from the INI configuration.
 */

namespace constants {

// Timeouts (in milliseconds unless otherwise specified)
namespace timeout {
    constexpr int DEFAULT_HTTP_MS = 30000;                // 30 seconds
    constexpr int CONNECTION_TIMEOUT_MS = 10000;          // 10 seconds
}

// ZMQ configuration
namespace zmq {
    constexpr int DEFAULT_SNDHWM = 1000;
    constexpr int DEFAULT_LINGER_MS = 0;
}

// Paper trading ledger
namespace paper {
    constexpr double DEFAULT_INITIAL_BALANCE = 100000.0;
    constexpr double DEFAULT_FEE_RATE = 0.001;            // 0.1% of notional
    constexpr double POSITION_EPSILON = 0.00001;          // Below this a position is closed
    constexpr int DEFAULT_HISTORY_LIMIT = 50;
}

// Order state machine
namespace order {
    constexpr double FILLED_QTY_EPSILON = 1e-9;          // Floating point comparison epsilon
}

// Risk defaults
namespace risk {
    constexpr double MAX_POSITION_SIZE = 0.1;             // 10% of equity per position
    constexpr double MAX_DAILY_LOSS = 0.05;
    constexpr double MAX_DRAWDOWN = 0.2;
    constexpr int MAX_OPEN_POSITIONS = 10;
    constexpr int MAX_CORRELATED_POSITIONS = 3;
    constexpr double MIN_RISK_REWARD_RATIO = 1.5;
    constexpr double RISK_FREE_RATE = 0.02;
    constexpr int PERIODS_PER_YEAR = 252;
    constexpr double VAR_CONFIDENCE = 0.95;
    constexpr double KELLY_CAP = 0.25;
    constexpr double FIXED_AMOUNT_CAP = 0.10;
    constexpr double VOLATILITY_MULTIPLIER_CAP = 2.0;
    constexpr double MIN_VOLATILITY = 0.001;
    constexpr double DEFAULT_STOP_PERCENT = 0.02;         // stop distance when an order carries no plan
    constexpr double DEFAULT_RISK_REWARD = 2.0;
}

// Circuit breaker defaults
namespace breaker {
    constexpr int FAILURE_THRESHOLD = 5;
    constexpr int SUCCESS_THRESHOLD = 2;
    constexpr int TIMEOUT_MS = 30000;
    constexpr int RESET_TIMEOUT_MS = 60000;
}

// Rate limiting
namespace ratelimit {
    constexpr int EXCHANGE_WINDOW_SECONDS = 60;
    constexpr double EXCHANGE_WARNING_PERCENT = 80.0;
    constexpr int DEFAULT_EXCHANGE_LIMIT = 100;           // calls per minute for unknown venues
    constexpr int MINUTES_PER_DAY = 1440;
    constexpr const char* ORDERS_CATEGORY = "orders";
    constexpr int ORDER_WINDOW_SECONDS = 60;
}

// Exchange-specific defaults
namespace exchange {
    namespace binance {
        constexpr const char* DEFAULT_HTTP_URL = "https://api.binance.com";
        constexpr const char* TESTNET_HTTP_URL = "https://testnet.binance.vision";
        constexpr int RECV_WINDOW_MS = 5000;
    }

    namespace coinbase {
        constexpr const char* DEFAULT_HTTP_URL = "https://api.coinbase.com";
        constexpr const char* SANDBOX_HTTP_URL = "https://api-sandbox.coinbase.com";
        constexpr const char* API_PREFIX = "/api/v3/brokerage";
    }
}

} // namespace constants
