#pragma once

/**
 * Error taxonomy and handling utilities for the trading core
 *
 * Faults travel as exceptions derived from TradingError. Every exception carries a
 * specific, user-facing reason; callers catch the concrete type to decide between
 * correcting input, backing off, or surfacing a venue failure.
 */

#include <cstdio>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include "logging/log_helper.hpp"

namespace error_handling {

class TradingError : public std::runtime_error {
public:
    explicit TradingError(const std::string& message) : std::runtime_error(message) {}
};

// Trading attempted without a connected exchange
class NoSessionError : public TradingError {
public:
    NoSessionError() : TradingError("Connect an exchange first before trading") {}
    explicit NoSessionError(const std::string& message) : TradingError(message) {}
};

// Bad credentials, unknown credential record, or unsupported venue
class ConnectionError : public TradingError {
public:
    explicit ConnectionError(const std::string& message) : TradingError(message) {}
};

class AcknowledgmentRequiredError : public TradingError {
public:
    AcknowledgmentRequiredError()
        : TradingError("Switching to live trading requires explicit acknowledgment that real money will be at risk") {}
};

// Feature not included in the user's subscription tier
class TierRestrictedError : public TradingError {
public:
    explicit TierRestrictedError(const std::string& message) : TradingError(message) {}
};

// Malformed symbol, non-positive quantity, or a venue call missing a required argument
class InvalidRequestError : public TradingError {
public:
    explicit InvalidRequestError(const std::string& message) : TradingError(message) {}
};

class InsufficientBalanceError : public TradingError {
public:
    InsufficientBalanceError(const std::string& asset, double required, double available)
        : TradingError(format(asset, required, available)),
          asset_(asset), required_(required), available_(available) {}

    const std::string& asset() const { return asset_; }
    double required() const { return required_; }
    double available() const { return available_; }

private:
    static std::string format(const std::string& asset, double required, double available);

    std::string asset_;
    double required_;
    double available_;
};

class RiskRejectedError : public TradingError {
public:
    RiskRejectedError(const std::string& reason, std::vector<std::string> warnings = {})
        : TradingError("Trade rejected by risk check: " + reason),
          reason_(reason), warnings_(std::move(warnings)) {}

    const std::string& reason() const { return reason_; }
    const std::vector<std::string>& warnings() const { return warnings_; }

private:
    std::string reason_;
    std::vector<std::string> warnings_;
};

class RateLimitExceededError : public TradingError {
public:
    RateLimitExceededError(const std::string& category, int retry_after_seconds)
        : TradingError("Rate limit exceeded for " + category + ", retry after " +
                       std::to_string(retry_after_seconds) + "s"),
          category_(category), retry_after_seconds_(retry_after_seconds) {}

    const std::string& category() const { return category_; }
    int retry_after_seconds() const { return retry_after_seconds_; }

private:
    std::string category_;
    int retry_after_seconds_;
};

/**
 * Opaque venue failure. what() carries the venue's raw message so the caller sees
 * exactly what the exchange reported; http_status is 0 for transport failures.
 */
class ExchangeError : public TradingError {
public:
    ExchangeError(const std::string& exchange, const std::string& message, int http_status = 0)
        : TradingError(exchange + ": " + message),
          exchange_(exchange), raw_message_(message), http_status_(http_status) {}

    const std::string& exchange() const { return exchange_; }
    const std::string& raw_message() const { return raw_message_; }
    int http_status() const { return http_status_; }

private:
    std::string exchange_;
    std::string raw_message_;
    int http_status_;
};

inline std::string InsufficientBalanceError::format(const std::string& asset, double required, double available) {
    char buffer[160];
    std::snprintf(buffer, sizeof(buffer), "Insufficient %s balance. Need %.8g, have %.8g",
                  asset.c_str(), required, available);
    return buffer;
}

/**
 * Execute a listener callback so that a throwing observer cannot break the caller.
 * Only std::exception is caught; anything else propagates.
 */
template<typename Callback, typename... Args>
void safe_callback(Callback&& callback, const std::string& component_name,
                   const std::string& operation_name, Args&&... args) {
    if (!callback) {
        return;
    }

    try {
        callback(std::forward<Args>(args)...);
    } catch (const std::exception& e) {
        LOG_ERROR_COMP(component_name, "Exception in " + operation_name + " callback: " + std::string(e.what()));
    }
}

} // namespace error_handling
