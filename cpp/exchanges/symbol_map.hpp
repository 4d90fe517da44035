#pragma once
#include "exchange_types.hpp"
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace exchanges {

/**
 * Canonical BASE/QUOTE <-> venue-native symbol mapping for one exchange.
 *
 * Pairs registered from get_trading_pairs() map exactly in both directions. Symbols not
 * (yet) registered fall back to the venue's naming rule, so market data works before the
 * pair list has been loaded.
 */
class SymbolMap {
public:
    // Builds the native symbol from base and quote
    using NativeRule = std::function<std::string(const std::string& base, const std::string& quote)>;
    // Splits a native symbol into base and quote, or nullopt if it cannot
    using CanonicalRule = std::function<std::optional<std::pair<std::string, std::string>>(const std::string& native)>;

    SymbolMap(std::string exchange, NativeRule native_rule, CanonicalRule canonical_rule);

    // Replaces any previous entry for the same canonical or native symbol
    void register_pair(const TradingPair& pair);
    void clear();
    size_t size() const;

    std::string to_native(const std::string& canonical) const;
    std::string to_canonical(const std::string& native) const;

    std::optional<TradingPair> find(const std::string& canonical) const;
    std::vector<TradingPair> pairs() const;

    // Round down to the pair's step/tick; unchanged when the pair has no filter
    double round_to_step(const std::string& canonical, double quantity) const;
    double round_to_tick(const std::string& canonical, double price) const;

    const std::string& exchange() const { return exchange_; }

private:
    std::string exchange_;
    NativeRule native_rule_;
    CanonicalRule canonical_rule_;

    mutable std::mutex mutex_;
    std::map<std::string, TradingPair> by_canonical_;
    std::map<std::string, std::string> native_to_canonical_;
};

// Round down to a multiple of increment; unchanged for increment <= 0
double round_down_to_increment(double value, double increment);

} // namespace exchanges
