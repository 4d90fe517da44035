#include "symbol_map.hpp"
#include "../utils/error_handling.hpp"
#include <cmath>

namespace exchanges {

double round_down_to_increment(double value, double increment) {
    if (increment <= 0.0) {
        return value;
    }

    // Small nudge so 0.3 / 0.1 does not floor to 2
    double steps = std::floor(value / increment + 1e-9);
    double rounded = steps * increment;

    int decimals = 0;
    double scaled = increment;
    while (decimals < 12 && std::abs(scaled - std::round(scaled)) > 1e-9) {
        scaled *= 10.0;
        decimals++;
    }
    double multiplier = std::pow(10.0, decimals);
    return std::round(rounded * multiplier) / multiplier;
}

SymbolMap::SymbolMap(std::string exchange, NativeRule native_rule, CanonicalRule canonical_rule)
    : exchange_(std::move(exchange)),
      native_rule_(std::move(native_rule)),
      canonical_rule_(std::move(canonical_rule)) {}

void SymbolMap::register_pair(const TradingPair& pair) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto existing = by_canonical_.find(pair.symbol);
    if (existing != by_canonical_.end()) {
        native_to_canonical_.erase(existing->second.native_symbol);
    }
    auto existing_native = native_to_canonical_.find(pair.native_symbol);
    if (existing_native != native_to_canonical_.end()) {
        by_canonical_.erase(existing_native->second);
    }

    by_canonical_[pair.symbol] = pair;
    native_to_canonical_[pair.native_symbol] = pair.symbol;
}

void SymbolMap::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    by_canonical_.clear();
    native_to_canonical_.clear();
}

size_t SymbolMap::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return by_canonical_.size();
}

std::string SymbolMap::to_native(const std::string& canonical) const {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = by_canonical_.find(canonical);
        if (it != by_canonical_.end()) {
            return it->second.native_symbol;
        }
    }

    auto [base, quote] = split_symbol(canonical);
    return native_rule_(base, quote);
}

std::string SymbolMap::to_canonical(const std::string& native) const {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = native_to_canonical_.find(native);
        if (it != native_to_canonical_.end()) {
            return it->second;
        }
    }

    auto parts = canonical_rule_(native);
    if (!parts) {
        throw error_handling::InvalidRequestError("Unknown " + exchange_ + " symbol: " + native);
    }
    return join_symbol(parts->first, parts->second);
}

std::optional<TradingPair> SymbolMap::find(const std::string& canonical) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = by_canonical_.find(canonical);
    if (it == by_canonical_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<TradingPair> SymbolMap::pairs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TradingPair> result;
    result.reserve(by_canonical_.size());
    for (const auto& entry : by_canonical_) {
        result.push_back(entry.second);
    }
    return result;
}

double SymbolMap::round_to_step(const std::string& canonical, double quantity) const {
    auto pair = find(canonical);
    return pair ? round_down_to_increment(quantity, pair->step_size) : quantity;
}

double SymbolMap::round_to_tick(const std::string& canonical, double price) const {
    auto pair = find(canonical);
    return pair ? round_down_to_increment(price, pair->tick_size) : price;
}

} // namespace exchanges
