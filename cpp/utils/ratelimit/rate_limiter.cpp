#include "rate_limiter.hpp"
#include "../constants.hpp"
#include "../logging/log_helper.hpp"
#include <algorithm>
#include <cmath>
#include <ctime>
#include <stdexcept>

namespace ratelimit {

namespace {

const std::map<std::string, int>& default_exchange_limits() {
    static const std::map<std::string, int> limits = {
        {"binance", 1200},
        {"coinbase", 300},
        {"kraken", 180},
        {"bybit", 600},
        {"okx", 600},
    };
    return limits;
}

std::string make_key(const std::string& user_id, const std::string& suffix) {
    return user_id + ":" + suffix;
}

int ceil_seconds(std::chrono::system_clock::duration d) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
    if (ms <= 0) return 0;
    return static_cast<int>((ms + 999) / 1000);
}

} // namespace

std::string to_string(UserTier tier) {
    switch (tier) {
        case UserTier::FREE: return "free";
        case UserTier::PRO: return "pro";
        case UserTier::ELITE: return "elite";
        case UserTier::INSTITUTIONAL: return "institutional";
        default: return "unknown";
    }
}

UserTier parse_tier(const std::string& name) {
    if (name == "free") return UserTier::FREE;
    if (name == "pro") return UserTier::PRO;
    if (name == "elite") return UserTier::ELITE;
    if (name == "institutional") return UserTier::INSTITUTIONAL;
    throw std::invalid_argument("Unknown user tier: " + name);
}

RateLimiter::RateLimiter(Clock clock) : clock_(std::move(clock)) {
    for (const auto& [exchange, limit] : default_exchange_limits()) {
        exchange_limits_[exchange] = limit;
    }
}

std::chrono::system_clock::time_point RateLimiter::now() const {
    return clock_ ? clock_() : std::chrono::system_clock::now();
}

int RateLimiter::today() const {
    std::time_t t = std::chrono::system_clock::to_time_t(now());
    std::tm tm{};
    localtime_r(&t, &tm);
    return (tm.tm_year + 1900) * 10000 + (tm.tm_mon + 1) * 100 + tm.tm_mday;
}

RateLimitResult RateLimiter::check_limit(const std::string& user_id, const std::string& category,
                                         int limit, int window_seconds) {
    const auto current = now();
    const auto window = std::chrono::seconds(window_seconds);

    std::lock_guard<std::mutex> lock(mutex_);
    auto key = make_key(user_id, category);
    auto it = buckets_.find(key);

    if (it == buckets_.end() || current - it->second.window_start >= window) {
        Bucket fresh;
        fresh.window_start = current;
        it = buckets_.insert_or_assign(key, fresh).first;
    }

    Bucket& bucket = it->second;
    bucket.limit = limit;

    RateLimitResult result;
    result.limit = limit;
    result.reset_seconds = ceil_seconds(bucket.window_start + window - current);

    if (limit < 0) {
        bucket.count++;
        result.allowed = true;
        result.remaining = -1;
        return result;
    }

    if (bucket.count < limit) {
        bucket.count++;
        result.allowed = true;
        result.remaining = limit - bucket.count;
        return result;
    }

    result.allowed = false;
    result.remaining = 0;
    result.retry_after_seconds = result.reset_seconds;
    LOG_DEBUG_COMP("RATE_LIMIT", "Limit reached for " + key + ", retry after " +
                   std::to_string(result.reset_seconds) + "s");
    return result;
}

std::map<std::string, BucketStatus> RateLimiter::get_status(const std::string& user_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, BucketStatus> result;
    const std::string prefix = user_id + ":";

    for (const auto& [key, bucket] : buckets_) {
        if (key.compare(0, prefix.size(), prefix) != 0) {
            continue;
        }
        BucketStatus status;
        status.used = bucket.count;
        status.limit = bucket.limit;
        status.remaining = bucket.limit < 0 ? -1 : std::max(0, bucket.limit - bucket.count);
        result[key.substr(prefix.size())] = status;
    }
    return result;
}

TierLimits RateLimiter::get_limits_for_tier(UserTier tier) {
    switch (tier) {
        case UserTier::PRO:
            return TierLimits{50, 5, 60, true, 300};
        case UserTier::ELITE:
            return TierLimits{-1, 20, 300, true, 1000, true};
        case UserTier::INSTITUTIONAL:
            return TierLimits{-1, -1, -1, true, -1, true, true};
        case UserTier::FREE:
        default:
            return TierLimits{5, 1, 10, false, 60};
    }
}

void RateLimiter::set_user_tier(const std::string& user_id, UserTier tier) {
    std::lock_guard<std::mutex> lock(mutex_);
    user_tiers_[user_id] = tier;
}

UserTier RateLimiter::get_user_tier(const std::string& user_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = user_tiers_.find(user_id);
    return it != user_tiers_.end() ? it->second : UserTier::FREE;
}

// Caller holds mutex_
int RateLimiter::current_exchange_calls(const std::string& key) const {
    auto it = exchange_usage_.find(key);
    if (it == exchange_usage_.end()) {
        return 0;
    }
    const auto window = std::chrono::seconds(constants::ratelimit::EXCHANGE_WINDOW_SECONDS);
    if (now() - it->second.window_start >= window) {
        return 0;
    }
    return it->second.calls;
}

// Caller holds mutex_
int RateLimiter::exchange_limit_locked(const std::string& exchange) const {
    auto it = exchange_limits_.find(exchange);
    return it != exchange_limits_.end() ? it->second : constants::ratelimit::DEFAULT_EXCHANGE_LIMIT;
}

void RateLimiter::track_exchange_call(const std::string& user_id, const std::string& exchange) {
    const auto current = now();
    const auto window = std::chrono::seconds(constants::ratelimit::EXCHANGE_WINDOW_SECONDS);

    std::lock_guard<std::mutex> lock(mutex_);
    auto& usage = exchange_usage_[make_key(user_id, exchange)];
    if (usage.calls == 0 || current - usage.window_start >= window) {
        usage.calls = 0;
        usage.window_start = current;
    }
    usage.calls++;
}

int RateLimiter::get_exchange_usage(const std::string& user_id, const std::string& exchange) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_exchange_calls(make_key(user_id, exchange));
}

void RateLimiter::set_exchange_limit(const std::string& exchange, int limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    exchange_limits_[exchange] = limit;
}

int RateLimiter::get_exchange_limit(const std::string& exchange) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return exchange_limit_locked(exchange);
}

ExchangeStatus RateLimiter::get_exchange_status(const std::string& user_id, const std::string& exchange) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const int calls = current_exchange_calls(make_key(user_id, exchange));
    const int limit = exchange_limit_locked(exchange);

    ExchangeStatus status;
    if (limit < 0) {
        status.remaining = -1;
        return status;
    }
    const double percent = limit > 0 ? (static_cast<double>(calls) / limit) * 100.0 : 0.0;
    status.warning = percent >= constants::ratelimit::EXCHANGE_WARNING_PERCENT;
    status.percent_used = static_cast<int>(std::lround(percent));
    status.remaining = std::max(0, limit - calls);
    return status;
}

ActionResult RateLimiter::can_make_exchange_call(const std::string& user_id, const std::string& exchange) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const int limit = exchange_limit_locked(exchange);
    if (limit >= 0 && current_exchange_calls(make_key(user_id, exchange)) >= limit) {
        return {false, "Exchange rate limit reached for " + exchange + ". Please wait before making more requests."};
    }
    return {};
}

ActionResult RateLimiter::try_exchange_call(const std::string& user_id, const std::string& exchange) {
    const auto current = now();
    const auto window = std::chrono::seconds(constants::ratelimit::EXCHANGE_WINDOW_SECONDS);

    std::lock_guard<std::mutex> lock(mutex_);
    auto& usage = exchange_usage_[make_key(user_id, exchange)];
    if (usage.calls == 0 || current - usage.window_start >= window) {
        usage.calls = 0;
        usage.window_start = current;
    }

    const int limit = exchange_limit_locked(exchange);
    if (limit < 0) {
        usage.calls++;
        return {};
    }
    if (usage.calls >= limit) {
        LOG_WARN_COMP("RATE_LIMIT", "Exchange budget spent for " + user_id + " on " + exchange);
        ActionResult denied{false, "Exchange rate limit reached for " + exchange + ". Please wait before making more requests."};
        denied.retry_after_seconds = std::max(1, ceil_seconds(usage.window_start + window - current));
        return denied;
    }

    const double threshold = limit * constants::ratelimit::EXCHANGE_WARNING_PERCENT / 100.0;
    const bool was_below = usage.calls < threshold;
    usage.calls++;
    if (was_below && usage.calls >= threshold) {
        LOG_WARN_COMP("RATE_LIMIT", "Exchange budget for " + user_id + " on " + exchange + " above 80%");
    }
    return {};
}

void RateLimiter::track_usage(const std::string& user_id, const std::string& action) {
    const int date = today();
    std::lock_guard<std::mutex> lock(mutex_);
    auto& usage = daily_usage_[user_id];
    if (usage.date != date) {
        usage.date = date;
        usage.actions.clear();
    }
    usage.actions[action]++;
}

std::map<std::string, int> RateLimiter::get_daily_usage(const std::string& user_id) const {
    const int date = today();
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = daily_usage_.find(user_id);
    if (it == daily_usage_.end() || it->second.date != date) {
        return {};
    }
    return it->second.actions;
}

ActionResult RateLimiter::can_perform_action(const std::string& user_id, const std::string& action) const {
    const TierLimits limits = get_limits_for_tier(get_user_tier(user_id));

    int limit = -1;
    if (action == "backtest") {
        limit = limits.backtests_per_day;
    } else if (action == "order") {
        limit = limits.orders_per_minute < 0 ? -1 : limits.orders_per_minute * constants::ratelimit::MINUTES_PER_DAY;
    }

    if (limit < 0) {
        return {};
    }

    const auto usage = get_daily_usage(user_id);
    auto it = usage.find(action);
    const int used = it != usage.end() ? it->second : 0;
    if (used >= limit) {
        return {false, "Daily limit reached for " + action + ". Upgrade your plan for higher limits."};
    }
    return {};
}

void RateLimiter::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    buckets_.clear();
    exchange_usage_.clear();
    daily_usage_.clear();
}

} // namespace ratelimit
