#pragma once
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace ratelimit {

enum class UserTier {
    FREE,
    PRO,
    ELITE,
    INSTITUTIONAL
};

std::string to_string(UserTier tier);
// Throws std::invalid_argument for unknown names
UserTier parse_tier(const std::string& name);

// -1 denotes unlimited
struct TierLimits {
    int backtests_per_day;
    int strategies_max;
    int orders_per_minute;
    bool live_trading;
    int api_requests_per_minute;
    bool priority_execution = false;
    bool dedicated_support = false;
};

struct RateLimitResult {
    bool allowed = false;
    int limit = 0;
    int remaining = 0;
    int reset_seconds = 0;
    std::optional<int> retry_after_seconds;
};

struct BucketStatus {
    int used = 0;
    int limit = 0;
    int remaining = 0;
};

struct ExchangeStatus {
    bool warning = false;
    int percent_used = 0;
    int remaining = 0;                        // -1 when the venue budget is unlimited
};

struct ActionResult {
    bool allowed = true;
    std::string reason;
    std::optional<int> retry_after_seconds;   // set for exchange budget denials
};

/**
 * Source of a user's subscription tier. The core never stores tiers authoritatively;
 * RateLimiter itself implements this port with an in-process map for tools and tests.
 */
class ITierLookup {
public:
    virtual ~ITierLookup() = default;
    virtual UserTier get_user_tier(const std::string& user_id) const = 0;
};

/**
 * Fixed-window request budgets.
 *
 * Three independent ledgers: per (user, category) buckets, per (user, exchange) call
 * budgets over a 60s window, and per-user daily action counters keyed by calendar date.
 * All state is guarded by one mutex so check-and-increment is atomic per key.
 */
class RateLimiter : public ITierLookup {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    explicit RateLimiter(Clock clock = nullptr);

    // Negative limit means unlimited
    RateLimitResult check_limit(const std::string& user_id, const std::string& category,
                                int limit, int window_seconds);
    std::map<std::string, BucketStatus> get_status(const std::string& user_id) const;

    static TierLimits get_limits_for_tier(UserTier tier);
    void set_user_tier(const std::string& user_id, UserTier tier);
    UserTier get_user_tier(const std::string& user_id) const override;

    // Exchange call budget
    void track_exchange_call(const std::string& user_id, const std::string& exchange);
    int get_exchange_usage(const std::string& user_id, const std::string& exchange) const;
    // Negative limit means unlimited
    void set_exchange_limit(const std::string& exchange, int limit);
    int get_exchange_limit(const std::string& exchange) const;
    ExchangeStatus get_exchange_status(const std::string& user_id, const std::string& exchange) const;
    ActionResult can_make_exchange_call(const std::string& user_id, const std::string& exchange) const;
    // Check and count in one step; returns the denial when the budget is spent
    ActionResult try_exchange_call(const std::string& user_id, const std::string& exchange);

    // Daily usage
    void track_usage(const std::string& user_id, const std::string& action);
    std::map<std::string, int> get_daily_usage(const std::string& user_id) const;
    ActionResult can_perform_action(const std::string& user_id, const std::string& action) const;

    void reset();

private:
    struct Bucket {
        int count = 0;
        std::chrono::system_clock::time_point window_start;
        int limit = 0;
    };

    struct ExchangeUsage {
        int calls = 0;
        std::chrono::system_clock::time_point window_start;
    };

    struct DailyUsage {
        int date = 0;
        std::map<std::string, int> actions;
    };

    std::chrono::system_clock::time_point now() const;
    int today() const;
    int current_exchange_calls(const std::string& key) const;
    int exchange_limit_locked(const std::string& exchange) const;

    Clock clock_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Bucket> buckets_;
    std::unordered_map<std::string, ExchangeUsage> exchange_usage_;
    std::unordered_map<std::string, int> exchange_limits_;
    std::unordered_map<std::string, DailyUsage> daily_usage_;
    std::unordered_map<std::string, UserTier> user_tiers_;
};

} // namespace ratelimit
