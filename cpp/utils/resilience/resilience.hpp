#pragma once
#include <string>
#include <exception>
#include <stdexcept>
#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace resilience {

enum class ErrorType {
    TIMEOUT_ERROR,
    CIRCUIT_OPEN,
    SYSTEM_ERROR
};

class ResilientError : public std::runtime_error {
public:
    ResilientError(ErrorType type, const std::string& message, const std::string& context = "")
        : std::runtime_error(message), type_(type), context_(context) {}

    ErrorType get_type() const { return type_; }
    const std::string& get_context() const { return context_; }

private:
    ErrorType type_;
    std::string context_;
};

// Thrown without invoking the guarded call while the circuit is open
class CircuitBreakerError : public ResilientError {
public:
    explicit CircuitBreakerError(const std::string& breaker_name)
        : ResilientError(ErrorType::CIRCUIT_OPEN, "Circuit breaker is open for " + breaker_name, breaker_name) {}
};

class TimeoutError : public ResilientError {
public:
    TimeoutError(std::chrono::milliseconds timeout, const std::string& breaker_name)
        : ResilientError(ErrorType::TIMEOUT_ERROR,
                         "Operation timeout after " + std::to_string(timeout.count()) + "ms", breaker_name) {}
};

enum class CircuitState {
    CLOSED,    // Normal operation
    OPEN,      // Requests fail fast
    HALF_OPEN  // Probing whether the dependency recovered
};

std::string to_string(CircuitState state);

struct CircuitBreakerConfig {
    std::string name = "default";
    int failure_threshold = 5;
    int success_threshold = 2;
    std::chrono::milliseconds timeout{30000};
    std::chrono::milliseconds reset_timeout{60000};
    // Decides whether an exception thrown by the guarded call counts against the circuit.
    // Unset means every exception counts.
    std::function<bool(const std::exception&)> is_failure;
};

struct CircuitBreakerStats {
    CircuitState state = CircuitState::CLOSED;
    int failure_count = 0;          // consecutive, reset by any success
    int success_count = 0;
    int total_requests = 0;
    int total_failures = 0;
    double failure_rate = 0.0;      // total_failures / total_requests
    std::optional<std::chrono::system_clock::time_point> last_failure_time;
    std::optional<std::chrono::system_clock::time_point> last_success_time;
    std::optional<std::chrono::system_clock::time_point> opened_at;
};

/**
 * Three-state circuit breaker around an external call.
 *
 * CLOSED counts consecutive failures and opens at failure_threshold. OPEN rejects with
 * CircuitBreakerError until reset_timeout has elapsed, at which point the next attempt
 * moves it to HALF_OPEN. HALF_OPEN closes after success_threshold consecutive successes
 * and reopens on any failure.
 *
 * Guarded calls run under a timeout. The callable is moved to a worker thread, so it must
 * own (or share ownership of) everything it touches; a call that times out keeps running
 * and its eventual result is discarded.
 */
class CircuitBreaker {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;
    using StateListener = std::function<void(const std::string& name, CircuitState from, CircuitState to)>;

    explicit CircuitBreaker(CircuitBreakerConfig config, Clock clock = nullptr);

    template<typename Func>
    auto execute(Func func) -> std::invoke_result_t<Func> {
        admit_or_throw();

        try {
            if constexpr (std::is_void_v<std::invoke_result_t<Func>>) {
                run_with_timeout(std::move(func));
                on_success();
            } else {
                auto result = run_with_timeout(std::move(func));
                on_success();
                return result;
            }
        } catch (const std::exception& e) {
            on_exception(e);
            throw;
        }
    }

    /**
     * Like execute(), but returns fallback() instead of throwing when the circuit is open
     * or the guarded call fails.
     */
    template<typename Func, typename Fallback>
    auto execute_with_fallback(Func func, Fallback fallback) -> std::invoke_result_t<Func> {
        if (!try_admit()) {
            return fallback();
        }

        try {
            if constexpr (std::is_void_v<std::invoke_result_t<Func>>) {
                run_with_timeout(std::move(func));
                on_success();
                return;
            } else {
                auto result = run_with_timeout(std::move(func));
                on_success();
                return result;
            }
        } catch (const std::exception& e) {
            on_exception(e);
        }
        return fallback();
    }

    CircuitState get_state();
    CircuitBreakerStats get_stats() const;
    const std::string& name() const { return config_.name; }
    const CircuitBreakerConfig& config() const { return config_; }

    // Manual control
    void reset();
    void open();

    void set_state_listener(StateListener listener);

private:
    struct Transition {
        CircuitState from;
        CircuitState to;
    };

    template<typename Func>
    auto run_with_timeout(Func func) -> std::invoke_result_t<Func> {
        using R = std::invoke_result_t<Func>;
        if (config_.timeout.count() <= 0) {
            return func();
        }

        auto task = std::make_shared<std::packaged_task<R()>>(std::move(func));
        std::future<R> future = task->get_future();
        std::thread([task]() { (*task)(); }).detach();

        if (future.wait_for(config_.timeout) != std::future_status::ready) {
            throw TimeoutError(config_.timeout, config_.name);
        }
        return future.get();
    }

    void admit_or_throw();
    bool try_admit();
    void on_success();
    void on_exception(const std::exception& e);
    void on_failure();

    void check_state_transition();
    void transition_to(CircuitState new_state);
    void notify_transitions();
    std::chrono::steady_clock::time_point now() const;

    CircuitBreakerConfig config_;
    Clock clock_;

    mutable std::mutex mutex_;
    CircuitState state_ = CircuitState::CLOSED;
    int failure_count_ = 0;
    int success_count_ = 0;
    int half_open_success_count_ = 0;
    int total_requests_ = 0;
    int total_failures_ = 0;
    std::optional<std::chrono::steady_clock::time_point> opened_at_;
    std::optional<std::chrono::system_clock::time_point> opened_at_wall_;
    std::optional<std::chrono::system_clock::time_point> last_failure_time_;
    std::optional<std::chrono::system_clock::time_point> last_success_time_;

    std::vector<Transition> pending_transitions_;
    std::mutex listener_mutex_;
    StateListener listener_;
};

/**
 * Name-indexed breakers, one per external dependency (e.g. "exchange:binance").
 */
class CircuitBreakerRegistry {
public:
    static CircuitBreakerRegistry& get_instance();

    CircuitBreakerRegistry() = default;

    // Returns the existing breaker for name, or creates one from config (whose name is overridden)
    std::shared_ptr<CircuitBreaker> get_or_create(const std::string& name, CircuitBreakerConfig config);
    std::shared_ptr<CircuitBreaker> get(const std::string& name) const;

    std::map<std::string, CircuitBreakerStats> get_all_stats() const;
    std::vector<std::string> names() const;
    void reset_all();

    // Listener applied to every breaker created after the call, and to existing ones
    void set_state_listener(CircuitBreaker::StateListener listener);

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<CircuitBreaker>> breakers_;
    CircuitBreaker::StateListener listener_;
};

} // namespace resilience
