#include "resilience.hpp"
#include "../error_handling.hpp"
#include "../logging/log_helper.hpp"

namespace resilience {

std::string to_string(CircuitState state) {
    switch (state) {
        case CircuitState::CLOSED: return "CLOSED";
        case CircuitState::OPEN: return "OPEN";
        case CircuitState::HALF_OPEN: return "HALF_OPEN";
        default: return "UNKNOWN";
    }
}

CircuitBreaker::CircuitBreaker(CircuitBreakerConfig config, Clock clock)
    : config_(std::move(config)), clock_(std::move(clock)) {
    if (config_.failure_threshold < 1) config_.failure_threshold = 1;
    if (config_.success_threshold < 1) config_.success_threshold = 1;
}

std::chrono::steady_clock::time_point CircuitBreaker::now() const {
    return clock_ ? clock_() : std::chrono::steady_clock::now();
}

void CircuitBreaker::admit_or_throw() {
    if (!try_admit()) {
        throw CircuitBreakerError(config_.name);
    }
}

bool CircuitBreaker::try_admit() {
    bool admitted = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        check_state_transition();
        if (state_ != CircuitState::OPEN) {
            total_requests_++;
            admitted = true;
        }
    }
    notify_transitions();

    if (!admitted) {
        LOG_DEBUG_COMP("CIRCUIT_BREAKER", "Rejected call to " + config_.name + " while open");
    }
    return admitted;
}

void CircuitBreaker::on_success() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        success_count_++;
        last_success_time_ = std::chrono::system_clock::now();
        failure_count_ = 0;

        if (state_ == CircuitState::HALF_OPEN) {
            half_open_success_count_++;
            if (half_open_success_count_ >= config_.success_threshold) {
                transition_to(CircuitState::CLOSED);
            }
        }
    }
    notify_transitions();
}

void CircuitBreaker::on_exception(const std::exception& e) {
    if (config_.is_failure && !config_.is_failure(e)) {
        LOG_DEBUG_COMP("CIRCUIT_BREAKER", config_.name + " call failed without counting: " + std::string(e.what()));
        return;
    }
    LOG_DEBUG_COMP("CIRCUIT_BREAKER", config_.name + " call failed: " + std::string(e.what()));
    on_failure();
}

void CircuitBreaker::on_failure() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        failure_count_++;
        total_failures_++;
        last_failure_time_ = std::chrono::system_clock::now();

        if (state_ == CircuitState::HALF_OPEN) {
            transition_to(CircuitState::OPEN);
        } else if (state_ == CircuitState::CLOSED && failure_count_ >= config_.failure_threshold) {
            transition_to(CircuitState::OPEN);
        }
    }
    notify_transitions();
}

CircuitState CircuitBreaker::get_state() {
    CircuitState state;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        check_state_transition();
        state = state_;
    }
    notify_transitions();
    return state;
}

CircuitBreakerStats CircuitBreaker::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CircuitBreakerStats stats;
    stats.state = state_;
    stats.failure_count = failure_count_;
    stats.success_count = success_count_;
    stats.total_requests = total_requests_;
    stats.total_failures = total_failures_;
    stats.failure_rate = total_requests_ > 0
        ? static_cast<double>(total_failures_) / static_cast<double>(total_requests_)
        : 0.0;
    stats.last_failure_time = last_failure_time_;
    stats.last_success_time = last_success_time_;
    stats.opened_at = opened_at_wall_;
    return stats;
}

void CircuitBreaker::reset() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        CircuitState previous = state_;
        state_ = CircuitState::CLOSED;
        failure_count_ = 0;
        success_count_ = 0;
        half_open_success_count_ = 0;
        opened_at_.reset();
        opened_at_wall_.reset();
        pending_transitions_.push_back({previous, CircuitState::CLOSED});
    }
    LOG_INFO_COMP("CIRCUIT_BREAKER", "Circuit " + config_.name + " manually reset");
    notify_transitions();
}

void CircuitBreaker::open() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        CircuitState previous = state_;
        state_ = CircuitState::OPEN;
        half_open_success_count_ = 0;
        opened_at_ = now();
        opened_at_wall_ = std::chrono::system_clock::now();
        pending_transitions_.push_back({previous, CircuitState::OPEN});
    }
    LOG_WARN_COMP("CIRCUIT_BREAKER", "Circuit " + config_.name + " manually opened");
    notify_transitions();
}

void CircuitBreaker::set_state_listener(StateListener listener) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listener_ = std::move(listener);
}

// Caller holds mutex_
void CircuitBreaker::check_state_transition() {
    if (state_ == CircuitState::OPEN && opened_at_ &&
        now() - *opened_at_ >= config_.reset_timeout) {
        transition_to(CircuitState::HALF_OPEN);
    }
}

// Caller holds mutex_
void CircuitBreaker::transition_to(CircuitState new_state) {
    CircuitState old_state = state_;
    state_ = new_state;

    if (new_state == CircuitState::OPEN) {
        opened_at_ = now();
        opened_at_wall_ = std::chrono::system_clock::now();
        half_open_success_count_ = 0;
    } else if (new_state == CircuitState::CLOSED) {
        opened_at_.reset();
        opened_at_wall_.reset();
        failure_count_ = 0;
        half_open_success_count_ = 0;
    } else {
        half_open_success_count_ = 0;
    }

    pending_transitions_.push_back({old_state, new_state});
}

void CircuitBreaker::notify_transitions() {
    std::vector<Transition> transitions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        transitions.swap(pending_transitions_);
    }
    if (transitions.empty()) {
        return;
    }

    StateListener listener;
    {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        listener = listener_;
    }

    for (const auto& t : transitions) {
        if (t.to == CircuitState::OPEN) {
            LOG_WARN_COMP("CIRCUIT_BREAKER", "Circuit " + config_.name + " " + to_string(t.from) + " -> OPEN");
        } else {
            LOG_INFO_COMP("CIRCUIT_BREAKER", "Circuit " + config_.name + " " + to_string(t.from) + " -> " + to_string(t.to));
        }
        error_handling::safe_callback(listener, "CIRCUIT_BREAKER", "state change", config_.name, t.from, t.to);
    }
}

CircuitBreakerRegistry& CircuitBreakerRegistry::get_instance() {
    static CircuitBreakerRegistry instance;
    return instance;
}

std::shared_ptr<CircuitBreaker> CircuitBreakerRegistry::get_or_create(const std::string& name, CircuitBreakerConfig config) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = breakers_.find(name);
    if (it != breakers_.end()) {
        return it->second;
    }

    config.name = name;
    auto breaker = std::make_shared<CircuitBreaker>(std::move(config));
    if (listener_) {
        breaker->set_state_listener(listener_);
    }
    breakers_[name] = breaker;
    return breaker;
}

std::shared_ptr<CircuitBreaker> CircuitBreakerRegistry::get(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = breakers_.find(name);
    return it != breakers_.end() ? it->second : nullptr;
}

std::map<std::string, CircuitBreakerStats> CircuitBreakerRegistry::get_all_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, CircuitBreakerStats> stats;
    for (const auto& [name, breaker] : breakers_) {
        stats[name] = breaker->get_stats();
    }
    return stats;
}

std::vector<std::string> CircuitBreakerRegistry::names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    for (const auto& entry : breakers_) {
        result.push_back(entry.first);
    }
    return result;
}

void CircuitBreakerRegistry::reset_all() {
    std::vector<std::shared_ptr<CircuitBreaker>> breakers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : breakers_) {
            breakers.push_back(entry.second);
        }
    }
    for (auto& breaker : breakers) {
        breaker->reset();
    }
}

void CircuitBreakerRegistry::set_state_listener(CircuitBreaker::StateListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listener_ = listener;
    for (auto& entry : breakers_) {
        entry.second->set_state_listener(listener);
    }
}

} // namespace resilience
