#pragma once

/**
 * Health of the trading core
 *
 * Named probes are evaluated on demand and folded into one report whose status is the
 * worst probe status. Each exchange circuit breaker contributes a probe.
 */

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include "../resilience/resilience.hpp"

namespace health {

enum class HealthStatus {
    HEALTHY,
    DEGRADED,     // usable, a dependency is recovering
    UNHEALTHY,
    UNKNOWN
};

inline std::string to_string(HealthStatus status) {
    switch (status) {
        case HealthStatus::HEALTHY: return "healthy";
        case HealthStatus::DEGRADED: return "degraded";
        case HealthStatus::UNHEALTHY: return "unhealthy";
        default: return "unknown";
    }
}

// Higher is worse; UNKNOWN ranks between DEGRADED and UNHEALTHY
inline int severity(HealthStatus status) {
    switch (status) {
        case HealthStatus::HEALTHY: return 0;
        case HealthStatus::DEGRADED: return 1;
        case HealthStatus::UNKNOWN: return 2;
        default: return 3;
    }
}

struct ProbeResult {
    HealthStatus status = HealthStatus::UNKNOWN;
    std::string message;
};

struct HealthReport {
    std::string component;
    HealthStatus status = HealthStatus::HEALTHY;
    std::string message = "all probes passed";
    std::map<std::string, ProbeResult> probes;
    std::chrono::system_clock::time_point checked_at;
};

using Probe = std::function<ProbeResult()>;

class HealthChecker {
public:
    explicit HealthChecker(std::string component_name) : component_name_(std::move(component_name)) {}

    // Replaces an existing probe of the same name
    void register_check(const std::string& name, Probe probe) {
        std::lock_guard<std::mutex> lock(mutex_);
        probes_[name] = std::move(probe);
    }

    /**
     * Runs every probe. A probe that throws counts as UNHEALTHY with the exception text.
     * The report message names the first probe with the worst status.
     */
    HealthReport check() const {
        std::map<std::string, Probe> probes;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            probes = probes_;
        }

        HealthReport report;
        report.component = component_name_;
        for (const auto& [name, probe] : probes) {
            ProbeResult result;
            try {
                result = probe();
            } catch (const std::exception& e) {
                result = {HealthStatus::UNHEALTHY, std::string("probe threw: ") + e.what()};
            }
            if (severity(result.status) > severity(report.status)) {
                report.status = result.status;
                report.message = name + ": " + result.message;
            }
            report.probes[name] = result;
        }
        report.checked_at = std::chrono::system_clock::now();
        return report;
    }

    const std::string& component_name() const { return component_name_; }

    size_t check_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return probes_.size();
    }

private:
    std::string component_name_;
    mutable std::mutex mutex_;
    std::map<std::string, Probe> probes_;
};

// get_state() may move an expired OPEN breaker to HALF_OPEN
inline ProbeResult breaker_probe(resilience::CircuitBreaker& breaker) {
    switch (breaker.get_state()) {
        case resilience::CircuitState::OPEN:
            return {HealthStatus::UNHEALTHY, "circuit open"};
        case resilience::CircuitState::HALF_OPEN:
            return {HealthStatus::DEGRADED, "circuit half-open"};
        default:
            return {HealthStatus::HEALTHY, "circuit closed"};
    }
}

/**
 * One probe per breaker currently in the registry, named "breaker:<name>".
 * Call again after new venues connect to pick up their breakers.
 */
inline void register_circuit_breaker_checks(HealthChecker& checker,
                                            resilience::CircuitBreakerRegistry& registry) {
    for (const auto& name : registry.names()) {
        checker.register_check("breaker:" + name, [&registry, name]() -> ProbeResult {
            auto breaker = registry.get(name);
            if (!breaker) {
                return {HealthStatus::UNKNOWN, "not registered"};
            }
            return breaker_probe(*breaker);
        });
    }
}

} // namespace health
