#include "doctest.h"
#include "../../../utils/health/health_checker.hpp"
#include <stdexcept>

TEST_CASE("HealthChecker - Worst probe wins") {
    health::HealthChecker checker("trading_core");
    CHECK(checker.check().status == health::HealthStatus::HEALTHY);
    CHECK(checker.check().message == "all probes passed");

    checker.register_check("a", []() -> health::ProbeResult { return {health::HealthStatus::HEALTHY, "ok"}; });
    checker.register_check("b", []() -> health::ProbeResult { return {health::HealthStatus::DEGRADED, "slow"}; });
    auto report = checker.check();
    CHECK(report.component == "trading_core");
    CHECK(report.status == health::HealthStatus::DEGRADED);
    CHECK(report.message == "b: slow");
    CHECK(report.probes.size() == 2);

    checker.register_check("c", []() -> health::ProbeResult { throw std::runtime_error("boom"); });
    report = checker.check();
    CHECK(report.status == health::HealthStatus::UNHEALTHY);
    CHECK(report.probes["c"].message == "probe threw: boom");
    CHECK(checker.check_count() == 3);

    CHECK(health::to_string(health::HealthStatus::UNKNOWN) == "unknown");
    CHECK(health::severity(health::HealthStatus::UNKNOWN) > health::severity(health::HealthStatus::DEGRADED));
}

TEST_CASE("HealthChecker - Circuit breaker probes") {
    resilience::CircuitBreakerRegistry registry;
    resilience::CircuitBreakerConfig config;
    config.reset_timeout = std::chrono::milliseconds(60000);
    auto binance = registry.get_or_create("exchange:binance", config);
    registry.get_or_create("exchange:coinbase", config);

    health::HealthChecker checker("trading_core");
    health::register_circuit_breaker_checks(checker, registry);
    CHECK(checker.check_count() == 2);
    CHECK(checker.check().status == health::HealthStatus::HEALTHY);

    binance->open();
    auto report = checker.check();
    CHECK(report.status == health::HealthStatus::UNHEALTHY);
    CHECK(report.message == "breaker:exchange:binance: circuit open");
    CHECK(report.probes["breaker:exchange:coinbase"].message == "circuit closed");

    // Re-registering is idempotent
    health::register_circuit_breaker_checks(checker, registry);
    CHECK(checker.check_count() == 2);
}
