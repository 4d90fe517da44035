#include "doctest.h"
#include "../../../utils/metrics/metrics_collector.hpp"
#include <algorithm>
#include <thread>
#include <vector>

using namespace metrics;

namespace {

const MetricSample* find_sample(const std::vector<MetricSample>& samples, const std::string& name) {
    auto it = std::find_if(samples.begin(), samples.end(),
                           [&](const MetricSample& s) { return s.name == name; });
    return it == samples.end() ? nullptr : &*it;
}

} // namespace

TEST_CASE("Metrics - Counter and gauge") {
    Counter counter("test_counter");
    counter.increment();
    counter.increment(4);
    CHECK(counter.get() == 5);
    CHECK(counter.to_string() == "test_counter: 5");
    CHECK(counter.sample().count == 5);
    counter.reset();
    CHECK(counter.get() == 0);

    Gauge gauge("test_gauge");
    gauge.set(10.0);
    gauge.increment(2.5);
    gauge.decrement(0.5);
    CHECK(gauge.get() == doctest::Approx(12.0));
    CHECK(gauge.sample().type == MetricType::GAUGE);
}

TEST_CASE("Metrics - Histogram keeps recent samples") {
    Histogram histogram("test_histogram", 3);
    for (double v : {1.0, 2.0, 3.0, 4.0}) {
        histogram.record(v);
    }
    CHECK(histogram.get_count() == 4);
    CHECK(histogram.get_sum() == doctest::Approx(10.0));
    CHECK(histogram.get_mean() == doctest::Approx(2.5));
    CHECK(histogram.recent() == std::vector<double>{2.0, 3.0, 4.0});

    auto sample = histogram.sample();
    CHECK(sample.type == MetricType::HISTOGRAM);
    CHECK(sample.value == doctest::Approx(2.5));
}

TEST_CASE("Metrics - Timer") {
    Timer timer("test_timer");
    timer.record(1500);
    timer.record(500);
    CHECK(timer.get_count() == 2);
    CHECK(timer.get_mean_ms() == doctest::Approx(1.0));

    {
        Timer::ScopedTimer scoped(timer);
    }
    CHECK(timer.get_count() == 3);
}

TEST_CASE("Metrics - Collector snapshot") {
    auto& collector = MetricsCollector::instance();
    CHECK(&collector.counter("snapshot_test_counter") == &METRICS_COUNTER("snapshot_test_counter"));

    METRICS_COUNTER("snapshot_test_counter").increment(3);
    METRICS_HISTOGRAM("snapshot_test_latency").record(12.0);

    auto samples = collector.snapshot();
    const auto* counter = find_sample(samples, "snapshot_test_counter");
    REQUIRE(counter != nullptr);
    CHECK(counter->type == MetricType::COUNTER);
    CHECK(counter->value >= 3.0);
    const auto* latency = find_sample(samples, "snapshot_test_latency");
    REQUIRE(latency != nullptr);
    CHECK(latency->type == MetricType::HISTOGRAM);

    // Counters come before histograms
    CHECK(counter < latency);

    collector.reset_all();
    CHECK(METRICS_COUNTER("snapshot_test_counter").get() == 0);
    CHECK(find_sample(collector.snapshot(), "snapshot_test_counter") != nullptr);
}

TEST_CASE("Metrics - Concurrent increments") {
    Counter counter("concurrent_counter");
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&counter]() {
            for (int i = 0; i < 1000; ++i) counter.increment();
        });
    }
    for (auto& thread : threads) thread.join();
    CHECK(counter.get() == 8000);
}
