#pragma once

/**
 * Trading core metrics
 *
 * Thread-safe counters, gauges, histograms and timers keyed by name. The execution path
 * records order and exchange-call outcomes here; snapshot() feeds the metrics event stream.
 */

#include <string>
#include <map>
#include <atomic>
#include <mutex>
#include <chrono>
#include <cstdint>
#include <deque>
#include <vector>
#include <memory>
#include "../logging/log_helper.hpp"

namespace metrics {

// Well-known metric names
namespace names {
    constexpr const char* ORDERS_PLACED = "orders_placed";
    constexpr const char* ORDERS_REJECTED = "orders_rejected";
    constexpr const char* EXCHANGE_ERRORS = "exchange_errors";
    constexpr const char* RATE_LIMITED = "rate_limited";
    constexpr const char* BREAKER_REJECTIONS = "breaker_rejections";
    constexpr const char* ORDER_LATENCY_MS = "order_latency_ms";
    constexpr const char* EXCHANGE_CALL_MS = "exchange_call_ms";
}

/**
 * Metric types
 */
enum class MetricType {
    COUNTER,    // Incrementing counter
    GAUGE,      // Current value (can go up or down)
    HISTOGRAM,  // Distribution of values
    TIMER       // Duration measurements
};

inline std::string to_string(MetricType type) {
    switch (type) {
        case MetricType::COUNTER: return "counter";
        case MetricType::GAUGE: return "gauge";
        case MetricType::HISTOGRAM: return "histogram";
        case MetricType::TIMER: return "timer";
        default: return "unknown";
    }
}

/**
 * Point-in-time reading of one metric. value is the counter/gauge value, or the mean for
 * histograms and timers (milliseconds for timers).
 */
struct MetricSample {
    std::string name;
    MetricType type = MetricType::COUNTER;
    double value = 0.0;
    uint64_t count = 0;
    double sum = 0.0;
};

/**
 * Base metric interface
 */
class IMetric {
public:
    virtual ~IMetric() = default;
    virtual MetricType get_type() const = 0;
    virtual std::string get_name() const = 0;
    virtual std::string to_string() const = 0;
    virtual MetricSample sample() const = 0;
    virtual void reset() = 0;
};

namespace detail {
inline void atomic_add(std::atomic<double>& target, double delta) {
    double current = target.load();
    while (!target.compare_exchange_weak(current, current + delta)) {
    }
}
}

/**
 * Counter metric - increments only
 */
class Counter : public IMetric {
public:
    explicit Counter(const std::string& name) : name_(name), value_(0) {}

    void increment(int64_t delta = 1) {
        value_.fetch_add(delta);
    }

    void reset() override {
        value_.store(0);
    }

    int64_t get() const {
        return value_.load();
    }

    MetricType get_type() const override { return MetricType::COUNTER; }
    std::string get_name() const override { return name_; }

    std::string to_string() const override {
        return name_ + ": " + std::to_string(value_.load());
    }

    MetricSample sample() const override {
        MetricSample s;
        s.name = name_;
        s.type = MetricType::COUNTER;
        s.value = static_cast<double>(value_.load());
        s.count = static_cast<uint64_t>(value_.load());
        s.sum = s.value;
        return s;
    }

private:
    std::string name_;
    std::atomic<int64_t> value_;
};

/**
 * Gauge metric - can increase or decrease
 */
class Gauge : public IMetric {
public:
    explicit Gauge(const std::string& name) : name_(name), value_(0) {}

    void set(double value) {
        value_.store(value);
    }

    void increment(double delta = 1.0) {
        detail::atomic_add(value_, delta);
    }

    void decrement(double delta = 1.0) {
        detail::atomic_add(value_, -delta);
    }

    double get() const {
        return value_.load();
    }

    void reset() override {
        value_.store(0.0);
    }

    MetricType get_type() const override { return MetricType::GAUGE; }
    std::string get_name() const override { return name_; }

    std::string to_string() const override {
        return name_ + ": " + std::to_string(value_.load());
    }

    MetricSample sample() const override {
        MetricSample s;
        s.name = name_;
        s.type = MetricType::GAUGE;
        s.value = value_.load();
        s.count = 1;
        s.sum = s.value;
        return s;
    }

private:
    std::string name_;
    std::atomic<double> value_;
};

/**
 * Histogram metric - tracks distribution of values over the most recent samples
 */
class Histogram : public IMetric {
public:
    explicit Histogram(const std::string& name, size_t max_samples = 1000)
        : name_(name), max_samples_(max_samples) {}

    void record(double value) {
        std::lock_guard<std::mutex> lock(mutex_);
        count_++;
        sum_ += value;
        values_.push_back(value);
        if (values_.size() > max_samples_) {
            values_.pop_front();
        }
    }

    size_t get_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return count_;
    }

    double get_sum() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sum_;
    }

    double get_mean() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return count_ > 0 ? sum_ / static_cast<double>(count_) : 0.0;
    }

    std::vector<double> recent() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::vector<double>(values_.begin(), values_.end());
    }

    void reset() override {
        std::lock_guard<std::mutex> lock(mutex_);
        count_ = 0;
        sum_ = 0.0;
        values_.clear();
    }

    MetricType get_type() const override { return MetricType::HISTOGRAM; }
    std::string get_name() const override { return name_; }

    std::string to_string() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return name_ + ": count=" + std::to_string(count_) +
               " sum=" + std::to_string(sum_) +
               " mean=" + std::to_string(count_ > 0 ? sum_ / static_cast<double>(count_) : 0.0);
    }

    MetricSample sample() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        MetricSample s;
        s.name = name_;
        s.type = MetricType::HISTOGRAM;
        s.count = count_;
        s.sum = sum_;
        s.value = count_ > 0 ? sum_ / static_cast<double>(count_) : 0.0;
        return s;
    }

private:
    std::string name_;
    size_t max_samples_;
    mutable std::mutex mutex_;
    uint64_t count_{0};
    double sum_{0.0};
    std::deque<double> values_;
};

/**
 * Timer metric - measures durations
 */
class Timer : public IMetric {
public:
    explicit Timer(const std::string& name) : name_(name), count_(0), total_us_(0) {}

    class ScopedTimer {
    public:
        explicit ScopedTimer(Timer& timer) : timer_(timer), start_(std::chrono::steady_clock::now()) {}

        ~ScopedTimer() {
            auto end = std::chrono::steady_clock::now();
            auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - start_);
            timer_.record(duration.count());
        }

        ScopedTimer(const ScopedTimer&) = delete;
        ScopedTimer& operator=(const ScopedTimer&) = delete;

    private:
        Timer& timer_;
        std::chrono::steady_clock::time_point start_;
    };

    void record(int64_t microseconds) {
        count_.fetch_add(1);
        total_us_.fetch_add(microseconds);
    }

    size_t get_count() const { return count_.load(); }
    int64_t get_total_us() const { return total_us_.load(); }
    double get_mean_ms() const {
        size_t cnt = count_.load();
        return cnt > 0 ? static_cast<double>(total_us_.load()) / 1000.0 / static_cast<double>(cnt) : 0.0;
    }

    void reset() override {
        count_.store(0);
        total_us_.store(0);
    }

    MetricType get_type() const override { return MetricType::TIMER; }
    std::string get_name() const override { return name_; }

    std::string to_string() const override {
        return name_ + ": count=" + std::to_string(count_.load()) +
               " mean_ms=" + std::to_string(get_mean_ms());
    }

    MetricSample sample() const override {
        MetricSample s;
        s.name = name_;
        s.type = MetricType::TIMER;
        s.count = count_.load();
        s.sum = static_cast<double>(total_us_.load()) / 1000.0;
        s.value = get_mean_ms();
        return s;
    }

private:
    std::string name_;
    std::atomic<size_t> count_;
    std::atomic<int64_t> total_us_;
};

/**
 * Centralized metrics collector
 * Thread-safe singleton; returned references stay valid for the process lifetime
 */
class MetricsCollector {
public:
    static MetricsCollector& instance() {
        static MetricsCollector instance;
        return instance;
    }

    Counter& counter(const std::string& name) {
        return get_or_create(counters_, name);
    }

    Gauge& gauge(const std::string& name) {
        return get_or_create(gauges_, name);
    }

    Histogram& histogram(const std::string& name) {
        return get_or_create(histograms_, name);
    }

    Timer& timer(const std::string& name) {
        return get_or_create(timers_, name);
    }

    // Samples of every registered metric, ordered by type then name
    std::vector<MetricSample> snapshot() const {
        std::vector<MetricSample> result;
        std::lock_guard<std::mutex> lock(mutex_);
        append_samples(counters_, result);
        append_samples(gauges_, result);
        append_samples(histograms_, result);
        append_samples(timers_, result);
        return result;
    }

    std::vector<std::string> get_all_metrics() const {
        std::vector<std::string> result;
        std::lock_guard<std::mutex> lock(mutex_);
        append_strings(counters_, result);
        append_strings(gauges_, result);
        append_strings(histograms_, result);
        append_strings(timers_, result);
        return result;
    }

    void print_all_metrics() const {
        LOG_INFO_COMP("METRICS", "=== Metrics Summary ===");
        for (const auto& metric : get_all_metrics()) {
            LOG_INFO_COMP("METRICS", metric);
        }
    }

    // Zeroes every metric; registrations and references survive
    void reset_all() {
        std::lock_guard<std::mutex> lock(mutex_);
        reset_each(counters_);
        reset_each(gauges_);
        reset_each(histograms_);
        reset_each(timers_);
    }

private:
    MetricsCollector() = default;
    ~MetricsCollector() = default;
    MetricsCollector(const MetricsCollector&) = delete;
    MetricsCollector& operator=(const MetricsCollector&) = delete;

    template <typename Metric>
    Metric& get_or_create(std::map<std::string, std::unique_ptr<Metric>>& metrics, const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = metrics.find(name);
        if (it == metrics.end()) {
            it = metrics.emplace(name, std::make_unique<Metric>(name)).first;
        }
        return *it->second;
    }

    template <typename Metric>
    static void append_samples(const std::map<std::string, std::unique_ptr<Metric>>& metrics,
                               std::vector<MetricSample>& out) {
        for (const auto& entry : metrics) {
            out.push_back(entry.second->sample());
        }
    }

    template <typename Metric>
    static void append_strings(const std::map<std::string, std::unique_ptr<Metric>>& metrics,
                               std::vector<std::string>& out) {
        for (const auto& entry : metrics) {
            out.push_back(entry.second->to_string());
        }
    }

    template <typename Metric>
    static void reset_each(std::map<std::string, std::unique_ptr<Metric>>& metrics) {
        for (auto& entry : metrics) {
            entry.second->reset();
        }
    }

    mutable std::mutex mutex_;
    std::map<std::string, std::unique_ptr<Counter>> counters_;
    std::map<std::string, std::unique_ptr<Gauge>> gauges_;
    std::map<std::string, std::unique_ptr<Histogram>> histograms_;
    std::map<std::string, std::unique_ptr<Timer>> timers_;
};

// Convenience macros for easy metric access
#define METRICS_COUNTER(name) metrics::MetricsCollector::instance().counter(name)
#define METRICS_GAUGE(name) metrics::MetricsCollector::instance().gauge(name)
#define METRICS_HISTOGRAM(name) metrics::MetricsCollector::instance().histogram(name)
#define METRICS_TIMER(name) metrics::MetricsCollector::instance().timer(name)

} // namespace metrics
