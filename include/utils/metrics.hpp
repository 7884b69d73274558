#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <atomic>
#include <chrono>
#include <cstdint>

namespace thisthat {

/**
 * Bounded latency sample window. Keeps the most recent max_samples values.
 */
class LatencyHistogram {
public:
    using Duration = std::chrono::microseconds;

    explicit LatencyHistogram(const std::string& name, size_t max_samples = 4096);

    void record(Duration d);

    Duration percentile(double p) const;
    Duration max() const;

    int64_t count() const { return count_.load(); }
    void reset();

    const std::string& name() const { return name_; }

private:
    std::string name_;
    size_t max_samples_;
    std::atomic<int64_t> count_{0};

    mutable std::mutex mutex_;
    std::vector<int64_t> samples_us_;
    size_t next_slot_{0};
};

/**
 * Monotonic counter.
 */
class Counter {
public:
    explicit Counter(const std::string& name) : name_(name) {}

    void increment(int64_t delta = 1) { value_ += delta; }
    int64_t value() const { return value_.load(); }
    void reset() { value_ = 0; }

    const std::string& name() const { return name_; }

private:
    std::string name_;
    std::atomic<int64_t> value_{0};
};

/**
 * Gauge metric (can go up or down).
 */
class Gauge {
public:
    explicit Gauge(const std::string& name) : name_(name) {}

    void set(double value) { value_ = value; }
    double value() const { return value_.load(); }

    const std::string& name() const { return name_; }

private:
    std::string name_;
    std::atomic<double> value_{0.0};
};

/**
 * Process-wide registry of named metrics.
 */
class MetricsRegistry {
public:
    static MetricsRegistry& instance();

    Counter& counter(const std::string& name);
    Gauge& gauge(const std::string& name);
    LatencyHistogram& histogram(const std::string& name);

    std::string to_json() const;
    void reset_all();

private:
    MetricsRegistry() = default;

    mutable std::mutex mutex_;
    std::map<std::string, std::unique_ptr<Counter>> counters_;
    std::map<std::string, std::unique_ptr<Gauge>> gauges_;
    std::map<std::string, std::unique_ptr<LatencyHistogram>> histograms_;
};

#define METRIC_COUNTER(name) ::thisthat::MetricsRegistry::instance().counter(name)
#define METRIC_GAUGE(name) ::thisthat::MetricsRegistry::instance().gauge(name)
#define METRIC_HISTOGRAM(name) ::thisthat::MetricsRegistry::instance().histogram(name)

/**
 * Records the elapsed time into a histogram when it goes out of scope.
 */
class ScopedLatency {
public:
    explicit ScopedLatency(LatencyHistogram& histogram);
    ~ScopedLatency();

private:
    LatencyHistogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

} // namespace thisthat
