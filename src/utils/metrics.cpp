#include "utils/metrics.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>

namespace thisthat {

// LatencyHistogram implementation

LatencyHistogram::LatencyHistogram(const std::string& name, size_t max_samples)
    : name_(name)
    , max_samples_(std::max<size_t>(max_samples, 1))
{
    samples_us_.reserve(max_samples_);
}

void LatencyHistogram::record(Duration d) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (samples_us_.size() < max_samples_) {
        samples_us_.push_back(d.count());
    } else {
        samples_us_[next_slot_] = d.count();
        next_slot_ = (next_slot_ + 1) % max_samples_;
    }
    count_++;
}

LatencyHistogram::Duration LatencyHistogram::percentile(double p) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (samples_us_.empty()) return Duration::zero();

    std::vector<int64_t> sorted = samples_us_;
    std::sort(sorted.begin(), sorted.end());
    size_t idx = static_cast<size_t>((p / 100.0) * static_cast<double>(sorted.size() - 1));
    return Duration(sorted[idx]);
}

LatencyHistogram::Duration LatencyHistogram::max() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (samples_us_.empty()) return Duration::zero();
    return Duration(*std::max_element(samples_us_.begin(), samples_us_.end()));
}

void LatencyHistogram::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    samples_us_.clear();
    next_slot_ = 0;
    count_ = 0;
}

// MetricsRegistry implementation

MetricsRegistry& MetricsRegistry::instance() {
    static MetricsRegistry registry;
    return registry;
}

Counter& MetricsRegistry::counter(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = counters_[name];
    if (!slot) {
        slot = std::make_unique<Counter>(name);
    }
    return *slot;
}

Gauge& MetricsRegistry::gauge(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = gauges_[name];
    if (!slot) {
        slot = std::make_unique<Gauge>(name);
    }
    return *slot;
}

LatencyHistogram& MetricsRegistry::histogram(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = histograms_[name];
    if (!slot) {
        slot = std::make_unique<LatencyHistogram>(name);
    }
    return *slot;
}

std::string MetricsRegistry::to_json() const {
    std::lock_guard<std::mutex> lock(mutex_);

    nlohmann::json j;
    j["counters"] = nlohmann::json::object();
    for (const auto& [name, counter] : counters_) {
        j["counters"][name] = counter->value();
    }

    j["gauges"] = nlohmann::json::object();
    for (const auto& [name, gauge] : gauges_) {
        j["gauges"][name] = gauge->value();
    }

    j["histograms"] = nlohmann::json::object();
    for (const auto& [name, hist] : histograms_) {
        j["histograms"][name] = {
            {"count", hist->count()},
            {"p50_us", hist->percentile(50.0).count()},
            {"p99_us", hist->percentile(99.0).count()},
            {"max_us", hist->max().count()}
        };
    }

    return j.dump(2);
}

void MetricsRegistry::reset_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [name, counter] : counters_) {
        counter->reset();
    }
    for (auto& [name, gauge] : gauges_) {
        gauge->set(0.0);
    }
    for (auto& [name, hist] : histograms_) {
        hist->reset();
    }
}

// ScopedLatency implementation

ScopedLatency::ScopedLatency(LatencyHistogram& histogram)
    : histogram_(histogram)
    , start_(std::chrono::steady_clock::now())
{
}

ScopedLatency::~ScopedLatency() {
    histogram_.record(std::chrono::duration_cast<LatencyHistogram::Duration>(
        std::chrono::steady_clock::now() - start_));
}

} // namespace thisthat
