#include <gtest/gtest.h>
#include "utils/metrics.hpp"
#include <nlohmann/json.hpp>

using namespace thisthat;

TEST(MetricsTest, HistogramKeepsRecentWindow) {
    LatencyHistogram hist("h", 4);
    for (int i = 1; i <= 6; ++i) {
        hist.record(std::chrono::microseconds(i * 100));
    }

    EXPECT_EQ(hist.count(), 6);
    // Samples 100 and 200 were overwritten
    EXPECT_EQ(hist.percentile(0).count(), 300);
    EXPECT_EQ(hist.max().count(), 600);

    hist.reset();
    EXPECT_EQ(hist.count(), 0);
    EXPECT_EQ(hist.max().count(), 0);
}

TEST(MetricsTest, RegistryExportsJson) {
    auto& registry = MetricsRegistry::instance();
    registry.reset_all();

    METRIC_COUNTER("test_counter").increment(3);
    METRIC_GAUGE("test_gauge").set(1.5);
    {
        ScopedLatency latency(METRIC_HISTOGRAM("test_latency"));
    }

    auto j = nlohmann::json::parse(registry.to_json());
    EXPECT_EQ(j["counters"]["test_counter"].get<int64_t>(), 3);
    EXPECT_DOUBLE_EQ(j["gauges"]["test_gauge"].get<double>(), 1.5);
    EXPECT_EQ(j["histograms"]["test_latency"]["count"].get<int64_t>(), 1);

    registry.reset_all();
    EXPECT_EQ(METRIC_COUNTER("test_counter").value(), 0);
}
