#include "uuidres/util/Metrics.hpp"
#include <gtest/gtest.h>
#include <thread>
#include <vector>

using namespace uuidres::util;

TEST(MetricsTest, CountersAccumulate) {
    MetricRegistry reg;
    reg.increment("a");
    reg.increment("a", 2.5);
    EXPECT_DOUBLE_EQ(reg.counter("a"), 3.5);
    EXPECT_DOUBLE_EQ(reg.counter("never"), 0.0);
}

TEST(MetricsTest, GaugesOverwrite) {
    MetricRegistry reg;
    reg.setGauge("depth", 4);
    reg.setGauge("depth", 1);
    EXPECT_DOUBLE_EQ(reg.gauge("depth"), 1.0);
    EXPECT_EQ(reg.snapshotGauges().size(), 1u);
}

TEST(MetricsTest, ResetClearsEverything) {
    MetricRegistry reg;
    reg.increment("a");
    reg.setGauge("g", 2);
    reg.reset();
    EXPECT_TRUE(reg.snapshotCounters().empty());
    EXPECT_TRUE(reg.snapshotGauges().empty());
}

TEST(MetricsTest, ConcurrentIncrements) {
    MetricRegistry reg;
    std::vector<std::thread> ths;
    for (int t = 0; t < 4; ++t) {
        ths.emplace_back([&reg]{
            for (int i = 0; i < 1000; ++i) reg.increment("hits");
        });
    }
    for (auto& t : ths) t.join();
    EXPECT_DOUBLE_EQ(reg.counter("hits"), 4000.0);
}

TEST(MetricsTest, MacrosHitProcessRegistry) {
    auto before = MetricRegistry::instance().counter("metrics_test.macro");
    UUIDRES_METRIC_HIT("metrics_test.macro");
    UUIDRES_METRIC_INC("metrics_test.macro", 2.0);
    UUIDRES_METRIC_SET("metrics_test.gauge", 9.0);
    EXPECT_DOUBLE_EQ(MetricRegistry::instance().counter("metrics_test.macro"), before + 3.0);
    EXPECT_DOUBLE_EQ(MetricRegistry::instance().gauge("metrics_test.gauge"), 9.0);
}
