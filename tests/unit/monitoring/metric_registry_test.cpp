#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include <gtest/gtest.h>

#include "ledger_test_support.h"
#include "coop_ledger/monitoring/metric_registry.h"

#if COOP_LEDGER_WITH_METRICS
#include <prometheus/metric_type.h>
#endif

namespace coop_ledger {
namespace {

#if COOP_LEDGER_WITH_METRICS
double CounterValue(const std::string& name, const MetricLabels& labels) {
    const auto collected = MetricRegistry::Instance().GetPrometheusRegistry()->Collect();
    for (const auto& family : collected) {
        if (family.name != name || family.type != prometheus::MetricType::Counter) {
            continue;
        }
        for (const auto& metric : family.metric) {
            MetricLabels metric_labels;
            for (const auto& pair : metric.label) {
                metric_labels[pair.name] = pair.value;
            }
            if (metric_labels == labels) {
                return metric.counter.value;
            }
        }
    }
    return -1.0;
}
#endif

TEST(MetricRegistryTest, CounterIncrementValueMatches) {
    auto counter = MetricRegistry::Instance().BuildCounter(
        "coop_ledger_test_counter_total", "test counter", {{"scope", "unit"}});
    ASSERT_NE(counter, nullptr);
    counter->Increment();
    counter->Increment(2.0);

#if COOP_LEDGER_WITH_METRICS
    EXPECT_DOUBLE_EQ(CounterValue("coop_ledger_test_counter_total", {{"scope", "unit"}}), 3.0);
#else
    SUCCEED();
#endif
}

TEST(MetricRegistryTest, SameLabelsShareOneSeries) {
    auto first = MetricRegistry::Instance().BuildCounter(
        "coop_ledger_test_shared_total", "shared counter", {{"tenant_id", "t-shared"}});
    auto second = MetricRegistry::Instance().BuildCounter(
        "coop_ledger_test_shared_total", "shared counter", {{"tenant_id", "t-shared"}});
    first->Increment();
    second->Increment();

#if COOP_LEDGER_WITH_METRICS
    EXPECT_DOUBLE_EQ(
        CounterValue("coop_ledger_test_shared_total", {{"tenant_id", "t-shared"}}), 2.0);
#else
    SUCCEED();
#endif
}

TEST(MetricRegistryTest, LedgerOperationInstrumentsAcceptSamples) {
    LedgerCounter counter;
    LedgerHistogram histogram;
    counter.Increment(5.0);
    histogram.Observe(1.0);

    RecordJournalPosted("branch-metrics", 2);
    RecordSettlementOutcome("branch-metrics", "AUTO_APPROVED");
    RecordSettlementVariance("branch-metrics", -40.0);
    RecordDayTransition("branch-metrics", "close");

#if COOP_LEDGER_WITH_METRICS
    EXPECT_DOUBLE_EQ(
        CounterValue("coop_ledger_ledger_lines_total", {{"tenant_id", "branch-metrics"}}), 2.0);
    EXPECT_DOUBLE_EQ(
        CounterValue("coop_ledger_day_transitions_total",
                     {{"tenant_id", "branch-metrics"}, {"transition", "close"}}),
        1.0);
#else
    SUCCEED();
#endif
}

TEST(MetricRegistryTest, SnapshotWritesTextExposition) {
    RecordDayTransition("branch-snapshot", "start");
    const auto path = test_support::TempPath("metrics", ".prom");
    std::string error;

#if COOP_LEDGER_WITH_METRICS
    ASSERT_TRUE(WriteMetricsSnapshot(path.string(), &error)) << error;
    std::ifstream in(path);
    std::stringstream text;
    text << in.rdbuf();
    EXPECT_NE(text.str().find("coop_ledger_day_transitions_total"), std::string::npos);
    EXPECT_NE(text.str().find("branch-snapshot"), std::string::npos);
    std::filesystem::remove(path);

    EXPECT_FALSE(WriteMetricsSnapshot("/nonexistent-dir/metrics.prom", &error));
    EXPECT_NE(error.find("unable to open"), std::string::npos);
#else
    EXPECT_FALSE(WriteMetricsSnapshot(path.string(), &error));
    EXPECT_EQ(error, "metrics support not enabled at build time");
    EXPECT_FALSE(std::filesystem::exists(path));
#endif
}

}  // namespace
}  // namespace coop_ledger
