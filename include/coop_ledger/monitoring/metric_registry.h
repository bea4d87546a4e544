#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#if COOP_LEDGER_WITH_METRICS
#include <prometheus/counter.h>
#include <prometheus/family.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>
#endif

namespace coop_ledger {

using MetricLabels = std::map<std::string, std::string>;

class LedgerCounter {
public:
    explicit LedgerCounter(std::function<void(double)> fn = nullptr);
    void Increment(double value = 1.0) const;

private:
    std::function<void(double)> fn_;
};

class LedgerHistogram {
public:
    explicit LedgerHistogram(std::function<void(double)> fn = nullptr);
    void Observe(double value) const;

private:
    std::function<void(double)> fn_;
};

// Process-wide metric families for ledger operations. Without
// COOP_LEDGER_WITH_METRICS every instrument is a no-op.
class MetricRegistry {
public:
    static MetricRegistry& Instance();

    std::shared_ptr<LedgerCounter> BuildCounter(const std::string& name,
                                                const std::string& help,
                                                const MetricLabels& labels = {});

    std::shared_ptr<LedgerHistogram> BuildHistogram(const std::string& name,
                                                    const std::string& help,
                                                    const std::vector<double>& buckets,
                                                    const MetricLabels& labels = {});

#if COOP_LEDGER_WITH_METRICS
    std::shared_ptr<prometheus::Registry> GetPrometheusRegistry() const;
#endif

private:
    MetricRegistry();

    static std::string BuildMetricKey(const std::string& name, const MetricLabels& labels);

    mutable std::mutex mutex_;

#if COOP_LEDGER_WITH_METRICS
    std::shared_ptr<prometheus::Registry> registry_;
    std::unordered_map<std::string, prometheus::Family<prometheus::Counter>*> counter_families_;
    std::unordered_map<std::string, prometheus::Family<prometheus::Histogram>*>
        histogram_families_;
    std::unordered_map<std::string, prometheus::Counter*> counters_;
    std::unordered_map<std::string, prometheus::Histogram*> histograms_;
#endif
};

// Instruments shared by the posting, settlement and day close services.
void RecordJournalPosted(const std::string& tenant_id, std::size_t line_count);
void RecordSettlementOutcome(const std::string& tenant_id, const std::string& status);
void RecordSettlementVariance(const std::string& tenant_id, double difference);
void RecordDayTransition(const std::string& tenant_id, const std::string& transition);

// Writes every registered family in Prometheus text format to path.
bool WriteMetricsSnapshot(const std::string& path, std::string* error);

}  // namespace coop_ledger
