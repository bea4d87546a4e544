#include "coop_ledger/monitoring/metric_registry.h"

#include <cmath>
#include <fstream>
#include <utility>

#if COOP_LEDGER_WITH_METRICS
#include <prometheus/text_serializer.h>
#endif

namespace coop_ledger {
namespace {

const std::vector<double>& VarianceBuckets() {
    static const std::vector<double> buckets{0.01, 1.0, 10.0, 50.0, 100.0, 500.0, 1000.0, 5000.0};
    return buckets;
}

}  // namespace

LedgerCounter::LedgerCounter(std::function<void(double)> fn) : fn_(std::move(fn)) {}

void LedgerCounter::Increment(double value) const {
    if (fn_) {
        fn_(value);
    }
}

LedgerHistogram::LedgerHistogram(std::function<void(double)> fn) : fn_(std::move(fn)) {}

void LedgerHistogram::Observe(double value) const {
    if (fn_) {
        fn_(value);
    }
}

MetricRegistry& MetricRegistry::Instance() {
    static MetricRegistry instance;
    return instance;
}

MetricRegistry::MetricRegistry() {
#if COOP_LEDGER_WITH_METRICS
    registry_ = std::make_shared<prometheus::Registry>();
#endif
}

std::string MetricRegistry::BuildMetricKey(const std::string& name, const MetricLabels& labels) {
    std::string key = name;
    for (const auto& [label_key, label_value] : labels) {
        key += "|" + label_key + "=" + label_value;
    }
    return key;
}

std::shared_ptr<LedgerCounter> MetricRegistry::BuildCounter(const std::string& name,
                                                            const std::string& help,
                                                            const MetricLabels& labels) {
#if !COOP_LEDGER_WITH_METRICS
    (void)name;
    (void)help;
    (void)labels;
    return std::make_shared<LedgerCounter>();
#else
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string metric_key = BuildMetricKey(name, labels);

    auto metric_it = counters_.find(metric_key);
    if (metric_it != counters_.end()) {
        auto* metric = metric_it->second;
        return std::make_shared<LedgerCounter>([metric](double value) { metric->Increment(value); });
    }

    prometheus::Family<prometheus::Counter>* family = nullptr;
    auto family_it = counter_families_.find(name);
    if (family_it == counter_families_.end()) {
        family = &prometheus::BuildCounter().Name(name).Help(help).Register(*registry_);
        counter_families_[name] = family;
    } else {
        family = family_it->second;
    }

    auto* metric = &family->Add(labels);
    counters_[metric_key] = metric;
    return std::make_shared<LedgerCounter>([metric](double value) { metric->Increment(value); });
#endif
}

std::shared_ptr<LedgerHistogram> MetricRegistry::BuildHistogram(const std::string& name,
                                                                const std::string& help,
                                                                const std::vector<double>& buckets,
                                                                const MetricLabels& labels) {
#if !COOP_LEDGER_WITH_METRICS
    (void)name;
    (void)help;
    (void)buckets;
    (void)labels;
    return std::make_shared<LedgerHistogram>();
#else
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string metric_key = BuildMetricKey(name, labels);

    auto metric_it = histograms_.find(metric_key);
    if (metric_it != histograms_.end()) {
        auto* metric = metric_it->second;
        return std::make_shared<LedgerHistogram>([metric](double value) { metric->Observe(value); });
    }

    prometheus::Family<prometheus::Histogram>* family = nullptr;
    auto family_it = histogram_families_.find(name);
    if (family_it == histogram_families_.end()) {
        family = &prometheus::BuildHistogram().Name(name).Help(help).Register(*registry_);
        histogram_families_[name] = family;
    } else {
        family = family_it->second;
    }

    auto* metric = &family->Add(labels, buckets);
    histograms_[metric_key] = metric;
    return std::make_shared<LedgerHistogram>([metric](double value) { metric->Observe(value); });
#endif
}

#if COOP_LEDGER_WITH_METRICS
std::shared_ptr<prometheus::Registry> MetricRegistry::GetPrometheusRegistry() const {
    return registry_;
}
#endif

void RecordJournalPosted(const std::string& tenant_id, std::size_t line_count) {
    MetricRegistry::Instance()
        .BuildCounter("coop_ledger_journal_entries_total",
                      "Journal entries posted",
                      {{"tenant_id", tenant_id}})
        ->Increment();
    MetricRegistry::Instance()
        .BuildCounter("coop_ledger_ledger_lines_total",
                      "Ledger lines posted",
                      {{"tenant_id", tenant_id}})
        ->Increment(static_cast<double>(line_count));
}

void RecordSettlementOutcome(const std::string& tenant_id, const std::string& status) {
    MetricRegistry::Instance()
        .BuildCounter("coop_ledger_settlements_total",
                      "Teller settlements by resulting status",
                      {{"tenant_id", tenant_id}, {"status", status}})
        ->Increment();
}

void RecordSettlementVariance(const std::string& tenant_id, double difference) {
    MetricRegistry::Instance()
        .BuildHistogram("coop_ledger_settlement_variance",
                        "Absolute teller cash variance at settlement",
                        VarianceBuckets(),
                        {{"tenant_id", tenant_id}})
        ->Observe(std::fabs(difference));
}

void RecordDayTransition(const std::string& tenant_id, const std::string& transition) {
    MetricRegistry::Instance()
        .BuildCounter("coop_ledger_day_transitions_total",
                      "Day book lifecycle transitions",
                      {{"tenant_id", tenant_id}, {"transition", transition}})
        ->Increment();
}

bool WriteMetricsSnapshot(const std::string& path, std::string* error) {
#if !COOP_LEDGER_WITH_METRICS
    (void)path;
    if (error != nullptr) {
        *error = "metrics support not enabled at build time";
    }
    return false;
#else
    const auto registry = MetricRegistry::Instance().GetPrometheusRegistry();
    const std::string text = prometheus::TextSerializer().Serialize(registry->Collect());
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out.is_open()) {
        if (error != nullptr) {
            *error = "unable to open metrics file: " + path;
        }
        return false;
    }
    out << text;
    out.flush();
    if (!out.good()) {
        if (error != nullptr) {
            *error = "failed writing metrics file: " + path;
        }
        return false;
    }
    return true;
#endif
}

}  // namespace coop_ledger
