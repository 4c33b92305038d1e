#include "mathtune/monitoring/metric_registry.h"

#include <utility>

#if MATHTUNE_WITH_METRICS
#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#endif

namespace mathtune {
namespace {

#if MATHTUNE_WITH_METRICS
using HandleMap = std::unordered_map<std::string, void*>;

// Families are keyed by kind and name, metrics by kind, name and labels.
template <typename MetricT, typename BuilderT, typename... AddArgs>
MetricT* FindOrAddMetric(prometheus::Registry* registry,
                         HandleMap* families,
                         HandleMap* metrics,
                         BuilderT&& builder,
                         const std::string& kind,
                         const std::string& name,
                         const std::string& help,
                         const std::string& metric_key,
                         const MetricLabels& labels,
                         AddArgs&&... add_args) {
    const std::string full_key = kind + ":" + metric_key;
    const auto metric_it = metrics->find(full_key);
    if (metric_it != metrics->end()) {
        return reinterpret_cast<MetricT*>(metric_it->second);
    }

    prometheus::Family<MetricT>* family = nullptr;
    const std::string family_key = kind + ":" + name;
    const auto family_it = families->find(family_key);
    if (family_it == families->end()) {
        family = &builder.Name(name).Help(help).Register(*registry);
        (*families)[family_key] = family;
    } else {
        family = reinterpret_cast<prometheus::Family<MetricT>*>(family_it->second);
    }

    MetricT* metric = &family->Add(labels, std::forward<AddArgs>(add_args)...);
    (*metrics)[full_key] = metric;
    return metric;
}
#endif

}  // namespace

MonitoringCounter::MonitoringCounter(std::function<void(double)> fn) : fn_(std::move(fn)) {}

void MonitoringCounter::Increment(double value) const {
    if (fn_) {
        fn_(value);
    }
}

MonitoringGauge::MonitoringGauge(std::function<void(double)> fn) : fn_(std::move(fn)) {}

void MonitoringGauge::Set(double value) const {
    if (fn_) {
        fn_(value);
    }
}

MonitoringHistogram::MonitoringHistogram(std::function<void(double)> fn) : fn_(std::move(fn)) {}

void MonitoringHistogram::Observe(double value) const {
    if (fn_) {
        fn_(value);
    }
}

MetricRegistry& MetricRegistry::Instance() {
    static MetricRegistry instance;
    return instance;
}

MetricRegistry::MetricRegistry() {
#if MATHTUNE_WITH_METRICS
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

std::shared_ptr<MonitoringCounter> MetricRegistry::BuildCounter(const std::string& name,
                                                                const std::string& help,
                                                                const MetricLabels& labels) {
#if !MATHTUNE_WITH_METRICS
    (void)name;
    (void)help;
    (void)labels;
    return std::make_shared<MonitoringCounter>();
#else
    std::lock_guard<std::mutex> lock(mutex_);
    auto* metric = FindOrAddMetric<prometheus::Counter>(
        registry_.get(), &families_, &metrics_, prometheus::BuildCounter(), "counter", name, help,
        BuildMetricKey(name, labels), labels);
    return std::make_shared<MonitoringCounter>([metric](double value) { metric->Increment(value); });
#endif
}

std::shared_ptr<MonitoringGauge> MetricRegistry::BuildGauge(const std::string& name,
                                                            const std::string& help,
                                                            const MetricLabels& labels) {
#if !MATHTUNE_WITH_METRICS
    (void)name;
    (void)help;
    (void)labels;
    return std::make_shared<MonitoringGauge>();
#else
    std::lock_guard<std::mutex> lock(mutex_);
    auto* metric = FindOrAddMetric<prometheus::Gauge>(
        registry_.get(), &families_, &metrics_, prometheus::BuildGauge(), "gauge", name, help,
        BuildMetricKey(name, labels), labels);
    return std::make_shared<MonitoringGauge>([metric](double value) { metric->Set(value); });
#endif
}

std::shared_ptr<MonitoringHistogram> MetricRegistry::BuildHistogram(
    const std::string& name,
    const std::string& help,
    const std::vector<double>& buckets,
    const MetricLabels& labels) {
#if !MATHTUNE_WITH_METRICS
    (void)name;
    (void)help;
    (void)buckets;
    (void)labels;
    return std::make_shared<MonitoringHistogram>();
#else
    std::lock_guard<std::mutex> lock(mutex_);
    auto* metric = FindOrAddMetric<prometheus::Histogram>(
        registry_.get(), &families_, &metrics_, prometheus::BuildHistogram(), "histogram", name,
        help, BuildMetricKey(name, labels), labels, prometheus::Histogram::BucketBoundaries(buckets));
    return std::make_shared<MonitoringHistogram>([metric](double value) { metric->Observe(value); });
#endif
}

#if MATHTUNE_WITH_METRICS
std::shared_ptr<prometheus::Registry> MetricRegistry::GetPrometheusRegistry() const {
    return registry_;
}
#endif

}  // namespace mathtune
