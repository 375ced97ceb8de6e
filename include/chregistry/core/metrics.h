#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace chregistry {

struct MetricLabels {
    // Sorted so that exposition is deterministic.
    std::map<std::string, std::string> kv;

    std::string ToPrometheusLabelText() const;
};

class Counter {
public:
    // Thread-safe
    void Inc(std::int64_t v = 1) { value_.fetch_add(v, std::memory_order_relaxed); }
    std::int64_t Value() const { return value_.load(std::memory_order_relaxed); }

private:
    std::atomic<std::int64_t> value_{0};
};

class Gauge {
public:
    // Thread-safe
    void Set(double v);
    double Value() const;

private:
    mutable std::mutex mu_;
    double value_{0.0};
};

class Histogram {
public:
    struct Data {
        std::vector<double> bounds;
        std::vector<std::uint64_t> counts; // per bucket, not cumulative
        double sum = 0.0;
        std::uint64_t count = 0;
    };

    // Thread-safe
    explicit Histogram(std::vector<double> bounds);

    void Observe(double v);
    Data Snapshot() const;

private:
    mutable std::mutex mu_;
    Data data_;
};

// Named instruments keyed by (name, labels). Instruments live as long as the registry,
// so returned references stay valid.
class MetricsRegistry {
public:
    // Thread-safe
    Counter& CounterMetric(std::string name, std::string help, MetricLabels labels = {});
    Gauge& GaugeMetric(std::string name, std::string help, MetricLabels labels = {});
    Histogram& HistogramMetric(std::string name, std::string help, std::vector<double> bounds, MetricLabels labels = {});

    // Thread-safe
    std::string ToPrometheusText() const;

private:
    template <class Instrument>
    struct Entry {
        std::string name;
        std::string help;
        MetricLabels labels;
        std::unique_ptr<Instrument> instrument;
    };

    static std::string Key(std::string_view name, const MetricLabels& labels);

    mutable std::mutex mu_;
    std::map<std::string, Entry<Counter>> counters_;
    std::map<std::string, Entry<Gauge>> gauges_;
    std::map<std::string, Entry<Histogram>> histograms_;
};

// Process-wide registry served on /metrics (Thread-safe)
MetricsRegistry& DefaultMetrics();

} // namespace chregistry
