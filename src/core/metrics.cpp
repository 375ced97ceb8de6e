#include <chregistry/core/metrics.h>

#include <algorithm>
#include <sstream>

namespace chregistry {
namespace {

void WriteHeader(std::ostringstream& oss, const std::string& name, const std::string& help, const char* type) {
    oss << "# HELP " << name << " " << help << "\n";
    oss << "# TYPE " << name << " " << type << "\n";
}

std::string FormatBound(double b) {
    std::ostringstream oss;
    oss << b;
    return oss.str();
}

} // namespace

std::string MetricLabels::ToPrometheusLabelText() const {
    if (kv.empty()) {
        return {};
    }
    std::string out = "{";
    bool first = true;
    for (const auto& [k, v] : kv) {
        if (!first) {
            out.push_back(',');
        }
        first = false;
        out.append(k);
        out.append("=\"");
        for (char c : v) {
            switch (c) {
                case '\\': out.append("\\\\"); break;
                case '"': out.append("\\\""); break;
                case '\n': out.append("\\n"); break;
                default: out.push_back(c); break;
            }
        }
        out.push_back('"');
    }
    out.push_back('}');
    return out;
}

void Gauge::Set(double v) {
    std::lock_guard<std::mutex> lk(mu_);
    value_ = v;
}

double Gauge::Value() const {
    std::lock_guard<std::mutex> lk(mu_);
    return value_;
}

Histogram::Histogram(std::vector<double> bounds) {
    std::sort(bounds.begin(), bounds.end());
    data_.counts.assign(bounds.size(), 0);
    data_.bounds = std::move(bounds);
}

void Histogram::Observe(double v) {
    std::lock_guard<std::mutex> lk(mu_);
    data_.sum += v;
    ++data_.count;

    auto it = std::lower_bound(data_.bounds.begin(), data_.bounds.end(), v);
    if (it != data_.bounds.end()) {
        ++data_.counts[static_cast<std::size_t>(it - data_.bounds.begin())];
    }
}

Histogram::Data Histogram::Snapshot() const {
    std::lock_guard<std::mutex> lk(mu_);
    return data_;
}

std::string MetricsRegistry::Key(std::string_view name, const MetricLabels& labels) {
    std::string key(name);
    key.append(labels.ToPrometheusLabelText());
    return key;
}

Counter& MetricsRegistry::CounterMetric(std::string name, std::string help, MetricLabels labels) {
    std::lock_guard<std::mutex> lk(mu_);
    auto key = Key(name, labels);
    auto it = counters_.find(key);
    if (it == counters_.end()) {
        Entry<Counter> e{std::move(name), std::move(help), std::move(labels), std::make_unique<Counter>()};
        it = counters_.emplace(std::move(key), std::move(e)).first;
    }
    return *it->second.instrument;
}

Gauge& MetricsRegistry::GaugeMetric(std::string name, std::string help, MetricLabels labels) {
    std::lock_guard<std::mutex> lk(mu_);
    auto key = Key(name, labels);
    auto it = gauges_.find(key);
    if (it == gauges_.end()) {
        Entry<Gauge> e{std::move(name), std::move(help), std::move(labels), std::make_unique<Gauge>()};
        it = gauges_.emplace(std::move(key), std::move(e)).first;
    }
    return *it->second.instrument;
}

Histogram& MetricsRegistry::HistogramMetric(std::string name, std::string help, std::vector<double> bounds, MetricLabels labels) {
    std::lock_guard<std::mutex> lk(mu_);
    auto key = Key(name, labels);
    auto it = histograms_.find(key);
    if (it == histograms_.end()) {
        Entry<Histogram> e{std::move(name), std::move(help), std::move(labels),
                           std::make_unique<Histogram>(std::move(bounds))};
        it = histograms_.emplace(std::move(key), std::move(e)).first;
    }
    return *it->second.instrument;
}

std::string MetricsRegistry::ToPrometheusText() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::ostringstream oss;

    // Series of one metric sort next to each other, so HELP/TYPE go out once per name.
    std::string last;
    auto header = [&](const std::string& name, const std::string& help, const char* type) {
        if (name != last) {
            WriteHeader(oss, name, help, type);
            last = name;
        }
    };

    for (const auto& [key, e] : counters_) {
        header(e.name, e.help, "counter");
        oss << key << " " << e.instrument->Value() << "\n";
    }

    for (const auto& [key, e] : gauges_) {
        header(e.name, e.help, "gauge");
        oss << key << " " << e.instrument->Value() << "\n";
    }

    for (const auto& [key, e] : histograms_) {
        auto data = e.instrument->Snapshot();
        header(e.name, e.help, "histogram");

        std::uint64_t cumulative = 0;
        for (std::size_t i = 0; i < data.bounds.size(); ++i) {
            cumulative += data.counts[i];
            MetricLabels labels = e.labels;
            labels.kv["le"] = FormatBound(data.bounds[i]);
            oss << e.name << "_bucket" << labels.ToPrometheusLabelText() << " " << cumulative << "\n";
        }
        MetricLabels inf = e.labels;
        inf.kv["le"] = "+Inf";
        oss << e.name << "_bucket" << inf.ToPrometheusLabelText() << " " << data.count << "\n";
        oss << e.name << "_sum" << e.labels.ToPrometheusLabelText() << " " << data.sum << "\n";
        oss << e.name << "_count" << e.labels.ToPrometheusLabelText() << " " << data.count << "\n";
    }

    return oss.str();
}

MetricsRegistry& DefaultMetrics() {
    static MetricsRegistry registry;
    return registry;
}

} // namespace chregistry
