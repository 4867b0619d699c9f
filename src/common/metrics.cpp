#include "metrics.hpp"
#include <nlohmann/json.hpp>
#include <sstream>

namespace idreg {

LatencyHistogram::LatencyHistogram(std::vector<uint64_t> bounds_ns)
    : bounds_(std::move(bounds_ns)), hits_(bounds_.size() + 1) {
    for (auto& hit : hits_) {
        hit.store(0);
    }
}

void LatencyHistogram::record(uint64_t latency_ns) {
    count_.fetch_add(1);
    sum_.fetch_add(latency_ns);

    uint64_t seen = max_.load();
    while (latency_ns > seen && !max_.compare_exchange_weak(seen, latency_ns)) {
    }

    size_t slot = bounds_.size();
    for (size_t i = 0; i < bounds_.size(); ++i) {
        if (latency_ns <= bounds_[i]) {
            slot = i;
            break;
        }
    }
    hits_[slot].fetch_add(1);
}

LatencyHistogram::Summary LatencyHistogram::summarize() const {
    Summary summary;
    summary.count = count_.load();
    summary.sum = sum_.load();
    summary.max = max_.load();
    if (summary.count == 0) {
        return summary;
    }

    // Upper bound of the bucket holding the requested rank
    auto rank_bound = [&](double quantile) -> uint64_t {
        uint64_t target = static_cast<uint64_t>(summary.count * quantile);
        if (target == 0) target = 1;
        uint64_t seen = 0;
        for (size_t i = 0; i < hits_.size(); ++i) {
            seen += hits_[i].load();
            if (seen >= target) {
                return i < bounds_.size() ? bounds_[i] : summary.max;
            }
        }
        return summary.max;
    };

    summary.p50 = rank_bound(0.50);
    summary.p99 = rank_bound(0.99);
    return summary;
}

MetricsCollector& MetricsCollector::instance() {
    static MetricsCollector collector;
    return collector;
}

void MetricsCollector::increment_counter(const std::string& name, uint64_t delta) {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_[name] += delta;
}

uint64_t MetricsCollector::get_counter(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counters_.find(name);
    return it != counters_.end() ? it->second : 0;
}

void MetricsCollector::set_gauge(const std::string& name, double value) {
    std::lock_guard<std::mutex> lock(mutex_);
    gauges_[name] = value;
}

double MetricsCollector::get_gauge(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = gauges_.find(name);
    return it != gauges_.end() ? it->second : 0.0;
}

void MetricsCollector::record_latency(const std::string& name, uint64_t latency_ns) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& histogram = histograms_[name];
    if (!histogram) {
        histogram = std::make_unique<LatencyHistogram>(default_bounds_ns_);
    }
    histogram->record(latency_ns);
}

LatencyHistogram::Summary MetricsCollector::get_latency(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = histograms_.find(name);
    return it != histograms_.end() ? it->second->summarize() : LatencyHistogram::Summary{};
}

std::string MetricsCollector::prometheus_text() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream out;

    for (const auto& [name, value] : counters_) {
        out << "# TYPE " << name << " counter\n" << name << " " << value << "\n";
    }
    for (const auto& [name, value] : gauges_) {
        out << "# TYPE " << name << " gauge\n" << name << " " << value << "\n";
    }
    for (const auto& [name, histogram] : histograms_) {
        auto summary = histogram->summarize();
        out << "# TYPE " << name << " summary\n";
        out << name << "{quantile=\"0.5\"} " << summary.p50 << "\n";
        out << name << "{quantile=\"0.99\"} " << summary.p99 << "\n";
        out << name << "_sum " << summary.sum << "\n";
        out << name << "_count " << summary.count << "\n";
    }
    return out.str();
}

std::string MetricsCollector::json_text() const {
    std::lock_guard<std::mutex> lock(mutex_);

    nlohmann::json metrics;
    metrics["counters"] = nlohmann::json::object();
    for (const auto& [name, value] : counters_) {
        metrics["counters"][name] = value;
    }
    metrics["gauges"] = nlohmann::json::object();
    for (const auto& [name, value] : gauges_) {
        metrics["gauges"][name] = value;
    }
    metrics["histograms"] = nlohmann::json::object();
    for (const auto& [name, histogram] : histograms_) {
        auto summary = histogram->summarize();
        metrics["histograms"][name] = {
            {"p50", summary.p50},
            {"p99", summary.p99},
            {"max", summary.max},
            {"count", summary.count}
        };
    }
    return metrics.dump();
}

ScopedTimer::ScopedTimer(std::string metric_name)
    : metric_name_(std::move(metric_name)), start_(std::chrono::steady_clock::now()) {
}

ScopedTimer::~ScopedTimer() {
    auto elapsed = std::chrono::steady_clock::now() - start_;
    MetricsCollector::instance().record_latency(
        metric_name_, std::chrono::duration_cast<std::chrono::nanoseconds>(elapsed).count());
}

} // namespace idreg
