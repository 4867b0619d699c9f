#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace idreg {

class LatencyHistogram {
public:
    explicit LatencyHistogram(std::vector<uint64_t> bounds_ns);

    void record(uint64_t latency_ns);

    struct Summary {
        uint64_t p50 = 0;
        uint64_t p99 = 0;
        uint64_t max = 0;
        uint64_t count = 0;
        uint64_t sum = 0;
    };

    Summary summarize() const;

private:
    std::vector<uint64_t> bounds_;
    std::vector<std::atomic<uint64_t>> hits_;  // one past bounds_ for overflow
    std::atomic<uint64_t> count_{0};
    std::atomic<uint64_t> sum_{0};
    std::atomic<uint64_t> max_{0};
};

class MetricsCollector {
public:
    static MetricsCollector& instance();

    void increment_counter(const std::string& name, uint64_t delta = 1);
    uint64_t get_counter(const std::string& name) const;

    void set_gauge(const std::string& name, double value);
    double get_gauge(const std::string& name) const;

    void record_latency(const std::string& name, uint64_t latency_ns);
    LatencyHistogram::Summary get_latency(const std::string& name) const;

    std::string prometheus_text() const;
    std::string json_text() const;

private:
    MetricsCollector() = default;

    mutable std::mutex mutex_;
    // Ordered so exports are stable
    std::map<std::string, uint64_t> counters_;
    std::map<std::string, double> gauges_;
    std::map<std::string, std::unique_ptr<LatencyHistogram>> histograms_;

    // Store rewrites are small files: 10us .. 100ms
    const std::vector<uint64_t> default_bounds_ns_ = {
        10000, 50000, 100000, 500000, 1000000, 5000000, 20000000, 100000000
    };
};

// Records the lifetime of the scope into a latency histogram
class ScopedTimer {
public:
    explicit ScopedTimer(std::string metric_name);
    ~ScopedTimer();

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    std::string metric_name_;
    std::chrono::steady_clock::time_point start_;
};

} // namespace idreg
