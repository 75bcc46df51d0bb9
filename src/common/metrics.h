#pragma once

/// @file metrics.h
/// @brief In-process metrics for cache operations

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace rcache {

/// @brief A monotonically increasing counter
class Counter {
public:
    explicit Counter(std::string name, std::string description = "");

    void Increment();

    /// @brief Add a non-negative amount; negative deltas are ignored
    void Add(int64_t delta);

    int64_t Value() const;

    void Reset();

    const std::string& Name() const { return name_; }
    const std::string& Description() const { return description_; }

private:
    std::string name_;
    std::string description_;
    std::atomic<int64_t> value_{0};
};

/// @brief A histogram for measuring latency distributions (seconds)
class Histogram {
public:
    explicit Histogram(std::string name, std::string description = "");
    Histogram(std::string name, std::vector<double> buckets, std::string description = "");

    void Observe(double value);

    /// @brief Zero every bucket, the count and the sum
    void Reset();

    int64_t Count() const;
    double Sum() const;

    /// @brief Cumulative bucket counts, ending with the +Inf bucket
    std::vector<std::pair<double, int64_t>> Buckets() const;

    const std::string& Name() const { return name_; }
    const std::string& Description() const { return description_; }

private:
    std::string name_;
    std::string description_;
    std::vector<double> bucket_bounds_;

    mutable std::mutex mutex_;
    std::vector<int64_t> bucket_counts_;
    int64_t count_ = 0;
    double sum_ = 0.0;
};

/// @brief RAII timer that records its lifetime into a histogram
class ScopedTimer {
public:
    explicit ScopedTimer(Histogram& histogram);
    ~ScopedTimer();

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// @brief Registry owning every metric in the process
///
/// Metrics live as long as the registry; references returned by the getters
/// never dangle.
class MetricsRegistry {
public:
    static MetricsRegistry& Instance();

    Counter& GetCounter(const std::string& name, const std::string& description = "");
    Histogram& GetHistogram(const std::string& name, const std::string& description = "");

    /// @brief Export all metrics in Prometheus text format
    std::string ExportText() const;

    /// @brief Zero every metric in place
    void Reset();

private:
    MetricsRegistry() = default;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<Counter>> counters_;
    std::unordered_map<std::string, std::unique_ptr<Histogram>> histograms_;
};

#define RCACHE_COUNTER(name) \
    ::rcache::MetricsRegistry::Instance().GetCounter(name)

#define RCACHE_HISTOGRAM(name) \
    ::rcache::MetricsRegistry::Instance().GetHistogram(name)

}  // namespace rcache
