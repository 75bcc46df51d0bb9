#include "metrics.h"

#include <algorithm>
#include <iterator>
#include <limits>
#include <map>
#include <sstream>

namespace rcache {

namespace {

// Round-trip latencies to a cache server, in seconds
const std::vector<double> kDefaultBuckets = {
    0.0001, 0.0005, 0.001, 0.0025, 0.005, 0.01, 0.025, 0.05, 0.1, 0.5, 1.0
};

}  // namespace

Counter::Counter(std::string name, std::string description)
    : name_(std::move(name)), description_(std::move(description)) {}

void Counter::Increment() {
    value_.fetch_add(1, std::memory_order_relaxed);
}

void Counter::Add(int64_t delta) {
    if (delta >= 0) {
        value_.fetch_add(delta, std::memory_order_relaxed);
    }
}

int64_t Counter::Value() const {
    return value_.load(std::memory_order_relaxed);
}

void Counter::Reset() {
    value_.store(0, std::memory_order_relaxed);
}

Histogram::Histogram(std::string name, std::string description)
    : Histogram(std::move(name), kDefaultBuckets, std::move(description)) {}

Histogram::Histogram(std::string name, std::vector<double> buckets, std::string description)
    : name_(std::move(name)),
      description_(std::move(description)),
      bucket_bounds_(std::move(buckets)) {
    std::sort(bucket_bounds_.begin(), bucket_bounds_.end());
    bucket_counts_.assign(bucket_bounds_.size() + 1, 0);  // +1 for +Inf
}

void Histogram::Observe(double value) {
    auto it = std::lower_bound(bucket_bounds_.begin(), bucket_bounds_.end(), value);
    size_t bucket_idx = static_cast<size_t>(std::distance(bucket_bounds_.begin(), it));

    std::lock_guard<std::mutex> lock(mutex_);
    ++bucket_counts_[bucket_idx];
    ++count_;
    sum_ += value;
}

void Histogram::Reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::fill(bucket_counts_.begin(), bucket_counts_.end(), 0);
    count_ = 0;
    sum_ = 0.0;
}

int64_t Histogram::Count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_;
}

double Histogram::Sum() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sum_;
}

std::vector<std::pair<double, int64_t>> Histogram::Buckets() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::pair<double, int64_t>> result;
    result.reserve(bucket_counts_.size());

    int64_t cumulative = 0;
    for (size_t i = 0; i < bucket_bounds_.size(); ++i) {
        cumulative += bucket_counts_[i];
        result.emplace_back(bucket_bounds_[i], cumulative);
    }
    cumulative += bucket_counts_.back();
    result.emplace_back(std::numeric_limits<double>::infinity(), cumulative);
    return result;
}

ScopedTimer::ScopedTimer(Histogram& histogram)
    : histogram_(histogram), start_(std::chrono::steady_clock::now()) {}

ScopedTimer::~ScopedTimer() {
    std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start_;
    histogram_.Observe(elapsed.count());
}

MetricsRegistry& MetricsRegistry::Instance() {
    static MetricsRegistry instance;
    return instance;
}

Counter& MetricsRegistry::GetCounter(const std::string& name, const std::string& description) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = counters_[name];
    if (!slot) {
        slot = std::make_unique<Counter>(name, description);
    }
    return *slot;
}

Histogram& MetricsRegistry::GetHistogram(const std::string& name, const std::string& description) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = histograms_[name];
    if (!slot) {
        slot = std::make_unique<Histogram>(name, description);
    }
    return *slot;
}

std::string MetricsRegistry::ExportText() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream oss;

    // Sorted so the output is stable between calls
    std::map<std::string, const Counter*> counters;
    for (const auto& [name, counter] : counters_) {
        counters.emplace(name, counter.get());
    }
    std::map<std::string, const Histogram*> histograms;
    for (const auto& [name, histogram] : histograms_) {
        histograms.emplace(name, histogram.get());
    }

    for (const auto& [name, counter] : counters) {
        oss << "# HELP " << name << " " << counter->Description() << "\n";
        oss << "# TYPE " << name << " counter\n";
        oss << name << " " << counter->Value() << "\n";
    }

    for (const auto& [name, histogram] : histograms) {
        oss << "# HELP " << name << " " << histogram->Description() << "\n";
        oss << "# TYPE " << name << " histogram\n";
        for (const auto& [bound, count] : histogram->Buckets()) {
            oss << name << "_bucket{le=\"";
            if (bound == std::numeric_limits<double>::infinity()) {
                oss << "+Inf";
            } else {
                oss << bound;
            }
            oss << "\"} " << count << "\n";
        }
        oss << name << "_sum " << histogram->Sum() << "\n";
        oss << name << "_count " << histogram->Count() << "\n";
    }

    return oss.str();
}

void MetricsRegistry::Reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [name, counter] : counters_) {
        counter->Reset();
    }
    for (auto& [name, histogram] : histograms_) {
        histogram->Reset();
    }
}

}  // namespace rcache
