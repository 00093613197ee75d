#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace fieldsync {

// ============================================================================
// Metric Types
// ============================================================================

// Monotonic count of processed items, errors, resolutions
class Counter {
    std::atomic<uint64_t> value_{0};
    std::string help_;

public:
    explicit Counter(std::string help = "") : help_(std::move(help)) {}

    void inc(uint64_t delta = 1) { value_.fetch_add(delta, std::memory_order_relaxed); }
    uint64_t value() const { return value_.load(std::memory_order_relaxed); }
    const std::string& help() const { return help_; }
};

// Current level of something that comes and goes (batches being applied)
class Gauge {
    std::atomic<int64_t> value_{0};
    std::string help_;

public:
    explicit Gauge(std::string help = "") : help_(std::move(help)) {}

    void inc() { value_.fetch_add(1, std::memory_order_relaxed); }
    void dec() { value_.fetch_sub(1, std::memory_order_relaxed); }
    int64_t value() const { return value_.load(std::memory_order_relaxed); }
    const std::string& help() const { return help_; }
};

// Duration distribution. Bounds are upper-inclusive and sorted; an implicit
// +Inf bucket catches the rest.
class Histogram {
    std::string help_;
    std::vector<double> bounds_;
    std::unique_ptr<std::atomic<uint64_t>[]> hits_;
    std::atomic<uint64_t> count_{0};
    std::atomic<double> sum_{0.0};

public:
    explicit Histogram(std::vector<double> bounds, std::string help = "");

    void observe(double value);

    uint64_t count() const { return count_.load(std::memory_order_relaxed); }
    double sum() const { return sum_.load(std::memory_order_relaxed); }
    const std::vector<double>& bounds() const { return bounds_; }
    uint64_t hits(size_t bucket) const;
    const std::string& help() const { return help_; }

    // Seconds; a batch of a few hundred items lands in the middle
    static std::vector<double> batch_duration_bounds();
};

// ============================================================================
// Metrics Registry
// ============================================================================

// Name-keyed metrics; the first registration of a name wins
class MetricsRegistry {
    std::map<std::string, std::shared_ptr<Counter>> counters_;
    std::map<std::string, std::shared_ptr<Gauge>> gauges_;
    std::map<std::string, std::shared_ptr<Histogram>> histograms_;
    mutable std::mutex mutex_;

public:
    std::shared_ptr<Counter> counter(const std::string& name, const std::string& help = "");
    std::shared_ptr<Gauge> gauge(const std::string& name, const std::string& help = "");
    std::shared_ptr<Histogram> histogram(const std::string& name,
                                         const std::vector<double>& bounds,
                                         const std::string& help = "");

    // Prometheus text exposition format
    std::string prometheus_export() const;
};

MetricsRegistry& default_metrics();

// ============================================================================
// Sync Metrics
// ============================================================================

struct SyncMetrics {
    std::shared_ptr<Counter> items_total;
    std::shared_ptr<Counter> errors_total;
    std::shared_ptr<Counter> conflicts_resolved_total;
    std::shared_ptr<Counter> notes_deduplicated_total;
    std::shared_ptr<Gauge> batches_in_flight;
    std::shared_ptr<Histogram> batch_duration;

    SyncMetrics();
    explicit SyncMetrics(MetricsRegistry& registry);

    // Counts a batch as in flight and times it until destruction
    class BatchScope {
        const SyncMetrics& metrics_;
        std::chrono::steady_clock::time_point start_;

    public:
        explicit BatchScope(const SyncMetrics& metrics);
        ~BatchScope();

        BatchScope(const BatchScope&) = delete;
        BatchScope& operator=(const BatchScope&) = delete;
    };
};

} // namespace fieldsync
