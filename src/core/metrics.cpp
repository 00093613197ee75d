#include "fieldsync/core/metrics.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace fieldsync {

// ============================================================================
// Histogram
// ============================================================================

Histogram::Histogram(std::vector<double> bounds, std::string help)
    : help_(std::move(help))
    , bounds_(std::move(bounds))
    , hits_(std::make_unique<std::atomic<uint64_t>[]>(bounds_.size() + 1))
{
    std::sort(bounds_.begin(), bounds_.end());
    for (size_t i = 0; i <= bounds_.size(); ++i) {
        hits_[i].store(0, std::memory_order_relaxed);
    }
}

void Histogram::observe(double value) {
    auto slot = std::lower_bound(bounds_.begin(), bounds_.end(), value) - bounds_.begin();
    hits_[slot].fetch_add(1, std::memory_order_relaxed);
    count_.fetch_add(1, std::memory_order_relaxed);

    double old_sum = sum_.load(std::memory_order_relaxed);
    while (!sum_.compare_exchange_weak(old_sum, old_sum + value, std::memory_order_relaxed)) {
    }
}

uint64_t Histogram::hits(size_t bucket) const {
    if (bucket > bounds_.size()) return 0;
    return hits_[bucket].load(std::memory_order_relaxed);
}

std::vector<double> Histogram::batch_duration_bounds() {
    return {0.005, 0.025, 0.1, 0.25, 1.0, 5.0, 30.0};
}

// ============================================================================
// Registry
// ============================================================================

namespace {

template<typename Metric, typename... Args>
std::shared_ptr<Metric> get_or_create(std::map<std::string, std::shared_ptr<Metric>>& metrics,
                                      const std::string& name, Args&&... args) {
    auto& slot = metrics[name];
    if (!slot) {
        slot = std::make_shared<Metric>(std::forward<Args>(args)...);
    }
    return slot;
}

void write_header(std::ostream& out, const std::string& name, const std::string& help,
                  const char* type) {
    if (!help.empty()) {
        out << "# HELP " << name << ' ' << help << '\n';
    }
    out << "# TYPE " << name << ' ' << type << '\n';
}

} // anonymous namespace

std::shared_ptr<Counter> MetricsRegistry::counter(const std::string& name, const std::string& help) {
    std::lock_guard<std::mutex> lock(mutex_);
    return get_or_create(counters_, name, help);
}

std::shared_ptr<Gauge> MetricsRegistry::gauge(const std::string& name, const std::string& help) {
    std::lock_guard<std::mutex> lock(mutex_);
    return get_or_create(gauges_, name, help);
}

std::shared_ptr<Histogram> MetricsRegistry::histogram(const std::string& name,
                                                      const std::vector<double>& bounds,
                                                      const std::string& help) {
    std::lock_guard<std::mutex> lock(mutex_);
    return get_or_create(histograms_, name, bounds, help);
}

std::string MetricsRegistry::prometheus_export() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream out;

    for (const auto& [name, counter] : counters_) {
        write_header(out, name, counter->help(), "counter");
        out << name << ' ' << counter->value() << '\n';
    }

    for (const auto& [name, gauge] : gauges_) {
        write_header(out, name, gauge->help(), "gauge");
        out << name << ' ' << gauge->value() << '\n';
    }

    for (const auto& [name, hist] : histograms_) {
        write_header(out, name, hist->help(), "histogram");

        // Exposition buckets are cumulative
        uint64_t cumulative = 0;
        const auto& bounds = hist->bounds();
        for (size_t i = 0; i <= bounds.size(); ++i) {
            cumulative += hist->hits(i);
            out << name << "_bucket{le=\"";
            if (i == bounds.size()) {
                out << "+Inf";
            } else {
                out << bounds[i];
            }
            out << "\"} " << cumulative << '\n';
        }
        out << name << "_sum " << std::fixed << std::setprecision(6) << hist->sum()
            << std::defaultfloat << '\n';
        out << name << "_count " << hist->count() << '\n';
    }

    return out.str();
}

MetricsRegistry& default_metrics() {
    static MetricsRegistry registry;
    return registry;
}

// ============================================================================
// Sync Metrics
// ============================================================================

SyncMetrics::SyncMetrics() : SyncMetrics(default_metrics()) {}

SyncMetrics::SyncMetrics(MetricsRegistry& registry)
    : items_total(registry.counter("fieldsync_sync_items_total",
                                   "Task updates and notes processed by batch sync"))
    , errors_total(registry.counter("fieldsync_sync_errors_total",
                                    "Batch items rejected or failed"))
    , conflicts_resolved_total(registry.counter("fieldsync_conflicts_resolved_total",
                                                "Field conflicts resolved during sync"))
    , notes_deduplicated_total(registry.counter("fieldsync_notes_deduplicated_total",
                                                "Resubmitted offline notes skipped"))
    , batches_in_flight(registry.gauge("fieldsync_sync_batches_in_flight",
                                       "Batches currently being applied"))
    , batch_duration(registry.histogram("fieldsync_sync_batch_duration_seconds",
                                        Histogram::batch_duration_bounds(),
                                        "Batch sync duration in seconds"))
{}

SyncMetrics::BatchScope::BatchScope(const SyncMetrics& metrics)
    : metrics_(metrics)
    , start_(std::chrono::steady_clock::now())
{
    metrics_.batches_in_flight->inc();
}

SyncMetrics::BatchScope::~BatchScope() {
    metrics_.batches_in_flight->dec();
    auto elapsed = std::chrono::steady_clock::now() - start_;
    metrics_.batch_duration->observe(std::chrono::duration<double>(elapsed).count());
}

} // namespace fieldsync
