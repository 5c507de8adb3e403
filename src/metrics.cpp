#include <vgreeks/metrics.hpp>

namespace vgreeks {

namespace {

double running_mean(double current, std::uint64_t count, double sample) {
    if (count <= 1) {
        return sample;
    }
    return current + (sample - current) / static_cast<double>(count);
}

} // namespace

std::optional<double> BatchMetricsRecord::speedup() const noexcept {
    if (!scalar_elapsed_ms || path != ComputationPath::Batch || elapsed_ms <= 0.0 || *scalar_elapsed_ms <= 0.0) {
        return std::nullopt;
    }
    return *scalar_elapsed_ms / elapsed_ms;
}

double BatchMetricsRecord::contracts_per_second() const noexcept {
    if (elapsed_ms <= 0.0) {
        return 0.0;
    }
    return static_cast<double>(total_contracts) * 1000.0 / elapsed_ms;
}

void PerformanceMetricsTracker::record(const BatchMetricsRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);

    totals_.total_contracts += record.total_contracts;
    totals_.total_elapsed_ms += record.elapsed_ms;
    if (totals_.total_elapsed_ms > 0.0) {
        totals_.contracts_per_second =
            static_cast<double>(totals_.total_contracts) * 1000.0 / totals_.total_elapsed_ms;
    }

    if (record.path == ComputationPath::Batch) {
        ++totals_.batch_calls;
        totals_.avg_batch_ms = running_mean(totals_.avg_batch_ms, totals_.batch_calls, record.elapsed_ms);
    } else {
        ++totals_.scalar_calls;
        if (record.fell_back) {
            ++totals_.fallback_calls;
        }
        totals_.avg_scalar_ms = running_mean(totals_.avg_scalar_ms, totals_.scalar_calls, record.elapsed_ms);
    }

    if (const auto ratio = record.speedup()) {
        ++totals_.speedup_samples;
        totals_.last_speedup = *ratio;
        totals_.mean_speedup = running_mean(totals_.mean_speedup, totals_.speedup_samples, *ratio);
    }
}

PerformanceSnapshot PerformanceMetricsTracker::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return totals_;
}

void PerformanceMetricsTracker::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    totals_ = PerformanceSnapshot{};
}

} // namespace vgreeks
