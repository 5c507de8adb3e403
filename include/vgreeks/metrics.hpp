#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>

#include <vgreeks/greeks.hpp>

namespace vgreeks {

// Execution metadata of one engine invocation.
struct BatchMetricsRecord {
    ComputationPath path = ComputationPath::Scalar;
    bool fell_back = false;       // batch attempted, scalar produced the results
    std::size_t chunk_count = 0;
    std::size_t total_contracts = 0;
    double elapsed_ms = 0.0;
    std::optional<double> scalar_elapsed_ms; // set by a comparison run

    // scalar time over batch time, when a comparison run was made.
    [[nodiscard]] std::optional<double> speedup() const noexcept;

    // 0 when no time was measured.
    [[nodiscard]] double contracts_per_second() const noexcept;
};

struct PerformanceSnapshot {
    std::uint64_t batch_calls = 0;
    std::uint64_t scalar_calls = 0;    // includes fallbacks
    std::uint64_t fallback_calls = 0;
    std::uint64_t total_contracts = 0;
    double total_elapsed_ms = 0.0;
    double contracts_per_second = 0.0; // over all recorded invocations
    double avg_batch_ms = 0.0;
    double avg_scalar_ms = 0.0;
    std::uint64_t speedup_samples = 0;
    double last_speedup = 0.0;
    double mean_speedup = 0.0;

    [[nodiscard]] std::uint64_t total_calls() const noexcept {
        return batch_calls + scalar_calls;
    }
};

// Process-wide aggregate of BatchMetricsRecords. Safe to update from
// several workers at once.
class PerformanceMetricsTracker {
public:
    void record(const BatchMetricsRecord& record);
    [[nodiscard]] PerformanceSnapshot snapshot() const;
    void reset();

private:
    mutable std::mutex mutex_;
    PerformanceSnapshot totals_;
};

} // namespace vgreeks
