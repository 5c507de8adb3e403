#pragma once

#include <cstddef>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <vgreeks/batch_core.hpp>
#include <vgreeks/bounds.hpp>
#include <vgreeks/contract.hpp>
#include <vgreeks/greeks.hpp>
#include <vgreeks/metrics.hpp>
#include <vgreeks/model_registry.hpp>
#include <vgreeks/scalar_path.hpp>
#include <vgreeks/worker_pool.hpp>

namespace vgreeks {

struct EngineConfig {
    std::size_t chunk_size = kDefaultChunkSize;
    std::size_t batch_threshold = 10;   // chains smaller than this use the scalar path
    std::size_t worker_count = 4;
    bool strict_bounds = true;          // false clamps out-of-range Greeks instead of rejecting
    double volatility_ceiling = kDefaultVolatilityCeiling;

    // Throws ConfigurationError.
    void validate() const;
};

struct ComputeOptions {
    // Overrides the threshold. Batch is ignored for a model without
    // batching support: it runs scalar and is not counted as a fallback.
    std::optional<ComputationPath> force_mode;
    std::optional<std::size_t> batch_threshold;
    bool compare_with_scalar = false;   // time a scalar rerun of a batch invocation
};

struct ChainComputation {
    std::vector<GreeksResult> results; // same order and length as the input chain
    BatchMetricsRecord metrics;
};

struct TermStructureEntry {
    std::optional<ChainComputation> computation;
    std::string error;

    [[nodiscard]] bool ok() const noexcept { return computation.has_value(); }
};

using ExpiryGroups = std::map<std::string, std::vector<ContractSpec>>;
using ExpiryContexts = std::map<std::string, ChainContext>;
using TermStructureResult = std::map<std::string, TermStructureEntry>;

ExpiryGroups group_by_expiry(std::span<const ContractSpec> contracts);

// A contract of a mixed batch together with the spot of its underlying.
struct UnderlyingContract {
    ContractSpec contract;
    double spot = 0.0;
};

using SpotGroups = std::map<double, std::vector<ContractSpec>>;

// Throws InvalidContractDataError (field "spot", batch index) for a
// non-finite or non-positive spot.
SpotGroups group_by_spot(std::span<const UnderlyingContract> contracts);

struct BulkComputation {
    std::map<double, TermStructureEntry> groups; // keyed by spot
    std::size_t total_contracts = 0;
    double elapsed_ms = 0.0;

    [[nodiscard]] double contracts_per_second() const noexcept;
};

// Public entry point. Picks the batch or scalar path per invocation, falls
// back from batch to scalar on batch failure, and records one
// BatchMetricsRecord per invocation into the injected tracker.
//
// compute_chain is safe to call concurrently. Futures returned by
// compute_chain_async must not outlive the engine.
class GreeksEngine {
public:
    GreeksEngine(EngineConfig config,
                 ModelRegistry registry,
                 std::shared_ptr<PerformanceMetricsTracker> metrics);

    GreeksEngine(const GreeksEngine&) = delete;
    GreeksEngine& operator=(const GreeksEngine&) = delete;

    // Throws UnsupportedModelError before any work when the model is
    // unknown and InvalidContractDataError when the context or any contract
    // is invalid.
    [[nodiscard]] ChainComputation compute_chain(std::span<const ContractSpec> contracts,
                                                 const ChainContext& context,
                                                 const ComputeOptions& options = {}) const;

    [[nodiscard]] std::future<ChainComputation> compute_chain_async(std::vector<ContractSpec> contracts,
                                                                    ChainContext context,
                                                                    ComputeOptions options = {});

    // One compute_chain per expiry group, run on the worker pool. A group
    // that throws, or has no context, is reported in its own entry.
    [[nodiscard]] TermStructureResult compute_term_structure(const ExpiryGroups& groups,
                                                             const ExpiryContexts& contexts,
                                                             const ComputeOptions& options = {});

    // One compute_chain per underlying spot, run on the worker pool with
    // `context_template` and the group's spot. Failing groups are reported
    // in their own entry.
    [[nodiscard]] BulkComputation compute_bulk(std::span<const UnderlyingContract> contracts,
                                               const ChainContext& context_template,
                                               const ComputeOptions& options = {});

    [[nodiscard]] PerformanceSnapshot get_performance_metrics() const;
    void reset_performance_metrics();

    [[nodiscard]] ComputationPath select_path(std::size_t contract_count,
                                              const PricingModel& model,
                                              const ComputeOptions& options) const;

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }
    [[nodiscard]] const ModelRegistry& registry() const noexcept { return registry_; }

private:
    void validate_request(std::span<const ContractSpec> contracts, const ChainContext& context) const;

    EngineConfig config_;
    ModelRegistry registry_;
    std::shared_ptr<PerformanceMetricsTracker> metrics_;
    BoundsValidator validator_;
    BatchPricingCore batch_;
    ScalarPricingPath scalar_;
    std::unique_ptr<WorkerPool> pool_;
};

} // namespace vgreeks
