#include <vgreeks/engine.hpp>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ranges.h>

#include <chrono>
#include <cmath>
#include <exception>
#include <utility>

#include <vgreeks/errors.hpp>

namespace vgreeks {

namespace {

using Clock = std::chrono::steady_clock;

double elapsed_ms(Clock::time_point start) {
    return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
}

const EngineConfig& validated(const EngineConfig& config) {
    config.validate();
    return config;
}

BoundsValidator make_validator(const EngineConfig& config) {
    return BoundsValidator(config.strict_bounds ? BoundsPolicy::Reject : BoundsPolicy::Clamp,
                           config.volatility_ceiling);
}

} // namespace

void EngineConfig::validate() const {
    if (chunk_size == 0) {
        throw ConfigurationError("chunk_size must be positive");
    }
    if (batch_threshold == 0) {
        throw ConfigurationError("batch_threshold must be positive");
    }
    if (worker_count == 0) {
        throw ConfigurationError("worker_count must be positive");
    }
    if (!(volatility_ceiling > 0.0)) {
        throw ConfigurationError("volatility_ceiling must be positive");
    }
}

ExpiryGroups group_by_expiry(std::span<const ContractSpec> contracts) {
    ExpiryGroups groups;
    for (const auto& contract : contracts) {
        groups[contract.expiry].push_back(contract);
    }
    return groups;
}

SpotGroups group_by_spot(std::span<const UnderlyingContract> contracts) {
    SpotGroups groups;
    for (std::size_t i = 0; i < contracts.size(); ++i) {
        const double spot = contracts[i].spot;
        if (!std::isfinite(spot) || spot <= 0.0) {
            throw InvalidContractDataError("spot", i, spot);
        }
        groups[spot].push_back(contracts[i].contract);
    }
    return groups;
}

double BulkComputation::contracts_per_second() const noexcept {
    if (elapsed_ms <= 0.0) {
        return 0.0;
    }
    return static_cast<double>(total_contracts) * 1000.0 / elapsed_ms;
}

GreeksEngine::GreeksEngine(EngineConfig config,
                           ModelRegistry registry,
                           std::shared_ptr<PerformanceMetricsTracker> metrics)
    : config_(validated(config)),
      registry_(std::move(registry)),
      metrics_(std::move(metrics)),
      validator_(make_validator(config_)),
      batch_(config_.chunk_size, validator_),
      scalar_(validator_),
      pool_(std::make_unique<WorkerPool>(config_.worker_count)) {
    if (registry_.empty()) {
        throw ConfigurationError("GreeksEngine requires at least one pricing model");
    }
    if (!metrics_) {
        throw ConfigurationError("GreeksEngine requires a metrics tracker");
    }
    spdlog::info("GreeksEngine ready: models [{}], chunk_size={}, batch_threshold={}, workers={}, strict_bounds={}",
                 fmt::join(registry_.names(), ", "),
                 config_.chunk_size,
                 config_.batch_threshold,
                 config_.worker_count,
                 config_.strict_bounds);
}

void GreeksEngine::validate_request(std::span<const ContractSpec> contracts, const ChainContext& context) const {
    validator_.check_context(context);
    for (std::size_t i = 0; i < contracts.size(); ++i) {
        validator_.check_contract(contracts[i], i);
    }
}

ComputationPath GreeksEngine::select_path(std::size_t contract_count,
                                          const PricingModel& model,
                                          const ComputeOptions& options) const {
    if (!model.supports_batching()) {
        if (options.force_mode == ComputationPath::Batch) {
            spdlog::warn("Model {} does not support batching; using scalar path", model.name());
        }
        return ComputationPath::Scalar;
    }
    if (options.force_mode) {
        return *options.force_mode;
    }
    const std::size_t threshold = options.batch_threshold.value_or(config_.batch_threshold);
    return contract_count >= threshold ? ComputationPath::Batch : ComputationPath::Scalar;
}

ChainComputation GreeksEngine::compute_chain(std::span<const ContractSpec> contracts,
                                             const ChainContext& context,
                                             const ComputeOptions& options) const {
    const std::shared_ptr<const PricingModel> model = registry_.find(context.model);
    validate_request(contracts, context);

    const auto start = Clock::now();

    ChainComputation computation;
    BatchMetricsRecord& record = computation.metrics;
    record.total_contracts = contracts.size();
    record.path = select_path(contracts.size(), *model, options);

    if (record.path == ComputationPath::Batch) {
        try {
            BatchOutcome outcome = batch_.evaluate(contracts, context, *model);
            computation.results = std::move(outcome.results);
            record.chunk_count = outcome.chunk_count;
        } catch (const GreeksOutOfBoundsError& ex) {
            spdlog::warn("Batch path rejected for {} contracts, falling back to scalar: {}", contracts.size(), ex.what());
            record.path = ComputationPath::Scalar;
            record.fell_back = true;
        } catch (const BatchComputationError& ex) {
            spdlog::warn("Batch path failed for {} contracts, falling back to scalar: {}", contracts.size(), ex.what());
            record.path = ComputationPath::Scalar;
            record.fell_back = true;
        }
    }

    if (record.path == ComputationPath::Scalar) {
        computation.results = scalar_.evaluate(contracts, context, *model);
    }

    record.elapsed_ms = elapsed_ms(start);

    if (options.compare_with_scalar && record.path == ComputationPath::Batch) {
        const auto scalar_start = Clock::now();
        const std::vector<GreeksResult> reference = scalar_.evaluate(contracts, context, *model);
        record.scalar_elapsed_ms = elapsed_ms(scalar_start);
        spdlog::debug("Scalar comparison: {} contracts in {:.3f} ms vs batch {:.3f} ms",
                      reference.size(),
                      *record.scalar_elapsed_ms,
                      record.elapsed_ms);
    }

    metrics_->record(record);

    spdlog::debug("{} contracts via {} path ({} chunks) in {:.3f} ms using {}",
                  record.total_contracts,
                  to_string(record.path),
                  record.chunk_count,
                  record.elapsed_ms,
                  model->name());

    return computation;
}

std::future<ChainComputation> GreeksEngine::compute_chain_async(std::vector<ContractSpec> contracts,
                                                                ChainContext context,
                                                                ComputeOptions options) {
    return pool_->submit([this,
                          contracts = std::move(contracts),
                          context = std::move(context),
                          options = std::move(options)]() {
        return compute_chain(contracts, context, options);
    });
}

TermStructureResult GreeksEngine::compute_term_structure(const ExpiryGroups& groups,
                                                         const ExpiryContexts& contexts,
                                                         const ComputeOptions& options) {
    TermStructureResult out;
    std::vector<std::pair<std::string, std::future<ChainComputation>>> pending;
    pending.reserve(groups.size());

    for (const auto& [expiry, contracts] : groups) {
        const auto context = contexts.find(expiry);
        if (context == contexts.end()) {
            spdlog::warn("No chain context for expiry {}, skipping {} contracts", expiry, contracts.size());
            out[expiry].error = "missing chain context";
            continue;
        }
        pending.emplace_back(expiry, compute_chain_async(contracts, context->second, options));
    }

    for (auto& [expiry, future] : pending) {
        TermStructureEntry& entry = out[expiry];
        try {
            entry.computation = future.get();
        } catch (const std::exception& ex) {
            spdlog::warn("Expiry {} failed: {}", expiry, ex.what());
            entry.error = ex.what();
        }
    }

    return out;
}

BulkComputation GreeksEngine::compute_bulk(std::span<const UnderlyingContract> contracts,
                                           const ChainContext& context_template,
                                           const ComputeOptions& options) {
    const auto start = Clock::now();
    const SpotGroups groups = group_by_spot(contracts);

    std::vector<std::pair<double, std::future<ChainComputation>>> pending;
    pending.reserve(groups.size());
    for (const auto& [spot, group] : groups) {
        ChainContext context = context_template;
        context.spot = spot;
        pending.emplace_back(spot, compute_chain_async(group, std::move(context), options));
    }

    BulkComputation out;
    out.total_contracts = contracts.size();
    for (auto& [spot, future] : pending) {
        TermStructureEntry& entry = out.groups[spot];
        try {
            entry.computation = future.get();
        } catch (const std::exception& ex) {
            spdlog::warn("Underlying at spot {} failed: {}", spot, ex.what());
            entry.error = ex.what();
        }
    }
    out.elapsed_ms = elapsed_ms(start);

    spdlog::debug("Bulk run: {} contracts over {} underlyings in {:.3f} ms ({:.0f} contracts/s)",
                  out.total_contracts,
                  out.groups.size(),
                  out.elapsed_ms,
                  out.contracts_per_second());
    return out;
}

PerformanceSnapshot GreeksEngine::get_performance_metrics() const {
    return metrics_->snapshot();
}

void GreeksEngine::reset_performance_metrics() {
    metrics_->reset();
}

} // namespace vgreeks
