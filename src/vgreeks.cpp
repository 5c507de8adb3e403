#include <CLI/CLI.hpp>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <chrono>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <vgreeks/chain_loader.hpp>
#include <vgreeks/contract.hpp>
#include <vgreeks/engine.hpp>
#include <vgreeks/errors.hpp>
#include <vgreeks/metrics.hpp>
#include <vgreeks/model_registry.hpp>

namespace {

constexpr double kTradingDaysPerYear = 252.0;

std::string format_value(const std::optional<double>& value, double scale = 1.0) {
    if (!value) {
        return fmt::format("{:>10}", "n/a");
    }
    return fmt::format("{:>10.4f}", *value * scale);
}

void print_chain(const std::vector<vgreeks::ContractSpec>& contracts,
                 const vgreeks::ChainComputation& computation) {
    spdlog::info("{:>6} | {:>4} | {:>9} | {:>8} | {:>10} | {:>10} | {:>10} | {:>10} | {:>10} | {:>10} | {}",
                 "id", "type", "strike", "vol", "price", "delta", "gamma", "vega/1%", "theta/day", "rho/1%", "note");
    for (std::size_t i = 0; i < computation.results.size(); ++i) {
        const auto& contract = contracts[i];
        const auto& result = computation.results[i];
        spdlog::info("{:>6} | {:>4} | {:>9.2f} | {:>8.4f} | {} | {} | {} | {} | {} | {} | {}",
                     result.contract_id,
                     vgreeks::to_string(contract.flavor),
                     contract.strike,
                     contract.volatility,
                     format_value(result.price),
                     format_value(result.delta),
                     format_value(result.gamma),
                     format_value(result.vega, 0.01),
                     format_value(result.theta, 1.0 / kTradingDaysPerYear),
                     format_value(result.rho, 0.01),
                     result.complete() ? "" : vgreeks::to_string(result.reason));
    }

    const auto& record = computation.metrics;
    spdlog::info("{} contracts via {} path{} ({} chunks) in {:.3f} ms",
                 record.total_contracts,
                 vgreeks::to_string(record.path),
                 record.fell_back ? " after batch fallback" : "",
                 record.chunk_count,
                 record.elapsed_ms);
    if (const auto speedup = record.speedup()) {
        spdlog::info("Scalar comparison: {:.3f} ms, speedup {:.2f}x", *record.scalar_elapsed_ms, *speedup);
    }
}

void print_snapshot(const vgreeks::PerformanceSnapshot& snapshot) {
    spdlog::info("==================== Metrics ====================");
    spdlog::info("  Batch calls:    {} (avg {:.3f} ms)", snapshot.batch_calls, snapshot.avg_batch_ms);
    spdlog::info("  Scalar calls:   {} (avg {:.3f} ms)", snapshot.scalar_calls, snapshot.avg_scalar_ms);
    spdlog::info("  Fallbacks:      {}", snapshot.fallback_calls);
    spdlog::info("  Contracts:      {}", snapshot.total_contracts);
    spdlog::info("  Throughput:     {:.0f} contracts/s", snapshot.contracts_per_second);
    if (snapshot.speedup_samples > 0) {
        spdlog::info("  Speedup:        last {:.2f}x, mean {:.2f}x over {} runs",
                     snapshot.last_speedup,
                     snapshot.mean_speedup,
                     snapshot.speedup_samples);
    }
}

} // namespace

int main(int argc, char** argv) {
    CLI::App app{"vgreeks"};
    app.set_config("--config", "", "INI or TOML file with option values");

    vgreeks::EngineConfig config;
    std::string chain_path;
    double spot = 0.0;
    double rate = 0.05;
    double dividend_yield = 0.0;
    std::string model = "black_scholes_merton";
    std::string greeks = "delta,gamma,theta,vega,rho";
    std::string mode = "auto";
    std::string valuation_date;
    double default_volatility = 0.2;
    bool no_strict_bounds = false;
    bool compare = false;
    bool term_structure = false;
    bool verbose = false;

    app.add_option("-c,--chain", chain_path, "Option chain CSV path")->required();
    app.add_option("-s,--spot", spot, "Underlying spot (forward price for black76)")->required();
    app.add_option("-r,--rate", rate, "Continuously compounded risk-free rate")->default_val(rate);
    app.add_option("-q,--dividend-yield", dividend_yield, "Continuous dividend yield")->default_val(dividend_yield);
    app.add_option("-m,--model", model, "Pricing model")
        ->default_val(model)
        ->check(CLI::IsMember(vgreeks::ModelRegistry::with_default_models().names()));
    app.add_option("-g,--greeks", greeks, "Comma separated Greeks to compute")->default_val(greeks);
    app.add_option("--mode", mode, "Computation path")
        ->default_val(mode)
        ->check(CLI::IsMember({"auto", "batch", "scalar"}));
    app.add_option("--chunk-size", config.chunk_size, "Contracts per batch model call")
        ->default_val(config.chunk_size);
    app.add_option("--batch-threshold", config.batch_threshold, "Smallest chain priced on the batch path")
        ->default_val(config.batch_threshold);
    app.add_option("--workers", config.worker_count, "Worker threads for term structure runs")
        ->default_val(config.worker_count);
    app.add_option("--volatility-ceiling", config.volatility_ceiling, "Largest accepted volatility")
        ->default_val(config.volatility_ceiling);
    app.add_flag("--no-strict-bounds", no_strict_bounds, "Clamp out-of-range Greeks instead of rejecting them");
    app.add_option("--valuation-date", valuation_date, "Valuation date YYYY-MM-DD (default today)");
    app.add_option("--default-volatility", default_volatility, "Volatility used when none can be implied")
        ->default_val(default_volatility);
    app.add_flag("--compare", compare, "Time a scalar rerun of batch invocations");
    app.add_flag("--term-structure", term_structure, "Price each expiry as its own chain on the worker pool");
    app.add_flag("-v,--verbose", verbose, "Debug logging");

    try {
        CLI11_PARSE(app, argc, argv);

        if (verbose) {
            spdlog::set_level(spdlog::level::debug);
        }
        config.strict_bounds = !no_strict_bounds;

        vgreeks::ChainContext context;
        context.spot = spot;
        context.rate = rate;
        context.dividend_yield = dividend_yield;
        context.model = model;
        context.greeks = vgreeks::parse_greek_set(greeks);

        vgreeks::ResolveDefaults defaults;
        defaults.default_volatility = default_volatility;
        defaults.volatility_ceiling = config.volatility_ceiling;
        if (valuation_date.empty()) {
            defaults.valuation_date = std::chrono::floor<std::chrono::days>(std::chrono::system_clock::now());
        } else {
            const auto parsed = vgreeks::parse_iso_date(valuation_date);
            if (!parsed) {
                spdlog::error("Invalid valuation date '{}'", valuation_date);
                return 1;
            }
            defaults.valuation_date = *parsed;
        }

        std::vector<vgreeks::ChainRow> rows;
        if (!vgreeks::load_chain_csv(chain_path, rows)) {
            return 1;
        }
        spdlog::info("Loaded chain from '{}' with {} contracts.", chain_path, rows.size());

        auto metrics = std::make_shared<vgreeks::PerformanceMetricsTracker>();
        vgreeks::GreeksEngine engine(config, vgreeks::ModelRegistry::with_default_models(), metrics);

        const auto pricing_model = engine.registry().find(context.model);
        const std::vector<vgreeks::ContractSpec> contracts =
            vgreeks::resolve_contracts(rows, context, *pricing_model, defaults);

        vgreeks::ComputeOptions options;
        options.compare_with_scalar = compare;
        if (mode == "batch") {
            options.force_mode = vgreeks::ComputationPath::Batch;
        } else if (mode == "scalar") {
            options.force_mode = vgreeks::ComputationPath::Scalar;
        }

        if (term_structure) {
            const vgreeks::ExpiryGroups groups = vgreeks::group_by_expiry(contracts);
            vgreeks::ExpiryContexts contexts;
            for (const auto& [expiry, group] : groups) {
                contexts.emplace(expiry, context);
            }
            const vgreeks::TermStructureResult result = engine.compute_term_structure(groups, contexts, options);
            for (const auto& [expiry, entry] : result) {
                spdlog::info("==================== Expiry {} ====================", expiry.empty() ? "-" : expiry);
                if (!entry.ok()) {
                    spdlog::error("  {}", entry.error);
                    continue;
                }
                print_chain(groups.at(expiry), *entry.computation);
            }
        } else {
            spdlog::info("==================== Chain ====================");
            const vgreeks::ChainComputation computation = engine.compute_chain(contracts, context, options);
            print_chain(contracts, computation);
        }

        print_snapshot(engine.get_performance_metrics());
    } catch (const CLI::ParseError& parse_error) {
        return app.exit(parse_error);
    } catch (const std::exception& ex) {
        spdlog::error("Failed to compute Greeks: {}", ex.what());
        return 1;
    }

    return 0;
}
