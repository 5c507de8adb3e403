#pragma once

#include <cstddef>
#include <optional>

#include <vgreeks/contract.hpp>
#include <vgreeks/pricing_model.hpp>

namespace vgreeks {

struct ImpliedVolatilityConfig {
    double lower = 1e-4;
    double upper = 5.0;
    double tolerance = 1e-8;
    std::size_t max_iterations = 100;
};

// Volatility at which `model` prices `contract` at `target_price`, found
// with Brent's method on [lower, upper]. Empty when the target is not
// bracketed, the contract is expired, or the solver does not converge.
// The contract's own volatility is ignored.
std::optional<double> implied_volatility(const PricingModel& model,
                                         const ContractSpec& contract,
                                         const ChainContext& context,
                                         double target_price,
                                         const ImpliedVolatilityConfig& config = {});

} // namespace vgreeks
