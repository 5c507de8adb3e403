#include <vgreeks/scalar_path.hpp>

#include <spdlog/spdlog.h>

#include <exception>

#include <vgreeks/chain_arrays.hpp>
#include <vgreeks/errors.hpp>

namespace vgreeks {

ScalarPricingPath::ScalarPricingPath(BoundsValidator validator)
    : validator_(validator) {}

std::vector<GreeksResult> ScalarPricingPath::evaluate(std::span<const ContractSpec> contracts,
                                                      const ChainContext& context,
                                                      const PricingModel& model) const {
    std::vector<GreeksResult> results;
    results.reserve(contracts.size());
    for (std::size_t i = 0; i < contracts.size(); ++i) {
        results.push_back(evaluate_one(contracts[i], i, context, model));
    }
    return results;
}

GreeksResult ScalarPricingPath::evaluate_one(const ContractSpec& contract,
                                             std::size_t index,
                                             const ChainContext& context,
                                             const PricingModel& model) const {
    validator_.check_contract(contract, index);

    try {
        const ChainArrays inputs = to_chain_arrays(std::span<const ContractSpec>(&contract, 1), context);
        GreeksArrays outputs = model.evaluate(inputs, context.greeks);
        validator_.check_outputs(inputs, outputs, context.greeks, index);
        return extract_result(contract, outputs, 0, context.greeks, model.name(), ComputationPath::Scalar);
    } catch (const GreeksOutOfBoundsError& ex) {
        spdlog::warn("Contract {} (index {}) unavailable: {}", contract.id, index, ex.what());
        return unavailable_result(contract, model.name(), ComputationPath::Scalar, UnavailableReason::OutOfBounds);
    } catch (const std::exception& ex) {
        spdlog::warn("Contract {} (index {}) failed in {}: {}", contract.id, index, model.name(), ex.what());
        return unavailable_result(contract, model.name(), ComputationPath::Scalar, UnavailableReason::ModelFailure);
    }
}

} // namespace vgreeks
