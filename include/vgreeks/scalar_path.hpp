#pragma once

#include <cstddef>
#include <span>
#include <vector>

#include <vgreeks/bounds.hpp>
#include <vgreeks/contract.hpp>
#include <vgreeks/greeks.hpp>
#include <vgreeks/pricing_model.hpp>

namespace vgreeks {

// Evaluates one contract at a time through the same model as the batch
// path, using length-one arrays. A contract whose evaluation fails gets an
// unavailable result and the rest of the chain continues. Invalid input
// (InvalidContractDataError) still propagates.
class ScalarPricingPath {
public:
    explicit ScalarPricingPath(BoundsValidator validator);

    [[nodiscard]] std::vector<GreeksResult> evaluate(std::span<const ContractSpec> contracts,
                                                     const ChainContext& context,
                                                     const PricingModel& model) const;

    [[nodiscard]] GreeksResult evaluate_one(const ContractSpec& contract,
                                            std::size_t index,
                                            const ChainContext& context,
                                            const PricingModel& model) const;

private:
    BoundsValidator validator_;
};

} // namespace vgreeks
