#pragma once

#include <cstddef>
#include <span>
#include <vector>

#include <vgreeks/bounds.hpp>
#include <vgreeks/contract.hpp>
#include <vgreeks/greeks.hpp>
#include <vgreeks/pricing_model.hpp>

namespace vgreeks {

inline constexpr std::size_t kDefaultChunkSize = 500;

struct BatchOutcome {
    std::vector<GreeksResult> results;
    std::size_t chunk_count = 0;
};

// Evaluates a whole chain with array math, `chunk_size` contracts per model
// call. All or nothing: the first chunk that fails validation or throws
// aborts the invocation and no results are returned. Failures surface as
// InvalidContractDataError, GreeksOutOfBoundsError or BatchComputationError;
// any other std::exception raised along the way is wrapped in the latter.
class BatchPricingCore {
public:
    BatchPricingCore(std::size_t chunk_size, BoundsValidator validator);

    [[nodiscard]] BatchOutcome evaluate(std::span<const ContractSpec> contracts,
                                        const ChainContext& context,
                                        const PricingModel& model) const;

    [[nodiscard]] std::size_t chunk_size() const noexcept { return chunk_size_; }

    [[nodiscard]] static std::size_t chunk_count(std::size_t contracts, std::size_t chunk_size) noexcept;

private:
    std::size_t chunk_size_;
    BoundsValidator validator_;
};

} // namespace vgreeks
