#pragma once

#include <cstddef>
#include <cstdint>

#include <vgreeks/chain_arrays.hpp>
#include <vgreeks/contract.hpp>

namespace vgreeks {

inline constexpr double kDefaultVolatilityCeiling = 5.0;

enum class BoundsPolicy : std::uint8_t { Reject, Clamp };

// Input checks before a model runs and range checks on what it returns.
//
// Input violations throw InvalidContractDataError. Output violations throw
// GreeksOutOfBoundsError under BoundsPolicy::Reject; under Clamp, delta,
// gamma and vega are pulled back into range instead. Non-finite outputs are
// rejected under both policies, except theta on an expired contract, which
// is left as NaN to mark it unavailable.
class BoundsValidator {
public:
    explicit BoundsValidator(BoundsPolicy policy = BoundsPolicy::Reject,
                             double volatility_ceiling = kDefaultVolatilityCeiling);

    [[nodiscard]] BoundsPolicy policy() const noexcept { return policy_; }
    [[nodiscard]] double volatility_ceiling() const noexcept { return volatility_ceiling_; }

    void check_context(const ChainContext& context) const;
    void check_contract(const ContractSpec& contract, std::size_t index) const;

    // `offset` is the chain index of row 0, so errors name the contract's
    // position in the caller's chain rather than in the chunk.
    void check_inputs(const ChainArrays& inputs, std::size_t offset = 0) const;
    void check_outputs(const ChainArrays& inputs,
                       GreeksArrays& outputs,
                       GreekSet requested,
                       std::size_t offset = 0) const;

private:
    void check_fields(double strike,
                      double time_to_expiry,
                      double volatility,
                      std::size_t index) const;
    double check_range(const char* quantity,
                       double value,
                       double lower,
                       double upper,
                       std::size_t index) const;

    BoundsPolicy policy_;
    double volatility_ceiling_;
};

} // namespace vgreeks
