#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <vgreeks/contract.hpp>

namespace vgreeks {

enum class ComputationPath : std::uint8_t { Batch = 0, Scalar = 1 };

enum class UnavailableReason : std::uint8_t {
    None = 0,
    Expired,      // theta at time-to-expiry 0
    OutOfBounds,  // scalar evaluation produced an invalid value
    ModelFailure, // scalar evaluation threw
};

std::string_view to_string(ComputationPath path) noexcept;
std::string_view to_string(UnavailableReason reason) noexcept;

// Greeks of one contract. A requested value left empty is unavailable and
// `reason` says why; values that were not requested are always empty.
struct GreeksResult {
    std::uint32_t contract_id = 0;
    std::optional<double> price;  // per contract
    std::optional<double> delta;  // per $1 spot move
    std::optional<double> gamma;  // per $^2
    std::optional<double> theta;  // per year
    std::optional<double> vega;   // per 1.00 volatility move
    std::optional<double> rho;    // per 1.00 rate move
    std::string model;
    ComputationPath path = ComputationPath::Scalar;
    UnavailableReason reason = UnavailableReason::None;

    [[nodiscard]] std::optional<double> value(Greek greek) const noexcept;
    std::optional<double>& slot(Greek greek) noexcept;

    [[nodiscard]] bool complete() const noexcept {
        return reason == UnavailableReason::None;
    }
};

GreeksResult unavailable_result(const ContractSpec& contract,
                                std::string model,
                                ComputationPath path,
                                UnavailableReason reason);

} // namespace vgreeks
