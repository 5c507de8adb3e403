#include <vgreeks/bounds.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

#include <vgreeks/errors.hpp>
#include <vgreeks/pricing_model.hpp>

namespace vgreeks {

namespace {

constexpr double kInfinity = std::numeric_limits<double>::infinity();

void check_length(const char* quantity, Eigen::Index actual, Eigen::Index expected) {
    if (actual != expected) {
        throw BatchComputationError("model returned " + std::to_string(actual) + " " + quantity +
                                    " values for " + std::to_string(expected) + " contracts");
    }
}

} // namespace

BoundsValidator::BoundsValidator(BoundsPolicy policy, double volatility_ceiling)
    : policy_(policy), volatility_ceiling_(volatility_ceiling) {}

void BoundsValidator::check_context(const ChainContext& context) const {
    if (!std::isfinite(context.spot) || context.spot <= 0.0) {
        throw InvalidContractDataError("spot", std::nullopt, context.spot);
    }
    if (!std::isfinite(context.rate)) {
        throw InvalidContractDataError("rate", std::nullopt, context.rate);
    }
    if (!std::isfinite(context.dividend_yield)) {
        throw InvalidContractDataError("dividend_yield", std::nullopt, context.dividend_yield);
    }
}

void BoundsValidator::check_contract(const ContractSpec& contract, std::size_t index) const {
    check_fields(contract.strike, contract.time_to_expiry, contract.volatility, index);
}

void BoundsValidator::check_fields(double strike,
                                   double time_to_expiry,
                                   double volatility,
                                   std::size_t index) const {
    if (!std::isfinite(strike) || strike <= 0.0) {
        throw InvalidContractDataError("strike", index, strike);
    }
    if (!std::isfinite(volatility) || volatility <= 0.0 || volatility > volatility_ceiling_) {
        throw InvalidContractDataError("volatility", index, volatility);
    }
    if (!std::isfinite(time_to_expiry) || time_to_expiry < 0.0) {
        throw InvalidContractDataError("time_to_expiry", index, time_to_expiry);
    }
}

void BoundsValidator::check_inputs(const ChainArrays& inputs, std::size_t offset) const {
    const Eigen::Index n = inputs.strike.size();
    for (Eigen::Index row = 0; row < n; ++row) {
        const std::size_t index = offset + static_cast<std::size_t>(row);
        if (!std::isfinite(inputs.spot(row)) || inputs.spot(row) <= 0.0) {
            throw InvalidContractDataError("spot", index, inputs.spot(row));
        }
        check_fields(inputs.strike(row), inputs.time_to_expiry(row), inputs.volatility(row), index);
    }
}

double BoundsValidator::check_range(const char* quantity,
                                    double value,
                                    double lower,
                                    double upper,
                                    std::size_t index) const {
    if (value >= lower && value <= upper) {
        return value;
    }
    if (policy_ == BoundsPolicy::Reject) {
        throw GreeksOutOfBoundsError(quantity, index, value);
    }
    const double clamped = std::clamp(value, lower, upper);
    spdlog::warn("Clamped {} {} to {} for contract at index {}", quantity, value, clamped, index);
    return clamped;
}

void BoundsValidator::check_outputs(const ChainArrays& inputs,
                                    GreeksArrays& outputs,
                                    GreekSet requested,
                                    std::size_t offset) const {
    const Eigen::Index n = inputs.strike.size();
    check_length("price", outputs.price.size(), n);
    for (const Greek greek : kAllGreeks) {
        if (requested.contains(greek)) {
            check_length(to_string(greek).data(), outputs[greek].size(), n);
        }
    }

    for (Eigen::Index row = 0; row < n; ++row) {
        const std::size_t index = offset + static_cast<std::size_t>(row);

        if (!std::isfinite(outputs.price(row))) {
            throw GreeksOutOfBoundsError("price", index, outputs.price(row));
        }

        for (const Greek greek : kAllGreeks) {
            if (!requested.contains(greek)) {
                continue;
            }
            double& value = outputs[greek](row);
            const char* name = to_string(greek).data();

            if (!std::isfinite(value)) {
                if (greek == Greek::Theta && std::isnan(value) && is_expired(inputs.time_to_expiry(row))) {
                    continue;
                }
                throw GreeksOutOfBoundsError(name, index, value);
            }

            switch (greek) {
            case Greek::Delta:
                if (inputs.is_call(row)) {
                    value = check_range(name, value, 0.0, 1.0, index);
                } else {
                    value = check_range(name, value, -1.0, 0.0, index);
                }
                break;
            case Greek::Gamma:
            case Greek::Vega:
                value = check_range(name, value, 0.0, kInfinity, index);
                break;
            case Greek::Theta:
            case Greek::Rho:
                break;
            }
        }
    }
}

} // namespace vgreeks
