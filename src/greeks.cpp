#include <vgreeks/greeks.hpp>

#include <utility>

namespace vgreeks {

std::string_view to_string(ComputationPath path) noexcept {
    return path == ComputationPath::Batch ? "batch" : "scalar";
}

std::string_view to_string(UnavailableReason reason) noexcept {
    switch (reason) {
    case UnavailableReason::None:
        return "none";
    case UnavailableReason::Expired:
        return "expired";
    case UnavailableReason::OutOfBounds:
        return "out_of_bounds";
    case UnavailableReason::ModelFailure:
        return "model_failure";
    }
    return "unknown";
}

std::optional<double> GreeksResult::value(Greek greek) const noexcept {
    switch (greek) {
    case Greek::Delta:
        return delta;
    case Greek::Gamma:
        return gamma;
    case Greek::Theta:
        return theta;
    case Greek::Vega:
        return vega;
    case Greek::Rho:
        return rho;
    }
    return std::nullopt;
}

std::optional<double>& GreeksResult::slot(Greek greek) noexcept {
    switch (greek) {
    case Greek::Delta:
        return delta;
    case Greek::Gamma:
        return gamma;
    case Greek::Theta:
        return theta;
    case Greek::Vega:
        return vega;
    case Greek::Rho:
        break;
    }
    return rho;
}

GreeksResult unavailable_result(const ContractSpec& contract,
                                std::string model,
                                ComputationPath path,
                                UnavailableReason reason) {
    GreeksResult result;
    result.contract_id = contract.id;
    result.model = std::move(model);
    result.path = path;
    result.reason = reason;
    return result;
}

} // namespace vgreeks
