#include <vgreeks/chain_arrays.hpp>

#include <cmath>

namespace vgreeks {

void ChainArrays::resize(std::size_t n) {
    const auto rows = static_cast<Eigen::Index>(n);
    spot.resize(rows);
    strike.resize(rows);
    time_to_expiry.resize(rows);
    rate.resize(rows);
    dividend_yield.resize(rows);
    volatility.resize(rows);
    is_call.resize(rows);
}

std::size_t ChainArrays::size() const noexcept {
    return static_cast<std::size_t>(strike.size());
}

Eigen::ArrayXd& GreeksArrays::operator[](Greek greek) noexcept {
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

const Eigen::ArrayXd& GreeksArrays::operator[](Greek greek) const noexcept {
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

ChainArrays to_chain_arrays(std::span<const ContractSpec> contracts, const ChainContext& context) {
    ChainArrays arrays;
    arrays.resize(contracts.size());

    arrays.spot.setConstant(context.spot);
    arrays.rate.setConstant(context.rate);
    arrays.dividend_yield.setConstant(context.dividend_yield);

    for (std::size_t i = 0; i < contracts.size(); ++i) {
        const auto row = static_cast<Eigen::Index>(i);
        const ContractSpec& contract = contracts[i];
        arrays.strike(row) = contract.strike;
        arrays.time_to_expiry(row) = contract.time_to_expiry;
        arrays.volatility(row) = contract.volatility;
        arrays.is_call(row) = contract.flavor == OptionFlavor::Call;
    }

    return arrays;
}

GreeksResult extract_result(const ContractSpec& contract,
                            const GreeksArrays& outputs,
                            Eigen::Index row,
                            GreekSet requested,
                            const std::string& model,
                            ComputationPath path) {
    GreeksResult result;
    result.contract_id = contract.id;
    result.model = model;
    result.path = path;
    result.price = outputs.price(row);

    for (const Greek greek : kAllGreeks) {
        if (!requested.contains(greek)) {
            continue;
        }
        const double value = outputs[greek](row);
        if (std::isnan(value)) {
            result.reason = UnavailableReason::Expired;
            continue;
        }
        result.slot(greek) = value;
    }

    return result;
}

} // namespace vgreeks
