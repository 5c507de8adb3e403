#pragma once

#include <cstddef>
#include <span>
#include <vector>

#include <Eigen/Dense>

#include <vgreeks/contract.hpp>
#include <vgreeks/greeks.hpp>

namespace vgreeks {

using FlagArray = Eigen::Array<bool, Eigen::Dynamic, 1>;

// Aligned model inputs, one row per contract. Context scalars are
// broadcast so every array has the same length.
struct ChainArrays {
    Eigen::ArrayXd spot;
    Eigen::ArrayXd strike;
    Eigen::ArrayXd time_to_expiry;
    Eigen::ArrayXd rate;
    Eigen::ArrayXd dividend_yield;
    Eigen::ArrayXd volatility;
    FlagArray is_call;

    void resize(std::size_t n);
    [[nodiscard]] std::size_t size() const noexcept;
};

// Model outputs. `price` is always filled; a Greek that was not requested
// stays empty. NaN marks a value the model could not define.
struct GreeksArrays {
    Eigen::ArrayXd price;
    Eigen::ArrayXd delta;
    Eigen::ArrayXd gamma;
    Eigen::ArrayXd theta;
    Eigen::ArrayXd vega;
    Eigen::ArrayXd rho;

    Eigen::ArrayXd& operator[](Greek greek) noexcept;
    const Eigen::ArrayXd& operator[](Greek greek) const noexcept;
};

ChainArrays to_chain_arrays(std::span<const ContractSpec> contracts, const ChainContext& context);

// Reads row `row` of `outputs` into a result for `contract`.
GreeksResult extract_result(const ContractSpec& contract,
                            const GreeksArrays& outputs,
                            Eigen::Index row,
                            GreekSet requested,
                            const std::string& model,
                            ComputationPath path);

} // namespace vgreeks
