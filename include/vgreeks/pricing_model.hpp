#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include <vgreeks/chain_arrays.hpp>
#include <vgreeks/contract.hpp>

namespace vgreeks {

// Time-to-expiry at or below this is treated as expired.
inline constexpr double kExpiryEpsilon = 1e-8;

[[nodiscard]] inline bool is_expired(double time_to_expiry) noexcept {
    return time_to_expiry <= kExpiryEpsilon;
}

double normal_cdf(double x);
double normal_pdf(double x);

// Closed-form pricing for one model. Implementations are stateless after
// construction and may be shared between threads.
class PricingModel {
public:
    virtual ~PricingModel() = default;

    [[nodiscard]] virtual const std::string& name() const noexcept = 0;

    [[nodiscard]] virtual bool supports_batching() const noexcept {
        return true;
    }

    // Price plus every requested Greek for each row of `inputs`, in row
    // order. Length-one inputs are valid and give the scalar result.
    [[nodiscard]] virtual GreeksArrays evaluate(const ChainArrays& inputs, GreekSet requested) const = 0;
};

enum class CarryModel : std::uint8_t {
    RiskFreeRate,  // b = r
    DividendYield, // b = r - q
    Futures,       // b = 0, spot is the forward price
};

// Generalized Black-Scholes with cost of carry b.
class BlackScholesFamily final : public PricingModel {
public:
    BlackScholesFamily(std::string name, CarryModel carry);

    [[nodiscard]] const std::string& name() const noexcept override { return name_; }
    [[nodiscard]] CarryModel carry() const noexcept { return carry_; }

    [[nodiscard]] GreeksArrays evaluate(const ChainArrays& inputs, GreekSet requested) const override;

private:
    [[nodiscard]] Eigen::ArrayXd carry_rate(const ChainArrays& inputs) const;

    std::string name_;
    CarryModel carry_;
};

std::shared_ptr<const PricingModel> make_black_scholes();
std::shared_ptr<const PricingModel> make_black_scholes_merton();
std::shared_ptr<const PricingModel> make_black76();

} // namespace vgreeks
