#include <vgreeks/pricing_model.hpp>

#include <cmath>
#include <limits>
#include <utility>

namespace vgreeks {

namespace {

constexpr double kMinVol = 1e-8;

Eigen::ArrayXd cdf(const Eigen::ArrayXd& x) {
    return x.unaryExpr([](double v) { return normal_cdf(v); });
}

Eigen::ArrayXd pdf(const Eigen::ArrayXd& x) {
    return x.unaryExpr([](double v) { return normal_pdf(v); });
}

} // namespace

double normal_cdf(double x) {
    return 0.5 * std::erfc(-x / std::sqrt(2.0));
}

double normal_pdf(double x) {
    static constexpr double inv_sqrt_2pi = 0.39894228040143267794;
    return inv_sqrt_2pi * std::exp(-0.5 * x * x);
}

BlackScholesFamily::BlackScholesFamily(std::string name, CarryModel carry)
    : name_(std::move(name)), carry_(carry) {}

Eigen::ArrayXd BlackScholesFamily::carry_rate(const ChainArrays& inputs) const {
    switch (carry_) {
    case CarryModel::RiskFreeRate:
        return inputs.rate;
    case CarryModel::DividendYield:
        return inputs.rate - inputs.dividend_yield;
    case CarryModel::Futures:
        break;
    }
    return Eigen::ArrayXd::Zero(inputs.rate.size());
}

GreeksArrays BlackScholesFamily::evaluate(const ChainArrays& inputs, GreekSet requested) const {
    const Eigen::Index n = inputs.strike.size();
    const FlagArray& is_call = inputs.is_call;
    const FlagArray expired = inputs.time_to_expiry <= kExpiryEpsilon;

    const Eigen::ArrayXd tau = inputs.time_to_expiry.max(kExpiryEpsilon);
    const Eigen::ArrayXd vol = inputs.volatility.max(kMinVol);
    const Eigen::ArrayXd sqrt_tau = tau.sqrt();
    const Eigen::ArrayXd vol_sqrt_tau = vol * sqrt_tau;
    const Eigen::ArrayXd carry = carry_rate(inputs);

    const Eigen::ArrayXd d1 =
        ((inputs.spot / inputs.strike).log() + (carry + 0.5 * vol.square()) * tau) / vol_sqrt_tau;
    const Eigen::ArrayXd d2 = d1 - vol_sqrt_tau;

    const Eigen::ArrayXd disc = (-inputs.rate * tau).exp();
    const Eigen::ArrayXd carry_disc = ((carry - inputs.rate) * tau).exp();
    const Eigen::ArrayXd spot_carry = inputs.spot * carry_disc;
    const Eigen::ArrayXd strike_disc = inputs.strike * disc;

    const Eigen::ArrayXd nd1 = cdf(d1);
    const Eigen::ArrayXd nd2 = cdf(d2);
    const Eigen::ArrayXd nd1_put = cdf(-d1);
    const Eigen::ArrayXd nd2_put = cdf(-d2);
    const Eigen::ArrayXd pdf_d1 = pdf(d1);

    const Eigen::ArrayXd zeros = Eigen::ArrayXd::Zero(n);
    const Eigen::ArrayXd ones = Eigen::ArrayXd::Ones(n);

    GreeksArrays out;

    const Eigen::ArrayXd live_price =
        is_call.select(spot_carry * nd1 - strike_disc * nd2, strike_disc * nd2_put - spot_carry * nd1_put);
    const Eigen::ArrayXd intrinsic =
        is_call.select((inputs.spot - inputs.strike).max(0.0), (inputs.strike - inputs.spot).max(0.0));
    out.price = expired.select(intrinsic, live_price);

    if (requested.contains(Greek::Delta)) {
        const Eigen::ArrayXd live = is_call.select(carry_disc * nd1, -carry_disc * nd1_put);
        const Eigen::ArrayXd limit = is_call.select((inputs.spot > inputs.strike).select(ones, zeros),
                                                    (inputs.spot < inputs.strike).select(-ones, zeros));
        out.delta = expired.select(limit, live);
    }

    if (requested.contains(Greek::Gamma)) {
        const Eigen::ArrayXd live = carry_disc * pdf_d1 / (inputs.spot * vol_sqrt_tau);
        out.gamma = expired.select(zeros, live);
    }

    if (requested.contains(Greek::Vega)) {
        const Eigen::ArrayXd live = spot_carry * pdf_d1 * sqrt_tau;
        out.vega = expired.select(zeros, live);
    }

    if (requested.contains(Greek::Theta)) {
        const Eigen::ArrayXd decay = -(spot_carry * pdf_d1 * vol) / (2.0 * sqrt_tau);
        const Eigen::ArrayXd carry_gap = carry - inputs.rate;
        const Eigen::ArrayXd call_theta =
            decay - carry_gap * spot_carry * nd1 - inputs.rate * strike_disc * nd2;
        const Eigen::ArrayXd put_theta =
            decay + carry_gap * spot_carry * nd1_put + inputs.rate * strike_disc * nd2_put;
        const Eigen::ArrayXd undefined =
            Eigen::ArrayXd::Constant(n, std::numeric_limits<double>::quiet_NaN());
        out.theta = expired.select(undefined, is_call.select(call_theta, put_theta));
    }

    if (requested.contains(Greek::Rho)) {
        Eigen::ArrayXd live;
        if (carry_ == CarryModel::Futures) {
            live = -tau * live_price;
        } else {
            live = is_call.select(strike_disc * tau * nd2, -strike_disc * tau * nd2_put);
        }
        out.rho = expired.select(zeros, live);
    }

    return out;
}

std::shared_ptr<const PricingModel> make_black_scholes() {
    return std::make_shared<BlackScholesFamily>("black_scholes", CarryModel::RiskFreeRate);
}

std::shared_ptr<const PricingModel> make_black_scholes_merton() {
    return std::make_shared<BlackScholesFamily>("black_scholes_merton", CarryModel::DividendYield);
}

std::shared_ptr<const PricingModel> make_black76() {
    return std::make_shared<BlackScholesFamily>("black76", CarryModel::Futures);
}

} // namespace vgreeks
