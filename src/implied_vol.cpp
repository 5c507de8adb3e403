#include <vgreeks/implied_vol.hpp>

#include <algorithm>
#include <cmath>
#include <span>
#include <utility>

#include <vgreeks/chain_arrays.hpp>

namespace vgreeks {

namespace {

double model_price(const PricingModel& model,
                   ContractSpec trial,
                   const ChainContext& context,
                   double volatility) {
    trial.volatility = volatility;
    const ChainArrays inputs = to_chain_arrays(std::span<const ContractSpec>(&trial, 1), context);
    return model.evaluate(inputs, GreekSet{}).price(0);
}

} // namespace

std::optional<double> implied_volatility(const PricingModel& model,
                                         const ContractSpec& contract,
                                         const ChainContext& context,
                                         double target_price,
                                         const ImpliedVolatilityConfig& config) {
    if (!std::isfinite(target_price) || target_price <= 0.0 || is_expired(contract.time_to_expiry)) {
        return std::nullopt;
    }
    if (!(config.lower > 0.0 && config.lower < config.upper)) {
        return std::nullopt;
    }

    auto f = [&](double sigma) { return model_price(model, contract, context, sigma) - target_price; };

    double a = config.lower;
    double b = config.upper;
    double fa = f(a);
    double fb = f(b);
    const double tol = config.tolerance;

    if (!std::isfinite(fa) || !std::isfinite(fb) || fa * fb > 0.0) {
        return std::nullopt;
    }
    if (std::abs(fa) < tol) {
        return a;
    }
    if (std::abs(fb) < tol) {
        return b;
    }
    if (std::abs(fa) < std::abs(fb)) {
        std::swap(a, b);
        std::swap(fa, fb);
    }

    double c = a;
    double fc = fa;
    double d = 0.0;
    bool bisected = true;

    for (std::size_t iter = 0; iter < config.max_iterations; ++iter) {
        if (std::abs(fb) < tol || std::abs(b - a) < tol) {
            return b;
        }

        double s = 0.0;
        if (fa != fc && fb != fc) {
            s = a * fb * fc / ((fa - fb) * (fa - fc)) +
                b * fa * fc / ((fb - fa) * (fb - fc)) +
                c * fa * fb / ((fc - fa) * (fc - fb));
        } else {
            s = b - fb * (b - a) / (fb - fa);
        }

        const double bound = (3.0 * a + b) / 4.0;
        const bool outside = !(s > std::min(bound, b) && s < std::max(bound, b));
        const bool slow_after_bisect = bisected && std::abs(s - b) >= std::abs(b - c) / 2.0;
        const bool slow_after_interp = !bisected && std::abs(s - b) >= std::abs(c - d) / 2.0;
        const bool tiny_after_bisect = bisected && std::abs(b - c) < tol;
        const bool tiny_after_interp = !bisected && std::abs(c - d) < tol;

        if (outside || slow_after_bisect || slow_after_interp || tiny_after_bisect || tiny_after_interp) {
            s = 0.5 * (a + b);
            bisected = true;
        } else {
            bisected = false;
        }

        const double fs = f(s);
        if (!std::isfinite(fs)) {
            return std::nullopt;
        }
        d = c;
        c = b;
        fc = fb;

        if (fa * fs < 0.0) {
            b = s;
            fb = fs;
        } else {
            a = s;
            fa = fs;
        }

        if (std::abs(fa) < std::abs(fb)) {
            std::swap(a, b);
            std::swap(fa, fb);
        }
    }

    return std::nullopt;
}

} // namespace vgreeks
