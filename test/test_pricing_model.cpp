#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

using Catch::Approx;

#include <cmath>
#include <vector>

#include <vgreeks/chain_arrays.hpp>
#include <vgreeks/contract.hpp>
#include <vgreeks/pricing_model.hpp>

namespace {
constexpr double kTolerance = 1e-6;

vgreeks::GreeksArrays evaluate_one(const vgreeks::PricingModel& model,
                                   double spot,
                                   double strike,
                                   double rate,
                                   double dividend_yield,
                                   double vol,
                                   double maturity,
                                   vgreeks::OptionFlavor flavor) {
    vgreeks::ContractSpec contract;
    contract.strike = strike;
    contract.time_to_expiry = maturity;
    contract.volatility = vol;
    contract.flavor = flavor;

    vgreeks::ChainContext context;
    context.spot = spot;
    context.rate = rate;
    context.dividend_yield = dividend_yield;

    const std::vector<vgreeks::ContractSpec> chain{contract};
    return model.evaluate(vgreeks::to_chain_arrays(chain, context), vgreeks::GreekSet::all());
}
} // namespace

TEST_CASE("Black-Scholes call price and greeks match known values") {
    const auto model = vgreeks::make_black_scholes();
    const auto out = evaluate_one(*model, 100.0, 100.0, 0.05, 0.0, 0.20, 1.0, vgreeks::OptionFlavor::Call);

    REQUIRE(out.price(0) == Approx(10.4505835721856).margin(kTolerance));
    REQUIRE(out.delta(0) == Approx(0.636830651175619).margin(kTolerance));
    REQUIRE(out.gamma(0) == Approx(0.0187620173458469).margin(kTolerance));
    REQUIRE(out.vega(0) == Approx(37.5240346916938).margin(kTolerance));
    REQUIRE(out.theta(0) == Approx(-6.4140275464382).margin(kTolerance));
    REQUIRE(out.rho(0) == Approx(53.2324815453763).margin(kTolerance));
}

TEST_CASE("Black-Scholes put price and greeks match known values") {
    const auto model = vgreeks::make_black_scholes();
    const auto out = evaluate_one(*model, 100.0, 100.0, 0.05, 0.0, 0.20, 1.0, vgreeks::OptionFlavor::Put);

    REQUIRE(out.price(0) == Approx(5.57352602225697).margin(kTolerance));
    REQUIRE(out.delta(0) == Approx(-0.363169348824381).margin(kTolerance));
    REQUIRE(out.gamma(0) == Approx(0.0187620173458469).margin(kTolerance));
    REQUIRE(out.vega(0) == Approx(37.5240346916938).margin(kTolerance));
    REQUIRE(out.theta(0) == Approx(-1.65788042393463).margin(kTolerance));
    REQUIRE(out.rho(0) == Approx(-41.8904609046951).margin(kTolerance));
}

TEST_CASE("Black-Scholes ignores the dividend yield") {
    const auto model = vgreeks::make_black_scholes();
    const auto plain = evaluate_one(*model, 100.0, 100.0, 0.05, 0.0, 0.20, 1.0, vgreeks::OptionFlavor::Call);
    const auto with_yield = evaluate_one(*model, 100.0, 100.0, 0.05, 0.03, 0.20, 1.0, vgreeks::OptionFlavor::Call);

    REQUIRE(with_yield.price(0) == Approx(plain.price(0)));
    REQUIRE(with_yield.delta(0) == Approx(plain.delta(0)));
}

TEST_CASE("Black-Scholes-Merton prices a dividend paying underlying") {
    const auto model = vgreeks::make_black_scholes_merton();

    SECTION("call") {
        const auto out = evaluate_one(*model, 100.0, 95.0, 0.05, 0.02, 0.25, 0.5, vgreeks::OptionFlavor::Call);
        REQUIRE(out.price(0) == Approx(10.3924296839918).margin(kTolerance));
        REQUIRE(out.delta(0) == Approx(0.6717103067222844).margin(kTolerance));
        REQUIRE(out.gamma(0) == Approx(0.02006836711292865).margin(kTolerance));
        REQUIRE(out.vega(0) == Approx(25.085458891160815).margin(kTolerance));
        REQUIRE(out.theta(0) == Approx(-7.7668741587574655).margin(kTolerance));
        REQUIRE(out.rho(0) == Approx(28.389300494118313).margin(kTolerance));
    }

    SECTION("put") {
        const auto out = evaluate_one(*model, 100.0, 95.0, 0.05, 0.02, 0.25, 0.5, vgreeks::OptionFlavor::Put);
        REQUIRE(out.price(0) == Approx(4.041887951766604).margin(kTolerance));
        REQUIRE(out.delta(0) == Approx(-0.31833952702688373).margin(kTolerance));
        REQUIRE(out.gamma(0) == Approx(0.02006836711292865).margin(kTolerance));
        REQUIRE(out.vega(0) == Approx(25.085458891160815).margin(kTolerance));
        REQUIRE(out.theta(0) == Approx(-5.114251744121222).margin(kTolerance));
        REQUIRE(out.rho(0) == Approx(-17.937920327227488).margin(kTolerance));
    }
}

TEST_CASE("Black76 prices options on a forward") {
    const auto model = vgreeks::make_black76();
    const auto call = evaluate_one(*model, 100.0, 100.0, 0.05, 0.0, 0.30, 0.5, vgreeks::OptionFlavor::Call);
    const auto put = evaluate_one(*model, 100.0, 100.0, 0.05, 0.0, 0.30, 0.5, vgreeks::OptionFlavor::Put);

    REQUIRE(call.price(0) == Approx(8.238445423493147).margin(kTolerance));
    REQUIRE(call.delta(0) == Approx(0.528847183131632).margin(kTolerance));
    REQUIRE(call.gamma(0) == Approx(0.018239105710147325).margin(kTolerance));
    REQUIRE(call.vega(0) == Approx(27.358658565220992).margin(kTolerance));
    REQUIRE(call.theta(0) == Approx(-7.795675298391638).margin(kTolerance));
    REQUIRE(call.rho(0) == Approx(-4.119222711746573).margin(kTolerance));

    // At-the-money forward: call and put are worth the same.
    REQUIRE(put.price(0) == Approx(call.price(0)).margin(kTolerance));
    REQUIRE(put.delta(0) == Approx(-0.4464627288967005).margin(kTolerance));
    REQUIRE(put.theta(0) == Approx(call.theta(0)).margin(kTolerance));
    REQUIRE(put.rho(0) == Approx(call.rho(0)).margin(kTolerance));
}

TEST_CASE("Expired contracts return intrinsic value and limit greeks") {
    const auto model = vgreeks::make_black_scholes_merton();

    const auto itm_call = evaluate_one(*model, 110.0, 100.0, 0.01, 0.0, 0.2, 0.0, vgreeks::OptionFlavor::Call);
    REQUIRE(itm_call.price(0) == Approx(10.0).margin(kTolerance));
    REQUIRE(itm_call.delta(0) == Approx(1.0));
    REQUIRE(itm_call.gamma(0) == Approx(0.0));
    REQUIRE(itm_call.vega(0) == Approx(0.0));
    REQUIRE(itm_call.rho(0) == Approx(0.0));
    REQUIRE(std::isnan(itm_call.theta(0)));

    const auto otm_put = evaluate_one(*model, 110.0, 100.0, 0.01, 0.0, 0.2, 0.0, vgreeks::OptionFlavor::Put);
    REQUIRE(otm_put.price(0) == Approx(0.0).margin(kTolerance));
    REQUIRE(otm_put.delta(0) == Approx(0.0));

    const auto itm_put = evaluate_one(*model, 90.0, 100.0, 0.01, 0.0, 0.2, 1e-9, vgreeks::OptionFlavor::Put);
    REQUIRE(itm_put.price(0) == Approx(10.0).margin(kTolerance));
    REQUIRE(itm_put.delta(0) == Approx(-1.0));
}

TEST_CASE("Unrequested greeks are not computed") {
    const auto model = vgreeks::make_black_scholes_merton();

    vgreeks::ContractSpec contract;
    contract.strike = 100.0;
    contract.time_to_expiry = 0.5;
    contract.volatility = 0.2;

    vgreeks::ChainContext context;
    context.spot = 100.0;
    context.rate = 0.05;

    const std::vector<vgreeks::ContractSpec> chain{contract};
    const auto out = model->evaluate(vgreeks::to_chain_arrays(chain, context),
                                     vgreeks::GreekSet{}.insert(vgreeks::Greek::Delta));

    REQUIRE(out.price.size() == 1);
    REQUIRE(out.delta.size() == 1);
    REQUIRE(out.gamma.size() == 0);
    REQUIRE(out.theta.size() == 0);
    REQUIRE(out.vega.size() == 0);
    REQUIRE(out.rho.size() == 0);
}

TEST_CASE("Rows of a multi-contract evaluation match single-contract evaluations") {
    const auto model = vgreeks::make_black_scholes_merton();

    vgreeks::ChainContext context;
    context.spot = 100.0;
    context.rate = 0.03;
    context.dividend_yield = 0.01;

    std::vector<vgreeks::ContractSpec> chain;
    for (int i = 0; i < 12; ++i) {
        vgreeks::ContractSpec contract;
        contract.id = static_cast<std::uint32_t>(i);
        contract.strike = 80.0 + 4.0 * i;
        contract.time_to_expiry = 0.1 + 0.15 * i;
        contract.volatility = 0.15 + 0.02 * i;
        contract.flavor = i % 2 == 0 ? vgreeks::OptionFlavor::Call : vgreeks::OptionFlavor::Put;
        chain.push_back(contract);
    }

    const auto batch = model->evaluate(vgreeks::to_chain_arrays(chain, context), vgreeks::GreekSet::all());
    for (std::size_t i = 0; i < chain.size(); ++i) {
        const std::vector<vgreeks::ContractSpec> single{chain[i]};
        const auto one = model->evaluate(vgreeks::to_chain_arrays(single, context), vgreeks::GreekSet::all());
        const auto row = static_cast<Eigen::Index>(i);
        REQUIRE(batch.price(row) == Approx(one.price(0)).margin(1e-12));
        REQUIRE(batch.delta(row) == Approx(one.delta(0)).margin(1e-12));
        REQUIRE(batch.gamma(row) == Approx(one.gamma(0)).margin(1e-12));
        REQUIRE(batch.theta(row) == Approx(one.theta(0)).margin(1e-12));
        REQUIRE(batch.vega(row) == Approx(one.vega(0)).margin(1e-12));
        REQUIRE(batch.rho(row) == Approx(one.rho(0)).margin(1e-12));
    }
}

TEST_CASE("Normal distribution helpers") {
    REQUIRE(vgreeks::normal_cdf(0.0) == Approx(0.5));
    REQUIRE(vgreeks::normal_cdf(1.96) == Approx(0.9750021048517795).margin(1e-12));
    REQUIRE(vgreeks::normal_pdf(0.0) == Approx(0.3989422804014327).margin(1e-12));
}
