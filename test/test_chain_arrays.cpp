#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <cmath>
#include <limits>
#include <vector>

#include <vgreeks/chain_arrays.hpp>
#include <vgreeks/contract.hpp>
#include <vgreeks/greeks.hpp>

using Catch::Approx;

TEST_CASE("to_chain_arrays preserves contract fields and broadcasts the context") {
    vgreeks::ContractSpec call{};
    call.id = 10;
    call.strike = 95.0;
    call.time_to_expiry = 0.25;
    call.volatility = 0.18;
    call.flavor = vgreeks::OptionFlavor::Call;

    vgreeks::ContractSpec put{};
    put.id = 11;
    put.strike = 105.0;
    put.time_to_expiry = 0.75;
    put.volatility = 0.35;
    put.flavor = vgreeks::OptionFlavor::Put;

    vgreeks::ChainContext context;
    context.spot = 100.0;
    context.rate = 0.04;
    context.dividend_yield = 0.01;

    const std::vector<vgreeks::ContractSpec> chain{call, put};
    const vgreeks::ChainArrays arrays = vgreeks::to_chain_arrays(chain, context);

    REQUIRE(arrays.size() == 2);
    REQUIRE(arrays.spot.size() == 2);
    REQUIRE(arrays.rate.size() == 2);
    REQUIRE(arrays.is_call.size() == 2);

    REQUIRE(arrays.strike(0) == Approx(call.strike));
    REQUIRE(arrays.strike(1) == Approx(put.strike));
    REQUIRE(arrays.time_to_expiry(1) == Approx(put.time_to_expiry));
    REQUIRE(arrays.volatility(0) == Approx(call.volatility));
    REQUIRE(arrays.is_call(0));
    REQUIRE_FALSE(arrays.is_call(1));

    for (Eigen::Index i = 0; i < 2; ++i) {
        REQUIRE(arrays.spot(i) == Approx(100.0));
        REQUIRE(arrays.rate(i) == Approx(0.04));
        REQUIRE(arrays.dividend_yield(i) == Approx(0.01));
    }
}

TEST_CASE("to_chain_arrays handles an empty chain") {
    vgreeks::ChainContext context;
    context.spot = 100.0;
    const vgreeks::ChainArrays arrays = vgreeks::to_chain_arrays({}, context);
    REQUIRE(arrays.size() == 0);
    REQUIRE(arrays.spot.size() == 0);
}

TEST_CASE("extract_result copies requested values and marks NaN as unavailable") {
    vgreeks::ContractSpec contract{};
    contract.id = 42;

    vgreeks::GreeksArrays outputs;
    outputs.price = Eigen::ArrayXd::Constant(2, 3.5);
    outputs.delta = Eigen::ArrayXd::Constant(2, 0.6);
    outputs.theta = Eigen::ArrayXd::Constant(2, std::numeric_limits<double>::quiet_NaN());

    const auto requested = vgreeks::GreekSet{}.insert(vgreeks::Greek::Delta).insert(vgreeks::Greek::Theta);
    const auto result = vgreeks::extract_result(contract,
                                                outputs,
                                                1,
                                                requested,
                                                "black_scholes_merton",
                                                vgreeks::ComputationPath::Batch);

    REQUIRE(result.contract_id == 42);
    REQUIRE(result.model == "black_scholes_merton");
    REQUIRE(result.path == vgreeks::ComputationPath::Batch);
    REQUIRE(result.price.value() == Approx(3.5));
    REQUIRE(result.delta.value() == Approx(0.6));
    REQUIRE_FALSE(result.theta.has_value());
    REQUIRE_FALSE(result.gamma.has_value());
    REQUIRE(result.reason == vgreeks::UnavailableReason::Expired);
    REQUIRE_FALSE(result.complete());
}

TEST_CASE("GreeksResult slots map to greeks") {
    vgreeks::GreeksResult result;
    result.slot(vgreeks::Greek::Vega) = 12.0;
    REQUIRE(result.vega.value() == Approx(12.0));
    REQUIRE(result.value(vgreeks::Greek::Vega).value() == Approx(12.0));
    REQUIRE_FALSE(result.value(vgreeks::Greek::Rho).has_value());
}
