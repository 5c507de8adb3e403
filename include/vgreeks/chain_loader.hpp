#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <vgreeks/contract.hpp>
#include <vgreeks/pricing_model.hpp>

namespace vgreeks {

// One row of a chain CSV before volatility and time to expiry are resolved.
struct ChainRow {
    std::uint32_t id = 0;
    double strike = 0.0;
    OptionFlavor flavor = OptionFlavor::Call;
    std::string expiry;
    std::optional<std::chrono::sys_days> expiry_date;
    std::optional<double> time_to_expiry;
    std::optional<double> volatility;
    std::optional<double> market_price;
};

// Header: id,strike,option_type,expiry,time_to_expiry,volatility,price
// A row needs either time_to_expiry or a parseable expiry date.
bool load_chain_csv(const std::string& path, std::vector<ChainRow>& rows);

std::optional<std::chrono::sys_days> parse_iso_date(std::string_view token);

// Years between valuation and expiry on an ACT/365.25 basis. Past expiries
// give 0; anything later is floored at one day.
double year_fraction(std::chrono::sys_days valuation, std::chrono::sys_days expiry);

struct ResolveDefaults {
    std::chrono::sys_days valuation_date{};
    double default_volatility = 0.2;
    double volatility_ceiling = 5.0;
};

// Fills in time to expiry and volatility. A missing volatility is implied
// from the row's price with `model`; if that is not possible the default
// volatility is used.
std::vector<ContractSpec> resolve_contracts(const std::vector<ChainRow>& rows,
                                            const ChainContext& context,
                                            const PricingModel& model,
                                            const ResolveDefaults& defaults);

} // namespace vgreeks
