#include <vgreeks/chain_loader.hpp>

#include <vgreeks/implied_vol.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace vgreeks {

namespace {

constexpr std::size_t kChainColumns = 7;

const char* kChainHeader[kChainColumns] = {
    "id",
    "strike",
    "option_type",
    "expiry",
    "time_to_expiry",
    "volatility",
    "price"
};

constexpr double kDaysPerYear = 365.25;

std::string trim(std::string_view input) {
    const auto begin = input.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return std::string{};
    }
    const auto end = input.find_last_not_of(" \t\r\n");
    return std::string(input.substr(begin, end - begin + 1));
}

std::vector<std::string> split_csv_line(const std::string& line) {
    std::vector<std::string> fields;
    std::string field;
    std::istringstream stream(line);
    while (std::getline(stream, field, ',')) {
        fields.emplace_back(trim(field));
    }
    if (!line.empty() && line.back() == ',') {
        fields.emplace_back();
    }
    return fields;
}

bool parse_uint32(const std::string& token, std::uint32_t& value_out) {
    if (token.empty()) {
        return false;
    }
    try {
        size_t idx = 0;
        unsigned long raw = std::stoul(token, &idx, 10);
        if (idx != token.size() || raw > std::numeric_limits<std::uint32_t>::max()) {
            return false;
        }
        value_out = static_cast<std::uint32_t>(raw);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

// Empty tokens leave `value_out` empty.
bool parse_optional_double(const std::string& token, std::optional<double>& value_out) {
    value_out.reset();
    if (token.empty()) {
        return true;
    }
    try {
        size_t idx = 0;
        double value = std::stod(token, &idx);
        if (idx != token.size() || !std::isfinite(value)) {
            return false;
        }
        value_out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parse_fixed_int(std::string_view token, int& value_out) {
    if (token.empty()) {
        return false;
    }
    int value = 0;
    for (const char c : token) {
        if (c < '0' || c > '9') {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    value_out = value;
    return true;
}

} // namespace

std::optional<std::chrono::sys_days> parse_iso_date(std::string_view token) {
    if (token.size() != 10 || token[4] != '-' || token[7] != '-') {
        return std::nullopt;
    }
    int year = 0;
    int month = 0;
    int day = 0;
    if (!parse_fixed_int(token.substr(0, 4), year) ||
        !parse_fixed_int(token.substr(5, 2), month) ||
        !parse_fixed_int(token.substr(8, 2), day)) {
        return std::nullopt;
    }
    const std::chrono::year_month_day ymd{std::chrono::year{year},
                                          std::chrono::month{static_cast<unsigned>(month)},
                                          std::chrono::day{static_cast<unsigned>(day)}};
    if (!ymd.ok()) {
        return std::nullopt;
    }
    return std::chrono::sys_days{ymd};
}

double year_fraction(std::chrono::sys_days valuation, std::chrono::sys_days expiry) {
    const auto days = (expiry - valuation).count();
    if (days < 0) {
        return 0.0;
    }
    return std::max(static_cast<double>(days), 1.0) / kDaysPerYear;
}

bool load_chain_csv(const std::string& path, std::vector<ChainRow>& rows) {
    rows.clear();

    std::ifstream input(path);
    if (!input.is_open()) {
        spdlog::error("Failed to open chain CSV: {}", path);
        return false;
    }

    std::string line;
    if (!std::getline(input, line)) {
        spdlog::error("Chain CSV missing header row");
        return false;
    }

    const auto header = split_csv_line(line);
    if (header.size() != kChainColumns) {
        spdlog::error("Unexpected chain header column count");
        return false;
    }
    for (std::size_t i = 0; i < kChainColumns; ++i) {
        if (header[i] != kChainHeader[i]) {
            spdlog::error("Chain header mismatch at column {}", i);
            return false;
        }
    }

    std::size_t row_index = 1;
    while (std::getline(input, line)) {
        ++row_index;
        if (line.find_first_not_of(" \t\r\n") == std::string::npos) {
            continue;
        }

        const auto fields = split_csv_line(line);
        if (fields.size() != kChainColumns) {
            spdlog::error("Unexpected field count in chain row {}", row_index);
            rows.clear();
            return false;
        }

        ChainRow row;
        if (!parse_uint32(fields[0], row.id)) {
            spdlog::error("Invalid id in chain row {}", row_index);
            rows.clear();
            return false;
        }

        std::optional<double> strike;
        if (!parse_optional_double(fields[1], strike) || !strike || *strike <= 0.0) {
            spdlog::error("Invalid strike in chain row {}", row_index);
            rows.clear();
            return false;
        }
        row.strike = *strike;

        const auto flavor = parse_flavor(fields[2]);
        if (!flavor) {
            spdlog::error("Invalid option_type '{}' in chain row {}", fields[2], row_index);
            rows.clear();
            return false;
        }
        row.flavor = *flavor;

        row.expiry = fields[3];
        if (!row.expiry.empty()) {
            row.expiry_date = parse_iso_date(row.expiry);
            if (!row.expiry_date) {
                spdlog::error("Invalid expiry '{}' in chain row {}", row.expiry, row_index);
                rows.clear();
                return false;
            }
        }

        if (!parse_optional_double(fields[4], row.time_to_expiry) ||
            (row.time_to_expiry && *row.time_to_expiry < 0.0)) {
            spdlog::error("Invalid time_to_expiry in chain row {}", row_index);
            rows.clear();
            return false;
        }
        if (!row.time_to_expiry && !row.expiry_date) {
            spdlog::error("Chain row {} needs an expiry or a time_to_expiry", row_index);
            rows.clear();
            return false;
        }

        if (!parse_optional_double(fields[5], row.volatility)) {
            spdlog::error("Invalid volatility in chain row {}", row_index);
            rows.clear();
            return false;
        }

        if (!parse_optional_double(fields[6], row.market_price) ||
            (row.market_price && *row.market_price < 0.0)) {
            spdlog::error("Invalid price in chain row {}", row_index);
            rows.clear();
            return false;
        }

        rows.push_back(std::move(row));
    }

    return true;
}

std::vector<ContractSpec> resolve_contracts(const std::vector<ChainRow>& rows,
                                            const ChainContext& context,
                                            const PricingModel& model,
                                            const ResolveDefaults& defaults) {
    ImpliedVolatilityConfig iv_config;
    iv_config.upper = defaults.volatility_ceiling;

    std::vector<ContractSpec> contracts;
    contracts.reserve(rows.size());
    for (const auto& row : rows) {
        ContractSpec contract;
        contract.id = row.id;
        contract.strike = row.strike;
        contract.flavor = row.flavor;
        contract.expiry = row.expiry;
        if (row.time_to_expiry) {
            contract.time_to_expiry = *row.time_to_expiry;
        } else {
            contract.time_to_expiry = year_fraction(defaults.valuation_date, *row.expiry_date);
        }

        if (row.volatility) {
            contract.volatility = *row.volatility;
        } else {
            std::optional<double> implied;
            if (row.market_price) {
                implied = implied_volatility(model, contract, context, *row.market_price, iv_config);
            }
            if (implied) {
                contract.volatility = *implied;
            } else {
                spdlog::warn("Contract {}: no volatility could be implied, using default {:.4f}",
                             row.id,
                             defaults.default_volatility);
                contract.volatility = defaults.default_volatility;
            }
        }

        contracts.push_back(std::move(contract));
    }
    return contracts;
}

} // namespace vgreeks
