#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace vgreeks {

enum class OptionFlavor : std::uint8_t { Put = 0, Call = 1 };

// One option of a chain. Built per request and passed by const reference
// from then on.
struct ContractSpec {
    std::uint32_t id = 0;
    double strike = 0.0;
    double time_to_expiry = 0.0; // years, 0 means expired
    double volatility = 0.0;
    OptionFlavor flavor = OptionFlavor::Call;
    std::string expiry;          // YYYY-MM-DD, groups a term structure
};

enum class Greek : std::uint8_t { Delta = 0, Gamma = 1, Theta = 2, Vega = 3, Rho = 4 };

inline constexpr std::array<Greek, 5> kAllGreeks{
    Greek::Delta, Greek::Gamma, Greek::Theta, Greek::Vega, Greek::Rho};

class GreekSet {
public:
    constexpr GreekSet() noexcept = default;

    static constexpr GreekSet all() noexcept {
        GreekSet set;
        set.bits_ = 0x1F;
        return set;
    }

    constexpr GreekSet& insert(Greek greek) noexcept {
        bits_ = static_cast<std::uint8_t>(bits_ | mask(greek));
        return *this;
    }

    [[nodiscard]] constexpr bool contains(Greek greek) const noexcept {
        return (bits_ & mask(greek)) != 0;
    }

    [[nodiscard]] constexpr bool empty() const noexcept {
        return bits_ == 0;
    }

    [[nodiscard]] std::size_t size() const noexcept;

    friend constexpr bool operator==(GreekSet lhs, GreekSet rhs) noexcept {
        return lhs.bits_ == rhs.bits_;
    }

private:
    static constexpr std::uint8_t mask(Greek greek) noexcept {
        return static_cast<std::uint8_t>(1U << static_cast<unsigned>(greek));
    }

    std::uint8_t bits_ = 0;
};

// Shared inputs of one request.
struct ChainContext {
    double spot = 0.0;
    double rate = 0.0;
    double dividend_yield = 0.0;
    std::string model = "black_scholes_merton";
    GreekSet greeks = GreekSet::all();
};

std::string_view to_string(Greek greek) noexcept;
std::string_view to_string(OptionFlavor flavor) noexcept;

std::optional<Greek> parse_greek(std::string_view token);

// Comma separated list such as "delta,gamma". Throws std::invalid_argument
// on unknown names or an empty list.
GreekSet parse_greek_set(std::string_view csv);

// Accepts C, CALL, CE, P, PUT, PE in any case.
std::optional<OptionFlavor> parse_flavor(std::string_view token);

} // namespace vgreeks
