#include <vgreeks/contract.hpp>

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>
#include <string_view>

namespace vgreeks {

namespace {

std::string trim_upper(std::string_view input) {
    const auto begin = input.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return std::string{};
    }
    const auto end = input.find_last_not_of(" \t\r\n");
    std::string out(input.substr(begin, end - begin + 1));
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return out;
}

} // namespace

std::size_t GreekSet::size() const noexcept {
    std::size_t count = 0;
    for (const Greek greek : kAllGreeks) {
        if (contains(greek)) {
            ++count;
        }
    }
    return count;
}

std::string_view to_string(Greek greek) noexcept {
    switch (greek) {
    case Greek::Delta:
        return "delta";
    case Greek::Gamma:
        return "gamma";
    case Greek::Theta:
        return "theta";
    case Greek::Vega:
        return "vega";
    case Greek::Rho:
        return "rho";
    }
    return "unknown";
}

std::string_view to_string(OptionFlavor flavor) noexcept {
    return flavor == OptionFlavor::Call ? "call" : "put";
}

std::optional<Greek> parse_greek(std::string_view token) {
    const std::string name = trim_upper(token);
    for (const Greek greek : kAllGreeks) {
        if (trim_upper(to_string(greek)) == name) {
            return greek;
        }
    }
    return std::nullopt;
}

GreekSet parse_greek_set(std::string_view csv) {
    GreekSet set;
    std::size_t start = 0;
    while (start <= csv.size()) {
        const auto comma = csv.find(',', start);
        const auto token = csv.substr(start, comma == std::string_view::npos ? std::string_view::npos
                                                                             : comma - start);
        if (!trim_upper(token).empty()) {
            const auto greek = parse_greek(token);
            if (!greek) {
                throw std::invalid_argument("unknown greek '" + std::string(token) + "'");
            }
            set.insert(*greek);
        }
        if (comma == std::string_view::npos) {
            break;
        }
        start = comma + 1;
    }
    if (set.empty()) {
        throw std::invalid_argument("greek list must name at least one greek");
    }
    return set;
}

std::optional<OptionFlavor> parse_flavor(std::string_view token) {
    const std::string name = trim_upper(token);
    if (name == "C" || name == "CALL" || name == "CE") {
        return OptionFlavor::Call;
    }
    if (name == "P" || name == "PUT" || name == "PE") {
        return OptionFlavor::Put;
    }
    return std::nullopt;
}

} // namespace vgreeks
