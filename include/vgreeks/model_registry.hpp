#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <vgreeks/pricing_model.hpp>

namespace vgreeks {

// Closed set of pricing models keyed by identifier. Filled at startup and
// read-only afterwards.
class ModelRegistry {
public:
    // black_scholes, black_scholes_merton and black76.
    static ModelRegistry with_default_models();

    // Throws ConfigurationError on a null model or a duplicate name.
    void register_model(std::shared_ptr<const PricingModel> model);

    // Throws UnsupportedModelError when `name` is not registered.
    [[nodiscard]] std::shared_ptr<const PricingModel> find(std::string_view name) const;

    [[nodiscard]] bool contains(std::string_view name) const;
    [[nodiscard]] std::vector<std::string> names() const;
    [[nodiscard]] bool empty() const noexcept { return models_.empty(); }

private:
    std::map<std::string, std::shared_ptr<const PricingModel>, std::less<>> models_;
};

} // namespace vgreeks
