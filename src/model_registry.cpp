#include <vgreeks/model_registry.hpp>

#include <utility>

#include <vgreeks/errors.hpp>

namespace vgreeks {

ModelRegistry ModelRegistry::with_default_models() {
    ModelRegistry registry;
    registry.register_model(make_black_scholes());
    registry.register_model(make_black_scholes_merton());
    registry.register_model(make_black76());
    return registry;
}

void ModelRegistry::register_model(std::shared_ptr<const PricingModel> model) {
    if (!model) {
        throw ConfigurationError("cannot register a null pricing model");
    }
    const std::string name = model->name();
    if (name.empty()) {
        throw ConfigurationError("pricing model name must not be empty");
    }
    if (!models_.emplace(name, std::move(model)).second) {
        throw ConfigurationError("pricing model '" + name + "' is already registered");
    }
}

std::shared_ptr<const PricingModel> ModelRegistry::find(std::string_view name) const {
    const auto it = models_.find(name);
    if (it == models_.end()) {
        throw UnsupportedModelError(std::string(name), names());
    }
    return it->second;
}

bool ModelRegistry::contains(std::string_view name) const {
    return models_.find(name) != models_.end();
}

std::vector<std::string> ModelRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(models_.size());
    for (const auto& entry : models_) {
        out.push_back(entry.first);
    }
    return out;
}

} // namespace vgreeks
