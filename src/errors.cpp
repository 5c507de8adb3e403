#include <vgreeks/errors.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>

#include <utility>

namespace vgreeks {

namespace {

std::string describe_invalid(const std::string& field, std::optional<std::size_t> index, double value) {
    if (index) {
        return fmt::format("invalid {} {} for contract at index {}", field, value, *index);
    }
    return fmt::format("invalid {} {} in chain context", field, value);
}

std::string describe_unsupported(const std::string& model, const std::vector<std::string>& supported) {
    return fmt::format("unsupported pricing model '{}' (supported: {})",
                       model,
                       fmt::join(supported, ", "));
}

} // namespace

InvalidContractDataError::InvalidContractDataError(std::string field,
                                                   std::optional<std::size_t> index,
                                                   double value)
    : std::invalid_argument(describe_invalid(field, index, value)),
      field_(std::move(field)),
      index_(index),
      value_(value) {}

UnsupportedModelError::UnsupportedModelError(std::string model, const std::vector<std::string>& supported)
    : std::invalid_argument(describe_unsupported(model, supported)),
      model_(std::move(model)) {}

GreeksOutOfBoundsError::GreeksOutOfBoundsError(std::string quantity, std::size_t index, double value)
    : std::range_error(fmt::format("{} {} out of bounds for contract at index {}", quantity, value, index)),
      quantity_(std::move(quantity)),
      index_(index),
      value_(value) {}

} // namespace vgreeks
