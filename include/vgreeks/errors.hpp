#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace vgreeks {

// Caller supplied an invalid contract or context value. `index` is empty
// for context fields.
class InvalidContractDataError : public std::invalid_argument {
public:
    InvalidContractDataError(std::string field, std::optional<std::size_t> index, double value);

    [[nodiscard]] const std::string& field() const noexcept { return field_; }
    [[nodiscard]] std::optional<std::size_t> index() const noexcept { return index_; }
    [[nodiscard]] double value() const noexcept { return value_; }

private:
    std::string field_;
    std::optional<std::size_t> index_;
    double value_;
};

class UnsupportedModelError : public std::invalid_argument {
public:
    UnsupportedModelError(std::string model, const std::vector<std::string>& supported);

    [[nodiscard]] const std::string& model() const noexcept { return model_; }

private:
    std::string model_;
};

// A computed value fell outside its valid range. Raised by output
// validation; the engine recovers from it by falling back to the scalar path.
class GreeksOutOfBoundsError : public std::range_error {
public:
    GreeksOutOfBoundsError(std::string quantity, std::size_t index, double value);

    [[nodiscard]] const std::string& quantity() const noexcept { return quantity_; }
    [[nodiscard]] std::size_t index() const noexcept { return index_; }
    [[nodiscard]] double value() const noexcept { return value_; }

private:
    std::string quantity_;
    std::size_t index_;
    double value_;
};

// Unexpected failure inside the array pipeline.
class BatchComputationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ConfigurationError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

} // namespace vgreeks
