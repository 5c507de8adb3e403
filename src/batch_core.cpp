#include <vgreeks/batch_core.hpp>

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <exception>
#include <utility>

#include <vgreeks/chain_arrays.hpp>
#include <vgreeks/errors.hpp>

namespace vgreeks {

BatchPricingCore::BatchPricingCore(std::size_t chunk_size, BoundsValidator validator)
    : chunk_size_(chunk_size), validator_(validator) {
    if (chunk_size_ == 0) {
        throw ConfigurationError("chunk_size must be positive");
    }
}

std::size_t BatchPricingCore::chunk_count(std::size_t contracts, std::size_t chunk_size) noexcept {
    if (chunk_size == 0) {
        return 0;
    }
    return (contracts + chunk_size - 1) / chunk_size;
}

BatchOutcome BatchPricingCore::evaluate(std::span<const ContractSpec> contracts,
                                        const ChainContext& context,
                                        const PricingModel& model) const {
    const std::size_t n = contracts.size();
    const GreekSet requested = context.greeks;

    std::vector<GreeksResult> staged;
    std::size_t chunks = 0;
    std::size_t offset = 0;

    try {
        staged.reserve(n);
        for (; offset < n; offset += chunk_size_) {
            const std::size_t count = std::min(chunk_size_, n - offset);
            const auto chunk = contracts.subspan(offset, count);

            const ChainArrays inputs = to_chain_arrays(chunk, context);
            validator_.check_inputs(inputs, offset);

            GreeksArrays outputs = model.evaluate(inputs, requested);
            validator_.check_outputs(inputs, outputs, requested, offset);

            for (std::size_t i = 0; i < count; ++i) {
                staged.push_back(extract_result(chunk[i],
                                                outputs,
                                                static_cast<Eigen::Index>(i),
                                                requested,
                                                model.name(),
                                                ComputationPath::Batch));
            }
            ++chunks;
        }
    } catch (const InvalidContractDataError&) {
        throw;
    } catch (const GreeksOutOfBoundsError&) {
        throw;
    } catch (const BatchComputationError&) {
        throw;
    } catch (const std::exception& ex) {
        throw BatchComputationError(fmt::format("{} batch failed on chunk at offset {} of {} contracts: {}",
                                                model.name(),
                                                offset,
                                                n,
                                                ex.what()));
    }

    BatchOutcome outcome;
    outcome.results = std::move(staged);
    outcome.chunk_count = chunks;
    return outcome;
}

} // namespace vgreeks
