/**
 * @file cost.cpp
 * @brief Rate table lookup.
 */

#include "executor/cost.hpp"

namespace agent_exec {

std::optional<ModelRate> rate_for_model(std::string_view model) noexcept {
    for (const auto& rate : kModelRates) {
        if (model == rate.tier) return rate;
    }
    for (const auto& rate : kModelRates) {
        if (model.find(rate.tier) != std::string_view::npos) return rate;
    }
    return std::nullopt;
}

double calculate_cost(std::string_view model, const TokenUsage& usage) noexcept {
    auto rate = rate_for_model(model);
    if (!rate) return 0.0;

    const double input = static_cast<double>(usage.input_tokens) / 1'000'000.0;
    const double output = static_cast<double>(usage.output_tokens) / 1'000'000.0;
    return input * rate->input_per_million + output * rate->output_per_million;
}

}  // namespace agent_exec
