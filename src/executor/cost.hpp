/**
 * @file cost.hpp
 * @brief Per-model-tier token pricing.
 */

#pragma once

#include "core/types.hpp"

#include <array>
#include <optional>
#include <string_view>

namespace agent_exec {

/// USD per million tokens.
struct ModelRate {
    std::string_view tier;
    double input_per_million;
    double output_per_million;
};

inline constexpr std::array<ModelRate, 3> kModelRates = {{
    {"haiku", 0.25, 1.25},
    {"sonnet", 3.00, 15.00},
    {"opus", 15.00, 75.00},
}};

/**
 * @brief Rate for a model identifier.
 *
 * A model selects a tier when it equals the tier name or contains it, so
 * "claude-sonnet-4" prices as sonnet. Returns nullopt for anything else.
 */
[[nodiscard]] std::optional<ModelRate> rate_for_model(std::string_view model) noexcept;

/// Advisory cost in USD. Unknown models cost zero.
[[nodiscard]] double calculate_cost(std::string_view model, const TokenUsage& usage) noexcept;

}  // namespace agent_exec
