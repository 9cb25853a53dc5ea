/**
 * @file agent_output.hpp
 * @brief Turning a finished agent process into a TaskResult.
 *
 * The agent runs with `--output-format json` and prints one JSON object:
 *   {"result": "<completion text>", "usage": {"input_tokens": N, "output_tokens": M}, ...}
 * Missing fields default to an empty completion and zero tokens.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace agent_exec {

struct AgentOutput {
    std::string completion;
    TokenUsage usage;
};

/// Number of trailing stderr characters quoted in error messages.
inline constexpr size_t kStderrTailChars = 2000;

/// Parse the agent's structured stdout. Errors carry the JSON parser's message.
[[nodiscard]] Result<AgentOutput> parse_agent_output(std::string_view json_text);

/// Last @p max_chars characters of @p text.
[[nodiscard]] std::string tail(std::string_view text, size_t max_chars = kStderrTailChars);

/**
 * @brief Build the terminal result for an agent that exited on its own.
 *
 * Exit 0 with parseable output is Completed with cost from the rate table;
 * a non-zero exit or unparseable output is Failed.
 */
[[nodiscard]] TaskResult interpret_agent_exit(const TaskId& task_id,
                                              std::string_view model,
                                              int exit_code,
                                              std::string_view stdout_text,
                                              std::string_view stderr_text);

}  // namespace agent_exec
