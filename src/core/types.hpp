/**
 * @file types.hpp
 * @brief Fundamental types used throughout AgentExec.
 *
 * Defines TaskId, TaskStatus, TokenUsage, TaskResult and the clock aliases
 * shared by the worker pool, the sandbox manager and telemetry.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace agent_exec {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using TaskId = std::string;
using ContainerId = std::string;
using Timestamp = std::chrono::system_clock::time_point;
using SteadyTime = std::chrono::steady_clock::time_point;
using Seconds = std::chrono::seconds;
using Milliseconds = std::chrono::milliseconds;

// ─────────────────────────────────────────────
// Task Status
// ─────────────────────────────────────────────

enum class TaskStatus : uint8_t {
    Pending,       ///< Queued, waiting for a free worker slot
    Running,       ///< Agent process is live
    Completed,     ///< Process exited 0 with parseable output
    Failed,        ///< Non-zero exit, bad output or spawn failure
    TimedOut,      ///< Exceeded its own or the caller's time budget
    Killed         ///< Terminated by kill() or drain()
};

[[nodiscard]] constexpr std::string_view to_string(TaskStatus status) noexcept {
    switch (status) {
        case TaskStatus::Pending:   return "pending";
        case TaskStatus::Running:   return "running";
        case TaskStatus::Completed: return "completed";
        case TaskStatus::Failed:    return "failed";
        case TaskStatus::TimedOut:  return "timeout";
        case TaskStatus::Killed:    return "killed";
    }
    return "unknown";
}

[[nodiscard]] constexpr bool is_terminal(TaskStatus status) noexcept {
    return status != TaskStatus::Pending && status != TaskStatus::Running;
}

// ─────────────────────────────────────────────
// Task Result
// ─────────────────────────────────────────────

struct TokenUsage {
    uint64_t input_tokens{0};
    uint64_t output_tokens{0};

    [[nodiscard]] constexpr uint64_t total_tokens() const noexcept {
        return input_tokens + output_tokens;
    }

    auto operator<=>(const TokenUsage&) const = default;
};

/**
 * @brief Terminal outcome of a task. Immutable once constructed.
 *
 * A Completed result carries completion, usage and cost; every other status
 * carries only an error message. Use the factories to keep that invariant.
 */
struct TaskResult {
    TaskId task_id;
    TaskStatus status{TaskStatus::Failed};
    std::optional<std::string> completion;
    std::optional<TokenUsage> usage;
    std::optional<double> cost;
    std::optional<std::string> error;

    [[nodiscard]] static TaskResult completed(TaskId id, std::string completion,
                                              TokenUsage usage, double cost) {
        return TaskResult{std::move(id), TaskStatus::Completed, std::move(completion),
                          usage, cost, std::nullopt};
    }

    [[nodiscard]] static TaskResult failure(TaskId id, TaskStatus status, std::string error) {
        return TaskResult{std::move(id), status, std::nullopt, std::nullopt, std::nullopt,
                          std::move(error)};
    }

    [[nodiscard]] bool ok() const noexcept { return status == TaskStatus::Completed; }
};

}  // namespace agent_exec
