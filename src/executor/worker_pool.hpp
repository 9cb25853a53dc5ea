/**
 * @file worker_pool.hpp
 * @brief Bounded pool of external agent processes.
 *
 * Callers submit prompts and later collect a TaskResult. A single scheduler
 * thread promotes queued tasks in FIFO order while fewer than max_workers
 * agents are running, and turns process exit or timeout into a terminal
 * result. The pool mutex is held only for state transitions; spawning,
 * signalling and reading process output all happen outside it.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/scratch_dir.hpp"
#include "core/types.hpp"
#include "executor/process.hpp"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <variant>
#include <vector>

namespace agent_exec {

class MetricsCollector;

/**
 * @brief One request to run the agent. Immutable once submitted.
 */
struct ExecutionRequest {
    std::string prompt;
    std::string model = "sonnet";
    std::string project_id = "default";
    Seconds timeout{30};
    std::optional<std::filesystem::path> working_directory;   ///< Used only if it exists
    std::vector<std::string> allowed_tools;                   ///< Empty = agent defaults
};

struct DrainSummary {
    size_t completed{0};   ///< In-flight tasks that finished on their own
    size_t killed{0};      ///< In-flight tasks that had to be signalled
};

class WorkerPool {
public:
    WorkerPool(WorkerPoolConfig config, Logger& logger, MetricsCollector* metrics = nullptr);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// Enqueue a task. Never blocks and never fails.
    TaskId submit(ExecutionRequest request);
    TaskId submit(std::string prompt, std::string model, std::string project_id, Seconds timeout);

    /**
     * @brief Block until the task has a terminal result or @p wait elapses.
     *
     * A delivered result is removed from the pool, so a second call for the
     * same id returns NotFound. When @p wait elapses first the agent is
     * killed and a TimedOut result is synthesized and delivered instead.
     */
    Result<TaskResult> get_result(const TaskId& task_id, Milliseconds wait);

    /// Kill a queued or running task. False if unknown or already finished.
    bool kill(const TaskId& task_id);

    [[nodiscard]] std::unordered_map<TaskId, pid_t> get_active_pids() const;

    /**
     * @brief Stop promoting, then wait, terminate and finally kill.
     *
     * In-flight agents get @p timeout to finish, then SIGTERM, then
     * drain_grace_ms before SIGKILL. completed + killed equals the number of
     * agents that were running when drain began. Queued tasks end as Killed
     * and are not counted. No agent process survives this call.
     */
    DrainSummary drain(Milliseconds timeout);

    [[nodiscard]] std::optional<TaskStatus> status(const TaskId& task_id) const;
    [[nodiscard]] size_t active_workers() const;
    [[nodiscard]] size_t queued_count() const;
    [[nodiscard]] size_t max_workers() const noexcept { return config_.max_workers; }

private:
    struct PendingState {};

    /// Slot reserved, agent being spawned outside the lock.
    struct StartingState {};

    struct RunningState {
        ChildProcess process;
        ScratchDir work_dir;
        SteadyTime started_at;
    };

    /// Agent has exited; its output is being parsed outside the lock.
    struct ReapedState {};

    struct FinishedState {
        TaskResult result;
    };

    using TaskState =
        std::variant<PendingState, StartingState, RunningState, ReapedState, FinishedState>;

    struct Task {
        TaskId id;
        ExecutionRequest request;
        TaskState state;
        SteadyTime submitted_at;
        std::optional<SteadyTime> started_at;
    };

    /// A running agent taken out of the registry for work done without the lock.
    struct Detached {
        TaskId id;
        RunningState running;
        std::string model;
        int exit_code{-1};
    };

    /// Terminal result waiting to be logged and handed to telemetry.
    struct Report {
        TaskResult result;
        std::string project_id;
        std::string model;
        Milliseconds duration{0};
    };

    void scheduler_loop(std::stop_token stop);
    void promote_next();
    void scan_running();
    void publish_reports();

    /// Finish a task taken out during drain(). Returns false if it was already delivered.
    bool install_drained(const TaskId& task_id, TaskResult result);

    Result<RunningState> launch(const TaskId& task_id, const ExecutionRequest& request) const;
    [[nodiscard]] std::vector<std::string> agent_command(const ExecutionRequest& request) const;
    [[nodiscard]] TaskResult collect_output(const TaskId& task_id, const std::string& model,
                                            int exit_code, const ScratchDir& work_dir) const;

    /// Install a terminal result and queue its report. Caller holds mutex_
    /// and adjusts active_ itself.
    void finish_locked(Task& task, TaskResult result);
    void report_locked(const Task& task, const TaskResult& result);

    static TaskStatus derive_status(const TaskState& state) noexcept;

    WorkerPoolConfig config_;
    Logger& logger_;
    MetricsCollector* metrics_;

    mutable std::mutex mutex_;
    std::condition_variable result_cv_;
    std::condition_variable_any wake_cv_;
    std::unordered_map<TaskId, Task> tasks_;
    std::deque<TaskId> queue_;
    std::vector<Report> reports_;
    size_t active_{0};
    bool draining_{false};
    bool wake_requested_{false};

    std::jthread scheduler_;
};

/// Random RFC 4122 version-4 identifier.
[[nodiscard]] TaskId generate_task_id();

}  // namespace agent_exec
