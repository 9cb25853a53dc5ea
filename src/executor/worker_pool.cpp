/**
 * @file worker_pool.cpp
 * @brief WorkerPool scheduling, result collection and drain.
 */

#include "executor/worker_pool.hpp"

#include "executor/agent_output.hpp"
#include "telemetry/metrics_collector.hpp"

#include <chrono>
#include <csignal>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <random>

namespace agent_exec {

namespace {

constexpr const char* kPromptFile = "prompt.txt";
constexpr const char* kStdoutFile = "stdout.json";
constexpr const char* kStderrFile = "stderr.log";

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return {};
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

/// "30" for whole seconds, "0.5" otherwise.
std::string format_seconds(Milliseconds duration) {
    const auto ms = duration.count();
    std::string text = std::to_string(ms / 1000);
    if (ms % 1000 == 0) return text;

    char fraction[8];
    std::snprintf(fraction, sizeof(fraction), "%03lld", static_cast<long long>(ms % 1000));
    std::string digits(fraction);
    while (!digits.empty() && digits.back() == '0') digits.pop_back();
    return text + "." + digits;
}

Milliseconds elapsed_since(std::optional<SteadyTime> start) {
    if (!start) return Milliseconds{0};
    return std::chrono::duration_cast<Milliseconds>(std::chrono::steady_clock::now() - *start);
}

}  // namespace

TaskId generate_task_id() {
    thread_local std::mt19937_64 rng = [] {
        std::random_device device;
        std::seed_seq seed{device(), device(), device(), device()};
        return std::mt19937_64(seed);
    }();
    std::uniform_int_distribution<uint64_t> dist;

    uint64_t hi = dist(rng);
    uint64_t lo = dist(rng);
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;  // version 4
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;  // RFC 4122 variant

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(hi >> 32),
                  static_cast<unsigned>((hi >> 16) & 0xFFFF),
                  static_cast<unsigned>(hi & 0xFFFF),
                  static_cast<unsigned>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return buf;
}

// ─────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────

WorkerPool::WorkerPool(WorkerPoolConfig config, Logger& logger, MetricsCollector* metrics)
    : config_(std::move(config)), logger_(logger), metrics_(metrics) {
    if (config_.max_workers == 0) config_.max_workers = 1;
    if (config_.poll_interval_ms == 0) config_.poll_interval_ms = 1;

    scheduler_ = std::jthread([this](std::stop_token stop) { scheduler_loop(stop); });
    logger_.info("pool", "Worker pool started with max_workers="
                             + std::to_string(config_.max_workers));
}

WorkerPool::~WorkerPool() {
    if (scheduler_.joinable()) {
        scheduler_.request_stop();
        scheduler_.join();
    }

    // Each RunningState kills its process group and removes its scratch dir.
    std::unordered_map<TaskId, Task> remaining;
    {
        std::lock_guard lock(mutex_);
        remaining.swap(tasks_);
        queue_.clear();
        active_ = 0;
    }
}

// ─────────────────────────────────────────────
// Submission and queries
// ─────────────────────────────────────────────

TaskId WorkerPool::submit(ExecutionRequest request) {
    TaskId task_id = generate_task_id();
    bool rejected = false;
    {
        std::lock_guard lock(mutex_);
        auto [it, inserted] = tasks_.emplace(
            task_id, Task{task_id, std::move(request), PendingState{},
                          std::chrono::steady_clock::now(), std::nullopt});
        if (draining_) {
            finish_locked(it->second, TaskResult::failure(task_id, TaskStatus::Failed,
                                                          "Worker pool is draining"));
            rejected = true;
        } else {
            queue_.push_back(task_id);
            wake_requested_ = true;
        }
    }

    if (rejected) {
        publish_reports();
    } else {
        wake_cv_.notify_all();
        logger_.debug("pool", "Task " + task_id + " queued");
    }
    return task_id;
}

TaskId WorkerPool::submit(std::string prompt, std::string model, std::string project_id,
                          Seconds timeout) {
    ExecutionRequest request;
    request.prompt = std::move(prompt);
    request.model = std::move(model);
    request.project_id = std::move(project_id);
    request.timeout = timeout;
    return submit(std::move(request));
}

Result<TaskResult> WorkerPool::get_result(const TaskId& task_id, Milliseconds wait) {
    const auto deadline = std::chrono::steady_clock::now() + wait;
    std::optional<RunningState> abandoned;
    Report report;
    {
        std::unique_lock lock(mutex_);
        if (!tasks_.contains(task_id)) {
            return Error{ErrorCode::NotFound, "Unknown task: " + task_id};
        }

        auto settled = [&] {
            auto found = tasks_.find(task_id);
            return found == tasks_.end()
                || std::holds_alternative<FinishedState>(found->second.state);
        };
        bool ready = result_cv_.wait_until(lock, deadline, settled);

        // An agent that has already exited only needs its output parsed.
        if (!ready) {
            auto found = tasks_.find(task_id);
            if (found != tasks_.end() && std::holds_alternative<ReapedState>(found->second.state)) {
                result_cv_.wait(lock, settled);
                ready = true;
            }
        }

        auto it = tasks_.find(task_id);
        if (it == tasks_.end()) {
            return Error{ErrorCode::NotFound, "Result for task " + task_id + " already delivered"};
        }

        if (ready) {
            TaskResult result = std::move(std::get<FinishedState>(it->second.state).result);
            tasks_.erase(it);
            return result;
        }

        // The caller's budget ran out first: take the agent away from the
        // scheduler and deliver a TimedOut result in its place.
        Task& task = it->second;
        if (auto* running = std::get_if<RunningState>(&task.state)) {
            abandoned = std::move(*running);
            --active_;
        } else if (std::holds_alternative<StartingState>(task.state)) {
            --active_;
        }
        report.project_id = task.request.project_id;
        report.model = task.request.model;
        report.duration = elapsed_since(task.started_at);
        tasks_.erase(it);
    }

    std::string message = "Task timed out after " + format_seconds(wait) + " seconds";
    if (abandoned) {
        abandoned->process.kill_and_reap();
        std::string stderr_text = read_file(abandoned->work_dir.path() / kStderrFile);
        if (!stderr_text.empty()) {
            message += "\nStderr: " + tail(stderr_text);
        }
        abandoned.reset();
    }

    report.result = TaskResult::failure(task_id, TaskStatus::TimedOut, std::move(message));
    TaskResult result = report.result;
    {
        std::lock_guard lock(mutex_);
        reports_.push_back(std::move(report));
    }
    publish_reports();
    return result;
}

bool WorkerPool::kill(const TaskId& task_id) {
    std::optional<RunningState> victim;
    {
        std::lock_guard lock(mutex_);
        auto it = tasks_.find(task_id);
        if (it == tasks_.end()) return false;

        Task& task = it->second;
        if (auto* running = std::get_if<RunningState>(&task.state)) {
            victim = std::move(*running);
            --active_;
        } else if (std::holds_alternative<StartingState>(task.state)) {
            // promote_next() discards the process it is about to install.
            --active_;
        } else if (!std::holds_alternative<PendingState>(task.state)) {
            return false;
        }
        finish_locked(task, TaskResult::failure(task_id, TaskStatus::Killed,
                                                "Task was killed by user"));
    }

    if (victim) {
        victim->process.kill_and_reap();
        victim.reset();
    }
    publish_reports();
    return true;
}

std::unordered_map<TaskId, pid_t> WorkerPool::get_active_pids() const {
    std::unordered_map<TaskId, pid_t> pids;
    std::lock_guard lock(mutex_);
    for (const auto& [id, task] : tasks_) {
        if (const auto* running = std::get_if<RunningState>(&task.state)) {
            pids.emplace(id, running->process.pid());
        }
    }
    return pids;
}

std::optional<TaskStatus> WorkerPool::status(const TaskId& task_id) const {
    std::lock_guard lock(mutex_);
    auto it = tasks_.find(task_id);
    if (it == tasks_.end()) return std::nullopt;
    return derive_status(it->second.state);
}

size_t WorkerPool::active_workers() const {
    std::lock_guard lock(mutex_);
    return active_;
}

size_t WorkerPool::queued_count() const {
    std::lock_guard lock(mutex_);
    size_t count = 0;
    for (const auto& [id, task] : tasks_) {
        if (std::holds_alternative<PendingState>(task.state)) ++count;
    }
    return count;
}

TaskStatus WorkerPool::derive_status(const TaskState& state) noexcept {
    if (std::holds_alternative<PendingState>(state)) return TaskStatus::Pending;
    if (const auto* finished = std::get_if<FinishedState>(&state)) return finished->result.status;
    return TaskStatus::Running;
}

// ─────────────────────────────────────────────
// Scheduler
// ─────────────────────────────────────────────

void WorkerPool::scheduler_loop(std::stop_token stop) {
    const Milliseconds interval{config_.poll_interval_ms};

    while (!stop.stop_requested()) {
        promote_next();
        scan_running();
        publish_reports();

        std::unique_lock lock(mutex_);
        wake_cv_.wait_for(lock, stop, interval, [this] { return wake_requested_; });
        wake_requested_ = false;
    }
}

void WorkerPool::promote_next() {
    TaskId task_id;
    ExecutionRequest request;
    {
        std::lock_guard lock(mutex_);
        if (draining_ || active_ >= config_.max_workers) return;

        while (!queue_.empty() && task_id.empty()) {
            TaskId candidate = std::move(queue_.front());
            queue_.pop_front();

            // Killed or abandoned tasks leave a stale queue entry behind.
            auto it = tasks_.find(candidate);
            if (it == tasks_.end() || !std::holds_alternative<PendingState>(it->second.state)) {
                continue;
            }
            it->second.state = StartingState{};
            it->second.started_at = std::chrono::steady_clock::now();
            ++active_;
            request = it->second.request;
            task_id = std::move(candidate);
        }
        if (task_id.empty()) return;
    }

    auto launched = launch(task_id, request);

    std::optional<RunningState> orphan;
    pid_t pid = launched ? launched->process.pid() : -1;
    {
        std::lock_guard lock(mutex_);
        auto it = tasks_.find(task_id);
        const bool still_starting =
            it != tasks_.end() && std::holds_alternative<StartingState>(it->second.state);

        if (!still_starting) {
            if (launched) orphan = std::move(launched).value();
        } else if (launched) {
            it->second.state = std::move(launched).value();
        } else {
            --active_;
            finish_locked(it->second,
                          TaskResult::failure(task_id, TaskStatus::Failed,
                                              "Failed to start process: "
                                                  + launched.error().message));
        }
    }

    if (orphan) {
        orphan->process.kill_and_reap();
        orphan.reset();
    } else if (launched) {
        logger_.info("pool", "Task " + task_id + " started (pid " + std::to_string(pid)
                                 + ", model " + request.model + ")");
    } else {
        logger_.error("pool", "Task " + task_id + " failed to start: "
                                  + launched.error().message);
    }
}

void WorkerPool::scan_running() {
    std::vector<Detached> exited;
    std::vector<Detached> expired;
    const auto now = std::chrono::steady_clock::now();
    {
        std::lock_guard lock(mutex_);
        for (auto& [id, task] : tasks_) {
            auto* running = std::get_if<RunningState>(&task.state);
            if (!running) continue;

            // try_wait() never blocks: it reaps only a leader that already exited.
            if (auto code = running->process.try_wait()) {
                exited.push_back(Detached{id, std::move(*running), task.request.model, *code});
                task.state = ReapedState{};
                --active_;
            } else if (now - running->started_at > task.request.timeout) {
                expired.push_back(Detached{id, std::move(*running), task.request.model, -1});
                --active_;
                finish_locked(task, TaskResult::failure(
                                        id, TaskStatus::TimedOut,
                                        "Task timed out after "
                                            + std::to_string(task.request.timeout.count())
                                            + " seconds"));
            }
        }
    }

    for (auto& entry : expired) {
        entry.running.process.kill_and_reap();
        logger_.warn("pool", "Task " + entry.id + " exceeded its timeout and was killed");
    }
    expired.clear();

    for (auto& entry : exited) {
        TaskResult result = collect_output(entry.id, entry.model, entry.exit_code,
                                           entry.running.work_dir);
        std::lock_guard lock(mutex_);
        auto it = tasks_.find(entry.id);
        if (it != tasks_.end() && std::holds_alternative<ReapedState>(it->second.state)) {
            finish_locked(it->second, std::move(result));
        }
    }
}

// ─────────────────────────────────────────────
// Drain
// ─────────────────────────────────────────────

DrainSummary WorkerPool::drain(Milliseconds timeout) {
    logger_.info("pool", "Draining: waiting up to " + format_seconds(timeout)
                             + "s for in-flight tasks");
    {
        std::lock_guard lock(mutex_);
        draining_ = true;
    }
    if (scheduler_.joinable()) {
        scheduler_.request_stop();
        scheduler_.join();
    }

    // With the scheduler gone no task is Starting or Reaped; every live agent
    // is in RunningState and is taken out here.
    std::vector<Detached> in_flight;
    {
        std::lock_guard lock(mutex_);
        for (auto& [id, task] : tasks_) {
            if (std::holds_alternative<PendingState>(task.state)) {
                finish_locked(task, TaskResult::failure(id, TaskStatus::Killed,
                                                        "Worker pool drained before the task started"));
            } else if (auto* running = std::get_if<RunningState>(&task.state)) {
                in_flight.push_back(Detached{id, std::move(*running), task.request.model, -1});
                task.state = ReapedState{};
            }
        }
        queue_.clear();
    }

    DrainSummary summary;
    const Milliseconds poll{config_.poll_interval_ms};

    // Phase 1: natural completion.
    const auto wait_deadline = std::chrono::steady_clock::now() + timeout;
    while (!in_flight.empty()) {
        for (auto it = in_flight.begin(); it != in_flight.end();) {
            if (auto code = it->running.process.try_wait()) {
                install_drained(it->id, collect_output(it->id, it->model, *code,
                                                       it->running.work_dir));
                ++summary.completed;
                it = in_flight.erase(it);
            } else {
                ++it;
            }
        }
        if (in_flight.empty() || std::chrono::steady_clock::now() >= wait_deadline) break;
        std::this_thread::sleep_for(poll);
    }

    // Phase 2: SIGTERM and the grace window.
    if (!in_flight.empty()) {
        logger_.warn("pool", std::to_string(in_flight.size())
                                 + " task(s) still running, sending SIGTERM");
        for (auto& entry : in_flight) entry.running.process.signal_group(SIGTERM);

        const auto grace_deadline =
            std::chrono::steady_clock::now() + Milliseconds{config_.drain_grace_ms};
        while (!in_flight.empty()) {
            for (auto it = in_flight.begin(); it != in_flight.end();) {
                if (it->running.process.try_wait()) {
                    install_drained(it->id, TaskResult::failure(it->id, TaskStatus::Killed,
                                                                "Task was terminated during drain"));
                    ++summary.killed;
                    it = in_flight.erase(it);
                } else {
                    ++it;
                }
            }
            if (in_flight.empty() || std::chrono::steady_clock::now() >= grace_deadline) break;
            std::this_thread::sleep_for(poll);
        }
    }

    // Phase 3: SIGKILL whatever ignored SIGTERM.
    if (!in_flight.empty()) {
        logger_.warn("pool", std::to_string(in_flight.size())
                                 + " task(s) ignored SIGTERM, sending SIGKILL");
        for (auto& entry : in_flight) {
            entry.running.process.kill_and_reap();
            install_drained(entry.id, TaskResult::failure(entry.id, TaskStatus::Killed,
                                                          "Task was force-killed during drain"));
            ++summary.killed;
        }
        in_flight.clear();
    }

    logger_.info("pool", "Drain complete: " + std::to_string(summary.completed)
                             + " completed, " + std::to_string(summary.killed) + " killed");
    if (metrics_) metrics_->record_drain(summary.completed, summary.killed);
    publish_reports();
    return summary;
}

bool WorkerPool::install_drained(const TaskId& task_id, TaskResult result) {
    std::lock_guard lock(mutex_);
    if (active_ > 0) --active_;
    auto it = tasks_.find(task_id);
    if (it == tasks_.end() || !std::holds_alternative<ReapedState>(it->second.state)) {
        return false;
    }
    finish_locked(it->second, std::move(result));
    return true;
}

// ─────────────────────────────────────────────
// Agent process
// ─────────────────────────────────────────────

std::vector<std::string> WorkerPool::agent_command(const ExecutionRequest& request) const {
    std::vector<std::string> argv = {
        config_.agent_binary,
        "-p", request.prompt,
        "--model", request.model,
        "--output-format", "json",
    };

    if (!request.allowed_tools.empty()) {
        std::string tools;
        for (const auto& tool : request.allowed_tools) {
            if (!tools.empty()) tools += ',';
            tools += tool;
        }
        argv.insert(argv.end(), {"--allowedTools", tools,
                                 "--permission-mode", "bypassPermissions"});
    }

    if (!config_.mcp_config.empty()) {
        std::error_code ec;
        if (std::filesystem::exists(config_.mcp_config, ec)) {
            auto absolute = std::filesystem::absolute(config_.mcp_config, ec);
            argv.insert(argv.end(), {"--mcp-config", ec ? config_.mcp_config.string()
                                                        : absolute.string()});
        }
    }
    return argv;
}

Result<WorkerPool::RunningState> WorkerPool::launch(const TaskId& task_id,
                                                    const ExecutionRequest& request) const {
    auto dir = make_scratch_dir(config_.temp_root, "agent_task_" + task_id.substr(0, 8) + "_");
    if (!dir) return dir.error();
    ScratchDir work_dir(std::move(dir).value());

    {
        std::ofstream prompt_file(work_dir.path() / kPromptFile, std::ios::binary);
        prompt_file << request.prompt;
        if (!prompt_file) {
            return Error{ErrorCode::Resource,
                         "Cannot write prompt file in " + work_dir.path().string()};
        }
    }

    SpawnOptions options;
    options.argv = agent_command(request);
    options.env = inherited_environment(config_.env_blocklist);
    options.stdout_path = work_dir.path() / kStdoutFile;
    options.stderr_path = work_dir.path() / kStderrFile;

    std::error_code ec;
    if (request.working_directory
        && std::filesystem::is_directory(*request.working_directory, ec)) {
        options.working_dir = *request.working_directory;
    }

    auto process = ChildProcess::spawn(options);
    if (!process) return process.error();

    return RunningState{std::move(process).value(), std::move(work_dir),
                        std::chrono::steady_clock::now()};
}

TaskResult WorkerPool::collect_output(const TaskId& task_id, const std::string& model,
                                      int exit_code, const ScratchDir& work_dir) const {
    return interpret_agent_exit(task_id, model, exit_code,
                                read_file(work_dir.path() / kStdoutFile),
                                read_file(work_dir.path() / kStderrFile));
}

// ─────────────────────────────────────────────
// Results and reporting
// ─────────────────────────────────────────────

void WorkerPool::finish_locked(Task& task, TaskResult result) {
    report_locked(task, result);
    task.state = FinishedState{std::move(result)};
    result_cv_.notify_all();
}

void WorkerPool::report_locked(const Task& task, const TaskResult& result) {
    reports_.push_back(Report{result, task.request.project_id, task.request.model,
                              elapsed_since(task.started_at)});
}

void WorkerPool::publish_reports() {
    std::vector<Report> reports;
    {
        std::lock_guard lock(mutex_);
        reports.swap(reports_);
    }

    for (const auto& report : reports) {
        const auto& result = report.result;
        std::string line = "Task " + result.task_id + " " + std::string(to_string(result.status));
        if (result.ok()) {
            line += " (" + std::to_string(result.usage->total_tokens()) + " tokens)";
            logger_.info("pool", line);
        } else {
            const std::string& error = result.error.value_or(std::string{});
            line += ": " + error.substr(0, error.find('\n'));
            logger_.log(result.status == TaskStatus::Killed ? LogLevel::Info : LogLevel::Warn,
                        "pool", line);
        }

        if (metrics_) {
            metrics_->record_task_result(result, TaskAccounting{report.project_id, report.model,
                                                                report.duration});
        }
    }
}

}  // namespace agent_exec
