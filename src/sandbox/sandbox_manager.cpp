/**
 * @file sandbox_manager.cpp
 * @brief SandboxManager implementation on top of IContainerRunner.
 */

#include "sandbox/sandbox_manager.hpp"

#include "core/scratch_dir.hpp"
#include "telemetry/metrics_collector.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace agent_exec {

namespace {

constexpr const char* kNoSuchContainer = "No such container";
constexpr const char* kInspectFormat =
    R"({{.Created}}|{{index .Config.Labels "task_id"}}|{{index .Config.Labels "workspace_path"}})";
constexpr int kInContainerKillStatus = 128 + 9;

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

std::vector<std::string> split(std::string_view text, char delimiter) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find(delimiter, start);
        if (end == std::string_view::npos) end = text.size();
        parts.emplace_back(text.substr(start, end - start));
        start = end + 1;
    }
    return parts;
}

std::vector<std::string> non_empty_lines(std::string_view text) {
    std::vector<std::string> lines;
    for (auto& line : split(text, '\n')) {
        auto trimmed = trim(line);
        if (!trimmed.empty()) lines.emplace_back(trimmed);
    }
    return lines;
}

/// Task ids become part of a directory name.
std::string path_safe(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        const bool keep = std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.';
        out.push_back(keep ? c : '-');
    }
    return out.empty() ? std::string("task") : out;
}

/**
 * Reason an engine call failed, or nullopt when it succeeded or the
 * container was already gone.
 */
std::optional<std::string> failure_of(const Result<ContainerProcessResult>& outcome) {
    if (!outcome) return outcome.error().message;
    if (outcome->exit_code == 0) return std::nullopt;
    if (outcome->stderr_text.find(kNoSuchContainer) != std::string::npos) return std::nullopt;

    auto reason = std::string(trim(outcome->stderr_text));
    if (reason.empty()) reason = "exit code " + std::to_string(outcome->exit_code);
    return reason;
}

}  // namespace

std::optional<Timestamp> parse_rfc3339(std::string_view text) {
    text = trim(text);
    if (text.size() < 19) return std::nullopt;

    std::tm tm{};
    std::istringstream in{std::string(text.substr(0, 19))};
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (in.fail()) return std::nullopt;
    const std::time_t seconds = ::timegm(&tm);

    size_t pos = 19;
    int64_t nanos = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 9) {
                nanos = nanos * 10 + (text[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        if (digits == 0) return std::nullopt;
        for (; digits < 9; ++digits) nanos *= 10;
    }

    int64_t offset = 0;
    if (pos < text.size()) {
        const char sign = text[pos];
        auto digit = [&](size_t i) { return std::isdigit(static_cast<unsigned char>(text[i])) != 0; };
        if (sign == 'Z' || sign == 'z') {
            ++pos;
        } else if ((sign == '+' || sign == '-') && pos + 6 == text.size()
                   && digit(pos + 1) && digit(pos + 2) && text[pos + 3] == ':'
                   && digit(pos + 4) && digit(pos + 5)) {
            const int hours = (text[pos + 1] - '0') * 10 + (text[pos + 2] - '0');
            const int minutes = (text[pos + 4] - '0') * 10 + (text[pos + 5] - '0');
            offset = (hours * 3600 + minutes * 60) * (sign == '+' ? 1 : -1);
            pos += 6;
        } else {
            return std::nullopt;
        }
    }
    if (pos != text.size()) return std::nullopt;

    return std::chrono::system_clock::from_time_t(seconds - offset)
        + std::chrono::duration_cast<std::chrono::system_clock::duration>(
              std::chrono::nanoseconds(nanos));
}

// ─────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────

SandboxManager::SandboxManager(SandboxManagerConfig config,
                               SecurityValidator validator,
                               std::shared_ptr<IContainerRunner> runner,
                               Logger& logger,
                               MetricsCollector* metrics)
    : config_(std::move(config))
    , validator_(std::move(validator))
    , runner_(std::move(runner))
    , logger_(logger)
    , metrics_(metrics) {
    workspace_base_ = config_.workspace_base;
    if (workspace_base_.empty()) {
        std::error_code ec;
        workspace_base_ = std::filesystem::temp_directory_path(ec);
        if (ec) workspace_base_ = "/tmp";
    }
    workspace_base_ = workspace_base_.lexically_normal();
    if (!workspace_base_.has_filename() && workspace_base_.has_parent_path()) {
        workspace_base_ = workspace_base_.parent_path();
    }
}

Result<ContainerProcessResult> SandboxManager::engine(const std::vector<std::string>& args,
                                                      bool allow_failure,
                                                      Milliseconds timeout) {
    ContainerCommandOptions options;
    options.allow_failure = allow_failure;
    options.timeout = timeout;
    return runner_->run(args, options);
}

Result<void> SandboxManager::prepare() {
    auto inspected = engine({"image", "inspect", config_.image}, true);
    if (!inspected) {
        return Error{ErrorCode::Resource, "Cannot query sandbox image: " + inspected.error().message};
    }
    if (inspected->exit_code == 0) {
        logger_.debug("sandbox", "Sandbox image " + config_.image + " present");
        return {};
    }

    if (config_.build_context.empty()) {
        return Error{ErrorCode::Resource, "Sandbox image " + config_.image
                                              + " not found and no build context configured"};
    }

    logger_.info("sandbox", "Building sandbox image " + config_.image + " from "
                                + config_.build_context.string());
    auto built = engine({"build", "--rm",
                         "-f", (config_.build_context / config_.dockerfile).string(),
                         "-t", config_.image,
                         config_.build_context.string()},
                        false, Milliseconds{600'000});
    if (!built) {
        return Error{ErrorCode::Resource, "Failed to build sandbox image: " + built.error().message};
    }
    logger_.info("sandbox", "Sandbox image " + config_.image + " built");
    return {};
}

// ─────────────────────────────────────────────
// Creation
// ─────────────────────────────────────────────

std::vector<std::string> SandboxManager::run_args(const TaskId& task_id,
                                                  const std::filesystem::path& workspace,
                                                  const std::optional<std::filesystem::path>& project,
                                                  const SandboxConfig& config) const {
    std::vector<std::string> args = {
        "run", "-d",
        "--network", config.network_enabled ? "bridge" : "none",
        "--read-only",
        "--security-opt", "no-new-privileges",
        "--cap-drop", "ALL",
        "--cpu-quota", std::to_string(config.cpu_quota),
        "--memory", config.memory_limit,
        "--memory-swap", config.memory_swap_limit,
        "--pids-limit", std::to_string(config.pids_limit),
        "--tmpfs", "/tmp:rw,noexec,nosuid,size=" + std::to_string(config.workspace_size_mb) + "m",
        "-v", workspace.string() + ":" + config_.container_workspace + ":rw",
    };
    if (project) {
        args.insert(args.end(), {"-v", project->string() + ":" + config_.container_project + ":ro"});
    }
    args.insert(args.end(), {
        "--label", "task_id=" + task_id,
        "--label", "managed_by=" + config_.managed_by,
        "--label", "workspace_path=" + workspace.string(),
        config_.image, "sleep", "infinity",
    });
    return args;
}

Result<Sandbox> SandboxManager::create_sandbox(const TaskId& task_id,
                                               const std::optional<std::filesystem::path>& project_path,
                                               const std::optional<SandboxConfig>& config) {
    const SandboxConfig sandbox_config = config.value_or(config_.defaults);

    std::optional<std::filesystem::path> project;
    if (project_path) {
        std::error_code ec;
        if (!std::filesystem::is_directory(*project_path, ec)) {
            return Error{ErrorCode::Resource,
                         "Project path is not a directory: " + project_path->string()};
        }
        auto absolute = std::filesystem::absolute(*project_path, ec);
        project = ec ? *project_path : absolute.lexically_normal();
    }

    auto dir = make_scratch_dir(workspace_base_, "sandbox-" + path_safe(task_id) + "-");
    if (!dir) {
        return Error{ErrorCode::Resource, "Failed to create sandbox workspace: " + dir.error().message};
    }
    ScratchDir workspace(std::move(dir).value());

    // The in-container user has an unrelated uid and must be able to write.
    std::error_code perm_ec;
    std::filesystem::permissions(workspace.path(), std::filesystem::perms::all,
                                 std::filesystem::perm_options::replace, perm_ec);
    if (perm_ec) {
        return Error{ErrorCode::Resource, "Cannot set workspace permissions: " + perm_ec.message()};
    }

    auto started = engine(run_args(task_id, workspace.path(), project, sandbox_config),
                          false, Milliseconds{120'000});
    std::string container_id = started ? std::string(trim(started->stdout_text)) : std::string{};
    if (!started || container_id.empty()) {
        const std::string reason = started ? "container engine returned no container id"
                                           : started.error().message;
        remove_leftover_containers(workspace.path());
        logger_.error("sandbox", "Sandbox creation for task " + task_id + " failed: " + reason);
        return Error{ErrorCode::Resource, "Failed to create sandbox: " + reason};
    }

    Sandbox sandbox{
        .task_id = task_id,
        .container_id = container_id,
        .workspace_path = workspace.release(),
        .project_path = project,
        .config = sandbox_config,
        .created_at = std::chrono::system_clock::now(),
        .destroyed = false,
    };

    logger_.info("sandbox", "Created sandbox " + container_id.substr(0, 12) + " for task "
                                + task_id + " at " + sandbox.workspace_path.string());
    if (metrics_) metrics_->record_sandbox_event(task_id, container_id, "created");
    return sandbox;
}

void SandboxManager::remove_leftover_containers(const std::filesystem::path& workspace) {
    auto listed = engine({"ps", "-aq", "--filter", "label=workspace_path=" + workspace.string()},
                         true);
    if (auto failure = failure_of(listed)) {
        logger_.warn("sandbox", "Cannot list leftover containers: " + *failure);
        return;
    }
    for (const auto& id : non_empty_lines(listed->stdout_text)) {
        auto removed = engine({"rm", "-f", id}, true);
        if (auto failure = failure_of(removed)) {
            logger_.warn("sandbox", "Cannot remove leftover container " + id + ": " + *failure);
        }
    }
}

// ─────────────────────────────────────────────
// Execution
// ─────────────────────────────────────────────

Result<CommandOutput> SandboxManager::execute_command(const Sandbox& sandbox,
                                                      const std::string& command,
                                                      std::optional<Seconds> timeout,
                                                      const Environment& env) {
    auto decision = validator_.validate_command(command);
    if (!decision) {
        logger_.warn("sandbox", "Command blocked for task " + sandbox.task_id + ": "
                                    + decision.reason);
        return Error{ErrorCode::Security, "Command blocked: " + decision.reason};
    }

    if (sandbox.destroyed) {
        return Error{ErrorCode::Execution,
                     "Sandbox for task " + sandbox.task_id + " has been destroyed"};
    }

    const Seconds limit = timeout.value_or(Seconds{sandbox.config.timeout_s});
    // timeout(1) reads a zero duration as "no limit".
    if (limit.count() <= 0) {
        return Error{ErrorCode::Execution, "Command timeout must be at least 1 second"};
    }

    std::vector<std::string> args = {
        "exec",
        "--user", config_.exec_user,
        "--workdir", config_.container_workspace,
    };
    for (const auto& [key, value] : validator_.sanitize_environment(env)) {
        args.insert(args.end(), {"-e", key + "=" + value});
    }
    args.insert(args.end(), {
        sandbox.container_id,
        "timeout", "-s", "KILL", std::to_string(limit.count()),
        "/bin/bash", "-c", command,
    });

    const auto start = std::chrono::steady_clock::now();
    auto ran = engine(args, true, std::chrono::duration_cast<Milliseconds>(limit + Seconds{5}));
    if (!ran) {
        return Error{ErrorCode::Execution, "Failed to execute command: " + ran.error().message};
    }
    if (ran->exit_code != 0 && ran->stderr_text.find(kNoSuchContainer) != std::string::npos) {
        return Error{ErrorCode::NotFound, "Sandbox container not found: " + sandbox.container_id};
    }

    const auto elapsed = std::chrono::steady_clock::now() - start;
    CommandOutput output;
    output.exit_code = ran->exit_code;
    output.stdout_text = std::move(ran->stdout_text);
    output.stderr_text = std::move(ran->stderr_text);
    output.timed_out = ran->timed_out
        || (output.exit_code == kInContainerKillStatus && elapsed >= limit);

    logger_.debug("sandbox", "Task " + sandbox.task_id + " command exited with "
                                 + std::to_string(output.exit_code));
    return output;
}

bool SandboxManager::validate_file_access(std::string_view path, FileOperation operation) const {
    return validator_.validate_path(path, operation == FileOperation::Write).allowed;
}

// ─────────────────────────────────────────────
// Workspace introspection
// ─────────────────────────────────────────────

std::vector<std::filesystem::path> SandboxManager::get_workspace_files(const Sandbox& sandbox) const {
    std::vector<std::filesystem::path> files;
    std::error_code ec;
    std::filesystem::recursive_directory_iterator it(
        sandbox.workspace_path, std::filesystem::directory_options::skip_permission_denied, ec);

    for (; !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code status_ec;
        if (it->is_regular_file(status_ec)) {
            files.push_back(it->path().lexically_relative(sandbox.workspace_path));
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

uint64_t SandboxManager::get_workspace_size(const Sandbox& sandbox) const {
    uint64_t total = 0;
    for (const auto& relative : get_workspace_files(sandbox)) {
        std::error_code ec;
        auto size = std::filesystem::file_size(sandbox.workspace_path / relative, ec);
        if (!ec) total += size;
    }
    return total;
}

// ─────────────────────────────────────────────
// Teardown
// ─────────────────────────────────────────────

Result<void> SandboxManager::destroy_sandbox(Sandbox& sandbox, bool force) {
    if (!sandbox.container_id.empty()) {
        const auto stop_wait = Milliseconds{(config_.stop_timeout_s + 30) * 1000};
        auto stopped = engine({"stop", "-t", std::to_string(config_.stop_timeout_s),
                               sandbox.container_id},
                              true, stop_wait);
        auto failure = failure_of(stopped);
        if (failure && !force) {
            logger_.error("sandbox", "Cannot stop container " + sandbox.container_id + ": " + *failure);
            return Error{ErrorCode::Execution, "Failed to stop container: " + *failure};
        }

        std::vector<std::string> rm_args = {"rm"};
        if (force) rm_args.push_back("-f");
        rm_args.push_back(sandbox.container_id);

        auto removed = engine(rm_args, true);
        if (auto rm_failure = failure_of(removed)) {
            if (!force) {
                logger_.error("sandbox", "Cannot remove container " + sandbox.container_id + ": "
                                             + *rm_failure);
                return Error{ErrorCode::Execution, "Failed to remove container: " + *rm_failure};
            }
            logger_.warn("sandbox", "Forced removal of " + sandbox.container_id + " failed: "
                                        + *rm_failure);
        }
    }

    if (!sandbox.workspace_path.empty()) {
        if (!remove_tree(sandbox.workspace_path)) {
            logger_.warn("sandbox", "Workspace " + sandbox.workspace_path.string()
                                        + " could not be fully removed");
        }
    }

    sandbox.destroyed = true;
    logger_.info("sandbox", "Destroyed sandbox for task " + sandbox.task_id);
    if (metrics_) metrics_->record_sandbox_event(sandbox.task_id, sandbox.container_id, "destroyed");
    return {};
}

bool SandboxManager::owns_workspace(const std::filesystem::path& path) const {
    const auto normalized = path.lexically_normal();
    return normalized.parent_path() == workspace_base_
        && normalized.filename().string().starts_with("sandbox-");
}

size_t SandboxManager::cleanup_old_sandboxes(Seconds max_age) {
    auto listed = engine({"ps", "-aq", "--filter", "label=managed_by=" + config_.managed_by});
    if (!listed) {
        logger_.warn("sandbox", "Sandbox cleanup failed: " + listed.error().message);
        return 0;
    }

    const auto now = std::chrono::system_clock::now();
    size_t count = 0;

    for (const auto& id : non_empty_lines(listed->stdout_text)) {
        auto inspected = engine({"inspect", "-f", kInspectFormat, id}, true);
        if (auto failure = failure_of(inspected)) {
            logger_.warn("sandbox", "Cannot inspect container " + id + ": " + *failure);
            continue;
        }
        if (inspected->exit_code != 0) continue;  // vanished since ps

        auto fields = split(trim(inspected->stdout_text), '|');
        if (fields.size() != 3) {
            logger_.warn("sandbox", "Unexpected inspect output for " + id);
            continue;
        }
        auto created = parse_rfc3339(fields[0]);
        if (!created) {
            logger_.warn("sandbox", "Unparseable creation time for " + id + ": " + fields[0]);
            continue;
        }
        if (now - *created <= max_age) continue;

        auto stopped = engine({"stop", "-t", std::to_string(config_.stop_timeout_s), id}, true,
                              Milliseconds{(config_.stop_timeout_s + 30) * 1000});
        if (auto failure = failure_of(stopped)) {
            logger_.debug("sandbox", "Stopping " + id + " failed, removing anyway: " + *failure);
        }
        auto removed = engine({"rm", "-f", id}, true);
        if (auto failure = failure_of(removed)) {
            logger_.warn("sandbox", "Cannot remove stale container " + id + ": " + *failure);
            continue;
        }

        const std::filesystem::path workspace = fields[2];
        if (!workspace.empty() && owns_workspace(workspace)) {
            remove_tree(workspace);
        }

        ++count;
        if (metrics_) metrics_->record_sandbox_event(fields[1], id, "reaped");
    }

    logger_.info("sandbox", "Reaped " + std::to_string(count) + " stale sandbox(es)");
    return count;
}

}  // namespace agent_exec
