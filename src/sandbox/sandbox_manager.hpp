/**
 * @file sandbox_manager.hpp
 * @brief Lifecycle of isolated, resource-bounded containers for tasks.
 *
 * Each sandbox is one long-lived container ("sleep infinity") with its own
 * host workspace mounted read-write at /workspace and, optionally, a project
 * tree mounted read-only at /project. Commands are exec'd into it only after
 * SecurityValidator approves them. Which containers exist is tracked by the
 * engine itself through labels; the manager keeps no registry of its own.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "sandbox/container_runner.hpp"
#include "security/security_validator.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace agent_exec {

class MetricsCollector;

struct Sandbox {
    TaskId task_id;
    ContainerId container_id;
    std::filesystem::path workspace_path;
    std::optional<std::filesystem::path> project_path;
    SandboxConfig config;
    Timestamp created_at;
    bool destroyed = false;
};

struct CommandOutput {
    int exit_code = 0;
    std::string stdout_text;
    std::string stderr_text;
    bool timed_out = false;
};

enum class FileOperation : uint8_t {
    Read,
    Write
};

class SandboxManager {
public:
    SandboxManager(SandboxManagerConfig config,
                   SecurityValidator validator,
                   std::shared_ptr<IContainerRunner> runner,
                   Logger& logger,
                   MetricsCollector* metrics = nullptr);

    /// Make sure the sandbox image exists, building it from build_context if not.
    Result<void> prepare();

    /**
     * @brief Start an isolated container for @p task_id.
     *
     * Defaults from the manager configuration apply when @p config is
     * omitted. On any failure the partially created container and the
     * workspace directory are removed before the error is returned.
     */
    Result<Sandbox> create_sandbox(const TaskId& task_id,
                                   const std::optional<std::filesystem::path>& project_path = std::nullopt,
                                   const std::optional<SandboxConfig>& config = std::nullopt);

    /**
     * @brief Run @p command with /bin/bash inside the sandbox.
     *
     * A command SecurityValidator rejects yields ErrorCode::Security and the
     * container engine is never invoked. @p env is sanitized before use.
     * A non-zero exit of the command itself is a normal CommandOutput.
     */
    Result<CommandOutput> execute_command(const Sandbox& sandbox,
                                          const std::string& command,
                                          std::optional<Seconds> timeout = std::nullopt,
                                          const Environment& env = {});

    [[nodiscard]] bool validate_file_access(std::string_view path, FileOperation operation) const;

    /// Regular files under the workspace, relative to it, sorted.
    [[nodiscard]] std::vector<std::filesystem::path> get_workspace_files(const Sandbox& sandbox) const;
    [[nodiscard]] uint64_t get_workspace_size(const Sandbox& sandbox) const;

    /**
     * @brief Stop and remove the container, then delete the workspace.
     *
     * Without @p force an engine failure is returned and the workspace is
     * kept. With @p force destruction is best-effort and always succeeds.
     * A container that no longer exists is not an error.
     */
    Result<void> destroy_sandbox(Sandbox& sandbox, bool force = false);

    /// Remove every managed container older than @p max_age. Returns how many.
    size_t cleanup_old_sandboxes(Seconds max_age);

    [[nodiscard]] const SandboxManagerConfig& config() const noexcept { return config_; }
    [[nodiscard]] const std::filesystem::path& workspace_base() const noexcept { return workspace_base_; }

private:
    [[nodiscard]] std::vector<std::string> run_args(const TaskId& task_id,
                                                    const std::filesystem::path& workspace,
                                                    const std::optional<std::filesystem::path>& project,
                                                    const SandboxConfig& config) const;
    void remove_leftover_containers(const std::filesystem::path& workspace);
    [[nodiscard]] bool owns_workspace(const std::filesystem::path& path) const;
    Result<ContainerProcessResult> engine(const std::vector<std::string>& args,
                                          bool allow_failure = false,
                                          Milliseconds timeout = Milliseconds{30'000});

    SandboxManagerConfig config_;
    SecurityValidator validator_;
    std::shared_ptr<IContainerRunner> runner_;
    Logger& logger_;
    MetricsCollector* metrics_;
    std::filesystem::path workspace_base_;
};

/// Parse an RFC 3339 timestamp as printed by the container engine.
[[nodiscard]] std::optional<Timestamp> parse_rfc3339(std::string_view text);

}  // namespace agent_exec
