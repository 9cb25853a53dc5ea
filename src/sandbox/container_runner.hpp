/**
 * @file container_runner.hpp
 * @brief Container engine access behind a virtual interface.
 *
 * SandboxManager talks to the engine only through IContainerRunner so tests
 * can substitute a recording fake. Arguments are passed as a vector and never
 * go through a shell.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <string>
#include <vector>

namespace agent_exec {

struct ContainerCommandOptions {
    bool allow_failure = false;            ///< Non-zero exit is returned, not an error
    Milliseconds timeout{30'000};
};

struct ContainerProcessResult {
    int exit_code = 0;
    std::string stdout_text;
    std::string stderr_text;
    bool timed_out = false;
};

class IContainerRunner {
public:
    virtual ~IContainerRunner() = default;

    /**
     * @brief Run one engine subcommand, e.g. {"exec", id, "ls"}.
     *
     * Fails with ErrorCode::Execution when the engine cannot be started or
     * exits non-zero (unless allow_failure), and ErrorCode::Timeout when the
     * host-side timeout fires.
     */
    [[nodiscard]] virtual Result<ContainerProcessResult> run(
        const std::vector<std::string>& args, const ContainerCommandOptions& options) = 0;
};

/**
 * @brief Drives the docker CLI as a subprocess. Safe for concurrent use.
 */
class DockerCliRunner final : public IContainerRunner {
public:
    explicit DockerCliRunner(std::string docker_binary = "docker");

    [[nodiscard]] Result<ContainerProcessResult> run(
        const std::vector<std::string>& args, const ContainerCommandOptions& options) override;

private:
    std::string docker_binary_;
};

}  // namespace agent_exec
