/**
 * @file process.hpp
 * @brief POSIX child processes running in their own process group.
 *
 * Every child is made a process-group leader so that a single signal reaches
 * the agent and everything it forked. ChildProcess is a move-only RAII handle:
 * a handle that goes out of scope while its process is alive kills the whole
 * group and reaps the leader, so no zombie or orphan outlives its owner.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <sys/types.h>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace agent_exec {

struct SpawnOptions {
    std::vector<std::string> argv;                   ///< argv[0] is looked up on PATH if bare
    std::optional<std::vector<std::string>> env;     ///< "KEY=VALUE"; nullopt inherits
    std::optional<std::filesystem::path> working_dir;
    std::filesystem::path stdout_path;               ///< Empty = /dev/null
    std::filesystem::path stderr_path;               ///< Empty = /dev/null
};

class ChildProcess {
public:
    /// Fork and exec. Fails if the executable cannot be found or exec fails.
    [[nodiscard]] static Result<ChildProcess> spawn(const SpawnOptions& options);

    ChildProcess() = default;
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;
    ChildProcess(ChildProcess&& other) noexcept;
    ChildProcess& operator=(ChildProcess&& other) noexcept;

    [[nodiscard]] pid_t pid() const noexcept { return pid_; }
    [[nodiscard]] bool valid() const noexcept { return pid_ > 0; }
    [[nodiscard]] bool reaped() const noexcept { return exit_status_.has_value(); }

    /**
     * @brief Non-blocking exit check.
     *
     * When the leader has exited, any stragglers left in its group are killed
     * before the leader is reaped. Returns the exit code (128 + signal number
     * for a signalled process), or nullopt while still running.
     */
    std::optional<int> try_wait();

    /// Send @p sig to the whole group. No-op once the leader has been reaped.
    bool signal_group(int sig) noexcept;

    /// SIGKILL the group and block until the leader is reaped.
    int kill_and_reap() noexcept;

private:
    explicit ChildProcess(pid_t pid) : pid_(pid) {}

    pid_t pid_{-1};
    std::optional<int> exit_status_;
};

/// Exit code for a waitpid status: the exit code, or 128 + signal.
[[nodiscard]] int decode_wait_status(int status) noexcept;

struct CapturedOutput {
    int exit_code{0};
    std::string stdout_text;
    std::string stderr_text;
    bool timed_out{false};
};

/**
 * @brief Run a command to completion, capturing stdout and stderr.
 *
 * The process group is SIGKILLed when @p timeout elapses; the partial output
 * read so far is returned with timed_out set.
 */
[[nodiscard]] Result<CapturedOutput> run_captured(const std::vector<std::string>& argv,
                                                  Milliseconds timeout);

/// Resolve a bare command name against $PATH.
[[nodiscard]] std::optional<std::filesystem::path> find_executable(std::string_view name);

/// The current process environment as "KEY=VALUE" strings, minus @p blocklist names.
[[nodiscard]] std::vector<std::string> inherited_environment(
    const std::vector<std::string>& blocklist);

}  // namespace agent_exec
