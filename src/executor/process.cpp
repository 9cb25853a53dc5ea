/**
 * @file process.cpp
 * @brief fork/exec, process-group signalling and captured runs.
 *
 * Everything the child needs (argv, envp, resolved executable, opened file
 * descriptors) is prepared before fork() so that the child only calls
 * async-signal-safe functions between fork and exec.
 */

#include "executor/process.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace agent_exec {

namespace {

/// RAII wrapper for a raw file descriptor.
class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    [[nodiscard]] int get() const noexcept { return fd_; }

    void reset() noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_{-1};
};

std::vector<char*> to_c_array(std::vector<std::string>& strings) {
    std::vector<char*> out;
    out.reserve(strings.size() + 1);
    for (auto& s : strings) out.push_back(s.data());
    out.push_back(nullptr);
    return out;
}

Result<std::string> resolve_executable(const std::string& name) {
    if (name.empty()) {
        return Error{ErrorCode::Execution, "Empty command line"};
    }
    if (name.find('/') != std::string::npos) {
        return name;
    }
    auto found = find_executable(name);
    if (!found) {
        return Error{ErrorCode::Execution, "Executable not found on PATH: " + name};
    }
    return found->string();
}

int open_output(const std::filesystem::path& path) {
    const char* target = path.empty() ? "/dev/null" : path.c_str();
    return ::open(target, O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
}

void write_errno_and_exit(int fd) {
    int err = errno;
    ssize_t ignored = ::write(fd, &err, sizeof(err));
    (void)ignored;
    ::_exit(127);
}

/// Wait for the exec report on a CLOEXEC pipe. Returns 0 when exec succeeded.
int read_exec_errno(int fd) {
    int err = 0;
    ssize_t n;
    do {
        n = ::read(fd, &err, sizeof(err));
    } while (n < 0 && errno == EINTR);
    return n == static_cast<ssize_t>(sizeof(err)) ? err : 0;
}

void reap_blocking(pid_t pid, int& status) {
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
}

}  // namespace

// ─────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────

int decode_wait_status(int status) noexcept {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

std::optional<std::filesystem::path> find_executable(std::string_view name) {
    const char* path_env = std::getenv("PATH");
    std::string_view search = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";

    while (!search.empty()) {
        auto colon = search.find(':');
        std::string_view dir = search.substr(0, colon);
        search = colon == std::string_view::npos ? std::string_view{} : search.substr(colon + 1);
        if (dir.empty()) dir = ".";

        auto candidate = std::filesystem::path(std::string(dir)) / std::string(name);
        if (::access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
    }
    return std::nullopt;
}

std::vector<std::string> inherited_environment(const std::vector<std::string>& blocklist) {
    std::vector<std::string> env;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string_view kv(*entry);
        auto eq = kv.find('=');
        std::string_view key = kv.substr(0, eq);

        bool blocked = false;
        for (const auto& name : blocklist) {
            if (key == name) {
                blocked = true;
                break;
            }
        }
        if (!blocked) env.emplace_back(kv);
    }
    return env;
}

// ─────────────────────────────────────────────
// ChildProcess
// ─────────────────────────────────────────────

Result<ChildProcess> ChildProcess::spawn(const SpawnOptions& options) {
    if (options.argv.empty()) {
        return Error{ErrorCode::Execution, "Empty command line"};
    }

    auto exe = resolve_executable(options.argv.front());
    if (!exe) return exe.error();

    std::vector<std::string> argv_storage = options.argv;
    std::vector<std::string> env_storage = options.env.value_or(std::vector<std::string>{});
    auto argv = to_c_array(argv_storage);
    auto envp = to_c_array(env_storage);
    char** envp_ptr = options.env ? envp.data() : environ;

    std::string workdir = options.working_dir ? options.working_dir->string() : std::string{};

    UniqueFd stdin_fd(::open("/dev/null", O_RDONLY | O_CLOEXEC));
    UniqueFd stdout_fd(open_output(options.stdout_path));
    UniqueFd stderr_fd(open_output(options.stderr_path));
    if (stdin_fd.get() < 0 || stdout_fd.get() < 0 || stderr_fd.get() < 0) {
        return Error{ErrorCode::Execution,
                     std::string("Cannot open process output files: ") + std::strerror(errno)};
    }

    int report[2];
    if (::pipe2(report, O_CLOEXEC) != 0) {
        return Error{ErrorCode::Execution, std::string("pipe2 failed: ") + std::strerror(errno)};
    }
    UniqueFd report_read(report[0]);
    UniqueFd report_write(report[1]);

    pid_t pid = ::fork();
    if (pid < 0) {
        return Error{ErrorCode::Execution, std::string("fork failed: ") + std::strerror(errno)};
    }

    if (pid == 0) {
        // Child: async-signal-safe calls only.
        ::setpgid(0, 0);
        if (!workdir.empty() && ::chdir(workdir.c_str()) != 0) {
            write_errno_and_exit(report_write.get());
        }
        if (::dup2(stdin_fd.get(), STDIN_FILENO) < 0
            || ::dup2(stdout_fd.get(), STDOUT_FILENO) < 0
            || ::dup2(stderr_fd.get(), STDERR_FILENO) < 0) {
            write_errno_and_exit(report_write.get());
        }
        ::execve(exe->c_str(), argv.data(), envp_ptr);
        write_errno_and_exit(report_write.get());
    }

    // Parent. Also set the group here so a signal sent right after spawn()
    // returns cannot race the child's own setpgid().
    ::setpgid(pid, pid);
    report_write.reset();

    int exec_errno = read_exec_errno(report_read.get());
    if (exec_errno != 0) {
        int status = 0;
        reap_blocking(pid, status);
        return Error{ErrorCode::Execution,
                     "Failed to exec " + *exe + ": " + std::strerror(exec_errno)};
    }

    return ChildProcess(pid);
}

ChildProcess::~ChildProcess() {
    kill_and_reap();
}

ChildProcess::ChildProcess(ChildProcess&& other) noexcept
    : pid_(other.pid_), exit_status_(other.exit_status_) {
    other.pid_ = -1;
    other.exit_status_.reset();
}

ChildProcess& ChildProcess::operator=(ChildProcess&& other) noexcept {
    if (this != &other) {
        kill_and_reap();
        pid_ = other.pid_;
        exit_status_ = other.exit_status_;
        other.pid_ = -1;
        other.exit_status_.reset();
    }
    return *this;
}

std::optional<int> ChildProcess::try_wait() {
    if (exit_status_) return exit_status_;
    if (pid_ <= 0) return std::nullopt;

    // Peek without reaping so the group id stays reserved while we clean it up.
    siginfo_t info{};
    int rc;
    do {
        rc = ::waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOHANG | WNOWAIT);
    } while (rc < 0 && errno == EINTR);

    if (rc < 0) {
        // ECHILD: someone else reaped it; treat as gone.
        exit_status_ = -1;
        return exit_status_;
    }
    if (info.si_pid == 0) return std::nullopt;

    ::kill(-pid_, SIGKILL);

    int status = 0;
    reap_blocking(pid_, status);
    exit_status_ = decode_wait_status(status);
    return exit_status_;
}

bool ChildProcess::signal_group(int sig) noexcept {
    if (pid_ <= 0 || exit_status_) return false;
    return ::kill(-pid_, sig) == 0;
}

int ChildProcess::kill_and_reap() noexcept {
    if (pid_ <= 0) return -1;
    if (exit_status_) return *exit_status_;

    ::kill(-pid_, SIGKILL);
    int status = 0;
    reap_blocking(pid_, status);
    exit_status_ = decode_wait_status(status);
    return *exit_status_;
}

// ─────────────────────────────────────────────
// run_captured
// ─────────────────────────────────────────────

Result<CapturedOutput> run_captured(const std::vector<std::string>& argv_in,
                                    Milliseconds timeout) {
    if (argv_in.empty()) {
        return Error{ErrorCode::Execution, "Empty command line"};
    }
    auto exe = resolve_executable(argv_in.front());
    if (!exe) return exe.error();

    std::vector<std::string> argv_storage = argv_in;
    auto argv = to_c_array(argv_storage);

    int out_pipe[2];
    int err_pipe[2];
    if (::pipe2(out_pipe, O_CLOEXEC) != 0) {
        return Error{ErrorCode::Execution, std::string("pipe2 failed: ") + std::strerror(errno)};
    }
    UniqueFd out_read(out_pipe[0]);
    UniqueFd out_write(out_pipe[1]);
    if (::pipe2(err_pipe, O_CLOEXEC) != 0) {
        return Error{ErrorCode::Execution, std::string("pipe2 failed: ") + std::strerror(errno)};
    }
    UniqueFd err_read(err_pipe[0]);
    UniqueFd err_write(err_pipe[1]);
    UniqueFd stdin_fd(::open("/dev/null", O_RDONLY | O_CLOEXEC));

    auto start = std::chrono::steady_clock::now();

    pid_t pid = ::fork();
    if (pid < 0) {
        return Error{ErrorCode::Execution, std::string("fork failed: ") + std::strerror(errno)};
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        if (stdin_fd.get() >= 0) ::dup2(stdin_fd.get(), STDIN_FILENO);
        ::dup2(out_write.get(), STDOUT_FILENO);
        ::dup2(err_write.get(), STDERR_FILENO);
        ::execve(exe->c_str(), argv.data(), environ);
        ::_exit(127);
    }

    ::setpgid(pid, pid);
    out_write.reset();
    err_write.reset();

    CapturedOutput output;
    pollfd fds[2] = {
        {out_read.get(), POLLIN, 0},
        {err_read.get(), POLLIN, 0},
    };
    std::string* sinks[2] = {&output.stdout_text, &output.stderr_text};
    int open_streams = 2;
    char buf[4096];

    while (open_streams > 0) {
        auto elapsed = std::chrono::duration_cast<Milliseconds>(
            std::chrono::steady_clock::now() - start);
        if (elapsed >= timeout) {
            ::kill(-pid, SIGKILL);
            output.timed_out = true;
            break;
        }
        auto remaining = timeout - elapsed;
        int wait_ms = static_cast<int>(std::min<int64_t>(remaining.count(), 100));

        int ready = ::poll(fds, 2, wait_ms);
        if (ready < 0) {
            if (errno == EINTR) continue;
            ::kill(-pid, SIGKILL);
            int status = 0;
            reap_blocking(pid, status);
            return Error{ErrorCode::Execution, std::string("poll failed: ") + std::strerror(errno)};
        }

        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;
            ssize_t n = ::read(fds[i].fd, buf, sizeof(buf));
            if (n > 0) {
                sinks[i]->append(buf, static_cast<size_t>(n));
            } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                fds[i].fd = -1;  // poll ignores negative descriptors
                --open_streams;
            }
        }
    }

    // Both streams may close while the child keeps running.
    int status = 0;
    while (!output.timed_out) {
        pid_t reaped = ::waitpid(pid, &status, WNOHANG);
        if (reaped == pid) {
            output.exit_code = decode_wait_status(status);
            return output;
        }
        if (reaped < 0 && errno != EINTR) {
            return Error{ErrorCode::Execution, std::string("waitpid failed: ") + std::strerror(errno)};
        }
        auto elapsed = std::chrono::duration_cast<Milliseconds>(
            std::chrono::steady_clock::now() - start);
        if (elapsed >= timeout) {
            ::kill(-pid, SIGKILL);
            output.timed_out = true;
            break;
        }
        auto remaining = timeout - elapsed;
        ::poll(nullptr, 0, static_cast<int>(std::min<int64_t>(remaining.count(), 20)));
    }

    reap_blocking(pid, status);
    output.exit_code = 124;
    return output;
}

}  // namespace agent_exec
