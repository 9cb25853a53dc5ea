/**
 * @file container_runner.cpp
 * @brief DockerCliRunner implementation.
 */

#include "sandbox/container_runner.hpp"

#include "executor/process.hpp"

namespace agent_exec {

namespace {

std::string first_line(const std::string& text) {
    auto end = text.find('\n');
    return end == std::string::npos ? text : text.substr(0, end);
}

}  // namespace

DockerCliRunner::DockerCliRunner(std::string docker_binary)
    : docker_binary_(std::move(docker_binary)) {}

Result<ContainerProcessResult> DockerCliRunner::run(const std::vector<std::string>& args,
                                                    const ContainerCommandOptions& options) {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(docker_binary_);
    argv.insert(argv.end(), args.begin(), args.end());

    auto captured = run_captured(argv, options.timeout);
    if (!captured) {
        return Error{ErrorCode::Execution, "Container engine unavailable: "
                                               + captured.error().message};
    }

    ContainerProcessResult result;
    result.exit_code = captured->exit_code;
    result.stdout_text = std::move(captured->stdout_text);
    result.stderr_text = std::move(captured->stderr_text);
    result.timed_out = captured->timed_out;

    const std::string subcommand = args.empty() ? std::string{} : args.front();
    if (result.timed_out && !options.allow_failure) {
        return Error{ErrorCode::Timeout, docker_binary_ + " " + subcommand + " timed out after "
                                             + std::to_string(options.timeout.count()) + "ms"};
    }
    if (result.exit_code != 0 && !options.allow_failure) {
        return Error{ErrorCode::Execution,
                     docker_binary_ + " " + subcommand + " failed with exit code "
                         + std::to_string(result.exit_code) + ": "
                         + first_line(result.stderr_text)};
    }
    return result;
}

}  // namespace agent_exec
