/**
 * @file main.cpp
 * @brief agent_exec command-line entry point.
 *
 * Wires the execution core together for one-shot use:
 *   Config → Logger → Telemetry → SecurityValidator → WorkerPool / SandboxManager
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "executor/worker_pool.hpp"
#include "sandbox/container_runner.hpp"
#include "sandbox/sandbox_manager.hpp"
#include "security/security_validator.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace agent_exec;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::string log_dir;
    std::string log_level;
    std::string command;

    // run
    std::string model = "sonnet";
    std::string project_id = "default";
    uint32_t timeout_s = 0;
    std::string working_dir;
    std::vector<std::string> allowed_tools;

    // check-path
    bool write_access = false;

    // reap / sandbox-run
    uint32_t max_age_s = 0;
    std::string project_path;

    std::vector<std::string> positional;
};

void print_usage() {
    std::cout << "Usage: agent_exec [OPTIONS] <command> [ARGS]\n"
              << "\n"
              << "Options:\n"
              << "  --config <path>      Configuration file (default: config/default.toml)\n"
              << "  --log-dir <path>     Log output directory\n"
              << "  --log-level <level>  debug, info, warn or error\n"
              << "  --help, -h           Show this help message\n"
              << "\n"
              << "Commands:\n"
              << "  run [--model M] [--project P] [--timeout S] [--cwd DIR] [--tools a,b] <prompt>\n"
              << "                       Run one prompt through the worker pool, print the result\n"
              << "  check-command <cmd>  Evaluate a shell command against the security policy\n"
              << "  check-path [--write] <path>\n"
              << "                       Evaluate a path against the security policy\n"
              << "  sandbox-run [--project-dir DIR] [--timeout S] <cmd>\n"
              << "                       Run one command in a fresh sandbox, then destroy it\n"
              << "  reap [--max-age S]   Remove managed sandboxes older than S seconds\n";
}

std::vector<std::string> split_csv(const std::string& text) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= text.size()) {
        auto comma = text.find(',', start);
        if (comma == std::string::npos) comma = text.size();
        if (comma > start) out.push_back(text.substr(start, comma - start));
        start = comma + 1;
    }
    return out;
}

Result<CLIArgs> parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--model" && i + 1 < argc) {
            args.model = argv[++i];
        } else if (arg == "--project" && i + 1 < argc) {
            args.project_id = argv[++i];
        } else if (arg == "--project-dir" && i + 1 < argc) {
            args.project_path = argv[++i];
        } else if (arg == "--timeout" && i + 1 < argc) {
            auto seconds = parse_seconds(argv[++i]);
            if (!seconds) return seconds.error();
            args.timeout_s = *seconds;
        } else if (arg == "--cwd" && i + 1 < argc) {
            args.working_dir = argv[++i];
        } else if (arg == "--tools" && i + 1 < argc) {
            args.allowed_tools = split_csv(argv[++i]);
        } else if (arg == "--max-age" && i + 1 < argc) {
            auto seconds = parse_seconds(argv[++i]);
            if (!seconds) return seconds.error();
            args.max_age_s = *seconds;
        } else if (arg == "--write") {
            args.write_access = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else if (args.command.empty()) {
            args.command = arg;
        } else {
            args.positional.push_back(arg);
        }
    }
    return args;
}

std::string join(const std::vector<std::string>& parts) {
    std::string out;
    for (const auto& part : parts) {
        if (!out.empty()) out += ' ';
        out += part;
    }
    return out;
}

nlohmann::json to_json(const TaskResult& result) {
    nlohmann::json doc = {
        {"task_id", result.task_id},
        {"status", std::string(to_string(result.status))},
    };
    if (result.completion) doc["completion"] = *result.completion;
    if (result.usage) {
        doc["usage"] = {
            {"input_tokens", result.usage->input_tokens},
            {"output_tokens", result.usage->output_tokens},
            {"total_tokens", result.usage->total_tokens()},
        };
    }
    if (result.cost) doc["cost"] = *result.cost;
    if (result.error) doc["error"] = *result.error;
    return doc;
}

// ─────────────────────────────────────────────
// Commands
// ─────────────────────────────────────────────

int run_prompt(const CLIArgs& args, const Config& config, Logger& logger,
               MetricsCollector& metrics) {
    if (args.positional.empty()) {
        std::cerr << "run: missing prompt\n";
        return 2;
    }

    WorkerPool pool(config.pool, logger, &metrics);

    ExecutionRequest request;
    request.prompt = join(args.positional);
    request.model = args.model;
    request.project_id = args.project_id;
    request.timeout = Seconds{args.timeout_s != 0 ? args.timeout_s
                                                  : config.pool.default_task_timeout_s};
    if (!args.working_dir.empty()) request.working_directory = args.working_dir;
    request.allowed_tools = args.allowed_tools;

    const auto task_timeout = request.timeout;
    const TaskId task_id = pool.submit(std::move(request));

    // The task enforces its own timeout; the extra margin covers queueing.
    const auto deadline = std::chrono::steady_clock::now() + task_timeout + Seconds{10};
    while (!g_shutdown_requested && std::chrono::steady_clock::now() < deadline) {
        auto status = pool.status(task_id);
        if (!status || is_terminal(*status)) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    if (g_shutdown_requested) {
        logger.info("app", "Shutdown requested, draining worker pool");
        auto summary = pool.drain(Seconds{config.pool.shutdown_timeout_s});
        logger.info("app", "Drained: " + std::to_string(summary.completed) + " completed, "
                               + std::to_string(summary.killed) + " killed");
    }

    auto remaining = std::chrono::duration_cast<Milliseconds>(
        deadline - std::chrono::steady_clock::now());
    auto result = pool.get_result(task_id, std::max(remaining, Milliseconds{0}));
    if (!result) {
        std::cerr << "run: " << result.error().message << "\n";
        return 1;
    }

    std::cout << to_json(*result).dump(2) << std::endl;
    return result->ok() ? 0 : 1;
}

int check_command(const CLIArgs& args, const SecurityValidator& validator) {
    if (args.positional.empty()) {
        std::cerr << "check-command: missing command\n";
        return 2;
    }
    auto decision = validator.validate_command(join(args.positional));
    std::cout << (decision.allowed ? "allowed" : "denied: " + decision.reason) << std::endl;
    return decision.allowed ? 0 : 1;
}

int check_path(const CLIArgs& args, const SecurityValidator& validator) {
    if (args.positional.size() != 1) {
        std::cerr << "check-path: expected exactly one path\n";
        return 2;
    }
    auto decision = validator.validate_path(args.positional.front(), args.write_access);
    std::cout << (decision.allowed ? "allowed" : "denied: " + decision.reason) << std::endl;
    return decision.allowed ? 0 : 1;
}

int sandbox_run(const CLIArgs& args, SandboxManager& manager, Logger& logger) {
    if (args.positional.empty()) {
        std::cerr << "sandbox-run: missing command\n";
        return 2;
    }

    if (auto prepared = manager.prepare(); !prepared) {
        std::cerr << "sandbox-run: " << prepared.error().message << "\n";
        return 1;
    }

    std::optional<std::filesystem::path> project;
    if (!args.project_path.empty()) {
        project = args.project_path;
    }

    const TaskId task_id = generate_task_id();
    auto sandbox = manager.create_sandbox(task_id, project);
    if (!sandbox) {
        std::cerr << "sandbox-run: " << sandbox.error().message << "\n";
        return 1;
    }

    std::optional<Seconds> timeout;
    if (args.timeout_s != 0) timeout = Seconds{args.timeout_s};

    int exit_code = 1;
    auto output = manager.execute_command(*sandbox, join(args.positional), timeout);
    if (output) {
        std::cout << output->stdout_text;
        std::cerr << output->stderr_text;
        if (output->timed_out) std::cerr << "sandbox-run: command timed out\n";
        exit_code = output->exit_code;
    } else {
        std::cerr << "sandbox-run: " << output.error().message << "\n";
    }

    if (auto destroyed = manager.destroy_sandbox(*sandbox, true); !destroyed) {
        logger.warn("app", "Sandbox teardown failed: " + destroyed.error().message);
    }
    return exit_code;
}

int reap(const CLIArgs& args, const Config& config, SandboxManager& manager) {
    const Seconds max_age{args.max_age_s != 0 ? args.max_age_s : config.sandbox.max_age_s};
    auto count = manager.cleanup_old_sandboxes(max_age);
    std::cout << "Removed " << count << " stale sandbox(es)" << std::endl;
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto parsed = parse_args(argc, argv);
    if (!parsed) {
        std::cerr << parsed.error().message << std::endl;
        print_usage();
        return 2;
    }
    auto& args = *parsed;
    if (args.command.empty()) {
        print_usage();
        return 2;
    }

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    // Apply CLI overrides
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;
    if (!args.log_level.empty()) config.telemetry.log_level = args.log_level;

    // ── Initialize Logger ────────────────────
    std::unique_ptr<ILogSink> log_sink;
    if (!config.telemetry.log_dir.empty()) {
        log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "agent_exec",
                                                  config.telemetry.max_file_size_mb,
                                                  config.telemetry.rotate_count);
    } else {
        log_sink = std::make_unique<StdoutSink>();
    }
    auto level = parse_log_level(config.telemetry.log_level);
    if (!level) {
        std::cerr << "Unknown log level '" << config.telemetry.log_level << "', using info\n";
    }
    Logger logger(std::move(log_sink), level.value_or(LogLevel::Info));
    logger.info("app", "agent_exec starting: " + args.command);

    // ── Initialize Telemetry ─────────────────
    std::unique_ptr<ILogSink> metrics_sink;
    if (!config.telemetry.log_dir.empty()) {
        metrics_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "metrics",
                                                      config.telemetry.max_file_size_mb,
                                                      config.telemetry.rotate_count);
    } else {
        metrics_sink = std::make_unique<NullSink>();
    }
    MetricsCollector metrics(std::move(metrics_sink));

    // Register signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    SecurityValidator validator(config.security.workspace_root, config.security.project_root);

    int rc = 2;
    if (args.command == "run") {
        rc = run_prompt(args, config, logger, metrics);
    } else if (args.command == "check-command") {
        rc = check_command(args, validator);
    } else if (args.command == "check-path") {
        rc = check_path(args, validator);
    } else if (args.command == "sandbox-run" || args.command == "reap") {
        auto runner = std::make_shared<DockerCliRunner>(config.sandbox.docker_binary);
        SandboxManager manager(config.sandbox, validator, runner, logger, &metrics);
        rc = args.command == "reap" ? reap(args, config, manager)
                                    : sandbox_run(args, manager, logger);
    } else {
        std::cerr << "Unknown command: " << args.command << "\n\n";
        print_usage();
    }

    metrics.flush();
    logger.info("app", "agent_exec finished with exit code " + std::to_string(rc));
    logger.flush();
    return rc;
}
