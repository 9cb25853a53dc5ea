/**
 * @file config.hpp
 * @brief Service configuration with TOML deserialization.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "core/result.hpp"

namespace agent_exec {

struct WorkerPoolConfig {
    uint32_t max_workers = 5;
    std::string agent_binary = "claude";
    std::filesystem::path mcp_config;               ///< Empty = not passed
    std::filesystem::path temp_root;                ///< Empty = system temp dir
    uint32_t poll_interval_ms = 10;
    uint32_t drain_grace_ms = 5000;                 ///< SIGTERM → SIGKILL window
    uint32_t shutdown_timeout_s = 30;
    uint32_t default_task_timeout_s = 30;
    std::vector<std::string> env_blocklist = {"CLAUDECODE"};
};

/**
 * @brief Resource quotas for one sandbox. Immutable for the sandbox's lifetime.
 */
struct SandboxConfig {
    int64_t cpu_quota = 100000;                     ///< CFS quota, 100000 = one core
    std::string memory_limit = "1g";
    std::string memory_swap_limit = "1g";
    uint32_t pids_limit = 100;
    uint32_t workspace_size_mb = 100;               ///< Size of the /tmp scratch tmpfs
    uint32_t timeout_s = 300;
    bool network_enabled = false;
};

struct SandboxManagerConfig {
    std::string image = "agent-exec-sandbox:latest";
    std::string docker_binary = "docker";
    std::filesystem::path build_context;            ///< Empty = never build
    std::string dockerfile = "Dockerfile.sandbox";
    std::string managed_by = "agent-exec";
    std::filesystem::path workspace_base;           ///< Empty = system temp dir
    std::string container_workspace = "/workspace";
    std::string container_project = "/project";
    std::string exec_user = "sandbox";
    uint32_t stop_timeout_s = 5;
    uint32_t max_age_s = 3600;
    SandboxConfig defaults;
};

struct SecurityConfig {
    std::string workspace_root = "/workspace";
    std::string project_root = "/project";
};

struct TelemetryConfig {
    std::filesystem::path log_dir = "./logs";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
};

/**
 * @brief Top-level service configuration.
 */
struct Config {
    WorkerPoolConfig pool;
    SandboxManagerConfig sandbox;
    SecurityConfig security;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

/**
 * @brief Parse a non-negative whole number of seconds from a command-line value.
 * @return Config error on empty input, trailing characters or overflow.
 */
Result<uint32_t> parse_seconds(std::string_view text);

}  // namespace agent_exec
