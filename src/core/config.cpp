/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"

#include <toml++/toml.hpp>

#include <charconv>

namespace agent_exec {

namespace {

template <typename T>
T read_uint(const toml::node_view<toml::node>& node, T fallback) {
    auto value = node.value<int64_t>();
    if (!value || *value < 0) return fallback;
    return static_cast<T>(*value);
}

std::vector<std::string> read_string_array(const toml::node_view<toml::node>& node,
                                           std::vector<std::string> fallback) {
    const auto* arr = node.as_array();
    if (!arr) return fallback;

    std::vector<std::string> out;
    for (const auto& element : *arr) {
        if (auto text = element.value<std::string>()) {
            out.push_back(*text);
        }
    }
    return out;
}

}  // namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::Config, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [pool]
        if (auto pool = tbl["pool"]; pool.is_table()) {
            auto& p = config.pool;
            p.max_workers = read_uint(pool["max_workers"], p.max_workers);
            p.agent_binary = pool["agent_binary"].value_or(p.agent_binary);
            p.mcp_config = pool["mcp_config"].value_or(std::string{});
            p.temp_root = pool["temp_root"].value_or(std::string{});
            p.poll_interval_ms = read_uint(pool["poll_interval_ms"], p.poll_interval_ms);
            p.drain_grace_ms = read_uint(pool["drain_grace_ms"], p.drain_grace_ms);
            p.shutdown_timeout_s = read_uint(pool["shutdown_timeout_s"], p.shutdown_timeout_s);
            p.default_task_timeout_s =
                read_uint(pool["default_task_timeout_s"], p.default_task_timeout_s);
            p.env_blocklist = read_string_array(pool["env_blocklist"], p.env_blocklist);
        }

        // [sandbox]
        if (auto sandbox = tbl["sandbox"]; sandbox.is_table()) {
            auto& s = config.sandbox;
            s.image = sandbox["image"].value_or(s.image);
            s.docker_binary = sandbox["docker_binary"].value_or(s.docker_binary);
            s.build_context = sandbox["build_context"].value_or(std::string{});
            s.dockerfile = sandbox["dockerfile"].value_or(s.dockerfile);
            s.managed_by = sandbox["managed_by"].value_or(s.managed_by);
            s.workspace_base = sandbox["workspace_base"].value_or(std::string{});
            s.exec_user = sandbox["exec_user"].value_or(s.exec_user);
            s.stop_timeout_s = read_uint(sandbox["stop_timeout_s"], s.stop_timeout_s);
            s.max_age_s = read_uint(sandbox["max_age_s"], s.max_age_s);

            auto& d = s.defaults;
            d.cpu_quota = sandbox["cpu_quota"].value_or(d.cpu_quota);
            d.memory_limit = sandbox["memory_limit"].value_or(d.memory_limit);
            d.memory_swap_limit = sandbox["memory_swap_limit"].value_or(d.memory_swap_limit);
            d.pids_limit = read_uint(sandbox["pids_limit"], d.pids_limit);
            d.workspace_size_mb = read_uint(sandbox["workspace_size_mb"], d.workspace_size_mb);
            d.timeout_s = read_uint(sandbox["timeout_s"], d.timeout_s);
            d.network_enabled = sandbox["network_enabled"].value_or(d.network_enabled);
        }

        // [security]
        if (auto security = tbl["security"]; security.is_table()) {
            config.security.workspace_root =
                security["workspace_root"].value_or(config.security.workspace_root);
            config.security.project_root =
                security["project_root"].value_or(config.security.project_root);
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            auto& t = config.telemetry;
            t.log_dir = telemetry["log_dir"].value_or(std::string{"./logs"});
            t.max_file_size_mb = read_uint(telemetry["max_file_size_mb"], t.max_file_size_mb);
            t.rotate_count = read_uint(telemetry["rotate_count"], t.rotate_count);
            t.log_level = telemetry["log_level"].value_or(t.log_level);
        }

        if (config.pool.max_workers == 0) {
            return Error{ErrorCode::Config, "pool.max_workers must be at least 1"};
        }
        if (config.sandbox.defaults.timeout_s == 0) {
            return Error{ErrorCode::Config, "sandbox.timeout_s must be at least 1"};
        }

        return config;

    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::Config,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

Result<uint32_t> parse_seconds(std::string_view text) {
    uint32_t value = 0;
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (text.empty() || ec != std::errc{} || ptr != end) {
        return Error{ErrorCode::Config, "Invalid number of seconds: '" + std::string{text} + "'"};
    }
    return value;
}

}  // namespace agent_exec
