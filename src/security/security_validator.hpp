/**
 * @file security_validator.hpp
 * @brief Fixed, fail-closed command and path policy.
 *
 * The validator is the only gate between caller-influenced strings and real
 * execution. Its rules are literal tables evaluated in a fixed order; the
 * first matching rule denies, and only the absence of any match approves.
 * It holds no mutable state, so one instance may be shared across threads.
 */

#pragma once

#include <array>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace agent_exec {

/**
 * @brief Allow/deny verdict with a human-readable reason. Never persisted.
 */
struct SecurityDecision {
    bool allowed{false};
    std::string reason;

    [[nodiscard]] static SecurityDecision allow() { return SecurityDecision{true, {}}; }
    [[nodiscard]] static SecurityDecision deny(std::string reason) {
        return SecurityDecision{false, std::move(reason)};
    }

    [[nodiscard]] explicit operator bool() const noexcept { return allowed; }
};

using Environment = std::map<std::string, std::string>;

class SecurityValidator {
public:
    /// Substrings that deny a command outright (matched case-insensitively).
    static constexpr std::array<std::string_view, 21> kDeniedCommands = {
        "rm -rf",
        "dd if=",
        "mkfs",
        "format",
        "curl",
        "wget",
        "nc",
        "netcat",
        "telnet",
        "ssh",
        "scp",
        "ftp",
        "sudo",
        "su",
        "chmod +s",
        "chown",
        ":(){ :|:& };:",
        "> /dev/",
        "iptables",
        "ufw",
        "firewall",
    };

    /// Network tools that may not appear anywhere in a pipeline.
    static constexpr std::array<std::string_view, 4> kNetworkTools = {
        "curl", "wget", "nc", "telnet",
    };

    /// Redirect targets that are never writable.
    static constexpr std::array<std::string_view, 4> kProtectedRedirectPrefixes = {
        "/etc/", "/root/", "/home/", "/dev/",
    };

    /// Substrings that deny any path (matched case-sensitively).
    static constexpr std::array<std::string_view, 26> kSensitivePaths = {
        "/etc/passwd",
        "/etc/shadow",
        "/etc/group",
        "/etc/sudoers",
        "/root/",
        "/home/",
        "~/.ssh/",
        ".ssh/",
        ".env",
        "credentials.json",
        "secrets.yaml",
        "secrets.yml",
        ".pem",
        ".key",
        ".crt",
        "id_rsa",
        "id_dsa",
        "id_ecdsa",
        "id_ed25519",
        "api_key",
        "access_token",
        "secret_key",
        ".aws/",
        ".kube/",
        ".docker/config.json",
        ".bash_history",
    };

    /// Environment variable name fragments that mark a credential.
    static constexpr std::array<std::string_view, 8> kSensitiveEnvKeys = {
        "API_KEY",
        "SECRET_KEY",
        "ACCESS_TOKEN",
        "PASSWORD",
        "AWS_ACCESS_KEY_ID",
        "AWS_SECRET_ACCESS_KEY",
        "GITHUB_TOKEN",
        "ANTHROPIC_API_KEY",
    };

    explicit SecurityValidator(std::string workspace_root = "/workspace",
                               std::string project_root = "/project");

    /**
     * @brief Vet a shell command string.
     *
     * Rules, in order: denylist substring, pipeline into a network tool,
     * backgrounding with '&' anywhere but the final token, and output
     * redirection into a protected directory.
     *
     * Only a lone '&' counts as backgrounding. "&&", ">&", "&>" and "|&"
     * are allowed anywhere, so "make && make install" and "cmd 2>&1"
     * pass this rule.
     */
    [[nodiscard]] SecurityDecision validate_command(std::string_view cmd) const;

    /**
     * @brief Vet a path for read or write access.
     *
     * Rules, in order: '..' traversal, sensitive pattern, then the prefix
     * check (writes: workspace only; reads: workspace or project).
     */
    [[nodiscard]] SecurityDecision validate_path(std::string_view path, bool allow_write) const;

    /// Copy of @p env without any variable whose name contains a credential fragment.
    [[nodiscard]] Environment sanitize_environment(const Environment& env) const;

    /// Advisory list of commands known to be safe inside a sandbox.
    [[nodiscard]] static std::vector<std::string> allowed_commands();

    [[nodiscard]] const std::string& workspace_root() const noexcept { return workspace_root_; }
    [[nodiscard]] const std::string& project_root() const noexcept { return project_root_; }

private:
    [[nodiscard]] static bool has_background_operator(std::string_view cmd);
    [[nodiscard]] static bool under_root(const std::string& normalized, const std::string& root);

    std::string workspace_root_;
    std::string project_root_;
};

}  // namespace agent_exec
