/**
 * @file security_validator.cpp
 * @brief SecurityValidator rule evaluation.
 */

#include "security/security_validator.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace agent_exec {

namespace {

std::string to_lower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string to_upper(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

bool contains(std::string_view haystack, std::string_view needle) {
    return haystack.find(needle) != std::string_view::npos;
}

std::string strip_trailing_slashes(std::string root) {
    while (root.size() > 1 && root.back() == '/') root.pop_back();
    return root;
}

}  // namespace

SecurityValidator::SecurityValidator(std::string workspace_root, std::string project_root)
    : workspace_root_(strip_trailing_slashes(std::move(workspace_root)))
    , project_root_(strip_trailing_slashes(std::move(project_root))) {}

// ─────────────────────────────────────────────
// Commands
// ─────────────────────────────────────────────

SecurityDecision SecurityValidator::validate_command(std::string_view cmd) const {
    const std::string lowered = to_lower(cmd);

    for (auto denied : kDeniedCommands) {
        if (contains(lowered, denied)) {
            return SecurityDecision::deny("Dangerous command blocked: " + std::string(denied));
        }
    }

    if (contains(cmd, "|")) {
        for (auto tool : kNetworkTools) {
            if (contains(lowered, tool)) {
                return SecurityDecision::deny("Piping to network commands is blocked");
            }
        }
    }

    if (has_background_operator(cmd)) {
        return SecurityDecision::deny("Background processes must end with '&'");
    }

    if (contains(cmd, ">")) {
        for (auto prefix : kProtectedRedirectPrefixes) {
            if (contains(lowered, prefix)) {
                return SecurityDecision::deny("Redirect to sensitive location blocked: "
                                              + std::string(prefix));
            }
        }
    }

    return SecurityDecision::allow();
}

bool SecurityValidator::has_background_operator(std::string_view cmd) {
    const std::string_view trimmed = trim(cmd);

    for (size_t i = 0; i < trimmed.size(); ++i) {
        if (trimmed[i] != '&') continue;

        const char prev = i > 0 ? trimmed[i - 1] : '\0';
        const char next = i + 1 < trimmed.size() ? trimmed[i + 1] : '\0';

        // "&&" is sequencing; ">&", "&>" and "|&" are fd redirections.
        if (prev == '&' || next == '&') continue;
        if (prev == '>' || next == '>' || prev == '|') continue;

        if (i + 1 != trimmed.size()) return true;
    }
    return false;
}

// ─────────────────────────────────────────────
// Paths
// ─────────────────────────────────────────────

bool SecurityValidator::under_root(const std::string& normalized, const std::string& root) {
    if (normalized == root) return true;
    if (root == "/") return !normalized.empty() && normalized.front() == '/';
    return normalized.size() > root.size()
        && normalized.compare(0, root.size(), root) == 0
        && normalized[root.size()] == '/';
}

SecurityDecision SecurityValidator::validate_path(std::string_view path, bool allow_write) const {
    if (contains(path, "..")) {
        return SecurityDecision::deny("Path traversal (..) is not allowed");
    }

    const std::string normalized =
        std::filesystem::path(std::string(path)).lexically_normal().string();

    for (auto sensitive : kSensitivePaths) {
        if (contains(normalized, sensitive) || contains(path, sensitive)) {
            return SecurityDecision::deny("Access to sensitive path blocked: "
                                          + std::string(sensitive));
        }
    }

    if (allow_write) {
        if (!under_root(normalized, workspace_root_)) {
            return SecurityDecision::deny("Write access only allowed in " + workspace_root_ + "/");
        }
    } else if (!under_root(normalized, workspace_root_) && !under_root(normalized, project_root_)) {
        return SecurityDecision::deny("Read access only allowed in " + workspace_root_ + "/ or "
                                      + project_root_ + "/");
    }

    return SecurityDecision::allow();
}

// ─────────────────────────────────────────────
// Environment
// ─────────────────────────────────────────────

Environment SecurityValidator::sanitize_environment(const Environment& env) const {
    Environment sanitized;
    for (const auto& [key, value] : env) {
        const std::string upper = to_upper(key);
        const bool sensitive = std::any_of(
            kSensitiveEnvKeys.begin(), kSensitiveEnvKeys.end(),
            [&upper](std::string_view fragment) { return contains(upper, fragment); });
        if (!sensitive) {
            sanitized.emplace(key, value);
        }
    }
    return sanitized;
}

std::vector<std::string> SecurityValidator::allowed_commands() {
    return {
        "ls", "cat", "head", "tail", "grep", "find", "echo",
        "pwd", "cd", "mkdir", "touch", "cp", "mv",
        "python", "python3", "pip", "pytest",
        "git status", "git log", "git diff",
        "wc", "sort", "uniq", "cut", "awk", "sed",
    };
}

}  // namespace agent_exec
