/**
 * @file test_security_validator.cpp
 * @brief Unit tests for SecurityValidator. Rule tables are enumerated entry by entry.
 */

#include "security/security_validator.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cctype>
#include <string>

using namespace agent_exec;

namespace {

std::string upper(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

bool starts_with(const std::string& text, std::string_view prefix) {
    return text.rfind(prefix, 0) == 0;
}

}  // namespace

class SecurityValidatorTest : public ::testing::Test {
protected:
    SecurityValidator validator_;
};

// ── Commands ─────────────────────────────────

TEST_F(SecurityValidatorTest, EveryDenylistEntryIsBlocked) {
    for (auto entry : SecurityValidator::kDeniedCommands) {
        const std::string command = "echo start; " + std::string(entry) + " target";
        auto decision = validator_.validate_command(command);
        EXPECT_FALSE(decision.allowed) << command;
        EXPECT_TRUE(starts_with(decision.reason, "Dangerous command blocked: ")) << decision.reason;
    }
}

TEST_F(SecurityValidatorTest, DenylistIsCaseInsensitive) {
    for (auto entry : SecurityValidator::kDeniedCommands) {
        const std::string command = upper(entry);
        EXPECT_FALSE(validator_.validate_command(command).allowed) << command;
    }
}

TEST_F(SecurityValidatorTest, DenylistReasonNamesFirstMatch) {
    EXPECT_EQ(validator_.validate_command("RM -RF /workspace").reason,
              "Dangerous command blocked: rm -rf");
    EXPECT_EQ(validator_.validate_command("sudo rm file").reason,
              "Dangerous command blocked: sudo");
    EXPECT_EQ(validator_.validate_command("curl http://x").reason,
              "Dangerous command blocked: curl");
    EXPECT_EQ(validator_.validate_command(":(){ :|:& };:").reason,
              "Dangerous command blocked: :(){ :|:& };:");
}

TEST_F(SecurityValidatorTest, PipelineIntoNetworkToolIsBlocked) {
    for (auto tool : SecurityValidator::kNetworkTools) {
        const std::string command = "cat data.txt | " + std::string(tool) + " example.org";
        EXPECT_FALSE(validator_.validate_command(command).allowed) << command;
    }
}

TEST_F(SecurityValidatorTest, BackgroundOnlyAllowedAtEnd) {
    EXPECT_TRUE(validator_.validate_command("python3 server.py &").allowed);
    EXPECT_TRUE(validator_.validate_command("python3 server.py &   ").allowed);

    auto decision = validator_.validate_command("sleep 10 & echo hi");
    EXPECT_FALSE(decision.allowed);
    EXPECT_EQ(decision.reason, "Background processes must end with '&'");
}

TEST_F(SecurityValidatorTest, SequencingAndFdRedirectsAreNotBackgrounding) {
    EXPECT_TRUE(validator_.validate_command("mkdir build && ls build").allowed);
    EXPECT_TRUE(validator_.validate_command("pytest 2>&1 | tail -n 5").allowed);
    EXPECT_TRUE(validator_.validate_command("pytest &> log.txt").allowed);
    EXPECT_TRUE(validator_.validate_command("make |& tee build.log").allowed);
    EXPECT_FALSE(validator_.validate_command("make && sleep 5 & ls").allowed);
}

TEST_F(SecurityValidatorTest, RedirectIntoProtectedDirectoryIsBlocked) {
    for (auto prefix : SecurityValidator::kProtectedRedirectPrefixes) {
        const std::string command = "echo x >" + std::string(prefix) + "file";
        auto decision = validator_.validate_command(command);
        EXPECT_FALSE(decision.allowed) << command;
    }

    auto decision = validator_.validate_command("echo x > /etc/hosts");
    EXPECT_EQ(decision.reason, "Redirect to sensitive location blocked: /etc/");

    // Reading a protected location without redirecting is not this rule's concern.
    EXPECT_TRUE(validator_.validate_command("cat /etc/hosts").allowed);
}

TEST_F(SecurityValidatorTest, RedirectInsideWorkspaceIsAllowed) {
    EXPECT_TRUE(validator_.validate_command("echo hello > out.txt").allowed);
    EXPECT_TRUE(validator_.validate_command("ls -la >> /workspace/listing.txt").allowed);
}

TEST_F(SecurityValidatorTest, SafeCommandIsApproved) {
    auto decision = validator_.validate_command("ls -la");
    EXPECT_TRUE(decision.allowed);
    EXPECT_TRUE(decision.reason.empty());
    EXPECT_TRUE(static_cast<bool>(decision));
}

TEST_F(SecurityValidatorTest, AdvisoryAllowedCommandsPassValidation) {
    auto allowed = SecurityValidator::allowed_commands();
    EXPECT_EQ(allowed.size(), 26u);
    for (const auto& command : allowed) {
        EXPECT_TRUE(validator_.validate_command(command).allowed) << command;
    }
}

// ── Paths ────────────────────────────────────

TEST_F(SecurityValidatorTest, TraversalIsBlockedBeforeAnythingElse) {
    for (bool write : {false, true}) {
        auto decision = validator_.validate_path("/workspace/../etc/passwd", write);
        EXPECT_FALSE(decision.allowed);
        EXPECT_EQ(decision.reason, "Path traversal (..) is not allowed");
    }
    EXPECT_FALSE(validator_.validate_path("/workspace/a/..", false).allowed);
}

TEST_F(SecurityValidatorTest, EverySensitivePatternIsBlocked) {
    for (auto pattern : SecurityValidator::kSensitivePaths) {
        const std::string path = "/workspace/" + std::string(pattern) + "x";
        for (bool write : {false, true}) {
            auto decision = validator_.validate_path(path, write);
            EXPECT_FALSE(decision.allowed) << path;
            EXPECT_TRUE(starts_with(decision.reason, "Access to sensitive path blocked: "))
                << path << " -> " << decision.reason;
        }
    }
}

TEST_F(SecurityValidatorTest, SensitiveExamples) {
    EXPECT_FALSE(validator_.validate_path("/workspace/keys/id_rsa", false).allowed);
    EXPECT_FALSE(validator_.validate_path("/workspace/.env", true).allowed);
    EXPECT_FALSE(validator_.validate_path("/project/config/.env.local", false).allowed);
    EXPECT_EQ(validator_.validate_path("/etc/shadow", false).reason,
              "Access to sensitive path blocked: /etc/shadow");
}

TEST_F(SecurityValidatorTest, WritesConfinedToWorkspace) {
    EXPECT_TRUE(validator_.validate_path("/workspace/out/result.txt", true).allowed);
    EXPECT_TRUE(validator_.validate_path("/workspace", true).allowed);

    auto decision = validator_.validate_path("/project/src/main.py", true);
    EXPECT_FALSE(decision.allowed);
    EXPECT_EQ(decision.reason, "Write access only allowed in /workspace/");

    EXPECT_FALSE(validator_.validate_path("/tmp/file", true).allowed);
    EXPECT_FALSE(validator_.validate_path("/workspace-other/file", true).allowed);
    EXPECT_FALSE(validator_.validate_path("relative/file", true).allowed);
}

TEST_F(SecurityValidatorTest, ReadsConfinedToWorkspaceAndProject) {
    EXPECT_TRUE(validator_.validate_path("/workspace/notes.md", false).allowed);
    EXPECT_TRUE(validator_.validate_path("/project/src/main.py", false).allowed);
    EXPECT_TRUE(validator_.validate_path("/project/./src//lib.py", false).allowed);

    auto decision = validator_.validate_path("/usr/bin/python3", false);
    EXPECT_FALSE(decision.allowed);
    EXPECT_EQ(decision.reason, "Read access only allowed in /workspace/ or /project/");

    EXPECT_FALSE(validator_.validate_path("/projectx/file", false).allowed);
}

TEST(SecurityValidatorRootsTest, CustomRoots) {
    SecurityValidator validator("/sandbox/ws/", "/sandbox/src");
    EXPECT_EQ(validator.workspace_root(), "/sandbox/ws");

    EXPECT_TRUE(validator.validate_path("/sandbox/ws/a.txt", true).allowed);
    EXPECT_TRUE(validator.validate_path("/sandbox/src/a.txt", false).allowed);
    EXPECT_FALSE(validator.validate_path("/workspace/a.txt", true).allowed);
    EXPECT_EQ(validator.validate_path("/sandbox/src/a.txt", true).reason,
              "Write access only allowed in /sandbox/ws/");
}

// ── Environment ──────────────────────────────

TEST_F(SecurityValidatorTest, EverySensitiveEnvFragmentIsRemoved) {
    for (auto fragment : SecurityValidator::kSensitiveEnvKeys) {
        Environment env = {
            {std::string(fragment), "secret"},
            {"MY_" + std::string(fragment) + "_2", "secret"},
            {"PATH", "/usr/bin"},
        };
        auto sanitized = validator_.sanitize_environment(env);
        EXPECT_EQ(sanitized.size(), 1u) << fragment;
        EXPECT_TRUE(sanitized.contains("PATH"));
    }
}

TEST_F(SecurityValidatorTest, SanitizeIsCaseInsensitiveAndKeepsValues) {
    Environment env = {
        {"anthropic_api_key", "sk-1"},
        {"Db_Password", "hunter2"},
        {"HOME", "/home/sandbox"},
        {"LANG", "C.UTF-8"},
    };
    auto sanitized = validator_.sanitize_environment(env);
    ASSERT_EQ(sanitized.size(), 2u);
    EXPECT_EQ(sanitized.at("HOME"), "/home/sandbox");
    EXPECT_EQ(sanitized.at("LANG"), "C.UTF-8");
}
