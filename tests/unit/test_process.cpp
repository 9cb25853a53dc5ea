/**
 * @file test_process.cpp
 * @brief Unit tests for ChildProcess, run_captured and PATH/environment helpers.
 */

#include "core/scratch_dir.hpp"
#include "executor/process.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <sys/wait.h>
#include <thread>

using namespace agent_exec;
namespace fs = std::filesystem;

namespace {

std::string read_file(const fs::path& path) {
    std::ifstream in(path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

std::optional<int> wait_for_exit(ChildProcess& child, Milliseconds limit = Milliseconds{5000}) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (auto code = child.try_wait()) return code;
        std::this_thread::sleep_for(Milliseconds{10});
    }
    return std::nullopt;
}

}  // namespace

class ProcessTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto dir = make_scratch_dir({}, "agent_exec_process_test_");
        ASSERT_TRUE(dir.has_value()) << dir.error().what();
        dir_ = ScratchDir(std::move(dir).value());
    }

    SpawnOptions shell(const std::string& script) const {
        SpawnOptions options;
        options.argv = {"/bin/sh", "-c", script};
        options.stdout_path = dir_.path() / "stdout.txt";
        options.stderr_path = dir_.path() / "stderr.txt";
        return options;
    }

    ScratchDir dir_;
};

// ── ChildProcess ─────────────────────────────

TEST_F(ProcessTest, CapturesOutputToFilesAndExitCode) {
    auto child = ChildProcess::spawn(shell("echo out; echo err >&2; exit 3"));
    ASSERT_TRUE(child.has_value()) << child.error().what();
    EXPECT_TRUE(child->valid());
    EXPECT_GT(child->pid(), 0);

    auto code = wait_for_exit(*child);
    ASSERT_TRUE(code.has_value());
    EXPECT_EQ(*code, 3);
    EXPECT_TRUE(child->reaped());
    EXPECT_EQ(read_file(dir_.path() / "stdout.txt"), "out\n");
    EXPECT_EQ(read_file(dir_.path() / "stderr.txt"), "err\n");

    // Further polls keep returning the same status.
    EXPECT_EQ(child->try_wait().value_or(-1), 3);
}

TEST_F(ProcessTest, RunsInWorkingDirectory) {
    auto options = shell("pwd -P");
    options.working_dir = dir_.path();
    auto child = ChildProcess::spawn(options);
    ASSERT_TRUE(child.has_value());
    ASSERT_EQ(wait_for_exit(*child).value_or(-1), 0);
    EXPECT_EQ(read_file(dir_.path() / "stdout.txt"), fs::canonical(dir_.path()).string() + "\n");
}

TEST_F(ProcessTest, ExplicitEnvironmentReplacesInherited) {
    ::setenv("AGENT_EXEC_PROCESS_TEST", "inherited", 1);
    auto options = shell("printf '%s|%s' \"$FOO\" \"$AGENT_EXEC_PROCESS_TEST\"");
    options.env = std::vector<std::string>{"FOO=bar"};
    auto child = ChildProcess::spawn(options);
    ASSERT_TRUE(child.has_value());
    ASSERT_EQ(wait_for_exit(*child).value_or(-1), 0);
    EXPECT_EQ(read_file(dir_.path() / "stdout.txt"), "bar|");
    ::unsetenv("AGENT_EXEC_PROCESS_TEST");
}

TEST_F(ProcessTest, MissingExecutableFailsToSpawn) {
    SpawnOptions options;
    options.argv = {"/nonexistent/agent-binary"};
    auto absolute = ChildProcess::spawn(options);
    ASSERT_FALSE(absolute.has_value());
    EXPECT_TRUE(absolute.error().is(ErrorCode::Execution));
    EXPECT_NE(absolute.error().message.find("Failed to exec"), std::string::npos);

    options.argv = {"agent-exec-no-such-command"};
    auto bare = ChildProcess::spawn(options);
    ASSERT_FALSE(bare.has_value());
    EXPECT_NE(bare.error().message.find("not found"), std::string::npos);

    options.argv.clear();
    EXPECT_FALSE(ChildProcess::spawn(options).has_value());
}

TEST_F(ProcessTest, MissingWorkingDirectoryFailsToSpawn) {
    auto options = shell("true");
    options.working_dir = dir_.path() / "does-not-exist";
    EXPECT_FALSE(ChildProcess::spawn(options).has_value());
}

TEST_F(ProcessTest, TryWaitWhileRunning) {
    auto child = ChildProcess::spawn(shell("sleep 30"));
    ASSERT_TRUE(child.has_value());
    EXPECT_FALSE(child->try_wait().has_value());
    EXPECT_FALSE(child->reaped());
}

TEST_F(ProcessTest, KillAndReapReportsSignal) {
    auto child = ChildProcess::spawn(shell("sleep 30"));
    ASSERT_TRUE(child.has_value());
    EXPECT_EQ(child->kill_and_reap(), 128 + SIGKILL);
    EXPECT_TRUE(child->reaped());
    EXPECT_FALSE(child->signal_group(SIGTERM));
}

TEST_F(ProcessTest, SignalGroupDeliversTerm) {
    auto child = ChildProcess::spawn(shell("exec sleep 30"));
    ASSERT_TRUE(child.has_value());
    EXPECT_TRUE(child->signal_group(SIGTERM));
    EXPECT_EQ(wait_for_exit(*child).value_or(-1), 128 + SIGTERM);
}

TEST_F(ProcessTest, DestructorKillsAndReaps) {
    pid_t pid = -1;
    {
        auto child = ChildProcess::spawn(shell("sleep 30"));
        ASSERT_TRUE(child.has_value());
        pid = child->pid();
    }
    int status = 0;
    EXPECT_EQ(::waitpid(pid, &status, WNOHANG), -1);
    EXPECT_EQ(errno, ECHILD);
}

TEST_F(ProcessTest, MoveTransfersOwnership) {
    auto spawned = ChildProcess::spawn(shell("sleep 30"));
    ASSERT_TRUE(spawned.has_value());
    ChildProcess owner = std::move(spawned).value();
    ChildProcess moved(std::move(owner));
    EXPECT_FALSE(owner.valid());
    EXPECT_TRUE(moved.valid());
    EXPECT_EQ(moved.kill_and_reap(), 128 + SIGKILL);
}

// ── run_captured ─────────────────────────────

TEST(RunCapturedTest, CapturesBothStreams) {
    auto out = run_captured({"sh", "-c", "echo hi; echo oops >&2; exit 2"}, Milliseconds{5000});
    ASSERT_TRUE(out.has_value()) << out.error().what();
    EXPECT_EQ(out->exit_code, 2);
    EXPECT_EQ(out->stdout_text, "hi\n");
    EXPECT_EQ(out->stderr_text, "oops\n");
    EXPECT_FALSE(out->timed_out);
}

TEST(RunCapturedTest, TimeoutKillsTheGroup) {
    auto start = std::chrono::steady_clock::now();
    auto out = run_captured({"sh", "-c", "echo started; sleep 30"}, Milliseconds{300});
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(out.has_value());
    EXPECT_TRUE(out->timed_out);
    EXPECT_EQ(out->exit_code, 124);
    EXPECT_EQ(out->stdout_text, "started\n");
    EXPECT_LT(elapsed, std::chrono::seconds{10});
}

TEST(RunCapturedTest, TimeoutHoldsAfterStreamsClose) {
    auto start = std::chrono::steady_clock::now();
    auto out = run_captured({"sh", "-c", "exec >&- 2>&-; sleep 4"}, Milliseconds{300});
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(out.has_value()) << out.error().what();
    EXPECT_TRUE(out->timed_out);
    EXPECT_EQ(out->exit_code, 124);
    EXPECT_LT(elapsed, std::chrono::seconds{3});
}

TEST(RunCapturedTest, MissingExecutable) {
    auto out = run_captured({"agent-exec-no-such-command"}, Milliseconds{1000});
    ASSERT_FALSE(out.has_value());
    EXPECT_TRUE(out.error().is(ErrorCode::Execution));
    EXPECT_FALSE(run_captured({}, Milliseconds{1000}).has_value());
}

// ── Helpers ──────────────────────────────────

TEST(ProcessHelpersTest, FindExecutableOnPath) {
    auto sh = find_executable("sh");
    ASSERT_TRUE(sh.has_value());
    EXPECT_EQ(sh->filename(), "sh");
    EXPECT_FALSE(find_executable("agent-exec-no-such-command").has_value());
}

TEST(ProcessHelpersTest, InheritedEnvironmentDropsExactNames) {
    ::setenv("AGENT_EXEC_BLOCKED", "1", 1);
    ::setenv("AGENT_EXEC_BLOCKED_NOT", "1", 1);

    auto contains = [](const std::vector<std::string>& env, const std::string& entry) {
        return std::find(env.begin(), env.end(), entry) != env.end();
    };

    auto full = inherited_environment({});
    EXPECT_TRUE(contains(full, "AGENT_EXEC_BLOCKED=1"));

    auto filtered = inherited_environment({"AGENT_EXEC_BLOCKED"});
    EXPECT_FALSE(contains(filtered, "AGENT_EXEC_BLOCKED=1"));
    EXPECT_TRUE(contains(filtered, "AGENT_EXEC_BLOCKED_NOT=1"));
    EXPECT_EQ(filtered.size() + 1, full.size());

    ::unsetenv("AGENT_EXEC_BLOCKED");
    ::unsetenv("AGENT_EXEC_BLOCKED_NOT");
}

TEST(ProcessHelpersTest, DecodeWaitStatus) {
    EXPECT_EQ(decode_wait_status(3 << 8), 3);
    EXPECT_EQ(decode_wait_status(SIGKILL), 128 + SIGKILL);
}
