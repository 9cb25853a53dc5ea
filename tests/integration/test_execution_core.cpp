/**
 * @file test_execution_core.cpp
 * @brief Integration tests wiring configuration, worker pool, sandbox manager and telemetry.
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/scratch_dir.hpp"
#include "executor/worker_pool.hpp"
#include "sandbox/container_runner.hpp"
#include "sandbox/sandbox_manager.hpp"
#include "security/security_validator.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <fstream>
#include <thread>

using namespace agent_exec;
namespace fs = std::filesystem;

namespace {

constexpr const char* kAgentScript = R"(#!/bin/sh
prompt="$2"
case "$prompt" in
  slow*) sleep 0.4 ;;
esac
printf '{"result":"done:%s","usage":{"input_tokens":100,"output_tokens":50}}' "$prompt"
)";

/// Accepts every engine call; containers are numbered in creation order.
class CountingRunner final : public IContainerRunner {
public:
    Result<ContainerProcessResult> run(const std::vector<std::string>& args,
                                       const ContainerCommandOptions&) override {
        ContainerProcessResult result;
        if (args.front() == "run") {
            result.stdout_text = "container-" + std::to_string(++created) + "\n";
        } else if (args.front() == "exec") {
            result.stdout_text = "ran: " + args.back() + "\n";
            ++executed;
        }
        return result;
    }

    int created = 0;
    int executed = 0;
};

std::vector<nlohmann::json> read_events(const fs::path& path) {
    std::vector<nlohmann::json> events;
    std::ifstream in(path);
    for (std::string line; std::getline(in, line);) {
        if (!line.empty()) events.push_back(nlohmann::json::parse(line));
    }
    return events;
}

}  // namespace

class ExecutionCoreIntegration : public ::testing::Test {
protected:
    void SetUp() override {
        auto dir = make_scratch_dir({}, "agent_exec_integration_");
        ASSERT_TRUE(dir.has_value());
        root_ = ScratchDir(std::move(dir).value());

        agent_ = root_.path() / "agent.sh";
        {
            std::ofstream out(agent_);
            out << kAgentScript;
        }
        fs::permissions(agent_, fs::perms::owner_all, fs::perm_options::replace);

        config_path_ = root_.path() / "agent_exec.toml";
        std::ofstream toml(config_path_);
        toml << "[pool]\n"
             << "max_workers = 2\n"
             << "agent_binary = \"" << agent_.string() << "\"\n"
             << "poll_interval_ms = 5\n"
             << "drain_grace_ms = 500\n"
             << "\n[sandbox]\n"
             << "workspace_base = \"" << root_.path().string() << "\"\n"
             << "pids_limit = 32\n"
             << "\n[telemetry]\n"
             << "log_dir = \"" << (root_.path() / "logs").string() << "\"\n";
    }

    ScratchDir root_;
    fs::path agent_;
    fs::path config_path_;
};

// ═══════════════════════════════════════════════
// Worker Pool Pipeline
// ═══════════════════════════════════════════════

TEST_F(ExecutionCoreIntegration, ThirdTaskStartsWhenASlotFrees) {
    auto config = load_config(config_path_);
    ASSERT_TRUE(config.has_value()) << config.error().what();
    ASSERT_EQ(config->pool.max_workers, 2u);

    const auto log_dir = config->telemetry.log_dir;
    {
        Logger logger(std::make_unique<JsonFileSink>(log_dir, "agent_exec"), LogLevel::Debug);
        MetricsCollector metrics(std::make_unique<JsonFileSink>(log_dir, "metrics"));
        WorkerPool pool(config->pool, logger, &metrics);

        auto first = pool.submit("slow one", "sonnet", "proj-x", Seconds{10});
        auto second = pool.submit("slow two", "haiku", "proj-x", Seconds{10});
        auto third = pool.submit("fast three", "opus", "proj-y", Seconds{10});

        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds{5};
        while (pool.active_workers() < 2 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds{5});
        }
        EXPECT_EQ(pool.active_workers(), 2u);
        EXPECT_EQ(pool.status(third), TaskStatus::Pending);

        for (const auto& id : {first, second, third}) {
            auto result = pool.get_result(id, Milliseconds{10'000});
            ASSERT_TRUE(result.has_value());
            EXPECT_EQ(result->status, TaskStatus::Completed) << result->error.value_or("");
        }
        EXPECT_EQ(pool.active_workers(), 0u);

        auto summary = pool.drain(Milliseconds{100});
        EXPECT_EQ(summary.completed + summary.killed, 0u);
        logger.flush();
        metrics.flush();
    }

    auto events = read_events(log_dir / "metrics.ndjson");
    ASSERT_EQ(events.size(), 4u);
    double total_cost = 0.0;
    for (size_t i = 0; i < 3; ++i) {
        EXPECT_EQ(events[i]["event"].get<std::string>(), "task_result");
        EXPECT_EQ(events[i]["status"].get<std::string>(), "completed");
        total_cost += events[i]["cost_usd"].get<double>();
    }
    EXPECT_EQ(events[3]["event"].get<std::string>(), "drain_summary");
    // 100 input + 50 output tokens priced at each tier.
    EXPECT_NEAR(total_cost, 0.00105 + 0.0000875 + 0.00525, 1e-5);

    auto log_lines = read_events(log_dir / "agent_exec.ndjson");
    ASSERT_FALSE(log_lines.empty());
    for (const auto& line : log_lines) {
        EXPECT_TRUE(line.contains("level"));
        EXPECT_TRUE(line.contains("ts"));
        EXPECT_EQ(line["component"].get<std::string>(), "pool");
    }
}

// ═══════════════════════════════════════════════
// Sandbox Pipeline
// ═══════════════════════════════════════════════

TEST_F(ExecutionCoreIntegration, SandboxLifecycleWithPolicy) {
    auto config = load_config(config_path_);
    ASSERT_TRUE(config.has_value());

    auto sink = std::make_unique<MemorySink>();
    auto* metric_lines = sink.get();
    MetricsCollector metrics(std::move(sink));
    Logger logger(std::make_unique<NullSink>());
    auto runner = std::make_shared<CountingRunner>();

    SandboxManager manager(config->sandbox,
                           SecurityValidator(config->security.workspace_root,
                                             config->security.project_root),
                           runner, logger, &metrics);

    auto a = manager.create_sandbox("task-a");
    auto b = manager.create_sandbox("task-b");
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(a->container_id, "container-1");
    EXPECT_EQ(b->container_id, "container-2");
    EXPECT_EQ(a->config.pids_limit, 32u);
    EXPECT_NE(a->workspace_path, b->workspace_path);

    auto listed = manager.execute_command(*a, "ls -la");
    ASSERT_TRUE(listed.has_value());
    EXPECT_EQ(listed->stdout_text, "ran: ls -la\n");

    auto blocked = manager.execute_command(*a, "wget http://example.org/payload");
    ASSERT_FALSE(blocked.has_value());
    EXPECT_TRUE(blocked.error().is(ErrorCode::Security));
    EXPECT_EQ(runner->executed, 1);

    ASSERT_TRUE(manager.destroy_sandbox(*a).has_value());
    ASSERT_TRUE(manager.destroy_sandbox(*b, true).has_value());
    EXPECT_FALSE(fs::exists(a->workspace_path));
    EXPECT_FALSE(fs::exists(b->workspace_path));

    const auto& lines = metric_lines->lines();
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(nlohmann::json::parse(lines[0])["event"].get<std::string>(), "sandbox_created");
    EXPECT_EQ(nlohmann::json::parse(lines[3])["event"].get<std::string>(), "sandbox_destroyed");
}
