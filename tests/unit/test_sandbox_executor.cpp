#include <gtest/gtest.h>

#include "sandpool/core/errors.hpp"
#include "sandpool/core/sandbox_executor.hpp"
#include "support/fake_docker_runner.hpp"

#include <algorithm>
#include <memory>

namespace sandpool {
namespace {

using namespace std::chrono_literals;
using core::AgentState;
using core::SandboxExecutor;
using core::TaskDefinition;
using test_support::FakeDockerRunner;

class SandboxExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        runner = std::make_shared<FakeDockerRunner>();
        auto gateway = std::make_shared<utils::ContainerUtils>(runner, 2s);
        isolation = std::make_shared<core::IsolationManager>(gateway);
        auto profiles = std::make_shared<const core::SecurityProfile>("sandpool-agent:test");

        core::ExecutorOptions options;
        options.agent_binary = "agent";
        options.default_task_timeout = 90s;
        options.stop_grace = 3s;
        executor = std::make_unique<SandboxExecutor>(gateway, isolation, profiles, options);

        task.id = "task-1";
        task.description = "write tests";
        agent = AgentState{"agent-1", "coder"};
    }

    std::shared_ptr<FakeDockerRunner> runner;
    std::shared_ptr<core::IsolationManager> isolation;
    std::unique_ptr<SandboxExecutor> executor;
    TaskDefinition task;
    AgentState agent;
};

TEST_F(SandboxExecutorTest, ExecuteOnceRunsAndTearsDown) {
    auto result = executor->ExecuteOnce(task, agent);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.output, "{\"status\":\"ok\"}\n");
    EXPECT_EQ(result.metadata.at("execution_mode"), "docker");
    EXPECT_EQ(result.metadata.at("pooled_execution"), "false");
    EXPECT_EQ(result.metadata.at("agent_type"), "coder");
    EXPECT_EQ(result.metadata.at("agent_id"), "agent-1");
    EXPECT_EQ(result.metadata.at("task_id"), "task-1");
    EXPECT_EQ(result.metadata.at("security_level"), "isolated");
    EXPECT_EQ(result.metadata.at("timed_out"), "false");
    EXPECT_FALSE(result.metadata.at("session_id").empty());

    EXPECT_EQ(result.resource_usage.memory_bytes, 13107200u);
    EXPECT_EQ(result.resource_usage.network_io_bytes, 1848u);
    EXPECT_EQ(result.resource_usage.disk_io_bytes, 4100u);
    EXPECT_EQ(result.resource_usage.pids, 3);

    EXPECT_EQ(runner->CallCount("create"), 1u);
    EXPECT_EQ(runner->LiveContainers(), 0u);
    EXPECT_EQ(runner->LiveNetworks(), 0u);
    EXPECT_EQ(runner->LiveVolumes(), 0u);
    EXPECT_EQ(isolation->LiveNetworkCount(), 0u);
}

TEST_F(SandboxExecutorTest, FailedTaskStillTearsDown) {
    runner->SetExecHandler([](const std::string&, const std::vector<std::string>&) {
        utils::CommandResult r;
        r.exit_code = 3;
        r.stderr_output = "boom";
        return r;
    });

    auto result = executor->ExecuteOnce(task, agent);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_EQ(result.error, "boom");
    EXPECT_EQ(runner->LiveContainers(), 0u);
    EXPECT_EQ(runner->LiveNetworks(), 0u);
}

TEST_F(SandboxExecutorTest, TimeoutBecomesFailedResult) {
    task.constraints.timeout_after = 250ms;
    runner->SetExecHandler([](const std::string& name, const std::vector<std::string>&) -> utils::CommandResult {
        throw core::TimeoutError("exec " + name, 1, 250ms);
    });

    auto result = executor->ExecuteOnce(task, agent);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exit_code, -1);
    EXPECT_EQ(result.metadata.at("timed_out"), "true");
    EXPECT_EQ(result.duration, 250ms);
    EXPECT_EQ(runner->LastTimeout("exec"), 250ms);
    EXPECT_EQ(runner->LiveContainers(), 0u);
}

TEST_F(SandboxExecutorTest, CreateFailureReleasesIsolation) {
    runner->SetFailCreate(true);

    EXPECT_THROW(executor->ExecuteOnce(task, agent), core::RuntimeError);

    EXPECT_EQ(runner->LiveNetworks(), 0u);
    EXPECT_EQ(runner->LiveVolumes(), 0u);
    EXPECT_EQ(runner->CallCount("exec"), 0u);
}

TEST_F(SandboxExecutorTest, StartFailureRemovesContainer) {
    runner->SetFailStart(true);

    EXPECT_THROW(executor->Provision("coder", "coder-x"), core::RuntimeError);

    EXPECT_EQ(runner->LiveContainers(), 0u);
    EXPECT_EQ(runner->LiveNetworks(), 0u);
    EXPECT_EQ(runner->LiveVolumes(), 0u);
}

TEST_F(SandboxExecutorTest, NetworkFailureIsResourceCreationError) {
    runner->SetFailNetworkCreate(true);

    EXPECT_THROW(executor->ExecuteOnce(task, agent), core::ResourceCreationError);
    EXPECT_EQ(runner->CallCount("create"), 0u);
}

TEST_F(SandboxExecutorTest, ProvisionUsesProfile) {
    auto sandbox = executor->Provision("Reviewer", "rev-1");

    EXPECT_EQ(sandbox.agent_type, "reviewer");
    EXPECT_EQ(sandbox.container_name, "sandpool-rev-1");
    EXPECT_EQ(sandbox.network_id, "sandpool-net-rev-1");
    EXPECT_EQ(sandbox.volume_id, "sandpool-vol-rev-1");
    EXPECT_FALSE(sandbox.container_id.empty());

    auto create = runner->LastCall("create");
    auto memory = std::find(create.begin(), create.end(), "--memory");
    ASSERT_NE(memory, create.end());
    EXPECT_EQ(*(memory + 1), "128m");

    EXPECT_TRUE(executor->ProbeHealth(sandbox.container_name));
    EXPECT_TRUE(executor->Teardown(sandbox));
    EXPECT_EQ(runner->CallCount("stop"), 1u);
    EXPECT_EQ(runner->LiveContainers(), 0u);
}

TEST_F(SandboxExecutorTest, TeardownReportsIncompleteCleanup) {
    auto sandbox = executor->Provision("coder", "coder-y");
    runner->SetFailRemove(true);

    EXPECT_FALSE(executor->Teardown(sandbox));

    // Isolation resources are still released
    EXPECT_EQ(runner->LiveNetworks(), 0u);
    EXPECT_EQ(runner->LiveVolumes(), 0u);
}

TEST_F(SandboxExecutorTest, ProbeHealthRequiresRunning) {
    auto sandbox = executor->Provision("coder", "coder-z");

    runner->SetContainerState(sandbox.container_name, "exited");
    EXPECT_FALSE(executor->ProbeHealth(sandbox.container_name));

    runner->DeleteContainer(sandbox.container_name);
    EXPECT_FALSE(executor->ProbeHealth(sandbox.container_name));
}

TEST_F(SandboxExecutorTest, TaskCommandLine) {
    auto direct = executor->BuildTaskCommand(task, agent, false);
    EXPECT_EQ(direct, (std::vector<std::string>{"agent", "--task-id", "task-1", "-p",
                                                "Execute task: write tests",
                                                "--output-format", "json"}));

    auto pooled = executor->BuildTaskCommand(task, AgentState{"a", " Coder"}, true);
    EXPECT_EQ(pooled, (std::vector<std::string>{"agent", "--pool-mode", "--agent-type", "coder",
                                                "--task-id", "task-1", "-p",
                                                "Execute task: write tests",
                                                "--output-format", "json",
                                                "--isolated-execution"}));
}

TEST_F(SandboxExecutorTest, TimeoutPrecedence) {
    EXPECT_EQ(executor->ResolveTimeout(task), 90s);

    task.resource_requirements.max_duration = 40s;
    EXPECT_EQ(executor->ResolveTimeout(task), 40s);

    task.constraints.timeout_after = 5s;
    EXPECT_EQ(executor->ResolveTimeout(task), 5s);

    task.constraints.timeout_after = 0ms;
    EXPECT_EQ(executor->ResolveTimeout(task), 40s);
}

TEST_F(SandboxExecutorTest, MissingStatsLeaveUsageEmpty) {
    runner->SetFailStats(true);

    auto result = executor->ExecuteOnce(task, agent);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.resource_usage.memory_bytes, 0u);
    EXPECT_EQ(result.resource_usage.pids, 0);
}

TEST_F(SandboxExecutorTest, PooledRunMetadata) {
    auto sandbox = executor->Provision("coder", "coder-p");

    auto result = executor->RunInSandbox(sandbox.container_name, task, agent, true);

    EXPECT_EQ(result.metadata.at("execution_mode"), "pooled-docker");
    EXPECT_EQ(result.metadata.at("pooled_execution"), "true");
    EXPECT_EQ(result.metadata.at("container_name"), "sandpool-coder-p");
    EXPECT_EQ(runner->LiveContainers(), 1u);
}

} // namespace
} // namespace sandpool
