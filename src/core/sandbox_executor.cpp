/**
 * @file sandbox_executor.cpp
 * @brief Implementation of sandbox provisioning and task execution
 *
 * @date 2025
 */

#include "sandpool/core/sandbox_executor.hpp"

#include "sandpool/core/errors.hpp"
#include "sandpool/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace sandpool {
namespace core {

using utils::StringUtils;

SandboxExecutor::SandboxExecutor(std::shared_ptr<utils::ContainerUtils> gateway,
                                 std::shared_ptr<IsolationManager> isolation,
                                 std::shared_ptr<const SecurityProfile> profiles,
                                 ExecutorOptions options)
    : gateway_(std::move(gateway))
    , isolation_(std::move(isolation))
    , profiles_(std::move(profiles))
    , options_(std::move(options)) {
}

// ============================================================================
// SINGLE-SHOT EXECUTION
// ============================================================================

ExecutionResult SandboxExecutor::ExecuteOnce(const TaskDefinition& task, const AgentState& agent) {
    std::string agent_type = NormalizeAgentType(agent.type);
    std::string instance_id = StringUtils::GenerateId(agent_type);

    spdlog::info("═══════════════════════════════════════════════════════════════");
    spdlog::info("SINGLE-SHOT EXECUTION");
    spdlog::info("═══════════════════════════════════════════════════════════════");
    spdlog::info("Task: {} ({})", task.id, StringUtils::Truncate(task.description, 60));
    spdlog::info("Agent: {} [{}]", agent.id, agent_type);

    ProvisionedSandbox sandbox = Provision(agent_type, instance_id);

    ExecutionResult result;
    try {
        result = RunInSandbox(sandbox.container_name, task, agent, false);
    } catch (const SandpoolError& e) {
        spdlog::error("Execution failed in {}: {}", sandbox.container_name, e.what());
        if (!Teardown(sandbox)) {
            spdlog::warn("⚠ Teardown of {} was incomplete", sandbox.container_name);
        }
        throw;
    }

    if (!Teardown(sandbox)) {
        spdlog::warn("⚠ Teardown of {} was incomplete", sandbox.container_name);
    }

    spdlog::info("Exit code: {}", result.exit_code);
    spdlog::info("Duration: {} ms", result.duration.count());
    spdlog::info("═══════════════════════════════════════════════════════════════");
    return result;
}

// ============================================================================
// PROVISIONING AND TEARDOWN
// ============================================================================

ProvisionedSandbox SandboxExecutor::Provision(const std::string& agent_type,
                                              const std::string& instance_id) {
    ProvisionedSandbox sandbox;
    sandbox.instance_id = instance_id;
    sandbox.agent_type = NormalizeAgentType(agent_type);

    SandboxConfig config = profiles_->BuildConfig(sandbox.agent_type, instance_id);
    sandbox.container_name = config.name;

    bool container_created = false;
    try {
        sandbox.network_id = isolation_->CreateIsolatedNetwork(instance_id);
        sandbox.volume_id = isolation_->CreateIsolatedVolume(instance_id);

        sandbox.container_id = gateway_->CreateContainer(config);
        container_created = true;
        gateway_->StartContainer(sandbox.container_name);
    } catch (const SandpoolError& e) {
        spdlog::error("Failed to provision sandbox {}: {}", instance_id, e.what());

        // Undo whatever was created; the original error wins
        if (container_created) {
            try {
                gateway_->RemoveContainer(sandbox.container_name, true);
            } catch (const SandpoolError& cleanup) {
                spdlog::warn("Cleanup of container {} failed: {}",
                             sandbox.container_name, cleanup.what());
            }
        }
        try {
            isolation_->RemoveVolume(sandbox.volume_id);
        } catch (const SandpoolError& cleanup) {
            spdlog::warn("Cleanup of volume {} failed: {}", sandbox.volume_id, cleanup.what());
        }
        try {
            isolation_->RemoveNetwork(sandbox.network_id);
        } catch (const SandpoolError& cleanup) {
            spdlog::warn("Cleanup of network {} failed: {}", sandbox.network_id, cleanup.what());
        }
        throw;
    }

    spdlog::debug("✓ Sandbox ready: {} [{}]", sandbox.container_name, sandbox.agent_type);
    return sandbox;
}

bool SandboxExecutor::Teardown(const ProvisionedSandbox& sandbox) {
    bool clean = true;

    try {
        gateway_->StopContainer(sandbox.container_name, options_.stop_grace);
    } catch (const SandpoolError& e) {
        spdlog::warn("Failed to stop {}: {}", sandbox.container_name, e.what());
        clean = false;
    }

    try {
        gateway_->RemoveContainer(sandbox.container_name, true);
    } catch (const SandpoolError& e) {
        spdlog::warn("Failed to remove {}: {}", sandbox.container_name, e.what());
        clean = false;
    }

    try {
        isolation_->RemoveVolume(sandbox.volume_id);
    } catch (const SandpoolError& e) {
        spdlog::warn("Failed to release volume {}: {}", sandbox.volume_id, e.what());
        clean = false;
    }

    try {
        isolation_->RemoveNetwork(sandbox.network_id);
    } catch (const SandpoolError& e) {
        spdlog::warn("Failed to release network {}: {}", sandbox.network_id, e.what());
        clean = false;
    }

    if (clean) {
        spdlog::debug("Sandbox torn down: {}", sandbox.container_name);
    }
    return clean;
}

// ============================================================================
// TASK EXECUTION
// ============================================================================

ExecutionResult SandboxExecutor::RunInSandbox(const std::string& container_name,
                                              const TaskDefinition& task,
                                              const AgentState& agent,
                                              bool pooled) {
    std::string agent_type = NormalizeAgentType(agent.type);
    auto command = BuildTaskCommand(task, agent, pooled);
    auto timeout = ResolveTimeout(task);

    ExecutionResult result;
    result.metadata["container_name"] = container_name;
    result.metadata["execution_mode"] = pooled ? "pooled-docker" : "docker";
    result.metadata["agent_type"] = agent_type;
    result.metadata["agent_id"] = agent.id;
    result.metadata["task_id"] = task.id;
    result.metadata["session_id"] = StringUtils::GenerateId("session");
    result.metadata["pooled_execution"] = pooled ? "true" : "false";
    result.metadata["security_level"] = "isolated";

    spdlog::debug("Running task {} in {} (timeout {} ms)", task.id, container_name, timeout.count());

    try {
        auto exec = gateway_->ExecuteCommand(container_name, command, timeout);
        result.success = exec.success;
        result.exit_code = exec.exit_code;
        result.output = std::move(exec.stdout_output);
        result.error = std::move(exec.stderr_output);
        result.duration = exec.duration;
        result.metadata["timed_out"] = "false";
    } catch (const TimeoutError& e) {
        spdlog::warn("Task {} exceeded its deadline in {}", task.id, container_name);
        result.success = false;
        result.exit_code = -1;
        result.error = e.what();
        result.duration = e.Deadline();
        result.metadata["timed_out"] = "true";
    }

    result.resource_usage = CollectUsage(container_name);

    if (result.success) {
        spdlog::debug("✓ Task {} completed in {} ms", task.id, result.duration.count());
    } else {
        spdlog::info("Task {} failed with exit code {}", task.id, result.exit_code);
    }
    return result;
}

ResourceUsage SandboxExecutor::CollectUsage(const std::string& container_name) const {
    ResourceUsage usage;
    try {
        auto stats = gateway_->GetContainerStats(container_name);
        usage.cpu_percent = stats.cpu_usage_percent;
        usage.memory_bytes = stats.memory_usage_bytes;
        usage.disk_io_bytes = stats.block_read_bytes + stats.block_write_bytes;
        usage.network_io_bytes = stats.network_rx_bytes + stats.network_tx_bytes;
        usage.pids = stats.process_count;
        spdlog::debug("Usage of {}: cpu {:.2f}%, memory {}, {} pids", container_name,
                      usage.cpu_percent, StringUtils::FormatSize(usage.memory_bytes), usage.pids);
    } catch (const SandpoolError& e) {
        // Usage is informational; the task result stands without it
        spdlog::warn("Could not collect usage for {}: {}", container_name, e.what());
    }
    return usage;
}

bool SandboxExecutor::ProbeHealth(const std::string& container_name) const {
    try {
        return gateway_->GetContainerState(container_name) == utils::ContainerState::RUNNING;
    } catch (const SandpoolError& e) {
        spdlog::debug("Health probe failed for {}: {}", container_name, e.what());
        return false;
    }
}

std::vector<std::string> SandboxExecutor::BuildTaskCommand(const TaskDefinition& task,
                                                           const AgentState& agent,
                                                           bool pooled) const {
    std::vector<std::string> command{options_.agent_binary};
    if (pooled) {
        command.push_back("--pool-mode");
        command.push_back("--agent-type");
        command.push_back(NormalizeAgentType(agent.type));
    }
    command.push_back("--task-id");
    command.push_back(task.id);
    command.push_back("-p");
    command.push_back("Execute task: " + task.description);
    command.push_back("--output-format");
    command.push_back("json");
    if (pooled) {
        command.push_back("--isolated-execution");
    }
    return command;
}

std::chrono::milliseconds SandboxExecutor::ResolveTimeout(const TaskDefinition& task) const {
    if (task.constraints.timeout_after && task.constraints.timeout_after->count() > 0) {
        return *task.constraints.timeout_after;
    }
    if (task.resource_requirements.max_duration &&
        task.resource_requirements.max_duration->count() > 0) {
        return *task.resource_requirements.max_duration;
    }
    return options_.default_task_timeout;
}

} // namespace core
} // namespace sandpool
