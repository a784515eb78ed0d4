/**
 * @file sandbox_executor.hpp
 * @brief Sandbox provisioning, task execution and teardown
 *
 * The executor knows how to bring one sandbox up (network, volume,
 * container), run a task inside it and take everything down again. The
 * single-shot path does all three per task; the pool reuses the provision
 * and run steps and keeps the sandbox between tasks.
 *
 * **Single-Shot Workflow**:
 * ```
 * BuildConfig -> network + volume -> create -> start -> exec -> stats
 *             -> stop -> rm -> release network + volume
 * ```
 *
 * @date 2025
 */

#pragma once

#include "sandpool/core/isolation_manager.hpp"
#include "sandpool/core/security_profile.hpp"
#include "sandpool/core/task_types.hpp"
#include "sandpool/utils/container_utils.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace sandpool {
namespace core {

/**
 * @struct ExecutorOptions
 * @brief Settings for task execution
 */
struct ExecutorOptions {
    std::string agent_binary{"sandpool-agent"};                                ///< Binary run in the sandbox
    std::chrono::milliseconds default_task_timeout{std::chrono::minutes(5)};  ///< Exec deadline fallback
    std::chrono::seconds stop_grace{10};                                       ///< Grace period for stop
};

/**
 * @struct ProvisionedSandbox
 * @brief Handles of one running sandbox and its isolation resources
 */
struct ProvisionedSandbox {
    std::string instance_id;     ///< Owner id of all resources below
    std::string agent_type;      ///< Normalized agent type
    std::string container_name;  ///< Container name
    std::string container_id;    ///< Engine container id
    std::string network_id;      ///< Isolated network
    std::string volume_id;       ///< Isolated volume
};

/**
 * @class SandboxExecutor
 * @brief Runs tasks in hardened sandboxes
 *
 * **Thread Safety**: Stateless apart from shared collaborators, which are
 * thread-safe; any number of tasks may run concurrently.
 */
class SandboxExecutor {
public:
    SandboxExecutor(std::shared_ptr<utils::ContainerUtils> gateway,
                    std::shared_ptr<IsolationManager> isolation,
                    std::shared_ptr<const SecurityProfile> profiles,
                    ExecutorOptions options = ExecutorOptions{});

    /**
     * @brief Create a sandbox, run one task, tear the sandbox down
     *
     * Teardown runs on every exit path.
     *
     * @return Task outcome; success == false if the task failed or timed out
     * @throws ResourceCreationError, RuntimeError, TimeoutError if the
     *         sandbox could not be provisioned
     */
    ExecutionResult ExecuteOnce(const TaskDefinition& task, const AgentState& agent);

    /**
     * @brief Allocate isolation resources, create and start a sandbox
     *
     * On failure everything created so far is released before rethrowing.
     *
     * @param agent_type Raw agent type
     * @param instance_id Unique instance id
     */
    ProvisionedSandbox Provision(const std::string& agent_type, const std::string& instance_id);

    /**
     * @brief Stop and remove the container, release its network and volume
     *
     * Every step is attempted even if an earlier one fails.
     *
     * @return true if all steps succeeded
     */
    bool Teardown(const ProvisionedSandbox& sandbox);

    /**
     * @brief Exec the task inside an already running sandbox
     *
     * A task that outlives its deadline is reported as a failed result with
     * metadata "timed_out" = "true", not as an exception.
     *
     * @param container_name Target container
     * @param task Task to run
     * @param agent Requesting agent
     * @param pooled Whether the sandbox belongs to the pool
     * @throws RuntimeError if the engine could not start the exec at all
     */
    ExecutionResult RunInSandbox(const std::string& container_name,
                                 const TaskDefinition& task,
                                 const AgentState& agent,
                                 bool pooled);

    /**
     * @brief Live health probe: true if the container is running
     *
     * Never throws; probe failures count as unhealthy.
     */
    bool ProbeHealth(const std::string& container_name) const;

    /**
     * @brief Command line run inside the sandbox for a task
     */
    std::vector<std::string> BuildTaskCommand(const TaskDefinition& task,
                                              const AgentState& agent,
                                              bool pooled) const;

    /**
     * @brief Exec deadline for a task
     *
     * constraints.timeout_after, else resource_requirements.max_duration,
     * else the configured default.
     */
    std::chrono::milliseconds ResolveTimeout(const TaskDefinition& task) const;

    const ExecutorOptions& Options() const { return options_; }

private:
    std::shared_ptr<utils::ContainerUtils> gateway_;
    std::shared_ptr<IsolationManager> isolation_;
    std::shared_ptr<const SecurityProfile> profiles_;
    ExecutorOptions options_;

    ResourceUsage CollectUsage(const std::string& container_name) const;
};

} // namespace core
} // namespace sandpool
