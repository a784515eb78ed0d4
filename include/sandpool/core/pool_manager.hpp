/**
 * @file pool_manager.hpp
 * @brief Per-agent-type pools of warm sandboxes
 *
 * Central orchestrator: keeps pre-created sandboxes per agent type, hands
 * them out to tasks, and runs the background loops that keep the pools
 * healthy and sized to load.
 *
 * **Concurrency Model**:
 * - A registry lock guards only lookup and insertion of type pools
 * - Each type pool has its own lock; no lock spans agent types
 * - Checkout sets in_use under the type lock, which is the only
 *   exclusivity guarantee for an instance
 * - Engine calls (create, exec, probe, teardown) run with no lock held
 * - A miss creates a new instance outside the lock; concurrent misses may
 *   each create one, and all of them join the pool
 *
 * **Background Loops**:
 * - Health check every health_check_interval
 * - Idle/aged cleanup every idle_timeout / 2
 * - Deferred refreshes and post-miss auto-scaling on a delayed task queue
 *
 * @date 2025
 */

#pragma once

#include "sandpool/core/isolation_manager.hpp"
#include "sandpool/core/pool_config.hpp"
#include "sandpool/core/pool_metrics.hpp"
#include "sandpool/core/sandbox_executor.hpp"
#include "sandpool/core/sandbox_instance.hpp"
#include "sandpool/core/security_profile.hpp"
#include "sandpool/core/task_types.hpp"
#include "sandpool/utils/container_utils.hpp"
#include "sandpool/utils/process_runner.hpp"
#include "sandpool/utils/scheduler.hpp"

#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace sandpool {
namespace core {

/**
 * @enum RefreshOutcome
 * @brief Result of a refresh request
 */
enum class RefreshOutcome {
    kRefreshed,  ///< Instance replaced by a fresh one
    kDeferred,   ///< Instance busy; retry scheduled
    kNotFound,   ///< No such instance in that pool
    kFailed      ///< Replacement could not be created; old instance kept
};

std::string RefreshOutcomeToString(RefreshOutcome outcome);

/**
 * @class PoolManager
 * @brief Pooled sandbox executor
 *
 * **Usage Example**:
 * @code
 * PoolConfig config;
 * config.warmup_agent_types = {"coder"};
 *
 * PoolManager pool(config, std::make_shared<utils::ProcessRunner>("docker"));
 * pool.Initialize();
 *
 * auto result = pool.ExecuteTask(task, agent);
 * if (!result.success) {
 *     // task ran and failed
 * }
 *
 * auto metrics = pool.GetPoolMetrics();
 * pool.Shutdown();
 * @endcode
 */
class PoolManager {
public:
    /**
     * @param config Validated on construction
     * @param runner Engine command runner
     * @throws std::invalid_argument if the configuration is inconsistent
     */
    PoolManager(PoolConfig config, std::shared_ptr<utils::CommandRunner> runner);

    /**
     * @brief Shuts down if still running
     */
    ~PoolManager();

    PoolManager(const PoolManager&) = delete;
    PoolManager& operator=(const PoolManager&) = delete;

    /**
     * @brief Warm the configured pools and start the background loops
     *
     * Creation failures are logged and skipped; a partial or empty pool is
     * acceptable.
     */
    void Initialize();

    /**
     * @brief Run one task in a sandbox of the agent's type
     *
     * Checks out an idle healthy instance or creates a new one on a miss.
     * The instance goes back to the pool afterwards whatever the task
     * outcome; task failure does not affect its health.
     *
     * @return Task outcome (success == false if the task failed)
     * @throws SandpoolError subclasses if no sandbox could run the task
     */
    ExecutionResult ExecuteTask(const TaskDefinition& task, const AgentState& agent);

    PoolMetricsSnapshot GetPoolMetrics() const;

    /**
     * @brief Grow or shrink one pool
     *
     * Grows by creating instances. Shrinks by removing least recently used
     * idle instances; in-use instances are never removed, so a shrink may
     * stop short of the target.
     */
    void ScalePool(const std::string& agent_type, std::size_t target_size);

    /**
     * @brief Replace one instance with a fresh one
     *
     * A busy instance is marked refresh-pending (no new checkouts) and the
     * refresh is retried after refresh_delay.
     */
    RefreshOutcome RefreshContainer(const std::string& agent_type, const std::string& instance_id);

    /**
     * @brief Copies of all pooled instances, keyed by agent type
     */
    PoolContents GetContainerPool() const;

    /**
     * @brief Stop the loops, drain running tasks, tear everything down
     *
     * Individual teardown failures are logged; shutdown always completes.
     * Idempotent.
     */
    void Shutdown();

    /**
     * @brief One pass of the health-check loop
     */
    void RunHealthChecks();

    /**
     * @brief One pass of the idle/aged cleanup loop
     * @return Number of instances removed
     */
    std::size_t RunCleanup();

    /**
     * @brief Grow or shrink a pool by one based on its utilization
     */
    void OptimizePool(const std::string& agent_type);

    bool IsRunning() const { return running_; }
    const PoolConfig& Config() const { return config_; }
    const IsolationManager& Isolation() const { return *isolation_; }

private:
    struct TypePool {
        std::mutex mutex;
        std::vector<std::shared_ptr<SandboxInstance>> instances;
    };

    std::shared_ptr<TypePool> GetOrCreatePool(const std::string& agent_type);
    std::shared_ptr<TypePool> FindPool(const std::string& agent_type) const;

    std::shared_ptr<SandboxInstance> CreateInstance(const std::string& agent_type);
    bool DestroyInstance(const SandboxInstance& instance);

    std::shared_ptr<SandboxInstance> Checkout(TypePool& pool);
    void Checkin(TypePool& pool, const std::shared_ptr<SandboxInstance>& instance, bool retire);

    void BeginTask();
    void EndTask();

    void ScheduleRefresh(const std::string& agent_type, const std::string& instance_id);
    void ScheduleOptimization(const std::string& agent_type);

    ExecutionResult ExecuteSingleShot(const TaskDefinition& task, const AgentState& agent,
                                      const std::string& agent_type);

    PoolConfig config_;

    std::shared_ptr<utils::ContainerUtils> gateway_;
    std::shared_ptr<IsolationManager> isolation_;
    std::shared_ptr<const SecurityProfile> profiles_;
    std::unique_ptr<SandboxExecutor> executor_;
    PoolMetrics metrics_;

    mutable std::mutex pools_mutex_;  ///< Guards the registry only
    std::map<std::string, std::shared_ptr<TypePool>> pools_;

    std::mutex optimization_mutex_;
    std::set<std::string> optimization_scheduled_;  ///< Types with a pending scaling pass

    std::mutex active_mutex_;
    std::condition_variable active_cv_;
    std::size_t active_tasks_{0};  ///< Checked-out instances and misses being provisioned

    std::atomic<bool> running_{false};
    std::atomic<bool> shut_down_{false};

    std::unique_ptr<utils::PeriodicTask> health_task_;
    std::unique_ptr<utils::PeriodicTask> cleanup_task_;
    utils::DelayedTaskQueue delayed_tasks_{"pool-delayed"};
};

} // namespace core
} // namespace sandpool
