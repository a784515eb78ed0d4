/**
 * @file pool_manager.cpp
 * @brief Implementation of the pooled sandbox executor
 *
 * **Task Workflow**:
 * 1. Normalize the agent type and find (or create) its pool
 * 2. Checkout: first healthy, idle, non-refreshing instance, marked in use
 *    under the pool lock
 * 3. Miss: provision a new instance with no lock held, add it in use
 * 4. Exec the task inside the instance
 * 5. Checkin: clear in_use, bump execution_count and last_used_at; an
 *    instance whose task timed out is retired and replaced
 * 6. After a miss, schedule a utilization check after the cooldown
 *
 * @date 2025
 */

#include "sandpool/core/pool_manager.hpp"

#include "sandpool/core/errors.hpp"
#include "sandpool/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace sandpool {
namespace core {

using utils::StringUtils;
using Clock = std::chrono::system_clock;

namespace {

ProvisionedSandbox ToProvisioned(const SandboxInstance& instance) {
    ProvisionedSandbox sandbox;
    sandbox.instance_id = instance.instance_id;
    sandbox.agent_type = instance.agent_type;
    sandbox.container_name = instance.container_name;
    sandbox.network_id = instance.network_id;
    sandbox.volume_id = instance.volume_id;
    return sandbox;
}

bool IsSelectable(const SandboxInstance& instance) {
    return instance.healthy && !instance.in_use && !instance.refresh_pending && !instance.refreshing;
}

} // anonymous namespace

std::string RefreshOutcomeToString(RefreshOutcome outcome) {
    switch (outcome) {
        case RefreshOutcome::kRefreshed: return "refreshed";
        case RefreshOutcome::kDeferred: return "deferred";
        case RefreshOutcome::kNotFound: return "not_found";
        case RefreshOutcome::kFailed: return "failed";
        default: return "unknown";
    }
}

// ============================================================================
// CONSTRUCTION AND LIFECYCLE
// ============================================================================

PoolManager::PoolManager(PoolConfig config, std::shared_ptr<utils::CommandRunner> runner)
    : config_(std::move(config))
    , metrics_(config_.metrics_window) {
    ValidatePoolConfig(config_);

    gateway_ = std::make_shared<utils::ContainerUtils>(std::move(runner), config_.command_timeout);
    isolation_ = std::make_shared<IsolationManager>(gateway_);
    profiles_ = std::make_shared<const SecurityProfile>(config_.image, config_.agent_profiles,
                                                        config_.default_profile);

    ExecutorOptions options;
    options.agent_binary = config_.agent_binary;
    options.default_task_timeout = config_.default_task_timeout;
    options.stop_grace = config_.stop_grace;
    executor_ = std::make_unique<SandboxExecutor>(gateway_, isolation_, profiles_, options);

    // Deferred refreshes work even before Initialize()
    delayed_tasks_.Start();

    spdlog::debug("Pool manager created (pool size {}, image {})", config_.pool_size, config_.image);
}

PoolManager::~PoolManager() {
    Shutdown();
}

void PoolManager::Initialize() {
    if (shut_down_) {
        throw SandpoolError("Pool manager has been shut down");
    }
    if (running_) {
        return;
    }

    spdlog::info("═══════════════════════════════════════════════════════════════");
    spdlog::info("INITIALIZING SANDBOX POOL");
    spdlog::info("═══════════════════════════════════════════════════════════════");

    if (gateway_->IsRuntimeAvailable()) {
        spdlog::info("✓ Sandbox engine available (version {})", gateway_->GetRuntimeVersion());
    } else {
        spdlog::warn("⚠ Sandbox engine did not answer; warmup will likely fail");
    }

    std::size_t warmed = 0;
    std::size_t failed = 0;
    for (const auto& raw_type : config_.warmup_agent_types) {
        std::string agent_type = NormalizeAgentType(raw_type);
        auto pool = GetOrCreatePool(agent_type);

        for (std::size_t i = 0; i < config_.pool_size; ++i) {
            try {
                auto instance = CreateInstance(agent_type);
                std::lock_guard<std::mutex> lock(pool->mutex);
                pool->instances.push_back(instance);
                ++warmed;
            } catch (const SandpoolError& e) {
                spdlog::warn("Warmup of {} instance failed: {}", agent_type, e.what());
                ++failed;
            }
        }
        spdlog::info("Warmed pool '{}'", agent_type);
    }

    health_task_ = std::make_unique<utils::PeriodicTask>(
        "health-check", config_.health_check_interval, [this] { RunHealthChecks(); });
    cleanup_task_ = std::make_unique<utils::PeriodicTask>(
        "cleanup", config_.idle_timeout / 2, [this] { RunCleanup(); });
    health_task_->Start();
    cleanup_task_->Start();
    running_ = true;

    spdlog::info("═══════════════════════════════════════════════════════════════");
    spdlog::info("✓ Sandbox pool ready: {} instances warmed, {} failed", warmed, failed);
    spdlog::info("═══════════════════════════════════════════════════════════════");
}

void PoolManager::Shutdown() {
    bool expected = false;
    if (!shut_down_.compare_exchange_strong(expected, true)) {
        return;
    }
    running_ = false;

    spdlog::info("Shutting down sandbox pool...");

    if (health_task_) {
        health_task_->Stop();
    }
    if (cleanup_task_) {
        cleanup_task_->Stop();
    }
    delayed_tasks_.Stop();

    // Give running tasks a chance to finish before their sandboxes go away
    {
        std::unique_lock<std::mutex> lock(active_mutex_);
        if (!active_cv_.wait_for(lock, config_.shutdown_drain_timeout,
                                 [this] { return active_tasks_ == 0; })) {
            spdlog::warn("⚠ {} tasks still running after drain timeout", active_tasks_);
        }
    }

    std::vector<std::shared_ptr<SandboxInstance>> instances;
    {
        std::lock_guard<std::mutex> registry_lock(pools_mutex_);
        for (auto& entry : pools_) {
            auto& pool = entry.second;
            std::lock_guard<std::mutex> lock(pool->mutex);
            instances.insert(instances.end(), pool->instances.begin(), pool->instances.end());
            pool->instances.clear();
        }
    }

    std::size_t failures = 0;
    for (const auto& instance : instances) {
        if (!DestroyInstance(*instance)) {
            spdlog::warn("Teardown of {} was incomplete", instance->instance_id);
            ++failures;
        }
    }

    std::size_t orphans = isolation_->ReleaseAll();

    spdlog::info("✓ Sandbox pool shut down: {} instances torn down, {} failures, {} orphans left",
                 instances.size(), failures, orphans);
}

// ============================================================================
// REGISTRY
// ============================================================================

std::shared_ptr<PoolManager::TypePool> PoolManager::GetOrCreatePool(const std::string& agent_type) {
    std::lock_guard<std::mutex> lock(pools_mutex_);
    auto& pool = pools_[agent_type];
    if (!pool) {
        pool = std::make_shared<TypePool>();
    }
    return pool;
}

std::shared_ptr<PoolManager::TypePool> PoolManager::FindPool(const std::string& agent_type) const {
    std::lock_guard<std::mutex> lock(pools_mutex_);
    auto it = pools_.find(agent_type);
    return it == pools_.end() ? nullptr : it->second;
}

// ============================================================================
// INSTANCE MANAGEMENT
// ============================================================================

std::shared_ptr<SandboxInstance> PoolManager::CreateInstance(const std::string& agent_type) {
    std::string instance_id = StringUtils::GenerateId(agent_type);
    ProvisionedSandbox sandbox = executor_->Provision(agent_type, instance_id);

    auto instance = std::make_shared<SandboxInstance>();
    instance->instance_id = sandbox.instance_id;
    instance->agent_type = sandbox.agent_type;
    instance->container_name = sandbox.container_name;
    instance->network_id = sandbox.network_id;
    instance->volume_id = sandbox.volume_id;
    instance->created_at = Clock::now();
    instance->last_used_at = instance->created_at;

    spdlog::debug("Created pooled instance {} [{}]", instance->instance_id, agent_type);
    return instance;
}

bool PoolManager::DestroyInstance(const SandboxInstance& instance) {
    return executor_->Teardown(ToProvisioned(instance));
}

std::shared_ptr<SandboxInstance> PoolManager::Checkout(TypePool& pool) {
    std::shared_ptr<SandboxInstance> selected;
    {
        std::lock_guard<std::mutex> lock(pool.mutex);
        for (const auto& instance : pool.instances) {
            if (IsSelectable(*instance)) {
                instance->in_use = true;
                selected = instance;
                BeginTask();
                break;
            }
        }
    }
    return selected;
}

void PoolManager::Checkin(TypePool& pool, const std::shared_ptr<SandboxInstance>& instance,
                          bool retire) {
    {
        std::lock_guard<std::mutex> lock(pool.mutex);
        instance->in_use = false;
        instance->last_used_at = Clock::now();
        ++instance->execution_count;
        if (retire) {
            // The task may still be running inside; never hand this one out again
            instance->refresh_pending = true;
        }
    }
    if (retire) {
        spdlog::warn("Instance {} timed out a task, scheduling replacement", instance->instance_id);
        ScheduleRefresh(instance->agent_type, instance->instance_id);
    }
    EndTask();
}

void PoolManager::BeginTask() {
    std::lock_guard<std::mutex> lock(active_mutex_);
    ++active_tasks_;
}

void PoolManager::EndTask() {
    {
        std::lock_guard<std::mutex> lock(active_mutex_);
        --active_tasks_;
    }
    active_cv_.notify_all();
}

// ============================================================================
// TASK EXECUTION
// ============================================================================

ExecutionResult PoolManager::ExecuteTask(const TaskDefinition& task, const AgentState& agent) {
    if (shut_down_) {
        throw SandpoolError("Pool manager has been shut down");
    }

    std::string agent_type = NormalizeAgentType(agent.type);

    if (!config_.enable_container_reuse) {
        return ExecuteSingleShot(task, agent, agent_type);
    }

    auto pool = GetOrCreatePool(agent_type);
    auto instance = Checkout(*pool);
    bool pool_hit = static_cast<bool>(instance);

    if (pool_hit) {
        metrics_.RecordHit();
    } else {
        spdlog::debug("Pool miss for '{}', creating instance", agent_type);
        metrics_.RecordMiss();

        // Counted before provisioning so that Shutdown waits for the miss
        BeginTask();
        try {
            instance = CreateInstance(agent_type);
        } catch (const SandpoolError& e) {
            spdlog::error("On-demand creation for '{}' failed: {}", agent_type, e.what());
            metrics_.RecordFailure();
            EndTask();
            throw;
        } catch (...) {
            metrics_.RecordFailure();
            EndTask();
            throw;
        }

        bool added = false;
        {
            std::lock_guard<std::mutex> lock(pool->mutex);
            if (!shut_down_) {
                instance->in_use = true;
                pool->instances.push_back(instance);
                added = true;
            }
        }
        if (!added) {
            spdlog::warn("Pool shut down while {} was being created, discarding it",
                         instance->instance_id);
            if (!DestroyInstance(*instance)) {
                spdlog::warn("Teardown of {} was incomplete", instance->instance_id);
            }
            EndTask();
            throw SandpoolError("Pool manager has been shut down");
        }
        ScheduleOptimization(agent_type);
    }

    bool healthy = true;
    {
        std::lock_guard<std::mutex> lock(pool->mutex);
        healthy = instance->healthy;
    }

    ExecutionResult result;
    try {
        if (!healthy) {
            throw UnhealthyInstanceError(instance->instance_id);
        }
        result = executor_->RunInSandbox(instance->container_name, task, agent, true);
    } catch (const SandpoolError& e) {
        spdlog::error("Task {} could not run in {}: {}", task.id, instance->instance_id, e.what());
        Checkin(*pool, instance, false);
        metrics_.RecordFailure();
        throw;
    } catch (...) {
        spdlog::error("Task {} could not run in {}", task.id, instance->instance_id);
        Checkin(*pool, instance, false);
        metrics_.RecordFailure();
        throw;
    }

    auto timed_out = result.metadata.find("timed_out");
    Checkin(*pool, instance, timed_out != result.metadata.end() && timed_out->second == "true");

    std::uint64_t execution_count = 0;
    Clock::time_point created_at;
    {
        std::lock_guard<std::mutex> lock(pool->mutex);
        execution_count = instance->execution_count;
        created_at = instance->created_at;
    }

    result.metadata["instance_id"] = instance->instance_id;
    result.metadata["execution_count"] = std::to_string(execution_count);
    result.metadata["container_age_ms"] = std::to_string(
        std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - created_at).count());
    result.metadata["pool_hit"] = pool_hit ? "true" : "false";

    metrics_.RecordDuration(agent_type, result.duration);
    if (!result.success) {
        metrics_.RecordFailure();
    }

    return result;
}

ExecutionResult PoolManager::ExecuteSingleShot(const TaskDefinition& task, const AgentState& agent,
                                               const std::string& agent_type) {
    metrics_.RecordMiss();

    ExecutionResult result;
    try {
        result = executor_->ExecuteOnce(task, agent);
    } catch (const SandpoolError&) {
        metrics_.RecordFailure();
        throw;
    }

    metrics_.RecordDuration(agent_type, result.duration);
    if (!result.success) {
        metrics_.RecordFailure();
    }
    return result;
}

// ============================================================================
// SCALING AND REFRESH
// ============================================================================

void PoolManager::ScalePool(const std::string& agent_type, std::size_t target_size) {
    std::string key = NormalizeAgentType(agent_type);
    auto pool = GetOrCreatePool(key);

    std::size_t current = 0;
    {
        std::lock_guard<std::mutex> lock(pool->mutex);
        current = pool->instances.size();
    }

    if (target_size > current) {
        std::size_t to_create = target_size - current;
        spdlog::info("Scaling pool '{}' up: {} -> {}", key, current, target_size);

        for (std::size_t i = 0; i < to_create; ++i) {
            try {
                auto instance = CreateInstance(key);
                std::lock_guard<std::mutex> lock(pool->mutex);
                pool->instances.push_back(instance);
            } catch (const SandpoolError& e) {
                spdlog::warn("Scale-up of '{}' failed: {}", key, e.what());
            }
        }
        return;
    }

    if (target_size == current) {
        return;
    }

    std::vector<std::shared_ptr<SandboxInstance>> removed;
    {
        std::lock_guard<std::mutex> lock(pool->mutex);
        auto& instances = pool->instances;
        std::size_t excess = instances.size() > target_size ? instances.size() - target_size : 0;

        std::vector<std::shared_ptr<SandboxInstance>> candidates;
        for (const auto& instance : instances) {
            if (!instance->in_use && !instance->refreshing) {
                candidates.push_back(instance);
            }
        }
        std::sort(candidates.begin(), candidates.end(),
                  [](const std::shared_ptr<SandboxInstance>& a,
                     const std::shared_ptr<SandboxInstance>& b) {
                      return a->last_used_at < b->last_used_at;
                  });
        if (candidates.size() > excess) {
            candidates.resize(excess);
        }

        for (const auto& victim : candidates) {
            instances.erase(std::remove(instances.begin(), instances.end(), victim), instances.end());
        }
        removed = std::move(candidates);
    }

    spdlog::info("Scaling pool '{}' down: {} -> {} (removed {})",
                 key, current, current - removed.size(), removed.size());

    for (const auto& instance : removed) {
        if (!DestroyInstance(*instance)) {
            spdlog::warn("Teardown of {} was incomplete", instance->instance_id);
        }
    }
}

RefreshOutcome PoolManager::RefreshContainer(const std::string& agent_type,
                                             const std::string& instance_id) {
    std::string key = NormalizeAgentType(agent_type);
    auto pool = FindPool(key);
    if (!pool) {
        return RefreshOutcome::kNotFound;
    }

    {
        std::lock_guard<std::mutex> lock(pool->mutex);
        auto it = std::find_if(pool->instances.begin(), pool->instances.end(),
                               [&](const std::shared_ptr<SandboxInstance>& instance) {
                                   return instance->instance_id == instance_id;
                               });
        if (it == pool->instances.end()) {
            return RefreshOutcome::kNotFound;
        }

        auto& instance = *it;
        if (instance->refreshing) {
            return RefreshOutcome::kDeferred;
        }
        if (instance->in_use) {
            instance->refresh_pending = true;
            spdlog::info("Instance {} is busy, deferring refresh", instance_id);
            ScheduleRefresh(key, instance_id);
            return RefreshOutcome::kDeferred;
        }
        instance->refreshing = true;
    }

    std::shared_ptr<SandboxInstance> replacement;
    try {
        replacement = CreateInstance(key);
    } catch (const SandpoolError& e) {
        spdlog::error("Refresh of {} failed: {}", instance_id, e.what());
        std::lock_guard<std::mutex> lock(pool->mutex);
        for (auto& instance : pool->instances) {
            if (instance->instance_id == instance_id) {
                instance->refreshing = false;
                instance->refresh_pending = false;
            }
        }
        return RefreshOutcome::kFailed;
    }

    std::shared_ptr<SandboxInstance> old;
    {
        std::lock_guard<std::mutex> lock(pool->mutex);
        for (auto& instance : pool->instances) {
            if (instance->instance_id == instance_id) {
                old = instance;
                instance = replacement;
                break;
            }
        }
    }

    if (!old) {
        // Pool was torn down while the replacement was being built
        if (!DestroyInstance(*replacement)) {
            spdlog::warn("Teardown of {} was incomplete", replacement->instance_id);
        }
        return RefreshOutcome::kNotFound;
    }

    if (!DestroyInstance(*old)) {
        spdlog::warn("Teardown of replaced instance {} was incomplete", instance_id);
    }
    spdlog::info("✓ Refreshed {} -> {}", instance_id, replacement->instance_id);
    return RefreshOutcome::kRefreshed;
}

void PoolManager::ScheduleRefresh(const std::string& agent_type, const std::string& instance_id) {
    bool scheduled = delayed_tasks_.Schedule(config_.refresh_delay, [this, agent_type, instance_id] {
        if (shut_down_) {
            return;
        }
        RefreshOutcome outcome = RefreshContainer(agent_type, instance_id);
        spdlog::debug("Deferred refresh of {}: {}", instance_id, RefreshOutcomeToString(outcome));
    });
    if (!scheduled) {
        spdlog::debug("Refresh of {} not scheduled, pool is stopping", instance_id);
    }
}

void PoolManager::ScheduleOptimization(const std::string& agent_type) {
    if (!config_.auto_scaling) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(optimization_mutex_);
        if (!optimization_scheduled_.insert(agent_type).second) {
            return;
        }
    }

    bool scheduled = delayed_tasks_.Schedule(config_.scale_cooldown, [this, agent_type] {
        {
            std::lock_guard<std::mutex> lock(optimization_mutex_);
            optimization_scheduled_.erase(agent_type);
        }
        if (!shut_down_) {
            OptimizePool(agent_type);
        }
    });
    if (!scheduled) {
        std::lock_guard<std::mutex> lock(optimization_mutex_);
        optimization_scheduled_.erase(agent_type);
    }
}

void PoolManager::OptimizePool(const std::string& agent_type) {
    std::string key = NormalizeAgentType(agent_type);
    auto pool = FindPool(key);
    if (!pool) {
        return;
    }

    std::size_t total = 0;
    std::size_t active = 0;
    {
        std::lock_guard<std::mutex> lock(pool->mutex);
        total = pool->instances.size();
        for (const auto& instance : pool->instances) {
            if (instance->in_use) {
                ++active;
            }
        }
    }
    if (total == 0) {
        return;
    }

    double utilization = static_cast<double>(active) / static_cast<double>(total);
    spdlog::debug("Pool '{}' utilization {:.2f} ({}/{})", key, utilization, active, total);

    if (utilization > config_.scale_up_threshold && total < config_.max_pool_size) {
        ScalePool(key, total + 1);
    } else if (utilization < config_.scale_down_threshold && total > config_.min_pool_size) {
        ScalePool(key, total - 1);
    }
}

// ============================================================================
// BACKGROUND LOOPS
// ============================================================================

void PoolManager::RunHealthChecks() {
    std::vector<std::pair<std::string, std::shared_ptr<TypePool>>> pools;
    {
        std::lock_guard<std::mutex> lock(pools_mutex_);
        pools.assign(pools_.begin(), pools_.end());
    }

    for (const auto& [agent_type, pool] : pools) {
        std::vector<std::shared_ptr<SandboxInstance>> instances;
        {
            std::lock_guard<std::mutex> lock(pool->mutex);
            instances = pool->instances;
        }

        for (const auto& instance : instances) {
            bool healthy = executor_->ProbeHealth(instance->container_name);

            bool was_healthy = false;
            {
                std::lock_guard<std::mutex> lock(pool->mutex);
                // A checked-out instance keeps its health until checkin
                if (instance->in_use) {
                    continue;
                }
                was_healthy = instance->healthy;
                instance->healthy = healthy;
            }

            if (was_healthy && !healthy) {
                spdlog::warn("Instance {} [{}] became unhealthy", instance->instance_id, agent_type);
                ScheduleRefresh(agent_type, instance->instance_id);
            } else if (!was_healthy && healthy) {
                spdlog::info("Instance {} [{}] recovered", instance->instance_id, agent_type);
            }
        }
    }
}

std::size_t PoolManager::RunCleanup() {
    auto now = Clock::now();

    std::vector<std::shared_ptr<TypePool>> pools;
    {
        std::lock_guard<std::mutex> lock(pools_mutex_);
        for (const auto& entry : pools_) {
            pools.push_back(entry.second);
        }
    }

    std::vector<std::shared_ptr<SandboxInstance>> removed;
    for (const auto& pool : pools) {
        std::lock_guard<std::mutex> lock(pool->mutex);
        auto& instances = pool->instances;

        auto expired = std::stable_partition(
            instances.begin(), instances.end(),
            [&](const std::shared_ptr<SandboxInstance>& instance) {
                if (instance->in_use || instance->refreshing) {
                    return true;
                }
                bool too_old = now - instance->created_at > config_.max_container_age;
                bool too_idle = now - instance->last_used_at > config_.idle_timeout;
                return !(too_old || too_idle || !instance->healthy);
            });

        removed.insert(removed.end(), expired, instances.end());
        instances.erase(expired, instances.end());
    }

    for (const auto& instance : removed) {
        spdlog::info("Evicting instance {} [{}]", instance->instance_id, instance->agent_type);
        if (!DestroyInstance(*instance)) {
            spdlog::warn("Teardown of {} was incomplete", instance->instance_id);
        }
    }
    return removed.size();
}

// ============================================================================
// INTROSPECTION
// ============================================================================

PoolContents PoolManager::GetContainerPool() const {
    std::vector<std::pair<std::string, std::shared_ptr<TypePool>>> pools;
    {
        std::lock_guard<std::mutex> lock(pools_mutex_);
        pools.assign(pools_.begin(), pools_.end());
    }

    PoolContents contents;
    for (const auto& [agent_type, pool] : pools) {
        auto& copies = contents[agent_type];
        std::lock_guard<std::mutex> lock(pool->mutex);
        for (const auto& instance : pool->instances) {
            copies.push_back(*instance);
        }
    }
    return contents;
}

PoolMetricsSnapshot PoolManager::GetPoolMetrics() const {
    return metrics_.BuildSnapshot(GetContainerPool());
}

} // namespace core
} // namespace sandpool
