/**
 * @file pool_config.hpp
 * @brief Pool manager configuration with defaults and JSON loading
 *
 * @date 2025
 */

#pragma once

#include "sandpool/core/security_profile.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace sandpool {
namespace core {

/**
 * @struct PoolConfig
 * @brief Pool sizing, lifecycle, scaling and execution settings
 *
 * Read once at startup; nothing here is hot-reloaded.
 */
struct PoolConfig {
    // Pool Sizing
    std::size_t pool_size{2};          ///< Warm instances per warmup type
    std::vector<std::string> warmup_agent_types{
        "coder", "tester", "reviewer", "researcher", "planner"};  ///< Types warmed by Initialize()
    std::size_t min_pool_size{1};      ///< Auto-scaling lower bound
    std::size_t max_pool_size{10};     ///< Auto-scaling upper bound
    bool enable_container_reuse{true}; ///< false: every task runs single-shot

    // Lifecycle
    std::chrono::milliseconds max_container_age{std::chrono::hours(1)};        ///< Retire after
    std::chrono::milliseconds health_check_interval{std::chrono::seconds(30)}; ///< Probe interval
    std::chrono::milliseconds idle_timeout{std::chrono::minutes(30)};          ///< Evict idle after
    std::chrono::milliseconds refresh_delay{std::chrono::seconds(5)};          ///< Deferred refresh retry

    // Auto Scaling
    bool auto_scaling{true};           ///< Scale after pool misses
    double scale_up_threshold{0.8};    ///< Grow above this utilization
    double scale_down_threshold{0.2};  ///< Shrink below this utilization
    std::chrono::milliseconds scale_cooldown{std::chrono::seconds(60)};  ///< Delay after a miss

    // Execution
    std::string docker_binary{"docker"};          ///< Engine CLI
    std::string image{"sandpool-agent:latest"};   ///< Default sandbox image
    std::string agent_binary{"sandpool-agent"};   ///< Binary invoked inside the sandbox
    std::chrono::milliseconds command_timeout{std::chrono::seconds(30)};      ///< Control-plane deadline
    std::chrono::milliseconds default_task_timeout{std::chrono::minutes(5)};  ///< Exec deadline fallback
    std::chrono::seconds stop_grace{10};          ///< Grace period for stop
    std::chrono::milliseconds shutdown_drain_timeout{std::chrono::seconds(30)};  ///< Wait for running tasks

    // Metrics
    std::size_t metrics_window{100};   ///< Durations kept for rolling averages

    // Security Profiles
    AgentProfileTable agent_profiles{DefaultAgentProfiles()};  ///< Per-type policy
    AgentProfile default_profile;                              ///< Unknown types
};

/**
 * @brief Parse a configuration document
 *
 * Keys are camelCase (poolSize, healthCheckIntervalMs, agentProfiles, ...).
 * Missing keys keep their defaults. Entries under agentProfiles are merged
 * over the built-in profile of the same type; "default" (or "unknown")
 * replaces the fallback profile.
 *
 * @param json_text JSON document
 * @throws std::invalid_argument on malformed JSON or wrong value types
 */
PoolConfig ParsePoolConfig(const std::string& json_text);

/**
 * @brief Read and parse a configuration file
 * @throws std::runtime_error if the file cannot be read
 * @throws std::invalid_argument on malformed content
 */
PoolConfig LoadPoolConfig(const std::filesystem::path& path);

/**
 * @brief Reject inconsistent settings
 * @throws std::invalid_argument describing the first problem found
 */
void ValidatePoolConfig(const PoolConfig& config);

} // namespace core
} // namespace sandpool
