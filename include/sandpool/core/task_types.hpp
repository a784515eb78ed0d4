/**
 * @file task_types.hpp
 * @brief Task, agent and execution result records
 *
 * TaskDefinition and AgentState come from the caller and are only read.
 * ExecutionResult is produced once per call.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace sandpool {
namespace core {

/**
 * @enum AgentType
 * @brief Known agent classifications
 */
enum class AgentType {
    Coder,
    Tester,
    Reviewer,
    Researcher,
    Planner,
    Unknown   ///< Any other type string; gets the default profile
};

/**
 * @struct ResourceRequirements
 * @brief Resources a task asks for
 */
struct ResourceRequirements {
    std::uint64_t memory_bytes{0};                          ///< 0 = profile default
    std::optional<std::chrono::milliseconds> max_duration;  ///< Upper bound on run time
};

/**
 * @struct TaskConstraints
 * @brief Timeout and retry constraints
 */
struct TaskConstraints {
    std::optional<std::chrono::milliseconds> timeout_after;  ///< Exec deadline
    int max_retries{0};                                      ///< Informational
};

/**
 * @struct TaskDefinition
 * @brief Unit of work submitted by an agent
 */
struct TaskDefinition {
    std::string id;
    std::string description;
    ResourceRequirements resource_requirements;
    TaskConstraints constraints;
};

/**
 * @struct AgentState
 * @brief Requesting agent
 */
struct AgentState {
    std::string id;
    std::string type;  ///< Raw type string ("coder", "tester", ...)
};

/**
 * @struct ResourceUsage
 * @brief Resource consumption sampled after the task ran
 */
struct ResourceUsage {
    double cpu_percent{0.0};            ///< CPU utilization
    std::uint64_t memory_bytes{0};      ///< Resident memory
    std::uint64_t disk_io_bytes{0};     ///< Block read + write
    std::uint64_t network_io_bytes{0};  ///< Network rx + tx
    int pids{0};                        ///< Live processes
};

/**
 * @struct ExecutionResult
 * @brief Outcome of one task execution
 *
 * success == false means the task ran and failed (or timed out). Failures
 * to run the task at all are thrown instead.
 */
struct ExecutionResult {
    bool success{false};                       ///< exit_code == 0
    std::string output;                        ///< Task stdout
    std::string error;                         ///< Task stderr or failure message
    int exit_code{-1};                         ///< Task exit code, -1 if it never finished
    std::chrono::milliseconds duration{0};     ///< Wall time of the exec
    ResourceUsage resource_usage;              ///< Usage snapshot
    std::map<std::string, std::string> metadata;  ///< Execution metadata
};

/**
 * @brief Parse an agent type string (case-insensitive)
 * @return AgentType::Unknown for anything unrecognized
 */
AgentType ParseAgentType(const std::string& type);

/**
 * @brief Pool key for a raw type string
 *
 * Lowercased and trimmed; an empty string becomes "unknown". Unrecognized
 * types keep their own name so that they get a pool of their own.
 */
std::string NormalizeAgentType(const std::string& type);

/**
 * @brief Canonical lowercase name, "unknown" for AgentType::Unknown
 */
std::string AgentTypeToString(AgentType type);

} // namespace core
} // namespace sandpool
