/**
 * @file sandbox_instance.hpp
 * @brief Pooled sandbox record
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace sandpool {
namespace core {

/**
 * @struct SandboxInstance
 * @brief One warm sandbox tracked by the pool
 *
 * Owned by PoolManager. The mutable fields are only touched under the lock
 * of the pool the instance belongs to; copies handed out are snapshots.
 *
 * **Lifecycle**:
 * ```
 * warming -> idle <-> in use
 * idle -> unhealthy -> refreshing -> replaced by a new idle instance
 * idle -> evicted
 * in use (task timed out) -> refresh pending -> refreshing
 * ```
 */
struct SandboxInstance {
    std::string instance_id;     ///< Unique id, owner of the isolation resources
    std::string agent_type;      ///< Normalized agent type (pool key)
    std::string container_name;  ///< Engine container name
    std::string network_id;      ///< Isolated network
    std::string volume_id;       ///< Isolated volume

    std::chrono::system_clock::time_point created_at;    ///< Creation time
    std::chrono::system_clock::time_point last_used_at;  ///< Last checkin (or creation)

    std::uint64_t execution_count{0};  ///< Tasks run; never decreases
    bool healthy{true};                ///< Last probe result
    bool in_use{false};                ///< Checked out by a task
    bool refresh_pending{false};       ///< Replacement waiting for checkin
    bool refreshing{false};            ///< Replacement in progress
};

} // namespace core
} // namespace sandpool
