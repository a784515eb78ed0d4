/**
 * @file security_profile.hpp
 * @brief Agent type to hardened sandbox configuration
 *
 * A static per-type policy table (memory, CPU share, extra environment,
 * mounts and security options) merged over global defaults that apply to
 * every sandbox: read-only root, all capabilities dropped,
 * no-new-privileges, non-root user, CPU quota and file/process ulimits.
 *
 * @date 2025
 */

#pragma once

#include "sandpool/core/task_types.hpp"
#include "sandpool/utils/container_utils.hpp"

#include <map>
#include <string>
#include <vector>

namespace sandpool {
namespace core {

/// Per-instance sandbox configuration, fixed at creation time
using SandboxConfig = utils::ContainerConfig;

/**
 * @struct AgentProfile
 * @brief Policy entry for one agent type
 */
struct AgentProfile {
    std::size_t memory_limit_mb{256};                     ///< Memory ceiling
    double cpu_limit{0.5};                                ///< CPU share
    long cpu_quota{50000};                                ///< CFS quota
    std::map<std::string, std::string> environment_vars;  ///< Extra environment
    std::vector<utils::VolumeMount> extra_mounts;         ///< Extra mounts
    std::vector<std::string> security_opts;               ///< Extra --security-opt
    std::vector<std::string> capabilities_add;            ///< Capabilities added back
    std::string image;                                    ///< Empty: global image
};

using AgentProfileTable = std::map<AgentType, AgentProfile>;

/**
 * @brief Built-in policy table for the five known agent types
 */
AgentProfileTable DefaultAgentProfiles();

/**
 * @class SecurityProfile
 * @brief Builds SandboxConfig values from the policy table
 *
 * Immutable after construction, so BuildConfig() can be called from any
 * thread.
 *
 * **Usage Example**:
 * @code
 * SecurityProfile profiles("sandpool-agent:latest");
 * SandboxConfig config = profiles.BuildConfig("coder", "coder-1718-0-af31");
 * // config.memory_limit_mb == 512, config.read_only_rootfs == true
 * @endcode
 */
class SecurityProfile {
public:
    /**
     * @param image Default image for all agent types
     * @param profiles Per-type policy table
     * @param default_profile Profile for types missing from the table
     */
    explicit SecurityProfile(std::string image = "sandpool-agent:latest",
                             AgentProfileTable profiles = DefaultAgentProfiles(),
                             AgentProfile default_profile = AgentProfile{});

    /**
     * @brief Build the configuration of one sandbox instance
     *
     * Never fails: unknown agent types get the default profile. Network and
     * volume names are derived from the instance id and match what
     * IsolationManager allocates for that owner.
     *
     * @param agent_type Raw agent type string
     * @param instance_id Unique instance id
     */
    SandboxConfig BuildConfig(const std::string& agent_type,
                              const std::string& instance_id) const;

    const AgentProfile& ProfileFor(AgentType type) const;

    const std::string& Image() const { return image_; }

    /**
     * @brief Container name for an instance id
     *
     * Characters the engine rejects in names are replaced with '-'.
     */
    static std::string ContainerName(const std::string& instance_id);

private:
    std::string image_;
    AgentProfileTable profiles_;
    AgentProfile default_profile_;
};

} // namespace core
} // namespace sandpool
