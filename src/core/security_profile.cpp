/**
 * @file security_profile.cpp
 * @brief Implementation of the per-agent-type policy table
 *
 * **Global Defaults** (every agent type):
 * - Read-only root filesystem, tmpfs /tmp (rw,noexec,nosuid,size=100m)
 * - --cap-drop ALL, no-new-privileges:true
 * - User swarm:swarm
 * - Ulimits nofile=1024:1024, nproc=64:64, oom-score-adj 1000
 * - Per-instance volume at /workspace and per-instance internal network
 *
 * @date 2025
 */

#include "sandpool/core/security_profile.hpp"

#include "sandpool/core/isolation_manager.hpp"

#include <cctype>
#include <utility>

namespace sandpool {
namespace core {

AgentProfileTable DefaultAgentProfiles() {
    AgentProfileTable table;

    AgentProfile coder;
    coder.memory_limit_mb = 512;
    coder.cpu_limit = 1.0;
    coder.cpu_quota = 100000;
    coder.environment_vars = {
        {"CODER_MODE", "true"},
        {"ALLOW_CODE_EXECUTION", "true"},
    };
    table[AgentType::Coder] = coder;

    AgentProfile tester;
    tester.memory_limit_mb = 256;
    tester.cpu_limit = 0.5;
    tester.environment_vars = {
        {"TESTER_MODE", "true"},
        {"TEST_FRAMEWORKS", "jest,mocha,cypress"},
    };
    table[AgentType::Tester] = tester;

    AgentProfile reviewer;
    reviewer.memory_limit_mb = 128;
    reviewer.cpu_limit = 0.25;
    reviewer.environment_vars = {
        {"REVIEWER_MODE", "true"},
        {"ANALYSIS_TOOLS", "eslint,prettier,sonar"},
    };
    table[AgentType::Reviewer] = reviewer;

    AgentProfile researcher;
    researcher.memory_limit_mb = 256;
    researcher.cpu_limit = 0.5;
    researcher.environment_vars = {
        {"RESEARCHER_MODE", "true"},
        {"SEARCH_ENGINES", "enabled"},
    };
    table[AgentType::Researcher] = researcher;

    AgentProfile planner;
    planner.memory_limit_mb = 128;
    planner.cpu_limit = 0.25;
    planner.environment_vars = {
        {"PLANNER_MODE", "true"},
    };
    table[AgentType::Planner] = planner;

    return table;
}

SecurityProfile::SecurityProfile(std::string image,
                                 AgentProfileTable profiles,
                                 AgentProfile default_profile)
    : image_(std::move(image))
    , profiles_(std::move(profiles))
    , default_profile_(std::move(default_profile)) {
    // Unknown always resolves to the default entry
    profiles_.erase(AgentType::Unknown);
}

const AgentProfile& SecurityProfile::ProfileFor(AgentType type) const {
    auto it = profiles_.find(type);
    return it != profiles_.end() ? it->second : default_profile_;
}

std::string SecurityProfile::ContainerName(const std::string& instance_id) {
    std::string name = "sandpool-" + instance_id;
    for (auto& c : name) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '_' && c != '.' && c != '-') {
            c = '-';
        }
    }
    return name;
}

SandboxConfig SecurityProfile::BuildConfig(const std::string& agent_type,
                                           const std::string& instance_id) const {
    const AgentProfile& profile = ProfileFor(ParseAgentType(agent_type));

    SandboxConfig config;
    config.name = ContainerName(instance_id);
    config.image = profile.image.empty() ? image_ : profile.image;
    config.command = {"sleep", "infinity"};

    // Resource limits
    config.memory_limit_mb = profile.memory_limit_mb;
    config.cpu_limit = profile.cpu_limit;
    config.cpu_quota = profile.cpu_quota;
    config.oom_score_adj = 1000;
    config.ulimits = {
        {"nofile", 1024, 1024},
        {"nproc", 64, 64},
    };

    // Security
    config.read_only_rootfs = true;
    config.no_new_privileges = true;
    config.capabilities_drop = {"ALL"};
    config.capabilities_add = profile.capabilities_add;
    config.security_opts = profile.security_opts;
    config.user = "swarm:swarm";

    // Isolation
    config.network = IsolationManager::NetworkName(instance_id);
    config.volumes.push_back({IsolationManager::VolumeName(instance_id), "/workspace", false});
    config.volumes.insert(config.volumes.end(),
                          profile.extra_mounts.begin(), profile.extra_mounts.end());
    config.tmpfs["/tmp"] = "rw,noexec,nosuid,size=100m";
    config.working_dir = "/workspace";

    // Metadata
    config.labels = {
        {"sandpool.agent.type", agent_type},
        {"sandpool.instance.id", instance_id},
        {"sandpool.pool", "true"},
        {"sandpool.security.level", "isolated"},
    };
    config.environment_vars = {
        {"AGENT_TYPE", agent_type},
        {"CONTAINER_ID", instance_id},
        {"POOL_MODE", "true"},
    };
    for (const auto& [key, value] : profile.environment_vars) {
        config.environment_vars[key] = value;
    }

    return config;
}

} // namespace core
} // namespace sandpool
