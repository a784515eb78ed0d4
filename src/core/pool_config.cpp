/**
 * @file pool_config.cpp
 * @brief JSON configuration loading and validation
 *
 * **Example Document**:
 * ```json
 * {
 *   "poolSize": 3,
 *   "warmupAgentTypes": ["coder", "tester"],
 *   "healthCheckIntervalMs": 10000,
 *   "agentProfiles": {
 *     "coder": { "memoryMb": 1024, "cpus": 2.0, "environment": { "LANG": "C" } }
 *   }
 * }
 * ```
 *
 * @date 2025
 */

#include "sandpool/core/pool_config.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace sandpool {
namespace core {

using json = nlohmann::json;

namespace {

template <typename T>
void ReadValue(const json& j, const char* key, T& target) {
    if (j.contains(key)) {
        target = j.at(key).get<T>();
    }
}

void ReadMillis(const json& j, const char* key, std::chrono::milliseconds& target) {
    if (j.contains(key)) {
        target = std::chrono::milliseconds(j.at(key).get<long long>());
    }
}

void MergeProfile(const json& j, AgentProfile& profile) {
    ReadValue(j, "memoryMb", profile.memory_limit_mb);
    ReadValue(j, "cpus", profile.cpu_limit);
    ReadValue(j, "cpuQuota", profile.cpu_quota);
    ReadValue(j, "image", profile.image);
    ReadValue(j, "securityOpts", profile.security_opts);
    ReadValue(j, "capAdd", profile.capabilities_add);

    if (j.contains("environment")) {
        for (const auto& [key, value] : j.at("environment").items()) {
            profile.environment_vars[key] = value.get<std::string>();
        }
    }

    if (j.contains("mounts")) {
        profile.extra_mounts.clear();
        for (const auto& mount : j.at("mounts")) {
            utils::VolumeMount volume;
            volume.source = mount.at("source").get<std::string>();
            volume.target = mount.at("target").get<std::string>();
            volume.read_only = mount.value("readOnly", false);
            profile.extra_mounts.push_back(volume);
        }
    }
}

} // anonymous namespace

PoolConfig ParsePoolConfig(const std::string& json_text) {
    PoolConfig config;

    try {
        json j = json::parse(json_text);
        if (!j.is_object()) {
            throw std::invalid_argument("configuration must be a JSON object");
        }

        ReadValue(j, "poolSize", config.pool_size);
        ReadValue(j, "warmupAgentTypes", config.warmup_agent_types);
        ReadValue(j, "minPoolSize", config.min_pool_size);
        ReadValue(j, "maxPoolSize", config.max_pool_size);
        ReadValue(j, "enableContainerReuse", config.enable_container_reuse);

        ReadMillis(j, "maxContainerAgeMs", config.max_container_age);
        ReadMillis(j, "healthCheckIntervalMs", config.health_check_interval);
        ReadMillis(j, "idleTimeoutMs", config.idle_timeout);
        ReadMillis(j, "refreshDelayMs", config.refresh_delay);

        ReadValue(j, "autoScaling", config.auto_scaling);
        ReadValue(j, "scaleUpThreshold", config.scale_up_threshold);
        ReadValue(j, "scaleDownThreshold", config.scale_down_threshold);
        ReadMillis(j, "scaleCooldownMs", config.scale_cooldown);

        ReadValue(j, "dockerBinary", config.docker_binary);
        ReadValue(j, "image", config.image);
        ReadValue(j, "agentBinary", config.agent_binary);
        ReadMillis(j, "commandTimeoutMs", config.command_timeout);
        ReadMillis(j, "defaultTaskTimeoutMs", config.default_task_timeout);
        if (j.contains("stopGraceSeconds")) {
            config.stop_grace = std::chrono::seconds(j.at("stopGraceSeconds").get<long long>());
        }

        ReadMillis(j, "shutdownDrainTimeoutMs", config.shutdown_drain_timeout);
        ReadValue(j, "metricsWindow", config.metrics_window);

        if (j.contains("agentProfiles")) {
            for (const auto& [type_name, profile_json] : j.at("agentProfiles").items()) {
                if (type_name == "default" || type_name == "unknown") {
                    MergeProfile(profile_json, config.default_profile);
                    continue;
                }
                AgentType type = ParseAgentType(type_name);
                if (type == AgentType::Unknown) {
                    spdlog::warn("Ignoring profile for unknown agent type '{}'", type_name);
                    continue;
                }
                MergeProfile(profile_json, config.agent_profiles[type]);
            }
        }
    } catch (const json::exception& e) {
        throw std::invalid_argument(std::string("Invalid configuration: ") + e.what());
    }

    return config;
}

PoolConfig LoadPoolConfig(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open configuration file: " + path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    spdlog::info("Loading configuration from {}", path.string());
    return ParsePoolConfig(buffer.str());
}

void ValidatePoolConfig(const PoolConfig& config) {
    if (config.max_pool_size == 0) {
        throw std::invalid_argument("maxPoolSize must be at least 1");
    }
    if (config.min_pool_size > config.max_pool_size) {
        throw std::invalid_argument("minPoolSize must not exceed maxPoolSize");
    }
    if (config.pool_size > config.max_pool_size) {
        throw std::invalid_argument("poolSize must not exceed maxPoolSize");
    }
    if (config.scale_down_threshold < 0.0 || config.scale_up_threshold > 1.0 ||
        config.scale_down_threshold >= config.scale_up_threshold) {
        throw std::invalid_argument(
            "scale thresholds must satisfy 0 <= scaleDownThreshold < scaleUpThreshold <= 1");
    }
    if (config.health_check_interval.count() <= 0 || config.idle_timeout.count() <= 1 ||
        config.max_container_age.count() <= 0) {
        throw std::invalid_argument("lifecycle intervals must be positive");
    }
    if (config.command_timeout.count() <= 0 || config.default_task_timeout.count() <= 0) {
        throw std::invalid_argument("timeouts must be positive");
    }
    if (config.refresh_delay.count() < 0 || config.scale_cooldown.count() < 0 ||
        config.shutdown_drain_timeout.count() < 0) {
        throw std::invalid_argument("delays must not be negative");
    }
    if (config.metrics_window == 0) {
        throw std::invalid_argument("metricsWindow must be at least 1");
    }
    if (config.image.empty() || config.docker_binary.empty() || config.agent_binary.empty()) {
        throw std::invalid_argument("image, dockerBinary and agentBinary must be set");
    }
}

} // namespace core
} // namespace sandpool
