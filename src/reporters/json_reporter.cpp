/**
 * @file json_reporter.cpp
 * @brief Implementation of JSON rendering
 *
 * **Result Document**:
 * ```json
 * {
 *   "success": true,
 *   "exitCode": 0,
 *   "durationMs": 412,
 *   "output": "...",
 *   "error": "",
 *   "resourceUsage": { "cpuPercent": 1.5, "memoryBytes": 12582912, ... },
 *   "metadata": { "execution_mode": "pooled-docker", ... }
 * }
 * ```
 *
 * @date 2025
 */

#include "sandpool/reporters/json_reporter.hpp"

#include "sandpool/utils/string_utils.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <stdexcept>

namespace sandpool {
namespace reporters {

using json = nlohmann::json;

namespace {

std::string FormatTimestamp(std::chrono::system_clock::time_point tp) {
    return std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count());
}

json ResultToJson(const core::ExecutionResult& result, std::size_t max_output_bytes) {
    auto clip = [max_output_bytes](const std::string& text) {
        return max_output_bytes == 0 ? text
                                     : utils::StringUtils::Truncate(text, max_output_bytes);
    };

    json j;
    j["success"] = result.success;
    j["exitCode"] = result.exit_code;
    j["durationMs"] = result.duration.count();
    j["output"] = clip(result.output);
    j["error"] = clip(result.error);
    j["resourceUsage"] = {
        {"cpuPercent", result.resource_usage.cpu_percent},
        {"memoryBytes", result.resource_usage.memory_bytes},
        {"diskIoBytes", result.resource_usage.disk_io_bytes},
        {"networkIoBytes", result.resource_usage.network_io_bytes},
        {"pids", result.resource_usage.pids},
    };
    j["metadata"] = result.metadata;
    return j;
}

} // anonymous namespace

JsonReporter::JsonReporter(JsonReporterConfig config)
    : config_(config) {
}

std::string JsonReporter::Render(const core::ExecutionResult& result) const {
    return ResultToJson(result, config_.max_output_bytes)
        .dump(config_.pretty_print ? config_.indent_size : -1);
}

std::string JsonReporter::Render(const std::vector<core::ExecutionResult>& results) const {
    json array = json::array();
    for (const auto& result : results) {
        array.push_back(ResultToJson(result, config_.max_output_bytes));
    }
    return array.dump(config_.pretty_print ? config_.indent_size : -1);
}

std::string JsonReporter::Render(const core::PoolMetricsSnapshot& snapshot) const {
    json j;
    j["totalContainers"] = snapshot.total_containers;
    j["activeContainers"] = snapshot.active_containers;
    j["idleContainers"] = snapshot.idle_containers;
    j["healthyContainers"] = snapshot.healthy_containers;
    j["unhealthyContainers"] = snapshot.unhealthy_containers;
    j["containersByType"] = snapshot.containers_by_type;
    j["utilization"] = snapshot.utilization;
    j["hitRate"] = snapshot.hit_rate;
    j["poolHits"] = snapshot.pool_hits;
    j["poolMisses"] = snapshot.pool_misses;
    j["failures"] = snapshot.failures;
    j["averageExecutionMs"] = snapshot.average_execution_ms;
    j["averageExecutionMsByType"] = snapshot.average_execution_ms_by_type;
    j["generatedAt"] = FormatTimestamp(snapshot.generated_at);
    return j.dump(config_.pretty_print ? config_.indent_size : -1);
}

std::string JsonReporter::Render(const core::PoolContents& pools) const {
    json j = json::object();
    for (const auto& [agent_type, instances] : pools) {
        json array = json::array();
        for (const auto& instance : instances) {
            array.push_back({
                {"instanceId", instance.instance_id},
                {"containerName", instance.container_name},
                {"networkId", instance.network_id},
                {"volumeId", instance.volume_id},
                {"createdAt", FormatTimestamp(instance.created_at)},
                {"lastUsedAt", FormatTimestamp(instance.last_used_at)},
                {"executionCount", instance.execution_count},
                {"healthy", instance.healthy},
                {"inUse", instance.in_use},
                {"refreshPending", instance.refresh_pending},
            });
        }
        j[agent_type] = array;
    }
    return j.dump(config_.pretty_print ? config_.indent_size : -1);
}

void JsonReporter::WriteToFile(const std::filesystem::path& path, const std::string& content) const {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot write report: " + path.string());
    }
    file << content << "\n";
    if (!file) {
        throw std::runtime_error("Failed writing report: " + path.string());
    }
}

} // namespace reporters
} // namespace sandpool
