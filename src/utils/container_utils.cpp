/**
 * @file container_utils.cpp
 * @brief Implementation of the sandbox engine control plane
 *
 * Every method maps to exactly one engine subcommand (StopContainer may add a
 * second `kill`). Arguments are passed as a vector to execvp, never through a
 * shell, so task descriptions cannot inject engine flags.
 *
 * **Container Lifecycle**:
 * ```
 * create -> start -> exec ... exec -> stop -> rm
 * ```
 *
 * **Hardening Flags** (from ContainerConfig):
 * - --read-only, --tmpfs for writable scratch space
 * - --cap-drop ALL, --security-opt no-new-privileges:true
 * - --memory, --cpu-shares, --cpu-period/--cpu-quota, --ulimit, --oom-score-adj
 * - --user, --network, named volume mounts
 *
 * @date 2025
 */

#include "sandpool/utils/container_utils.hpp"

#include "sandpool/core/errors.hpp"
#include "sandpool/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <utility>

namespace sandpool {
namespace utils {

using json = nlohmann::json;

namespace {

// CFS period the quota is expressed against, and the relative weight of one CPU
constexpr long kCpuPeriodUs = 100000;
constexpr double kCpuSharesPerCpu = 1024.0;

std::string FirstLine(const std::string& output) {
    std::string trimmed = StringUtils::Trim(output);
    auto newline = trimmed.find('\n');
    return newline == std::string::npos ? trimmed : StringUtils::Trim(trimmed.substr(0, newline));
}

double ParsePercent(std::string value) {
    value.erase(std::remove(value.begin(), value.end(), '%'), value.end());
    value = StringUtils::Trim(value);
    if (value.empty() || value == "--") {
        return 0.0;
    }
    try {
        return std::stod(value);
    } catch (const std::exception&) {
        return 0.0;
    }
}

void AppendLabels(std::vector<std::string>& args,
                  const std::map<std::string, std::string>& labels) {
    for (const auto& [key, value] : labels) {
        args.push_back("--label");
        args.push_back(key + "=" + value);
    }
}

} // anonymous namespace

ContainerUtils::ContainerUtils(std::shared_ptr<CommandRunner> runner,
                               std::chrono::milliseconds command_timeout)
    : runner_(std::move(runner))
    , command_timeout_(command_timeout) {
    if (!runner_) {
        throw std::invalid_argument("ContainerUtils requires a command runner");
    }
}

CommandResult ContainerUtils::Run(const std::vector<std::string>& args,
                                  std::chrono::milliseconds timeout) const {
    return runner_->Run(args, timeout);
}

CommandResult ContainerUtils::RunChecked(const std::vector<std::string>& args,
                                         const std::string& what) const {
    auto result = runner_->Run(args, command_timeout_);
    if (!result.success) {
        spdlog::debug("{} failed: {}", what, StringUtils::Trim(result.stderr_output));
        throw core::RuntimeError(what, result.exit_code, StringUtils::Trim(result.stderr_output));
    }
    return result;
}

// ============================================================================
// RUNTIME DETECTION
// ============================================================================

bool ContainerUtils::IsRuntimeAvailable() const {
    try {
        auto result = runner_->Run({"version", "--format", "{{.Server.Version}}"}, command_timeout_);
        return result.success;
    } catch (const core::SandpoolError& e) {
        spdlog::warn("Sandbox engine not available: {}", e.what());
        return false;
    }
}

std::string ContainerUtils::GetRuntimeVersion() const {
    try {
        auto result = runner_->Run({"version", "--format", "{{.Server.Version}}"}, command_timeout_);
        if (result.success) {
            return FirstLine(result.stdout_output);
        }
    } catch (const core::SandpoolError& e) {
        spdlog::debug("Version query failed: {}", e.what());
    }
    return "unknown";
}

// ============================================================================
// CONTAINER LIFECYCLE MANAGEMENT
// ============================================================================

std::string ContainerUtils::CreateContainer(const ContainerConfig& config) const {
    spdlog::debug("Creating container {} from {}", config.name, config.image);

    auto result = RunChecked(BuildCreateArgs(config), "Failed to create container " + config.name);
    std::string container_id = FirstLine(result.stdout_output);

    spdlog::debug("Container created: {} ({})", config.name, container_id);
    return container_id;
}

void ContainerUtils::StartContainer(const std::string& container) const {
    RunChecked({"start", container}, "Failed to start container " + container);
    spdlog::debug("Container started: {}", container);
}

void ContainerUtils::StopContainer(const std::string& container,
                                   std::chrono::seconds grace) const {
    try {
        RunChecked({"stop", "--time", std::to_string(grace.count()), container},
                   "Failed to stop container " + container);
        return;
    } catch (const core::RuntimeError& e) {
        spdlog::warn("Graceful stop failed for {}, killing: {}", container, e.what());
    }

    RunChecked({"kill", container}, "Failed to kill container " + container);
}

void ContainerUtils::RemoveContainer(const std::string& container, bool force) const {
    std::vector<std::string> args{"rm"};
    if (force) {
        args.push_back("-f");
    }
    args.push_back(container);
    RunChecked(args, "Failed to remove container " + container);
    spdlog::debug("Container removed: {}", container);
}

// ============================================================================
// CONTAINER EXECUTION
// ============================================================================

ContainerExecResult ContainerUtils::ExecuteCommand(const std::string& container,
                                                   const std::vector<std::string>& command,
                                                   std::chrono::milliseconds timeout) const {
    std::vector<std::string> args{"exec", container};
    args.insert(args.end(), command.begin(), command.end());

    auto result = runner_->Run(args, timeout);

    ContainerExecResult exec_result;
    exec_result.exit_code = result.exit_code;
    exec_result.stdout_output = std::move(result.stdout_output);
    exec_result.stderr_output = std::move(result.stderr_output);
    exec_result.duration = result.duration;
    exec_result.success = result.success;
    return exec_result;
}

// ============================================================================
// CONTAINER INSPECTION
// ============================================================================

ContainerState ContainerUtils::GetContainerState(const std::string& container) const {
    auto result = RunChecked({"inspect", "--format", "{{.State.Status}}", container},
                             "Failed to inspect container " + container);
    return ParseState(FirstLine(result.stdout_output));
}

ContainerStats ContainerUtils::GetContainerStats(const std::string& container) const {
    auto result = RunChecked({"stats", "--no-stream", "--format", "{{json .}}", container},
                             "Failed to read stats for " + container);
    try {
        return ParseStatsOutput(FirstLine(result.stdout_output));
    } catch (const json::exception& e) {
        throw core::RuntimeError("Unparseable stats for " + container, 0, e.what());
    }
}

// ============================================================================
// NETWORKS AND VOLUMES
// ============================================================================

std::string ContainerUtils::CreateNetwork(const std::string& name,
                                          const std::map<std::string, std::string>& labels,
                                          bool internal) const {
    std::vector<std::string> args{"network", "create", "--driver", "bridge"};
    if (internal) {
        args.push_back("--internal");
    }
    AppendLabels(args, labels);
    args.push_back(name);

    RunChecked(args, "Failed to create network " + name);
    spdlog::debug("Network created: {}", name);
    return name;
}

void ContainerUtils::RemoveNetwork(const std::string& name) const {
    RunChecked({"network", "rm", name}, "Failed to remove network " + name);
}

std::string ContainerUtils::CreateVolume(const std::string& name,
                                         const std::map<std::string, std::string>& labels) const {
    std::vector<std::string> args{"volume", "create"};
    AppendLabels(args, labels);
    args.push_back(name);

    RunChecked(args, "Failed to create volume " + name);
    spdlog::debug("Volume created: {}", name);
    return name;
}

void ContainerUtils::RemoveVolume(const std::string& name) const {
    RunChecked({"volume", "rm", "-f", name}, "Failed to remove volume " + name);
}

// ============================================================================
// COMMAND BUILDING AND PARSING
// ============================================================================

std::vector<std::string> ContainerUtils::BuildCreateArgs(const ContainerConfig& config) {
    std::vector<std::string> args;
    args.push_back("create");

    if (!config.name.empty()) {
        args.push_back("--name");
        args.push_back(config.name);
    }

    // Resource limits
    if (config.memory_limit_mb > 0) {
        args.push_back("--memory");
        args.push_back(std::to_string(config.memory_limit_mb) + "m");
    }
    // The engine rejects --cpus together with --cpu-quota, so the share is a weight
    if (config.cpu_limit > 0) {
        args.push_back("--cpu-shares");
        args.push_back(std::to_string(std::max(2L, std::lround(config.cpu_limit * kCpuSharesPerCpu))));
    }
    if (config.cpu_quota > 0) {
        args.push_back("--cpu-period");
        args.push_back(std::to_string(kCpuPeriodUs));
        args.push_back("--cpu-quota");
        args.push_back(std::to_string(config.cpu_quota));
    }
    for (const auto& ulimit : config.ulimits) {
        args.push_back("--ulimit");
        args.push_back(ulimit.name + "=" + std::to_string(ulimit.soft) + ":" +
                       std::to_string(ulimit.hard));
    }
    args.push_back("--oom-score-adj");
    args.push_back(std::to_string(config.oom_score_adj));

    // Network
    if (!config.network.empty()) {
        args.push_back("--network");
        args.push_back(config.network);
    }

    // Security
    if (config.read_only_rootfs) {
        args.push_back("--read-only");
    }
    if (config.no_new_privileges) {
        args.push_back("--security-opt");
        args.push_back("no-new-privileges:true");
    }
    for (const auto& opt : config.security_opts) {
        args.push_back("--security-opt");
        args.push_back(opt);
    }
    for (const auto& cap : config.capabilities_drop) {
        args.push_back("--cap-drop");
        args.push_back(cap);
    }
    for (const auto& cap : config.capabilities_add) {
        args.push_back("--cap-add");
        args.push_back(cap);
    }
    if (!config.user.empty()) {
        args.push_back("--user");
        args.push_back(config.user);
    }

    // Filesystem
    for (const auto& [target, options] : config.tmpfs) {
        args.push_back("--tmpfs");
        args.push_back(options.empty() ? target : target + ":" + options);
    }
    for (const auto& volume : config.volumes) {
        args.push_back("-v");
        args.push_back(volume.source + ":" + volume.target + (volume.read_only ? ":ro" : ""));
    }
    if (!config.working_dir.empty()) {
        args.push_back("--workdir");
        args.push_back(config.working_dir);
    }

    // Metadata
    for (const auto& [key, value] : config.environment_vars) {
        args.push_back("-e");
        args.push_back(key + "=" + value);
    }
    AppendLabels(args, config.labels);

    args.push_back(config.image);
    args.insert(args.end(), config.command.begin(), config.command.end());

    return args;
}

ContainerStats ContainerUtils::ParseStatsOutput(const std::string& json_str) {
    json j = json::parse(json_str);

    ContainerStats stats;
    stats.timestamp = std::chrono::system_clock::now();

    if (j.contains("CPUPerc")) {
        stats.cpu_usage_percent = ParsePercent(j["CPUPerc"].get<std::string>());
    }

    // "12.5MiB / 512MiB"
    if (j.contains("MemUsage")) {
        auto parts = StringUtils::Split(j["MemUsage"].get<std::string>(), '/');
        if (!parts.empty()) {
            stats.memory_usage_bytes = StringUtils::ParseByteSize(parts[0]);
        }
        if (parts.size() > 1) {
            stats.memory_limit_bytes = StringUtils::ParseByteSize(parts[1]);
        }
    }

    if (j.contains("MemPerc")) {
        stats.memory_usage_percent = ParsePercent(j["MemPerc"].get<std::string>());
    }

    // "1.2kB / 648B" (rx / tx)
    if (j.contains("NetIO")) {
        auto parts = StringUtils::Split(j["NetIO"].get<std::string>(), '/');
        if (!parts.empty()) {
            stats.network_rx_bytes = StringUtils::ParseByteSize(parts[0]);
        }
        if (parts.size() > 1) {
            stats.network_tx_bytes = StringUtils::ParseByteSize(parts[1]);
        }
    }

    // "8.19kB / 0B" (read / write)
    if (j.contains("BlockIO")) {
        auto parts = StringUtils::Split(j["BlockIO"].get<std::string>(), '/');
        if (!parts.empty()) {
            stats.block_read_bytes = StringUtils::ParseByteSize(parts[0]);
        }
        if (parts.size() > 1) {
            stats.block_write_bytes = StringUtils::ParseByteSize(parts[1]);
        }
    }

    if (j.contains("PIDs")) {
        try {
            stats.process_count = std::stoi(j["PIDs"].get<std::string>());
        } catch (const std::exception&) {
            stats.process_count = 0;
        }
    }

    return stats;
}

ContainerState ContainerUtils::ParseState(const std::string& state_str) {
    std::string state = StringUtils::ToLower(StringUtils::Trim(state_str));
    if (state == "created") return ContainerState::CREATED;
    if (state == "running") return ContainerState::RUNNING;
    if (state == "paused") return ContainerState::PAUSED;
    if (state == "removing" || state == "stopped") return ContainerState::STOPPED;
    if (state == "exited") return ContainerState::EXITED;
    if (state == "dead") return ContainerState::DEAD;
    return ContainerState::UNKNOWN;
}

std::string ContainerUtils::StateToString(ContainerState state) {
    switch (state) {
        case ContainerState::CREATED: return "created";
        case ContainerState::RUNNING: return "running";
        case ContainerState::PAUSED: return "paused";
        case ContainerState::STOPPED: return "stopped";
        case ContainerState::EXITED: return "exited";
        case ContainerState::DEAD: return "dead";
        default: return "unknown";
    }
}

} // namespace utils
} // namespace sandpool
