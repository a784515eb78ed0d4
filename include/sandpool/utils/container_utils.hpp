/**
 * @file container_utils.hpp
 * @brief Sandbox engine control plane (docker CLI) with deadlines and typed errors
 *
 * Thin gateway over the engine's command-line interface. Every operation is
 * one external command run through a CommandRunner with a hard deadline.
 * Non-zero exits become core::RuntimeError, expired deadlines become
 * core::TimeoutError. The only exception is ExecuteCommand(), whose exit
 * code belongs to the task and is returned as data.
 *
 * @date 2025
 */

#pragma once

#include "sandpool/utils/process_runner.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace sandpool {
namespace utils {

/**
 * @enum ContainerState
 * @brief Container lifecycle states as reported by inspect
 */
enum class ContainerState {
    CREATED,   ///< Container created but not started
    RUNNING,   ///< Container is running
    PAUSED,    ///< Container paused
    STOPPED,   ///< Container stopped gracefully
    EXITED,    ///< Container exited
    DEAD,      ///< Container is dead
    UNKNOWN    ///< Unknown state
};

/**
 * @struct VolumeMount
 * @brief Named volume mounted into the container
 */
struct VolumeMount {
    std::string source;      ///< Volume name
    std::string target;      ///< Mount point inside the container
    bool read_only{false};   ///< Mount read-only
};

/**
 * @struct Ulimit
 * @brief Per-process resource limit (--ulimit name=soft:hard)
 */
struct Ulimit {
    std::string name;  ///< Limit name (nofile, nproc, ...)
    long soft{0};      ///< Soft limit
    long hard{0};      ///< Hard limit
};

/**
 * @struct ContainerConfig
 * @brief Complete container creation configuration
 */
struct ContainerConfig {
    // Basic Settings
    std::string name;                             ///< Container name
    std::string image{"sandpool-agent:latest"};   ///< Image reference
    std::vector<std::string> command{"sleep", "infinity"};  ///< Keep-alive command

    // Resource Limits
    std::size_t memory_limit_mb{256};   ///< Memory limit
    double cpu_limit{0.5};              ///< CPU share in CPUs (--cpu-shares weight)
    long cpu_quota{50000};              ///< CFS quota per 100ms period (--cpu-quota)
    int oom_score_adj{1000};            ///< OOM killer preference
    std::vector<Ulimit> ulimits;        ///< Ulimits

    // Network Settings
    std::string network;                ///< Network name (empty: engine default)

    // Security Settings
    bool read_only_rootfs{true};                        ///< Read-only root filesystem
    bool no_new_privileges{true};                       ///< Block privilege escalation
    std::vector<std::string> security_opts;             ///< Extra --security-opt values
    std::vector<std::string> capabilities_drop{"ALL"};  ///< Dropped capabilities
    std::vector<std::string> capabilities_add;          ///< Added capabilities
    std::string user{"swarm:swarm"};                    ///< Run as user

    // Filesystem Settings
    std::vector<VolumeMount> volumes;           ///< Named volume mounts
    std::map<std::string, std::string> tmpfs;   ///< tmpfs target -> options
    std::string working_dir{"/workspace"};      ///< Working directory

    // Metadata
    std::map<std::string, std::string> environment_vars;  ///< Environment variables
    std::map<std::string, std::string> labels;            ///< Container labels
};

/**
 * @struct ContainerStats
 * @brief One resource usage snapshot
 */
struct ContainerStats {
    double cpu_usage_percent{0.0};          ///< CPU utilization
    std::uint64_t memory_usage_bytes{0};    ///< Memory usage
    std::uint64_t memory_limit_bytes{0};    ///< Memory limit
    double memory_usage_percent{0.0};       ///< Memory utilization
    std::uint64_t network_rx_bytes{0};      ///< Received bytes
    std::uint64_t network_tx_bytes{0};      ///< Transmitted bytes
    std::uint64_t block_read_bytes{0};      ///< Bytes read
    std::uint64_t block_write_bytes{0};     ///< Bytes written
    int process_count{0};                   ///< Active processes
    std::chrono::system_clock::time_point timestamp;  ///< Snapshot time
};

/**
 * @struct ContainerExecResult
 * @brief Result of a command executed inside a container
 */
struct ContainerExecResult {
    int exit_code{0};                       ///< Exit code
    std::string stdout_output;              ///< Standard output
    std::string stderr_output;              ///< Standard error
    std::chrono::milliseconds duration{0};  ///< Execution duration
    bool success{false};                    ///< Success flag
};

/**
 * @class ContainerUtils
 * @brief Sandbox runtime gateway
 *
 * Stateless apart from the injected runner and the default deadline; one
 * external process per call, so concurrent use from several threads is
 * safe as long as the runner is.
 *
 * **Usage Example**:
 * @code
 * ContainerUtils gateway(std::make_shared<ProcessRunner>("docker"));
 *
 * ContainerConfig config;
 * config.name = "sandpool-coder-1";
 * gateway.CreateContainer(config);
 * gateway.StartContainer(config.name);
 * auto result = gateway.ExecuteCommand(config.name, {"echo", "hi"},
 *                                      std::chrono::seconds(30));
 * gateway.StopContainer(config.name);
 * gateway.RemoveContainer(config.name);
 * @endcode
 */
class ContainerUtils {
public:
    /**
     * @param runner Command runner bound to the engine binary
     * @param command_timeout Deadline for control-plane calls
     */
    explicit ContainerUtils(std::shared_ptr<CommandRunner> runner,
                            std::chrono::milliseconds command_timeout = std::chrono::seconds(30));

    /**
     * @brief Raw primitive: run one engine command
     * @throws core::TimeoutError on deadline expiry
     */
    CommandResult Run(const std::vector<std::string>& args,
                      std::chrono::milliseconds timeout) const;

    /**
     * @brief Check that the engine answers a version query
     * @return true if available (never throws)
     */
    bool IsRuntimeAvailable() const;

    /**
     * @brief Engine version string, "unknown" on failure
     */
    std::string GetRuntimeVersion() const;

    /**
     * @brief Create (but do not start) a container
     * @return Container ID printed by the engine
     * @throws core::RuntimeError on non-zero exit
     */
    std::string CreateContainer(const ContainerConfig& config) const;

    void StartContainer(const std::string& container) const;

    /**
     * @brief Stop a container, falling back to kill if stop fails
     * @param container Container name or ID
     * @param grace Seconds the engine waits before SIGKILL
     */
    void StopContainer(const std::string& container,
                       std::chrono::seconds grace = std::chrono::seconds(10)) const;

    void RemoveContainer(const std::string& container, bool force = true) const;

    /**
     * @brief Execute a command inside a running container
     *
     * The exit code is the command's own result; it is not turned into an
     * exception.
     *
     * @param container Container name or ID
     * @param command Command and arguments
     * @param timeout Deadline for this exec
     * @throws core::TimeoutError if the exec outlives its deadline
     */
    ContainerExecResult ExecuteCommand(const std::string& container,
                                       const std::vector<std::string>& command,
                                       std::chrono::milliseconds timeout) const;

    /**
     * @brief Live state from inspect
     * @throws core::RuntimeError if the container cannot be inspected
     */
    ContainerState GetContainerState(const std::string& container) const;

    /**
     * @brief Single resource usage snapshot
     * @throws core::RuntimeError on non-zero exit or unparseable output
     */
    ContainerStats GetContainerStats(const std::string& container) const;

    /**
     * @brief Create a bridge network
     * @param name Network name
     * @param labels Labels to attach
     * @param internal Disable external connectivity
     * @return Network name
     */
    std::string CreateNetwork(const std::string& name,
                              const std::map<std::string, std::string>& labels,
                              bool internal = true) const;

    void RemoveNetwork(const std::string& name) const;

    /**
     * @brief Create a named volume
     * @return Volume name
     */
    std::string CreateVolume(const std::string& name,
                             const std::map<std::string, std::string>& labels) const;

    void RemoveVolume(const std::string& name) const;

    std::chrono::milliseconds GetCommandTimeout() const { return command_timeout_; }

    /**
     * @brief Translate a configuration into `create` arguments
     *
     * Output starts with "create" and ends with image + command.
     */
    static std::vector<std::string> BuildCreateArgs(const ContainerConfig& config);

    /**
     * @brief Parse one line of `stats --format {{json .}}`
     * @throws nlohmann::json::exception on malformed JSON
     */
    static ContainerStats ParseStatsOutput(const std::string& json_str);

    static ContainerState ParseState(const std::string& state_str);
    static std::string StateToString(ContainerState state);

private:
    std::shared_ptr<CommandRunner> runner_;      ///< Engine command runner
    std::chrono::milliseconds command_timeout_;  ///< Control-plane deadline

    CommandResult RunChecked(const std::vector<std::string>& args,
                             const std::string& what) const;
};

} // namespace utils
} // namespace sandpool
