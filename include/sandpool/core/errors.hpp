/**
 * @file errors.hpp
 * @brief Exception taxonomy for sandbox control-plane and pool failures
 *
 * Infrastructure failures are reported by throwing one of these types.
 * A task that ran but failed is NOT an exception: it comes back as an
 * ExecutionResult with success == false.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <stdexcept>
#include <string>
#include <utility>

#include <sys/types.h>

namespace sandpool {
namespace core {

/**
 * @class SandpoolError
 * @brief Root of all sandpool exceptions
 */
class SandpoolError : public std::runtime_error {
public:
    explicit SandpoolError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @class RuntimeError
 * @brief Sandbox engine command exited with a non-zero status
 */
class RuntimeError : public SandpoolError {
public:
    RuntimeError(const std::string& message, int exit_code, std::string stderr_output)
        : SandpoolError(message + " (exit code " + std::to_string(exit_code) + "): " +
                        stderr_output)
        , exit_code_(exit_code)
        , stderr_output_(std::move(stderr_output)) {}

    int ExitCode() const { return exit_code_; }
    const std::string& StderrOutput() const { return stderr_output_; }

private:
    int exit_code_;              ///< Exit status of the failed command
    std::string stderr_output_;  ///< Captured standard error
};

/**
 * @class TimeoutError
 * @brief Command exceeded its deadline and was force-killed
 */
class TimeoutError : public SandpoolError {
public:
    TimeoutError(const std::string& command, pid_t pid, std::chrono::milliseconds deadline)
        : SandpoolError("Command '" + command + "' exceeded deadline of " +
                        std::to_string(deadline.count()) + " ms")
        , pid_(pid)
        , deadline_(deadline) {}

    pid_t Pid() const { return pid_; }
    std::chrono::milliseconds Deadline() const { return deadline_; }

private:
    pid_t pid_;                           ///< Process that was killed
    std::chrono::milliseconds deadline_;  ///< Deadline that expired
};

/**
 * @class ResourceCreationError
 * @brief Isolated network or volume could not be allocated
 */
class ResourceCreationError : public SandpoolError {
public:
    ResourceCreationError(const std::string& resource, const std::string& owner_id,
                          const std::string& reason)
        : SandpoolError("Failed to create " + resource + " for " + owner_id + ": " + reason) {}
};

/**
 * @class UnhealthyInstanceError
 * @brief An unhealthy instance reached the execution path
 *
 * Checkout never selects unhealthy instances, so this is a guard only.
 */
class UnhealthyInstanceError : public SandpoolError {
public:
    explicit UnhealthyInstanceError(const std::string& instance_id)
        : SandpoolError("Sandbox instance is unhealthy: " + instance_id) {}
};

} // namespace core
} // namespace sandpool
