/**
 * @file process_runner.hpp
 * @brief Deadline-bounded external command execution
 *
 * Every call to the sandbox engine goes through a CommandRunner. The
 * production implementation forks one process per call, captures its
 * output and kills its whole process group when the deadline expires.
 * Tests substitute a scripted runner.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace sandpool {
namespace utils {

/**
 * @struct CommandResult
 * @brief Outcome of one external command
 */
struct CommandResult {
    int exit_code{0};                       ///< Exit status (128 + signal if signalled)
    std::string stdout_output;              ///< Standard output
    std::string stderr_output;              ///< Standard error
    std::chrono::milliseconds duration{0};  ///< Wall time
    bool success{false};                    ///< exit_code == 0
};

/**
 * @class CommandRunner
 * @brief Runs one command line against a fixed binary
 */
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    /**
     * @brief Run the binary with the given arguments
     *
     * @param args Arguments, not including the binary itself
     * @param timeout Hard deadline for the whole call
     * @return Exit status and captured output
     *
     * @throws core::TimeoutError if the deadline expires (process is killed)
     * @throws core::RuntimeError if the process cannot be spawned
     */
    virtual CommandResult Run(const std::vector<std::string>& args,
                              std::chrono::milliseconds timeout) = 0;
};

/**
 * @class ProcessRunner
 * @brief fork/exec implementation of CommandRunner
 *
 * stdin is /dev/null, stdout and stderr are read through pipes with
 * poll(). The child runs in its own process group so that SIGKILL on
 * timeout also reaches anything it spawned.
 *
 * **Thread Safety**: Run() may be called concurrently; each call owns its
 * own process and pipes.
 */
class ProcessRunner : public CommandRunner {
public:
    /**
     * @param binary Executable resolved through PATH (default: docker)
     */
    explicit ProcessRunner(std::string binary = "docker");

    CommandResult Run(const std::vector<std::string>& args,
                      std::chrono::milliseconds timeout) override;

    const std::string& Binary() const { return binary_; }

private:
    std::string binary_;  ///< Executable name or path
};

} // namespace utils
} // namespace sandpool
