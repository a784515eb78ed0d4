/**
 * @file process_runner.cpp
 * @brief fork/exec command execution with output capture and hard deadlines
 *
 * **Execution Workflow**:
 * 1. Create CLOEXEC pipes for stdout and stderr
 * 2. fork(); the child joins a new process group, redirects stdin to
 *    /dev/null and its output to the pipes, then execvp()s the binary
 * 3. The parent poll()s both pipes until they close or the deadline passes
 * 4. waitpid() with the remaining budget
 * 5. On expiry: SIGKILL to the process group, reap, throw TimeoutError
 *
 * @date 2025
 */

#include "sandpool/utils/process_runner.hpp"

#include "sandpool/core/errors.hpp"
#include "sandpool/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <climits>
#include <cstring>
#include <thread>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace sandpool {
namespace utils {

namespace {

using Clock = std::chrono::steady_clock;

void CloseFd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

int RemainingMillis(Clock::time_point deadline) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - Clock::now()).count();
    if (remaining <= 0) {
        return 0;
    }
    return remaining > INT_MAX ? INT_MAX : static_cast<int>(remaining);
}

// Drain whatever is readable; returns false once the pipe is closed
bool ReadAvailable(int fd, std::string& sink) {
    std::array<char, 4096> buffer;
    ssize_t n = read(fd, buffer.data(), buffer.size());
    if (n > 0) {
        sink.append(buffer.data(), static_cast<std::size_t>(n));
        return true;
    }
    if (n == 0) {
        return false;
    }
    return errno == EINTR || errno == EAGAIN;
}

int DecodeStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

} // anonymous namespace

ProcessRunner::ProcessRunner(std::string binary)
    : binary_(std::move(binary)) {
}

CommandResult ProcessRunner::Run(const std::vector<std::string>& args,
                                 std::chrono::milliseconds timeout) {
    std::vector<std::string> argv_storage;
    argv_storage.reserve(args.size() + 1);
    argv_storage.push_back(binary_);
    argv_storage.insert(argv_storage.end(), args.begin(), args.end());

    std::vector<char*> argv;
    argv.reserve(argv_storage.size() + 1);
    for (auto& arg : argv_storage) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    const std::string command_line = StringUtils::Truncate(StringUtils::Join(argv_storage, " "), 200);
    const std::string exec_failure = "failed to execute " + binary_ + "\n";

    spdlog::debug("Executing: {}", command_line);

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    if (pipe2(stdout_pipe, O_CLOEXEC) == -1) {
        throw core::RuntimeError("Failed to create pipes", -1, std::strerror(errno));
    }
    if (pipe2(stderr_pipe, O_CLOEXEC) == -1) {
        int saved = errno;
        CloseFd(stdout_pipe[0]);
        CloseFd(stdout_pipe[1]);
        throw core::RuntimeError("Failed to create pipes", -1, std::strerror(saved));
    }

    auto start_time = Clock::now();
    auto deadline = start_time + timeout;

    pid_t pid = fork();
    if (pid == -1) {
        int saved = errno;
        CloseFd(stdout_pipe[0]);
        CloseFd(stdout_pipe[1]);
        CloseFd(stderr_pipe[0]);
        CloseFd(stderr_pipe[1]);
        throw core::RuntimeError("Failed to fork process", -1, std::strerror(saved));
    }

    if (pid == 0) {
        // Child process: only async-signal-safe calls from here on
        setpgid(0, 0);

        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);

        execvp(argv[0], argv.data());

        ssize_t ignored = write(STDERR_FILENO, exec_failure.data(), exec_failure.size());
        (void)ignored;
        _exit(127);
    }

    // Parent process; set the group here too so kill(-pid) works even if
    // the child has not run setpgid yet
    setpgid(pid, pid);
    CloseFd(stdout_pipe[1]);
    CloseFd(stderr_pipe[1]);

    CommandResult result;
    bool timed_out = false;

    int out_fd = stdout_pipe[0];
    int err_fd = stderr_pipe[0];

    while (out_fd >= 0 || err_fd >= 0) {
        int wait_ms = RemainingMillis(deadline);
        if (wait_ms == 0) {
            timed_out = true;
            break;
        }

        std::array<pollfd, 2> fds{};
        nfds_t count = 0;
        if (out_fd >= 0) {
            fds[count++] = pollfd{out_fd, POLLIN, 0};
        }
        if (err_fd >= 0) {
            fds[count++] = pollfd{err_fd, POLLIN, 0};
        }

        int ready = poll(fds.data(), count, wait_ms);
        if (ready == -1) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::warn("poll() failed for {}: {}", command_line, std::strerror(errno));
            break;
        }
        if (ready == 0) {
            continue;
        }

        for (nfds_t i = 0; i < count; ++i) {
            if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                continue;
            }
            if (fds[i].fd == out_fd) {
                if (!ReadAvailable(out_fd, result.stdout_output)) {
                    CloseFd(out_fd);
                }
            } else if (fds[i].fd == err_fd) {
                if (!ReadAvailable(err_fd, result.stderr_output)) {
                    CloseFd(err_fd);
                }
            }
        }
    }

    int status = 0;
    bool reaped = false;
    while (!timed_out) {
        pid_t waited = waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            reaped = true;
            break;
        }
        if (waited == -1 && errno != EINTR) {
            spdlog::warn("waitpid() failed for {}: {}", command_line, std::strerror(errno));
            break;
        }
        if (RemainingMillis(deadline) == 0) {
            timed_out = true;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    if (timed_out) {
        spdlog::warn("Deadline of {} ms exceeded, killing pid {}: {}",
                     timeout.count(), pid, command_line);
        kill(-pid, SIGKILL);
        kill(pid, SIGKILL);
        while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {
        }
        CloseFd(out_fd);
        CloseFd(err_fd);
        throw core::TimeoutError(command_line, pid, timeout);
    }

    CloseFd(out_fd);
    CloseFd(err_fd);

    result.exit_code = reaped ? DecodeStatus(status) : -1;
    result.success = (result.exit_code == 0);
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        Clock::now() - start_time);

    return result;
}

} // namespace utils
} // namespace sandpool
