/**
 * @file scheduler.hpp
 * @brief Background timers with explicit start/stop
 *
 * PeriodicTask runs a callback on a fixed interval on its own thread.
 * DelayedTaskQueue runs one-shot callbacks after a delay on a single worker
 * thread. Both stop promptly: Stop() wakes the thread and joins it, and
 * callbacks that have not started yet are dropped.
 *
 * @date 2025
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace sandpool {
namespace utils {

/**
 * @class PeriodicTask
 * @brief Fixed-interval background loop
 *
 * The first run happens one interval after Start(). Exceptions thrown by the
 * callback are logged and the loop continues.
 */
class PeriodicTask {
public:
    PeriodicTask(std::string name, std::chrono::milliseconds interval,
                 std::function<void()> callback);
    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    void Start();

    /**
     * @brief Signal the loop and join it; waits for a running callback
     */
    void Stop();

    bool IsRunning() const { return running_; }
    std::uint64_t RunCount() const { return run_count_; }
    const std::string& Name() const { return name_; }

private:
    void Loop();

    std::string name_;
    std::chrono::milliseconds interval_;
    std::function<void()> callback_;

    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_requested_{false};
    std::atomic<bool> running_{false};
    std::atomic<std::uint64_t> run_count_{0};
};

/**
 * @class DelayedTaskQueue
 * @brief One-shot callbacks executed after a delay
 *
 * Used for deferred refreshes and scaling cooldowns. Callbacks run
 * sequentially on one worker thread in due-time order.
 */
class DelayedTaskQueue {
public:
    explicit DelayedTaskQueue(std::string name = "delayed-tasks");
    ~DelayedTaskQueue();

    DelayedTaskQueue(const DelayedTaskQueue&) = delete;
    DelayedTaskQueue& operator=(const DelayedTaskQueue&) = delete;

    void Start();

    /**
     * @brief Stop the worker, dropping callbacks not yet started
     */
    void Stop();

    /**
     * @brief Queue a callback
     * @return false if the queue is not running (callback dropped)
     */
    bool Schedule(std::chrono::milliseconds delay, std::function<void()> callback);

    std::size_t Pending() const;

private:
    using Clock = std::chrono::steady_clock;

    void Loop();

    std::string name_;
    std::thread thread_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::multimap<Clock::time_point, std::function<void()>> tasks_;
    bool running_{false};
};

} // namespace utils
} // namespace sandpool
