/**
 * @file scheduler.cpp
 * @brief Implementation of periodic and delayed background tasks
 *
 * @date 2025
 */

#include "sandpool/utils/scheduler.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <stdexcept>
#include <utility>

namespace sandpool {
namespace utils {

namespace {

void JoinUnlessSelf(std::thread& thread) {
    if (!thread.joinable()) {
        return;
    }
    if (thread.get_id() == std::this_thread::get_id()) {
        // Stopped from inside its own callback
        thread.detach();
    } else {
        thread.join();
    }
}

} // anonymous namespace

// ============================================================================
// PERIODIC TASK
// ============================================================================

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds interval,
                           std::function<void()> callback)
    : name_(std::move(name))
    , interval_(interval)
    , callback_(std::move(callback)) {
    if (interval_.count() <= 0) {
        throw std::invalid_argument("PeriodicTask interval must be positive: " + name_);
    }
}

PeriodicTask::~PeriodicTask() {
    Stop();
}

void PeriodicTask::Start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        return;
    }
    stop_requested_ = false;
    running_ = true;
    thread_ = std::thread(&PeriodicTask::Loop, this);
    spdlog::debug("Started periodic task '{}' ({} ms)", name_, interval_.count());
}

void PeriodicTask::Stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        stop_requested_ = true;
    }
    cv_.notify_all();
    JoinUnlessSelf(thread_);
    running_ = false;
    spdlog::debug("Stopped periodic task '{}'", name_);
}

void PeriodicTask::Loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_requested_) {
        if (cv_.wait_for(lock, interval_, [this] { return stop_requested_; })) {
            break;
        }

        lock.unlock();
        try {
            callback_();
        } catch (const std::exception& e) {
            spdlog::error("Periodic task '{}' failed: {}", name_, e.what());
        }
        ++run_count_;
        lock.lock();
    }
}

// ============================================================================
// DELAYED TASK QUEUE
// ============================================================================

DelayedTaskQueue::DelayedTaskQueue(std::string name)
    : name_(std::move(name)) {
}

DelayedTaskQueue::~DelayedTaskQueue() {
    Stop();
}

void DelayedTaskQueue::Start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        return;
    }
    running_ = true;
    thread_ = std::thread(&DelayedTaskQueue::Loop, this);
}

void DelayedTaskQueue::Stop() {
    std::size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
        dropped = tasks_.size();
        tasks_.clear();
    }
    cv_.notify_all();
    JoinUnlessSelf(thread_);

    if (dropped > 0) {
        spdlog::debug("Delayed task queue '{}' dropped {} pending tasks", name_, dropped);
    }
}

bool DelayedTaskQueue::Schedule(std::chrono::milliseconds delay, std::function<void()> callback) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return false;
        }
        tasks_.emplace(Clock::now() + delay, std::move(callback));
    }
    cv_.notify_all();
    return true;
}

std::size_t DelayedTaskQueue::Pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

void DelayedTaskQueue::Loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_) {
        if (tasks_.empty()) {
            cv_.wait(lock, [this] { return !running_ || !tasks_.empty(); });
            continue;
        }

        auto due = tasks_.begin()->first;
        if (Clock::now() < due) {
            cv_.wait_until(lock, due);
            continue;
        }

        auto callback = std::move(tasks_.begin()->second);
        tasks_.erase(tasks_.begin());

        lock.unlock();
        try {
            callback();
        } catch (const std::exception& e) {
            spdlog::error("Delayed task in '{}' failed: {}", name_, e.what());
        }
        lock.lock();
    }
}

} // namespace utils
} // namespace sandpool
