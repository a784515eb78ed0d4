/**
 * @file pool_metrics.cpp
 * @brief Implementation of pool statistics
 *
 * @date 2025
 */

#include "sandpool/core/pool_metrics.hpp"

#include <numeric>

namespace sandpool {
namespace core {

PoolMetrics::PoolMetrics(std::size_t window)
    : window_(window == 0 ? 1 : window) {
}

void PoolMetrics::RecordHit() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++hits_;
}

void PoolMetrics::RecordMiss() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++misses_;
}

void PoolMetrics::RecordFailure() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++failures_;
}

void PoolMetrics::RecordDuration(const std::string& agent_type,
                                 std::chrono::milliseconds duration) {
    double ms = static_cast<double>(duration.count());

    std::lock_guard<std::mutex> lock(mutex_);
    Push(durations_, ms);
    Push(durations_by_type_[agent_type], ms);
}

void PoolMetrics::Push(std::deque<double>& series, double value) {
    series.push_back(value);
    while (series.size() > window_) {
        series.pop_front();
    }
}

double PoolMetrics::Mean(const std::deque<double>& series) {
    if (series.empty()) {
        return 0.0;
    }
    return std::accumulate(series.begin(), series.end(), 0.0) / static_cast<double>(series.size());
}

std::uint64_t PoolMetrics::Hits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hits_;
}

std::uint64_t PoolMetrics::Misses() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return misses_;
}

std::uint64_t PoolMetrics::Failures() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failures_;
}

double PoolMetrics::HitRate() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::uint64_t total = hits_ + misses_;
    return total == 0 ? 0.0 : static_cast<double>(hits_) / static_cast<double>(total);
}

double PoolMetrics::AverageExecutionMs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return Mean(durations_);
}

double PoolMetrics::AverageExecutionMs(const std::string& agent_type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = durations_by_type_.find(agent_type);
    return it == durations_by_type_.end() ? 0.0 : Mean(it->second);
}

PoolMetricsSnapshot PoolMetrics::BuildSnapshot(const PoolContents& pools) const {
    PoolMetricsSnapshot snapshot;
    snapshot.generated_at = std::chrono::system_clock::now();

    for (const auto& [agent_type, instances] : pools) {
        snapshot.containers_by_type[agent_type] = instances.size();
        for (const auto& instance : instances) {
            ++snapshot.total_containers;
            if (instance.in_use) {
                ++snapshot.active_containers;
            } else if (instance.healthy) {
                ++snapshot.idle_containers;
            }
            if (instance.healthy) {
                ++snapshot.healthy_containers;
            } else {
                ++snapshot.unhealthy_containers;
            }
        }
    }

    if (snapshot.total_containers > 0) {
        snapshot.utilization = static_cast<double>(snapshot.active_containers) /
                               static_cast<double>(snapshot.total_containers);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    snapshot.pool_hits = hits_;
    snapshot.pool_misses = misses_;
    snapshot.failures = failures_;
    std::uint64_t total = hits_ + misses_;
    snapshot.hit_rate = total == 0 ? 0.0 : static_cast<double>(hits_) / static_cast<double>(total);
    snapshot.average_execution_ms = Mean(durations_);
    for (const auto& [agent_type, series] : durations_by_type_) {
        snapshot.average_execution_ms_by_type[agent_type] = Mean(series);
    }

    return snapshot;
}

} // namespace core
} // namespace sandpool
