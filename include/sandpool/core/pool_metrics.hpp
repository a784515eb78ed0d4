/**
 * @file pool_metrics.hpp
 * @brief Pool utilization, hit rate and execution time statistics
 *
 * @date 2025
 */

#pragma once

#include "sandpool/core/sandbox_instance.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace sandpool {
namespace core {

/// Per-type copies of the pool contents
using PoolContents = std::map<std::string, std::vector<SandboxInstance>>;

/**
 * @struct PoolMetricsSnapshot
 * @brief Point-in-time view of the pool
 *
 * Counts are derived from the live instances at snapshot time. Hit and
 * failure counters are running totals since startup.
 */
struct PoolMetricsSnapshot {
    std::size_t total_containers{0};      ///< All tracked instances
    std::size_t active_containers{0};     ///< In use
    std::size_t idle_containers{0};       ///< Not in use and healthy
    std::size_t healthy_containers{0};    ///< Last probe succeeded
    std::size_t unhealthy_containers{0};  ///< Last probe failed
    std::map<std::string, std::size_t> containers_by_type;  ///< Instances per type

    double utilization{0.0};  ///< active / total, 0..1
    double hit_rate{0.0};     ///< hits / (hits + misses), 0..1

    std::uint64_t pool_hits{0};    ///< Executions served by a warm instance
    std::uint64_t pool_misses{0};  ///< Executions that needed a new sandbox
    std::uint64_t failures{0};     ///< Executions that failed or threw

    double average_execution_ms{0.0};                          ///< Rolling average
    std::map<std::string, double> average_execution_ms_by_type;  ///< Rolling average per type

    std::chrono::system_clock::time_point generated_at;  ///< Snapshot time
};

/**
 * @class PoolMetrics
 * @brief Running counters plus rolling execution-time windows
 *
 * **Thread Safety**: All methods are thread-safe.
 */
class PoolMetrics {
public:
    /**
     * @param window Number of most recent durations kept per series
     */
    explicit PoolMetrics(std::size_t window = 100);

    void RecordHit();
    void RecordMiss();
    void RecordFailure();

    /**
     * @brief Add one execution duration to the overall and per-type windows
     */
    void RecordDuration(const std::string& agent_type, std::chrono::milliseconds duration);

    std::uint64_t Hits() const;
    std::uint64_t Misses() const;
    std::uint64_t Failures() const;

    /**
     * @brief hits / (hits + misses), 0 before the first execution
     */
    double HitRate() const;

    double AverageExecutionMs() const;

    /**
     * @return Rolling average for one type, 0 if nothing recorded
     */
    double AverageExecutionMs(const std::string& agent_type) const;

    /**
     * @brief Combine the counters with the given pool contents
     */
    PoolMetricsSnapshot BuildSnapshot(const PoolContents& pools) const;

    std::size_t Window() const { return window_; }

private:
    void Push(std::deque<double>& series, double value);
    static double Mean(const std::deque<double>& series);

    std::size_t window_;

    mutable std::mutex mutex_;
    std::uint64_t hits_{0};
    std::uint64_t misses_{0};
    std::uint64_t failures_{0};
    std::deque<double> durations_;                         ///< Overall window (ms)
    std::map<std::string, std::deque<double>> durations_by_type_;  ///< Per-type windows (ms)
};

} // namespace core
} // namespace sandpool
