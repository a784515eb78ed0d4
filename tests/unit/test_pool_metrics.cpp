#include <gtest/gtest.h>

#include "sandpool/core/pool_metrics.hpp"

#include <thread>
#include <vector>

namespace sandpool {
namespace {

using namespace std::chrono_literals;
using core::PoolMetrics;
using core::SandboxInstance;

SandboxInstance MakeInstance(const std::string& type, bool in_use, bool healthy) {
    SandboxInstance instance;
    instance.instance_id = type + "-x";
    instance.agent_type = type;
    instance.in_use = in_use;
    instance.healthy = healthy;
    return instance;
}

TEST(PoolMetricsTest, HitRateStartsAtZero) {
    PoolMetrics metrics;
    EXPECT_DOUBLE_EQ(metrics.HitRate(), 0.0);
    EXPECT_DOUBLE_EQ(metrics.AverageExecutionMs(), 0.0);
}

TEST(PoolMetricsTest, AllHitsGiveFullRate) {
    PoolMetrics metrics;
    for (int i = 0; i < 5; ++i) {
        metrics.RecordHit();
    }
    EXPECT_DOUBLE_EQ(metrics.HitRate(), 1.0);
}

TEST(PoolMetricsTest, HitRateIsHitsOverExecutions) {
    // 8 executions, 3 of which needed a new sandbox
    PoolMetrics metrics;
    for (int i = 0; i < 3; ++i) {
        metrics.RecordMiss();
    }
    for (int i = 0; i < 5; ++i) {
        metrics.RecordHit();
    }

    EXPECT_EQ(metrics.Hits(), 5u);
    EXPECT_EQ(metrics.Misses(), 3u);
    EXPECT_DOUBLE_EQ(metrics.HitRate(), 5.0 / 8.0);
}

TEST(PoolMetricsTest, RollingWindowKeepsMostRecent) {
    PoolMetrics metrics(3);
    metrics.RecordDuration("coder", 1000ms);
    metrics.RecordDuration("coder", 10ms);
    metrics.RecordDuration("coder", 20ms);
    metrics.RecordDuration("coder", 30ms);

    EXPECT_EQ(metrics.Window(), 3u);
    EXPECT_DOUBLE_EQ(metrics.AverageExecutionMs(), 20.0);
    EXPECT_DOUBLE_EQ(metrics.AverageExecutionMs("coder"), 20.0);
}

TEST(PoolMetricsTest, PerTypeAverages) {
    PoolMetrics metrics;
    metrics.RecordDuration("coder", 100ms);
    metrics.RecordDuration("coder", 300ms);
    metrics.RecordDuration("planner", 50ms);

    EXPECT_DOUBLE_EQ(metrics.AverageExecutionMs("coder"), 200.0);
    EXPECT_DOUBLE_EQ(metrics.AverageExecutionMs("planner"), 50.0);
    EXPECT_DOUBLE_EQ(metrics.AverageExecutionMs("tester"), 0.0);
    EXPECT_DOUBLE_EQ(metrics.AverageExecutionMs(), 150.0);
}

TEST(PoolMetricsTest, SnapshotCountsInstances) {
    PoolMetrics metrics;
    metrics.RecordHit();
    metrics.RecordMiss();
    metrics.RecordFailure();
    metrics.RecordDuration("coder", 40ms);

    core::PoolContents pools;
    pools["coder"] = {MakeInstance("coder", true, true), MakeInstance("coder", false, true),
                      MakeInstance("coder", false, false)};
    pools["tester"] = {MakeInstance("tester", false, true)};

    auto snapshot = metrics.BuildSnapshot(pools);

    EXPECT_EQ(snapshot.total_containers, 4u);
    EXPECT_EQ(snapshot.active_containers, 1u);
    EXPECT_EQ(snapshot.idle_containers, 2u);
    EXPECT_EQ(snapshot.healthy_containers, 3u);
    EXPECT_EQ(snapshot.unhealthy_containers, 1u);
    EXPECT_EQ(snapshot.containers_by_type.at("coder"), 3u);
    EXPECT_EQ(snapshot.containers_by_type.at("tester"), 1u);
    EXPECT_DOUBLE_EQ(snapshot.utilization, 0.25);
    EXPECT_DOUBLE_EQ(snapshot.hit_rate, 0.5);
    EXPECT_EQ(snapshot.pool_hits, 1u);
    EXPECT_EQ(snapshot.pool_misses, 1u);
    EXPECT_EQ(snapshot.failures, 1u);
    EXPECT_DOUBLE_EQ(snapshot.average_execution_ms, 40.0);
    EXPECT_DOUBLE_EQ(snapshot.average_execution_ms_by_type.at("coder"), 40.0);
}

TEST(PoolMetricsTest, EmptyPoolSnapshot) {
    PoolMetrics metrics;
    auto snapshot = metrics.BuildSnapshot({});

    EXPECT_EQ(snapshot.total_containers, 0u);
    EXPECT_DOUBLE_EQ(snapshot.utilization, 0.0);
    EXPECT_TRUE(snapshot.containers_by_type.empty());
}

TEST(PoolMetricsTest, ConcurrentRecording) {
    PoolMetrics metrics;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 1000; ++i) {
                metrics.RecordHit();
                metrics.RecordDuration("coder", 1ms);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(metrics.Hits(), 4000u);
    EXPECT_DOUBLE_EQ(metrics.AverageExecutionMs("coder"), 1.0);
}

} // namespace
} // namespace sandpool
