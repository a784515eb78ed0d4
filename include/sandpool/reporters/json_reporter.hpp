/**
 * @file json_reporter.hpp
 * @brief JSON rendering of execution results and pool state
 *
 * @date 2025
 */

#pragma once

#include "sandpool/core/pool_metrics.hpp"
#include "sandpool/core/task_types.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace sandpool {
namespace reporters {

/**
 * @struct JsonReporterConfig
 * @brief Output options
 */
struct JsonReporterConfig {
    bool pretty_print{true};          ///< Indent output
    int indent_size{2};               ///< Indentation spaces
    std::size_t max_output_bytes{0};  ///< Truncate task output (0 = keep all)
};

/**
 * @class JsonReporter
 * @brief Serializes results, metric snapshots and pool contents
 */
class JsonReporter {
public:
    explicit JsonReporter(JsonReporterConfig config = JsonReporterConfig{});

    std::string Render(const core::ExecutionResult& result) const;

    /**
     * @brief Render several results as one array
     */
    std::string Render(const std::vector<core::ExecutionResult>& results) const;

    std::string Render(const core::PoolMetricsSnapshot& snapshot) const;

    /**
     * @brief Render instance copies grouped by agent type
     */
    std::string Render(const core::PoolContents& pools) const;

    /**
     * @brief Write a rendered document to disk
     * @throws std::runtime_error if the file cannot be written
     */
    void WriteToFile(const std::filesystem::path& path, const std::string& content) const;

private:
    JsonReporterConfig config_;
};

} // namespace reporters
} // namespace sandpool
