/**
 * @file main.cpp
 * @brief sandpool - command-line interface
 *
 * Runs one or more tasks for an agent type through the sandbox pool and
 * prints the results as JSON on stdout. Logs go to stderr.
 *
 * **Exit Codes**:
 * - 0: every task succeeded
 * - 1: at least one task ran and failed
 * - 2: infrastructure failure (configuration, engine, sandbox creation)
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "sandpool/core/errors.hpp"
#include "sandpool/core/pool_config.hpp"
#include "sandpool/core/pool_manager.hpp"
#include "sandpool/reporters/json_reporter.hpp"
#include "sandpool/utils/process_runner.hpp"
#include "sandpool/utils/string_utils.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>

using sandpool::core::AgentState;
using sandpool::core::ExecutionResult;
using sandpool::core::PoolConfig;
using sandpool::core::PoolManager;
using sandpool::core::TaskDefinition;

/*******************************************************************************
 * Task Dispatch
 ******************************************************************************/

struct BatchOutcome {
    std::vector<ExecutionResult> results;
    std::size_t failed_tasks{0};
    std::size_t infrastructure_errors{0};
};

BatchOutcome RunBatch(PoolManager& pool, const TaskDefinition& base_task, const AgentState& agent,
                      int repeat, int concurrency) {
    BatchOutcome outcome;
    outcome.results.resize(static_cast<std::size_t>(repeat));

    std::atomic<int> next{0};
    std::mutex outcome_mutex;

    auto worker = [&]() {
        for (int index = next++; index < repeat; index = next++) {
            TaskDefinition task = base_task;
            if (repeat > 1) {
                task.id = base_task.id + "-" + std::to_string(index + 1);
            }

            ExecutionResult result;
            bool infrastructure_error = false;
            try {
                result = pool.ExecuteTask(task, agent);
            } catch (const sandpool::core::SandpoolError& e) {
                spdlog::error("[ERROR] Task {} could not run: {}", task.id, e.what());
                result.success = false;
                result.exit_code = -1;
                result.error = e.what();
                result.metadata["task_id"] = task.id;
                result.metadata["infrastructure_error"] = "true";
                infrastructure_error = true;
            }

            std::lock_guard<std::mutex> lock(outcome_mutex);
            if (infrastructure_error) {
                ++outcome.infrastructure_errors;
            } else if (!result.success) {
                ++outcome.failed_tasks;
            }
            outcome.results[static_cast<std::size_t>(index)] = std::move(result);
        }
    };

    std::vector<std::thread> workers;
    for (int i = 0; i < std::min(concurrency, repeat); ++i) {
        workers.emplace_back(worker);
    }
    for (auto& thread : workers) {
        thread.join();
    }

    return outcome;
}

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    CLI::App app{"sandpool - pooled sandbox executor for agent tasks"};

    std::string agent_type = "coder";
    std::string agent_id = "cli-agent";
    std::string task_description;
    std::string task_id;
    std::string config_path;
    std::string output_path;
    std::string image;
    std::string docker_binary;
    int timeout_seconds = 0;
    int repeat = 1;
    int concurrency = 1;
    bool single_shot = false;
    bool show_metrics = false;
    bool show_pool = false;
    bool compact = false;
    bool verbose = false;

    app.add_option("-a,--agent-type", agent_type, "Agent type (coder, tester, reviewer, researcher, planner)")
        ->default_val("coder");
    app.add_option("--agent-id", agent_id, "Requesting agent id")
        ->default_val("cli-agent");
    app.add_option("-t,--task", task_description, "Task description")
        ->required();
    app.add_option("--task-id", task_id, "Task id (generated if omitted)");
    app.add_option("-c,--config", config_path, "JSON configuration file")
        ->check(CLI::ExistingFile);
    app.add_option("--timeout", timeout_seconds, "Task timeout in seconds (0 = configured default)")
        ->check(CLI::NonNegativeNumber);
    app.add_option("-n,--repeat", repeat, "Number of times to run the task")
        ->check(CLI::PositiveNumber)
        ->default_val(1);
    app.add_option("-j,--concurrency", concurrency, "Tasks run in parallel")
        ->check(CLI::PositiveNumber)
        ->default_val(1);
    app.add_option("--image", image, "Sandbox image (overrides configuration)");
    app.add_option("--docker", docker_binary, "Sandbox engine CLI (overrides configuration)");
    app.add_option("-o,--output", output_path, "Also write results to this file");
    app.add_flag("--single-shot", single_shot, "Create a fresh sandbox per task, no pooling");
    app.add_flag("--metrics", show_metrics, "Print pool metrics after the run");
    app.add_flag("--pool", show_pool, "Print pool contents after the run");
    app.add_flag("--compact", compact, "Single-line JSON output");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    CLI11_PARSE(app, argc, argv);

    // Results own stdout; logs go to stderr
    spdlog::set_default_logger(spdlog::stderr_color_mt("sandpool"));
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    try {
        PoolConfig config;
        if (!config_path.empty()) {
            config = sandpool::core::LoadPoolConfig(config_path);
        } else {
            config.warmup_agent_types = {agent_type};
        }
        if (!image.empty()) {
            config.image = image;
        }
        if (!docker_binary.empty()) {
            config.docker_binary = docker_binary;
        }
        if (single_shot) {
            config.enable_container_reuse = false;
        }
        sandpool::core::ValidatePoolConfig(config);

        TaskDefinition task;
        task.id = task_id.empty() ? sandpool::utils::StringUtils::GenerateId("task") : task_id;
        task.description = task_description;
        if (timeout_seconds > 0) {
            task.constraints.timeout_after = std::chrono::seconds(timeout_seconds);
        }

        AgentState agent{agent_id, agent_type};

        PoolManager pool(config, std::make_shared<sandpool::utils::ProcessRunner>(config.docker_binary));
        if (config.enable_container_reuse) {
            pool.Initialize();
        }

        spdlog::info("━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━");
        spdlog::info("[START] {} x task '{}' for {} (concurrency {})",
                     repeat, sandpool::utils::StringUtils::Truncate(task.description, 40),
                     agent_type, concurrency);

        auto outcome = RunBatch(pool, task, agent, repeat, concurrency);

        spdlog::info("━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━");
        spdlog::info("[DONE] {} succeeded, {} failed, {} could not run",
                     outcome.results.size() - outcome.failed_tasks - outcome.infrastructure_errors,
                     outcome.failed_tasks, outcome.infrastructure_errors);

        sandpool::reporters::JsonReporterConfig reporter_config;
        reporter_config.pretty_print = !compact;
        sandpool::reporters::JsonReporter reporter(reporter_config);

        std::string rendered = outcome.results.size() == 1 ? reporter.Render(outcome.results.front())
                                                           : reporter.Render(outcome.results);
        std::cout << rendered << std::endl;

        if (!output_path.empty()) {
            reporter.WriteToFile(output_path, rendered);
            spdlog::info("[REPORT] Results saved: {}", output_path);
        }
        if (show_metrics) {
            std::cout << reporter.Render(pool.GetPoolMetrics()) << std::endl;
        }
        if (show_pool) {
            std::cout << reporter.Render(pool.GetContainerPool()) << std::endl;
        }

        pool.Shutdown();

        if (outcome.infrastructure_errors > 0) {
            return 2;
        }
        return outcome.failed_tasks > 0 ? 1 : 0;

    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    } catch (const std::invalid_argument& e) {
        spdlog::error("[ERROR] Invalid configuration: {}", e.what());
        return 2;
    } catch (const sandpool::core::SandpoolError& e) {
        spdlog::error("[ERROR] Sandbox failure: {}", e.what());
        return 2;
    } catch (const std::exception& e) {
        spdlog::error("[ERROR] Fatal error: {}", e.what());
        return 2;
    }
}
