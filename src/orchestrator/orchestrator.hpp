/**
 * @file orchestrator.hpp
 * @brief Top-level Orchestrator facade — ties all modules together.
 * @author Dimitris Kafetzis
 *
 * Provides a single entry point for:
 *   1. Resolving a project's task list (planner file or built-in template)
 *   2. Building and validating the task graph
 *   3. Running it to completion through a delegate
 *
 * Each execute() call builds an independent graph; nothing is shared
 * between runs except the logger, the telemetry sink and the pool.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "graph/graph_builder.hpp"
#include "scheduler/delegate.hpp"
#include "scheduler/final_report.hpp"
#include "scheduler/scheduler_loop.hpp"
#include "telemetry/run_telemetry.hpp"

#include <memory>
#include <stop_token>
#include <vector>

namespace crew_orchestrator {

/**
 * @brief The top-level Orchestrator that wires all modules together.
 *
 * A delegate passed to execute() must outlive the Orchestrator: a call
 * abandoned at its deadline may still be running on a pool thread.
 */
class Orchestrator {
public:
    struct Options {
        Config config;
        std::unique_ptr<ILogSink> log_sink;
        std::unique_ptr<ILogSink> telemetry_sink;   ///< nullptr = discard run events
        LogLevel log_level = LogLevel::Info;
    };

    explicit Orchestrator(Options opts);

    // Non-copyable, non-movable
    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    /// Task list from project.task_file if set, else from project.template_name.
    Result<std::vector<RawTask>> plan_project();

    /// Build then run. Builder warnings precede run warnings in the report.
    Result<FinalReport> execute(std::vector<RawTask> raw_tasks, IDelegate& delegate,
                                std::stop_token cancel = {});

    // ── Accessors (for testing) ─────────────
    Logger& logger() { return logger_; }
    RunTelemetry& telemetry() { return telemetry_; }
    const Config& config() const { return config_; }

private:
    Config config_;
    Logger logger_;
    RunTelemetry telemetry_;
    SchedulerLoop loop_;
};

}  // namespace crew_orchestrator
