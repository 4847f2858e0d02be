/**
 * @file scheduler_loop.hpp
 * @brief Drives a task graph to completion through a delegate.
 * @author Dimitris Kafetzis
 *
 * Each pass promotes newly ready tasks, dispatches every Ready task to the
 * delegate on the thread pool, waits for each call up to its deadline and
 * applies the outcomes. Only the thread calling run() mutates the graph.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "executor/thread_pool.hpp"
#include "graph/graph_builder.hpp"
#include "graph/task_graph.hpp"
#include "scheduler/delegate.hpp"
#include "scheduler/final_report.hpp"

#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <stop_token>
#include <vector>

namespace crew_orchestrator {

class RunTelemetry;

struct SchedulerConfig {
    std::chrono::milliseconds per_task_timeout{300000};
    uint32_t max_retries = 2;
    uint32_t max_total_iterations = 50;
    uint32_t max_parallel = 0;               ///< 0 = every Ready task of a pass
    bool order_by_phase = true;              ///< Sort each batch by phase rank, ties in insertion order
    uint32_t thread_count = 0;               ///< 0 = hardware_concurrency

    [[nodiscard]] static SchedulerConfig from(const Config& config);
};

/**
 * @brief The scheduling loop.
 *
 * A call's deadline runs from the moment a worker starts it; time spent
 * queued behind other calls does not count. A call that outlives its
 * deadline is abandoned, not killed: its stop token is signalled and its
 * failure recorded, but its worker stays busy until the call returns. The
 * pool gets one extra worker per abandoned call still running, so the
 * configured number of workers stays free for new calls. The pool belongs
 * to the loop, so run() never waits for an abandoned call; destroying the
 * loop does. The delegate must therefore outlive the SchedulerLoop.
 */
class SchedulerLoop {
public:
    SchedulerLoop(SchedulerConfig config, Logger& logger, RunTelemetry* telemetry = nullptr);
    ~SchedulerLoop();

    SchedulerLoop(const SchedulerLoop&) = delete;
    SchedulerLoop& operator=(const SchedulerLoop&) = delete;

    /**
     * @brief Run the graph until every task is terminal, the iteration
     *        ceiling is reached, or `cancel` is signalled.
     *
     * A state-machine violation aborts the run with
     * ErrorCode::InvalidTransition; everything else is reported in the
     * FinalReport.
     */
    Result<FinalReport> run(TaskGraph& graph, IDelegate& delegate, std::stop_token cancel = {});

    [[nodiscard]] const SchedulerConfig& config() const noexcept { return config_; }

private:
    struct PassStats {
        size_t newly_ready = 0;
        size_t dispatched = 0;
        size_t completed = 0;
        size_t failed = 0;

        [[nodiscard]] bool progressed() const noexcept {
            return newly_ready + dispatched + completed + failed > 0;
        }
    };

    struct InFlight;

    [[nodiscard]] std::vector<TaskId> select_batch(const TaskGraph& graph) const;
    Result<PassStats> run_pass(TaskGraph& graph, IDelegate& delegate);
    Result<std::string> await_outcome(InFlight& flight, SteadyTime started);
    void reserve_threads();
    Result<void> apply_outcome(TaskGraph& graph, const TaskId& id,
                               Result<std::string> outcome, PassStats& stats);
    Result<size_t> break_deadlock(TaskGraph& graph, std::vector<ValidationWarning>& warnings);
    void note_transition(const TaskGraph& graph, const TaskId& id, TaskStatus from);

    SchedulerConfig config_;
    Logger& logger_;
    RunTelemetry* telemetry_;
    std::unique_ptr<ThreadPool> pool_;
    size_t base_threads_ = 0;
    std::vector<std::future<Result<std::string>>> abandoned_;   ///< Timed-out calls not yet returned
};

}  // namespace crew_orchestrator
