/**
 * @file scheduler_loop.cpp
 * @brief SchedulerLoop — dispatch, deadlines, retry, cascade and deadlock breaking.
 * @author Dimitris Kafetzis
 *
 * Per pass:
 *   1. ready_tasks() promotes Pending tasks whose dependencies completed.
 *   2. Every Ready task (new or retried) is marked InProgress and handed
 *      to the pool with its own stop source. Its deadline runs from the
 *      moment a worker starts the call, not from when it was queued.
 *   3. Outcomes are collected in dispatch order and applied on this
 *      thread: success → Completed; error/timeout → Failed, then Ready
 *      again while retries remain, otherwise dependents → Blocked.
 *   4. A pass that changed nothing while Pending tasks remain runs the
 *      deadlock breaker.
 */

#include "scheduler/scheduler_loop.hpp"
#include "graph/phase.hpp"
#include "telemetry/run_telemetry.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <memory>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace crew_orchestrator {

namespace {

Result<std::string> collect_outcome(const TaskId& id,
                                    std::future<Result<std::string>>& future) {
    try {
        return future.get();
    } catch (const std::exception& ex) {
        return Error{ErrorCode::DelegateFailure,
                     "task " + id + ": delegate threw: " + ex.what()};
    } catch (...) {
        return Error{ErrorCode::DelegateFailure,
                     "task " + id + ": delegate threw a non-standard exception"};
    }
}

std::unordered_map<TaskId, TaskStatus> statuses_of(const TaskGraph& graph,
                                                   const std::vector<TaskId>& ids) {
    std::unordered_map<TaskId, TaskStatus> statuses;
    for (const auto& id : ids) {
        if (const auto* task = graph.find(id)) {
            statuses.emplace(id, task->status);
        }
    }
    return statuses;
}

/// True if `start` can reach itself through dependencies that are all in `stuck`.
bool on_stuck_cycle(const TaskGraph& graph, const TaskId& start,
                    const std::unordered_set<TaskId>& stuck) {
    std::vector<TaskId> frontier{start};
    std::unordered_set<TaskId> visited;

    while (!frontier.empty()) {
        auto current = std::move(frontier.back());
        frontier.pop_back();

        for (const auto& dep : graph.dependencies(current)) {
            if (!stuck.contains(dep)) continue;
            if (dep == start) return true;
            if (visited.insert(dep).second) {
                frontier.push_back(dep);
            }
        }
    }
    return false;
}

std::string join_ids(const std::vector<TaskId>& ids) {
    std::string joined;
    for (const auto& id : ids) {
        if (!joined.empty()) joined += ", ";
        joined += id;
    }
    return joined;
}

}  // anonymous namespace

struct SchedulerLoop::InFlight {
    TaskId id;
    std::stop_source stop;
    std::future<SteadyTime> started;          ///< Set by the worker as the call begins
    std::future<Result<std::string>> future;
};

// ─────────────────────────────────────────────
// Configuration
// ─────────────────────────────────────────────

SchedulerConfig SchedulerConfig::from(const Config& config) {
    return SchedulerConfig{
        .per_task_timeout = std::chrono::milliseconds{config.scheduler.per_task_timeout_ms},
        .max_retries = config.scheduler.max_retries,
        .max_total_iterations = config.scheduler.max_total_iterations,
        .max_parallel = config.scheduler.max_parallel,
        .order_by_phase = config.scheduler.order_by_phase,
        .thread_count = config.executor.thread_count
    };
}

SchedulerLoop::SchedulerLoop(SchedulerConfig config, Logger& logger, RunTelemetry* telemetry)
    : config_(config), logger_(logger), telemetry_(telemetry) {}

SchedulerLoop::~SchedulerLoop() = default;

// ─────────────────────────────────────────────
// Run
// ─────────────────────────────────────────────

Result<FinalReport> SchedulerLoop::run(TaskGraph& graph, IDelegate& delegate,
                                       std::stop_token cancel) {
    auto start_time = std::chrono::steady_clock::now();

    if (!pool_) {
        size_t threads = config_.thread_count != 0 ? config_.thread_count : config_.max_parallel;
        pool_ = std::make_unique<ThreadPool>(threads);
        base_threads_ = pool_->thread_count();
    }
    reserve_threads();

    logger_.info("Run started: " + std::to_string(graph.task_count()) + " tasks, max_retries="
                 + std::to_string(config_.max_retries) + ", timeout="
                 + std::to_string(config_.per_task_timeout.count()) + "ms, ceiling="
                 + std::to_string(config_.max_total_iterations) + " passes");

    std::vector<ValidationWarning> warnings;
    uint32_t iterations = 0;
    bool stalled = false;
    bool cancelled = false;

    while (!graph.all_terminal()) {
        if (cancel.stop_requested()) {
            cancelled = true;
            break;
        }
        if (iterations >= config_.max_total_iterations) {
            stalled = true;
            break;
        }
        ++iterations;

        auto stats = run_pass(graph, delegate);
        if (!stats) {
            logger_.error("Run aborted in pass " + std::to_string(iterations) + ": "
                          + stats.error().message);
            return stats.error();
        }

        logger_.debug("Pass " + std::to_string(iterations) + ": "
                      + std::to_string(stats->newly_ready) + " newly ready, "
                      + std::to_string(stats->dispatched) + " dispatched, "
                      + std::to_string(stats->completed) + " completed, "
                      + std::to_string(stats->failed) + " failed");
        if (telemetry_) {
            telemetry_->record_pass(iterations, stats->newly_ready, stats->dispatched,
                                    stats->completed, stats->failed);
        }

        if (!stats->progressed() && !graph.tasks_in(TaskStatus::Pending).empty()) {
            logger_.warn("Pass " + std::to_string(iterations)
                         + " made no progress with pending tasks remaining");
            auto repaired = break_deadlock(graph, warnings);
            if (!repaired) return repaired.error();
        }
    }

    if (cancelled) {
        auto before = statuses_of(graph, graph.tasks_in(TaskStatus::Pending));
        before.merge(statuses_of(graph, graph.tasks_in(TaskStatus::Ready)));

        auto cancelled_ids = graph.cancel_remaining();
        for (const auto& id : cancelled_ids) {
            note_transition(graph, id, before.at(id));
        }
        logger_.warn("Run cancelled after " + std::to_string(iterations) + " passes; "
                     + std::to_string(cancelled_ids.size()) + " tasks cancelled");
    }
    if (stalled) {
        logger_.warn("Run stalled: iteration ceiling of "
                     + std::to_string(config_.max_total_iterations)
                     + " passes reached before the graph drained");
    }

    FinalReport report = summarize(graph);
    report.warnings = std::move(warnings);
    report.stalled = stalled;
    report.cancelled_run = cancelled;
    report.iterations = iterations;
    report.elapsed = std::chrono::duration_cast<Duration>(
        std::chrono::steady_clock::now() - start_time);

    logger_.info("Run finished: " + std::to_string(report.completed) + " completed, "
                 + std::to_string(report.failed) + " failed, "
                 + std::to_string(report.blocked) + " blocked, "
                 + std::to_string(report.cancelled) + " cancelled of "
                 + std::to_string(report.total) + " in " + std::to_string(iterations)
                 + " passes");
    if (telemetry_) {
        telemetry_->record_run_complete(report);
    }

    return report;
}

// ─────────────────────────────────────────────
// Pass
// ─────────────────────────────────────────────

std::vector<TaskId> SchedulerLoop::select_batch(const TaskGraph& graph) const {
    auto batch = graph.tasks_in(TaskStatus::Ready);

    if (config_.order_by_phase) {
        std::stable_sort(batch.begin(), batch.end(), [&graph](const TaskId& a, const TaskId& b) {
            return phase_rank(graph.find(a)->phase) < phase_rank(graph.find(b)->phase);
        });
    }
    if (config_.max_parallel != 0 && batch.size() > config_.max_parallel) {
        batch.resize(config_.max_parallel);
    }
    return batch;
}

Result<SchedulerLoop::PassStats> SchedulerLoop::run_pass(TaskGraph& graph, IDelegate& delegate) {
    PassStats stats;

    auto newly_ready = graph.ready_tasks();
    stats.newly_ready = newly_ready.size();
    for (const auto& id : newly_ready) {
        note_transition(graph, id, TaskStatus::Pending);
    }

    auto batch = select_batch(graph);
    std::vector<InFlight> in_flight;
    in_flight.reserve(batch.size());

    for (const auto& id : batch) {
        if (auto started = graph.mark_in_progress(id); !started) {
            return started.error();
        }
        note_transition(graph, id, TaskStatus::Ready);

        const auto* task = graph.find(id);
        logger_.info("Dispatching task " + id + " to " + task->owner + " (attempt "
                     + std::to_string(task->attempts) + ")");

        auto call_start = std::make_shared<std::promise<SteadyTime>>();
        InFlight flight{.id = id, .started = call_start->get_future()};
        flight.future = pool_->submit_cancellable(
            flight.stop.get_token(),
            [&delegate, call_start, snapshot = *task](std::stop_token stop) -> Result<std::string> {
                call_start->set_value(std::chrono::steady_clock::now());
                return delegate.execute(snapshot, stop);
            });
        in_flight.push_back(std::move(flight));
        ++stats.dispatched;
    }

    // Outcomes are awaited in dispatch order. Every earlier call has either
    // returned or been abandoned (with a worker added in its place), so the
    // call being awaited always gets a thread.
    for (auto& flight : in_flight) {
        auto start = flight.started.get();
        auto outcome = await_outcome(flight, start);
        if (auto applied = apply_outcome(graph, flight.id, std::move(outcome), stats); !applied) {
            return applied.error();
        }
    }

    return stats;
}

Result<std::string> SchedulerLoop::await_outcome(InFlight& flight, SteadyTime started) {
    if (flight.future.wait_until(started + config_.per_task_timeout) == std::future_status::ready) {
        return collect_outcome(flight.id, flight.future);
    }

    flight.stop.request_stop();
    abandoned_.push_back(std::move(flight.future));
    reserve_threads();
    return Error{ErrorCode::Timeout,
                 "task " + flight.id + " timed out after "
                 + std::to_string(config_.per_task_timeout.count()) + " ms"};
}

void SchedulerLoop::reserve_threads() {
    std::erase_if(abandoned_, [](const std::future<Result<std::string>>& call) {
        return call.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    });

    // An abandoned call keeps its worker until it returns.
    auto wanted = base_threads_ + abandoned_.size();
    if (pool_->thread_count() < wanted) {
        pool_->grow_to(wanted);
        logger_.debug("Thread pool grown to " + std::to_string(wanted) + " workers, "
                      + std::to_string(abandoned_.size()) + " abandoned calls still running");
    }
}

Result<void> SchedulerLoop::apply_outcome(TaskGraph& graph, const TaskId& id,
                                          Result<std::string> outcome, PassStats& stats) {
    if (outcome) {
        if (auto done = graph.mark_completed(id, std::move(*outcome)); !done) {
            return done.error();
        }
        note_transition(graph, id, TaskStatus::InProgress);
        ++stats.completed;
        logger_.info("Task " + id + " completed");
        return {};
    }

    const auto& error = outcome.error();
    if (auto failed = graph.mark_failed(id, error.message); !failed) {
        return failed.error();
    }
    note_transition(graph, id, TaskStatus::InProgress);
    ++stats.failed;

    const auto* task = graph.find(id);
    if (task->retry_count < config_.max_retries) {
        logger_.warn("Task " + id + " failed (" + std::string{to_string(error.code)} + "): "
                     + error.message + "; retry " + std::to_string(task->retry_count + 1)
                     + " of " + std::to_string(config_.max_retries));
        if (auto retried = graph.retry(id, config_.max_retries); !retried) {
            return retried.error();
        }
        note_transition(graph, id, TaskStatus::Failed);
        return {};
    }

    logger_.error("Task " + id + " failed permanently after " + std::to_string(task->attempts)
                  + " attempts: " + error.message);

    auto before = statuses_of(graph, graph.dependents_of(id));
    for (const auto& blocked_id : graph.block_dependents(id)) {
        logger_.warn("Task " + blocked_id + " blocked: dependency " + id + " failed");
        note_transition(graph, blocked_id, before.at(blocked_id));
    }
    return {};
}

// ─────────────────────────────────────────────
// Deadlock Breaker
// ─────────────────────────────────────────────

Result<size_t> SchedulerLoop::break_deadlock(TaskGraph& graph,
                                             std::vector<ValidationWarning>& warnings) {
    // A Pending task behind a dependency that can never complete belongs in
    // Blocked, not in Ready.
    size_t blocked = 0;
    for (const auto& id : graph.tasks_in(TaskStatus::Pending)) {
        const auto* task = graph.find(id);
        if (task->status != TaskStatus::Pending) continue;   // blocked earlier in this sweep

        for (const auto& dep : task->dependencies) {
            auto dep_status = graph.find(dep)->status;
            if (dep_status != TaskStatus::Failed && dep_status != TaskStatus::Blocked
                && dep_status != TaskStatus::Cancelled) {
                continue;
            }

            auto before = statuses_of(graph, graph.dependents_of(id));
            if (auto marked = graph.mark_blocked(id, "blocked: dependency " + dep + " is "
                                                 + std::string{to_string(dep_status)});
                !marked) {
                return marked.error();
            }
            note_transition(graph, id, TaskStatus::Pending);
            logger_.warn("Task " + id + " blocked: dependency " + dep + " is "
                         + std::string{to_string(dep_status)});
            ++blocked;

            for (const auto& downstream : graph.block_dependents(id)) {
                note_transition(graph, downstream, before.at(downstream));
                ++blocked;
            }
            break;
        }
    }
    if (blocked > 0) {
        return blocked;
    }

    auto stuck_ids = graph.tasks_in(TaskStatus::Pending);
    std::unordered_set<TaskId> stuck(stuck_ids.begin(), stuck_ids.end());

    auto unmet_dependencies = [&graph](const TaskId& id) {
        std::vector<TaskId> unmet;
        for (const auto& dep : graph.dependencies(id)) {
            if (graph.find(dep)->status != TaskStatus::Completed) unmet.push_back(dep);
        }
        return unmet;
    };

    // Prefer releasing only the tasks caught in a dependency cycle; whatever
    // waits behind them becomes ready through the normal path.
    std::vector<TaskId> release;
    for (const auto& id : stuck_ids) {
        if (on_stuck_cycle(graph, id, stuck)) release.push_back(id);
    }
    if (release.empty()) {
        for (const auto& id : stuck_ids) {
            auto unmet = unmet_dependencies(id);
            bool all_stuck = std::all_of(unmet.begin(), unmet.end(),
                [&stuck](const TaskId& dep) { return stuck.contains(dep); });
            if (all_stuck) release.push_back(id);
        }
    }

    for (const auto& id : release) {
        auto unmet = unmet_dependencies(id);
        if (auto forced = graph.force_ready(id); !forced) {
            return forced.error();
        }
        note_transition(graph, id, TaskStatus::Pending);

        ValidationWarning warning{
            .kind = WarningKind::DeadlockBroken,
            .task_id = id,
            .related_id = unmet.empty() ? TaskId{} : unmet.front(),
            .message = "task " + id + ": forced to ready with unmet dependencies ["
                       + join_ids(unmet) + "] after a pass without progress"
        };
        logger_.warn("Deadlock breaker: " + warning.message);
        if (telemetry_) {
            telemetry_->record_warning(warning);
        }
        warnings.push_back(std::move(warning));
    }

    return release.size();
}

void SchedulerLoop::note_transition(const TaskGraph& graph, const TaskId& id, TaskStatus from) {
    if (!telemetry_) return;
    if (const auto* task = graph.find(id)) {
        telemetry_->record_task_transition(id, from, task->status, task->attempts);
    }
}

}  // namespace crew_orchestrator
