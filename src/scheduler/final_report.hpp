/**
 * @file final_report.hpp
 * @brief Per-task and aggregate outcome of a scheduler run.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/types.hpp"
#include "graph/graph_builder.hpp"
#include "graph/task_graph.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace crew_orchestrator {

struct TaskReport {
    TaskId id;
    OwnerTag owner;
    std::string description;
    std::string phase;
    TaskStatus status = TaskStatus::Pending;
    uint32_t retry_count = 0;
    uint32_t attempts = 0;
    std::optional<std::string> error;
    std::optional<std::string> result;
};

/**
 * @brief Outcome of SchedulerLoop::run().
 *
 * Completed, Failed (retries exhausted) and Blocked (a dependency failed)
 * are always counted separately.
 */
struct FinalReport {
    size_t total = 0;
    size_t completed = 0;
    size_t failed = 0;
    size_t blocked = 0;
    size_t cancelled = 0;
    size_t pending = 0;
    size_t ready = 0;
    size_t in_progress = 0;

    std::vector<TaskReport> tasks;           ///< Graph insertion order
    std::vector<PhaseProgress> phases;
    std::vector<ValidationWarning> warnings;

    bool stalled = false;                    ///< Iteration ceiling reached before the graph drained
    bool cancelled_run = false;              ///< External stop request honored
    uint32_t iterations = 0;
    double completion_percent = 0.0;
    Duration elapsed{0};

    [[nodiscard]] bool succeeded() const noexcept {
        return !stalled && !cancelled_run && total == completed;
    }

    [[nodiscard]] const TaskReport* find(const TaskId& id) const {
        for (const auto& task : tasks) {
            if (task.id == id) return &task;
        }
        return nullptr;
    }
};

/// Fill the counters, task list and phase summary from the graph's current state.
FinalReport summarize(const TaskGraph& graph);

}  // namespace crew_orchestrator
