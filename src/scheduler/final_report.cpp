/**
 * @file final_report.cpp
 * @brief Report assembly from a task graph.
 * @author Dimitris Kafetzis
 */

#include "scheduler/final_report.hpp"

namespace crew_orchestrator {

FinalReport summarize(const TaskGraph& graph) {
    FinalReport report;

    auto snap = graph.snapshot();
    report.total = snap.total;
    report.completed = snap.count(TaskStatus::Completed);
    report.failed = snap.count(TaskStatus::Failed);
    report.blocked = snap.count(TaskStatus::Blocked);
    report.cancelled = snap.count(TaskStatus::Cancelled);
    report.pending = snap.count(TaskStatus::Pending);
    report.ready = snap.count(TaskStatus::Ready);
    report.in_progress = snap.count(TaskStatus::InProgress);
    report.completion_percent = snap.completion_percent;

    report.tasks.reserve(graph.task_count());
    for (const auto& id : graph.task_ids()) {
        const auto* task = graph.find(id);
        if (!task) continue;

        report.tasks.push_back(TaskReport{
            .id = task->id,
            .owner = task->owner,
            .description = task->description,
            .phase = task->phase,
            .status = task->status,
            .retry_count = task->retry_count,
            .attempts = task->attempts,
            .error = task->error,
            .result = task->result
        });
    }

    report.phases = graph.phase_progress();
    return report;
}

}  // namespace crew_orchestrator
