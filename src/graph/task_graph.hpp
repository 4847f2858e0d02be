/**
 * @file task_graph.hpp
 * @brief Task graph holding tasks, dependency edges and per-task status.
 * @author Dimitris Kafetzis
 *
 * Pure data plus graph algorithms: readiness computation, transitive
 * dependents, cycle detection and the task state machine. No I/O and no
 * internal locking: a single mutator (the scheduler loop) owns every
 * status change. snapshot() reads atomic counters and may be called from
 * other threads while a run is in progress.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <array>
#include <atomic>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace crew_orchestrator {

/**
 * @brief A single unit of work.
 */
struct Task {
    TaskId id;
    OwnerTag owner;
    std::string description;
    std::string phase = "construction";
    std::vector<TaskId> dependencies;
    std::map<std::string, std::string> requirements;
    std::vector<std::string> materials;

    TaskStatus status = TaskStatus::Pending;
    uint32_t retry_count = 0;
    uint32_t attempts = 0;                    ///< Delegate calls made so far
    std::optional<std::string> result;
    std::optional<std::string> error;

    // Graph-wide event sequence numbers, 0 = never happened.
    uint64_t ready_seq = 0;
    uint64_t started_seq = 0;
    uint64_t finished_seq = 0;
    SteadyTime started_at{};
    SteadyTime finished_at{};
};

/**
 * @brief Read-only status summary.
 */
struct GraphSnapshot {
    size_t total = 0;
    std::array<size_t, kTaskStatusCount> counts{};
    double completion_percent = 0.0;

    [[nodiscard]] size_t count(TaskStatus status) const noexcept {
        return counts[index_of(status)];
    }
};

struct PhaseProgress {
    std::string phase;
    size_t total = 0;
    size_t completed = 0;
};

/**
 * @brief Dependency graph of tasks with status tracking.
 */
class TaskGraph {
public:
    TaskGraph();
    ~TaskGraph();

    TaskGraph(TaskGraph&&) noexcept;
    TaskGraph& operator=(TaskGraph&&) noexcept;
    TaskGraph(const TaskGraph&) = delete;
    TaskGraph& operator=(const TaskGraph&) = delete;

    // ── Construction ──────────────────────────

    /// Insert a Pending task. Its dependency list is discarded; edges are
    /// wired through add_dependency().
    Result<TaskId> add_task(Task task);

    /// `dependent` may not become Ready before `dependency` is Completed.
    Result<void> add_dependency(const TaskId& dependency, const TaskId& dependent);

    /// Returns true if the edge existed.
    bool remove_dependency(const TaskId& dependency, const TaskId& dependent);

    // ── Queries ───────────────────────────────
    [[nodiscard]] bool contains(const TaskId& id) const;
    [[nodiscard]] size_t task_count() const noexcept;
    [[nodiscard]] std::optional<Task> get_task(const TaskId& id) const;
    [[nodiscard]] const Task* find(const TaskId& id) const;
    [[nodiscard]] const std::vector<TaskId>& task_ids() const noexcept { return order_; }
    [[nodiscard]] std::vector<TaskId> tasks_in(TaskStatus status) const;
    [[nodiscard]] std::vector<TaskId> dependencies(const TaskId& id) const;
    [[nodiscard]] std::vector<TaskId> direct_dependents(const TaskId& id) const;
    [[nodiscard]] std::vector<TaskId> dependents_of(const TaskId& id) const;
    [[nodiscard]] std::vector<TaskId> topological_order() const;
    [[nodiscard]] bool has_cycle() const;
    [[nodiscard]] bool all_terminal() const noexcept;
    [[nodiscard]] GraphSnapshot snapshot() const noexcept;
    [[nodiscard]] std::vector<PhaseProgress> phase_progress() const;

    // ── State Machine ─────────────────────────

    /// Promote every Pending task whose dependencies are all Completed.
    std::vector<TaskId> ready_tasks();

    Result<void> mark_in_progress(const TaskId& id);
    Result<void> mark_completed(const TaskId& id, std::string result);
    Result<void> mark_failed(const TaskId& id, std::string error);

    /// Failed → Ready while retry_count < max_retries.
    Result<void> retry(const TaskId& id, uint32_t max_retries);

    /// Pending/Ready → Blocked with the given reason.
    Result<void> mark_blocked(const TaskId& id, std::string reason);

    /// Block every transitive dependent of `failed_id` still Pending or Ready.
    std::vector<TaskId> block_dependents(const TaskId& failed_id);

    /// Pending → Ready regardless of dependencies (deadlock breaker).
    Result<void> force_ready(const TaskId& id);

    /// Every Pending or Ready task → Cancelled.
    std::vector<TaskId> cancel_remaining();

private:
    struct StatusCounters {
        std::array<std::atomic<size_t>, kTaskStatusCount> counts{};
        std::atomic<size_t> total{0};
    };

    Task* find_mutable(const TaskId& id);
    Result<Task*> expect_status(const TaskId& id, TaskStatus expected, TaskStatus target);
    void set_status(Task& task, TaskStatus status);

    std::unordered_map<TaskId, Task> tasks_;
    std::vector<TaskId> order_;                                        // insertion order
    std::unordered_map<TaskId, std::vector<TaskId>> adj_list_;        // dependency → dependents
    std::unique_ptr<StatusCounters> counters_;
    uint64_t sequence_ = 0;
};

}  // namespace crew_orchestrator
