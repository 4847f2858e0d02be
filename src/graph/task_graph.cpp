/**
 * @file task_graph.cpp
 * @brief TaskGraph implementation — state machine and graph algorithms.
 * @author Dimitris Kafetzis
 *
 * Kahn's algorithm for topological ordering, iterative DFS for cycle
 * detection, BFS for the transitive dependent closure. Iteration follows
 * insertion order so results are deterministic for a given input.
 */

#include "graph/task_graph.hpp"
#include "graph/phase.hpp"

#include <algorithm>
#include <chrono>
#include <queue>
#include <stack>
#include <unordered_set>

namespace crew_orchestrator {

TaskGraph::TaskGraph() : counters_(std::make_unique<StatusCounters>()) {}
TaskGraph::~TaskGraph() = default;
TaskGraph::TaskGraph(TaskGraph&&) noexcept = default;
TaskGraph& TaskGraph::operator=(TaskGraph&&) noexcept = default;

// ─────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────

Result<TaskId> TaskGraph::add_task(Task task) {
    if (task.id.empty()) {
        return Error{ErrorCode::InvalidInput, "task id must not be empty"};
    }
    if (tasks_.contains(task.id)) {
        return Error{ErrorCode::DuplicateTask, "task " + task.id + " already exists"};
    }

    TaskId id = task.id;
    task.dependencies.clear();
    task.status = TaskStatus::Pending;

    adj_list_[id];
    order_.push_back(id);
    tasks_.emplace(id, std::move(task));

    counters_->counts[index_of(TaskStatus::Pending)].fetch_add(1, std::memory_order_relaxed);
    counters_->total.fetch_add(1, std::memory_order_relaxed);
    return id;
}

Result<void> TaskGraph::add_dependency(const TaskId& dependency, const TaskId& dependent) {
    auto* target = find_mutable(dependent);
    if (!target) {
        return Error{ErrorCode::NotFound, "unknown task " + dependent};
    }
    if (!contains(dependency)) {
        return Error{ErrorCode::NotFound,
                     "task " + dependent + " depends on unknown task " + dependency};
    }

    auto& deps = target->dependencies;
    if (std::find(deps.begin(), deps.end(), dependency) != deps.end()) {
        return {};
    }
    deps.push_back(dependency);
    adj_list_[dependency].push_back(dependent);
    return {};
}

bool TaskGraph::remove_dependency(const TaskId& dependency, const TaskId& dependent) {
    auto* target = find_mutable(dependent);
    if (!target) return false;

    auto& deps = target->dependencies;
    auto it = std::find(deps.begin(), deps.end(), dependency);
    if (it == deps.end()) return false;
    deps.erase(it);

    if (auto adj_it = adj_list_.find(dependency); adj_it != adj_list_.end()) {
        auto& out = adj_it->second;
        out.erase(std::remove(out.begin(), out.end(), dependent), out.end());
    }
    return true;
}

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

bool TaskGraph::contains(const TaskId& id) const {
    return tasks_.contains(id);
}

size_t TaskGraph::task_count() const noexcept {
    return tasks_.size();
}

std::optional<Task> TaskGraph::get_task(const TaskId& id) const {
    auto it = tasks_.find(id);
    if (it == tasks_.end()) return std::nullopt;
    return it->second;
}

const Task* TaskGraph::find(const TaskId& id) const {
    auto it = tasks_.find(id);
    return it == tasks_.end() ? nullptr : &it->second;
}

Task* TaskGraph::find_mutable(const TaskId& id) {
    auto it = tasks_.find(id);
    return it == tasks_.end() ? nullptr : &it->second;
}

std::vector<TaskId> TaskGraph::tasks_in(TaskStatus status) const {
    std::vector<TaskId> ids;
    for (const auto& id : order_) {
        if (tasks_.at(id).status == status) ids.push_back(id);
    }
    return ids;
}

std::vector<TaskId> TaskGraph::dependencies(const TaskId& id) const {
    auto it = tasks_.find(id);
    if (it == tasks_.end()) return {};
    return it->second.dependencies;
}

std::vector<TaskId> TaskGraph::direct_dependents(const TaskId& id) const {
    auto it = adj_list_.find(id);
    if (it == adj_list_.end()) return {};
    return it->second;
}

std::vector<TaskId> TaskGraph::dependents_of(const TaskId& id) const {
    std::vector<TaskId> closure;
    std::unordered_set<TaskId> visited{id};
    std::queue<TaskId> frontier;
    frontier.push(id);

    while (!frontier.empty()) {
        auto current = frontier.front();
        frontier.pop();

        auto it = adj_list_.find(current);
        if (it == adj_list_.end()) continue;
        for (const auto& next : it->second) {
            if (visited.insert(next).second) {
                closure.push_back(next);
                frontier.push(next);
            }
        }
    }
    return closure;
}

// ─────────────────────────────────────────────
// Topological Ordering (Kahn's Algorithm)
// ─────────────────────────────────────────────

std::vector<TaskId> TaskGraph::topological_order() const {
    std::unordered_map<TaskId, size_t> in_degree;
    for (const auto& id : order_) {
        in_degree[id] = tasks_.at(id).dependencies.size();
    }

    std::queue<TaskId> zero_in;
    for (const auto& id : order_) {
        if (in_degree[id] == 0) zero_in.push(id);
    }

    std::vector<TaskId> sorted;
    sorted.reserve(tasks_.size());

    while (!zero_in.empty()) {
        auto current = zero_in.front();
        zero_in.pop();
        sorted.push_back(current);

        for (const auto& dependent : adj_list_.at(current)) {
            if (--in_degree[dependent] == 0) {
                zero_in.push(dependent);
            }
        }
    }

    return sorted;
}

bool TaskGraph::has_cycle() const {
    enum class Color : uint8_t { White, Gray, Black };
    std::unordered_map<TaskId, Color> color;

    for (const auto& id : order_) {
        color[id] = Color::White;
    }

    struct Frame {
        TaskId node;
        size_t neighbor_idx;
    };

    for (const auto& start_id : order_) {
        if (color[start_id] != Color::White) continue;

        std::stack<Frame> dfs_stack;
        dfs_stack.push({start_id, 0});
        color[start_id] = Color::Gray;

        while (!dfs_stack.empty()) {
            auto& [node, idx] = dfs_stack.top();
            const auto& neighbors = adj_list_.at(node);

            if (idx >= neighbors.size()) {
                color[node] = Color::Black;
                dfs_stack.pop();
                continue;
            }

            const auto neighbor = neighbors[idx];
            ++idx;

            if (color[neighbor] == Color::Gray) {
                return true;
            }
            if (color[neighbor] == Color::White) {
                color[neighbor] = Color::Gray;
                dfs_stack.push({neighbor, 0});
            }
        }
    }

    return false;
}

bool TaskGraph::all_terminal() const noexcept {
    return std::all_of(tasks_.begin(), tasks_.end(), [](const auto& entry) {
        return is_terminal(entry.second.status);
    });
}

GraphSnapshot TaskGraph::snapshot() const noexcept {
    GraphSnapshot snap;
    if (!counters_) return snap;

    snap.total = counters_->total.load(std::memory_order_relaxed);
    for (auto status : kAllStatuses) {
        snap.counts[index_of(status)] =
            counters_->counts[index_of(status)].load(std::memory_order_relaxed);
    }
    if (snap.total > 0) {
        snap.completion_percent = 100.0
            * static_cast<double>(snap.count(TaskStatus::Completed))
            / static_cast<double>(snap.total);
    }
    return snap;
}

std::vector<PhaseProgress> TaskGraph::phase_progress() const {
    std::vector<PhaseProgress> phases;
    for (const auto& id : order_) {
        const auto& task = tasks_.at(id);
        auto it = std::find_if(phases.begin(), phases.end(),
            [&](const PhaseProgress& p) { return p.phase == task.phase; });
        if (it == phases.end()) {
            phases.push_back(PhaseProgress{.phase = task.phase});
            it = std::prev(phases.end());
        }
        ++it->total;
        if (task.status == TaskStatus::Completed) ++it->completed;
    }

    std::stable_sort(phases.begin(), phases.end(),
        [](const PhaseProgress& a, const PhaseProgress& b) {
            return phase_rank(a.phase) < phase_rank(b.phase);
        });
    return phases;
}

// ─────────────────────────────────────────────
// State Machine
// ─────────────────────────────────────────────

void TaskGraph::set_status(Task& task, TaskStatus status) {
    counters_->counts[index_of(task.status)].fetch_sub(1, std::memory_order_relaxed);
    counters_->counts[index_of(status)].fetch_add(1, std::memory_order_relaxed);
    task.status = status;

    ++sequence_;
    switch (status) {
        case TaskStatus::Ready:
            task.ready_seq = sequence_;
            break;
        case TaskStatus::InProgress:
            task.started_seq = sequence_;
            task.started_at = std::chrono::steady_clock::now();
            break;
        case TaskStatus::Completed:
        case TaskStatus::Failed:
        case TaskStatus::Blocked:
        case TaskStatus::Cancelled:
            task.finished_seq = sequence_;
            task.finished_at = std::chrono::steady_clock::now();
            break;
        case TaskStatus::Pending:
            break;
    }
}

Result<Task*> TaskGraph::expect_status(const TaskId& id, TaskStatus expected, TaskStatus target) {
    auto* task = find_mutable(id);
    if (!task) {
        return Error{ErrorCode::NotFound, "unknown task " + id};
    }
    if (task->status != expected) {
        return Error{ErrorCode::InvalidTransition,
                     "task " + id + ": cannot move from " + std::string{to_string(task->status)}
                     + " to " + std::string{to_string(target)}};
    }
    return task;
}

std::vector<TaskId> TaskGraph::ready_tasks() {
    std::vector<TaskId> ready;

    for (const auto& id : order_) {
        auto& task = tasks_.at(id);
        if (task.status != TaskStatus::Pending) continue;

        bool all_deps_met = std::all_of(task.dependencies.begin(), task.dependencies.end(),
            [this](const TaskId& dep) {
                return tasks_.at(dep).status == TaskStatus::Completed;
            });

        if (all_deps_met) {
            set_status(task, TaskStatus::Ready);
            ready.push_back(id);
        }
    }

    return ready;
}

Result<void> TaskGraph::mark_in_progress(const TaskId& id) {
    auto task = expect_status(id, TaskStatus::Ready, TaskStatus::InProgress);
    if (!task) return task.error();

    ++(*task)->attempts;
    set_status(**task, TaskStatus::InProgress);
    return {};
}

Result<void> TaskGraph::mark_completed(const TaskId& id, std::string result) {
    auto task = expect_status(id, TaskStatus::InProgress, TaskStatus::Completed);
    if (!task) return task.error();

    (*task)->result = std::move(result);
    (*task)->error.reset();
    set_status(**task, TaskStatus::Completed);
    return {};
}

Result<void> TaskGraph::mark_failed(const TaskId& id, std::string error) {
    auto task = expect_status(id, TaskStatus::InProgress, TaskStatus::Failed);
    if (!task) return task.error();

    (*task)->error = std::move(error);
    set_status(**task, TaskStatus::Failed);
    return {};
}

Result<void> TaskGraph::retry(const TaskId& id, uint32_t max_retries) {
    auto task = expect_status(id, TaskStatus::Failed, TaskStatus::Ready);
    if (!task) return task.error();

    if ((*task)->retry_count >= max_retries) {
        return Error{ErrorCode::InvalidTransition,
                     "task " + id + ": retry budget of " + std::to_string(max_retries)
                     + " exhausted"};
    }
    ++(*task)->retry_count;
    (*task)->error.reset();
    set_status(**task, TaskStatus::Ready);
    return {};
}

Result<void> TaskGraph::mark_blocked(const TaskId& id, std::string reason) {
    auto* task = find_mutable(id);
    if (!task) {
        return Error{ErrorCode::NotFound, "unknown task " + id};
    }
    if (task->status != TaskStatus::Pending && task->status != TaskStatus::Ready) {
        return Error{ErrorCode::InvalidTransition,
                     "task " + id + ": cannot move from "
                     + std::string{to_string(task->status)} + " to blocked"};
    }
    task->error = std::move(reason);
    set_status(*task, TaskStatus::Blocked);
    return {};
}

std::vector<TaskId> TaskGraph::block_dependents(const TaskId& failed_id) {
    std::vector<TaskId> blocked;
    for (const auto& id : dependents_of(failed_id)) {
        auto& task = tasks_.at(id);
        if (task.status != TaskStatus::Pending && task.status != TaskStatus::Ready) continue;

        task.error = "blocked: dependency " + failed_id + " failed";
        set_status(task, TaskStatus::Blocked);
        blocked.push_back(id);
    }
    return blocked;
}

Result<void> TaskGraph::force_ready(const TaskId& id) {
    auto task = expect_status(id, TaskStatus::Pending, TaskStatus::Ready);
    if (!task) return task.error();

    set_status(**task, TaskStatus::Ready);
    return {};
}

std::vector<TaskId> TaskGraph::cancel_remaining() {
    std::vector<TaskId> cancelled;
    for (const auto& id : order_) {
        auto& task = tasks_.at(id);
        if (task.status != TaskStatus::Pending && task.status != TaskStatus::Ready) continue;

        task.error = "cancelled: run stopped before dispatch";
        set_status(task, TaskStatus::Cancelled);
        cancelled.push_back(id);
    }
    return cancelled;
}

}  // namespace crew_orchestrator
