/**
 * @file graph_builder.cpp
 * @brief GraphBuilder — dangling reference removal and cycle breaking.
 * @author Dimitris Kafetzis
 */

#include "graph/graph_builder.hpp"

#include <algorithm>
#include <stack>
#include <unordered_map>
#include <unordered_set>

namespace crew_orchestrator {

namespace {

struct Frame {
    size_t node;
    size_t dep_idx;
};

/// Remove every DFS back-edge from `deps` (task index → dependency indices).
/// What remains are tree, forward and cross edges, which cannot form a cycle.
void break_cycles(std::vector<std::vector<size_t>>& deps,
                  const std::vector<RawTask>& tasks,
                  std::vector<ValidationWarning>& warnings) {
    enum class Color : uint8_t { White, Gray, Black };
    std::vector<Color> color(deps.size(), Color::White);

    for (size_t start = 0; start < deps.size(); ++start) {
        if (color[start] != Color::White) continue;

        std::stack<Frame> dfs_stack;
        dfs_stack.push({start, 0});
        color[start] = Color::Gray;

        while (!dfs_stack.empty()) {
            auto& frame = dfs_stack.top();
            auto& edges = deps[frame.node];

            if (frame.dep_idx >= edges.size()) {
                color[frame.node] = Color::Black;
                dfs_stack.pop();
                continue;
            }

            size_t next = edges[frame.dep_idx];

            if (color[next] == Color::Gray) {
                const auto& from = tasks[frame.node].id;
                const auto& to = tasks[next].id;
                warnings.push_back(ValidationWarning{
                    .kind = WarningKind::CycleEdgeRemoved,
                    .task_id = from,
                    .related_id = to,
                    .message = "task " + from + ": removed dependency on " + to
                               + " to break a dependency cycle"
                });
                edges.erase(edges.begin() + static_cast<std::ptrdiff_t>(frame.dep_idx));
                continue;
            }

            ++frame.dep_idx;
            if (color[next] == Color::White) {
                color[next] = Color::Gray;
                dfs_stack.push({next, 0});
            }
        }
    }
}

}  // anonymous namespace

Result<BuildOutput> GraphBuilder::build(std::vector<RawTask> raw_tasks) {
    BuildOutput output;

    // ── 1. Index ─────────────────────────────
    std::unordered_map<TaskId, size_t> index;
    index.reserve(raw_tasks.size());
    for (size_t i = 0; i < raw_tasks.size(); ++i) {
        const auto& id = raw_tasks[i].id;
        if (id.empty()) {
            return Error{ErrorCode::InvalidInput,
                         "task record #" + std::to_string(i + 1) + " has an empty id"};
        }
        if (!index.emplace(id, i).second) {
            return Error{ErrorCode::DuplicateTask, "task id " + id + " appears more than once"};
        }
    }

    // ── 2. Dangling and repeated references ──
    std::vector<std::vector<size_t>> deps(raw_tasks.size());
    for (size_t i = 0; i < raw_tasks.size(); ++i) {
        const auto& task = raw_tasks[i];
        std::unordered_set<size_t> seen;

        for (const auto& dep_id : task.dependencies) {
            auto it = index.find(dep_id);
            if (it == index.end()) {
                output.warnings.push_back(ValidationWarning{
                    .kind = WarningKind::DanglingDependency,
                    .task_id = task.id,
                    .related_id = dep_id,
                    .message = "task " + task.id + ": removed dependency on unknown task "
                               + dep_id
                });
                continue;
            }
            if (!seen.insert(it->second).second) {
                output.warnings.push_back(ValidationWarning{
                    .kind = WarningKind::DuplicateDependency,
                    .task_id = task.id,
                    .related_id = dep_id,
                    .message = "task " + task.id + ": dependency on " + dep_id
                               + " listed more than once"
                });
                continue;
            }
            deps[i].push_back(it->second);
        }
    }

    // ── 3. Cycle breaking ────────────────────
    break_cycles(deps, raw_tasks, output.warnings);

    // ── 4. Wire the graph ────────────────────
    for (auto& raw : raw_tasks) {
        Task task{
            .id = raw.id,
            .owner = std::move(raw.owner),
            .description = std::move(raw.description),
            .phase = std::move(raw.phase),
            .dependencies = {},
            .requirements = std::move(raw.requirements),
            .materials = std::move(raw.materials),
        };
        if (auto added = output.graph.add_task(std::move(task)); !added) {
            return added.error();
        }
    }

    for (size_t i = 0; i < raw_tasks.size(); ++i) {
        for (size_t dep : deps[i]) {
            if (auto wired = output.graph.add_dependency(raw_tasks[dep].id, raw_tasks[i].id);
                !wired) {
                return wired.error();
            }
        }
    }

    return Result<BuildOutput>{std::move(output)};
}

}  // namespace crew_orchestrator
