/**
 * @file graph_builder.hpp
 * @brief Builds a validated, acyclic TaskGraph from an unvalidated task list.
 * @author Dimitris Kafetzis
 *
 * Input typically comes from a project template or an external planner and
 * may reference unknown ids or contain cycles. The builder repairs edges,
 * never tasks: every record that has a usable id ends up in the graph, and
 * each correction is reported as a ValidationWarning.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "graph/task_graph.hpp"

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace crew_orchestrator {

/**
 * @brief A task record as supplied by a template or planner.
 */
struct RawTask {
    TaskId id;
    OwnerTag owner;
    std::string description;
    std::string phase = "construction";
    std::vector<TaskId> dependencies;
    std::map<std::string, std::string> requirements;
    std::vector<std::string> materials;
};

enum class WarningKind : uint8_t {
    DanglingDependency,    ///< Dependency id not present in the task list
    DuplicateDependency,   ///< Same dependency listed more than once
    CycleEdgeRemoved,      ///< Back-edge removed to keep the graph acyclic
    DeadlockBroken         ///< Scheduler forced a stuck task to Ready
};

[[nodiscard]] constexpr std::string_view to_string(WarningKind kind) noexcept {
    switch (kind) {
        case WarningKind::DanglingDependency:  return "dangling_dependency";
        case WarningKind::DuplicateDependency: return "duplicate_dependency";
        case WarningKind::CycleEdgeRemoved:    return "cycle_edge_removed";
        case WarningKind::DeadlockBroken:      return "deadlock_broken";
    }
    return "unknown";
}

/**
 * @brief A non-fatal correction applied to the input or during a run.
 */
struct ValidationWarning {
    WarningKind kind;
    TaskId task_id;
    TaskId related_id;         ///< The dependency involved
    std::string message;
};

struct BuildOutput {
    TaskGraph graph;
    std::vector<ValidationWarning> warnings;
};

/**
 * @brief Validates raw task lists and produces task graphs.
 */
class GraphBuilder {
public:
    /**
     * @brief Index, repair and wire a raw task list.
     *
     * 1. Dependencies on ids absent from the list are removed.
     * 2. Repeated dependency ids are collapsed.
     * 3. A depth-first walk in input order removes every back-edge.
     *
     * Fails only on records that cannot be kept without guessing
     * (empty id, duplicate id).
     */
    [[nodiscard]] static Result<BuildOutput> build(std::vector<RawTask> raw_tasks);
};

}  // namespace crew_orchestrator
