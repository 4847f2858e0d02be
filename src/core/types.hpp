/**
 * @file types.hpp
 * @brief Fundamental types used throughout CrewOrchestrator.
 * @author Dimitris Kafetzis
 *
 * Defines TaskId, TaskStatus, and the clock aliases shared by the graph,
 * the scheduler loop and telemetry.
 */

#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace crew_orchestrator {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using TaskId = std::string;
using OwnerTag = std::string;
using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::microseconds;
using SteadyTime = std::chrono::steady_clock::time_point;

// ─────────────────────────────────────────────
// Task Status
// ─────────────────────────────────────────────

enum class TaskStatus : uint8_t {
    Pending,       ///< Waiting for dependencies
    Ready,         ///< All dependencies completed, not yet dispatched
    InProgress,    ///< Handed to the delegate
    Completed,     ///< Delegate reported success
    Failed,        ///< Delegate reported an error or timed out
    Blocked,       ///< A dependency failed permanently
    Cancelled      ///< Run stopped before the task was dispatched
};

inline constexpr size_t kTaskStatusCount = 7;

[[nodiscard]] constexpr size_t index_of(TaskStatus status) noexcept {
    return static_cast<size_t>(status);
}

/**
 * @brief Convert TaskStatus to string representation.
 */
[[nodiscard]] constexpr std::string_view to_string(TaskStatus status) noexcept {
    switch (status) {
        case TaskStatus::Pending:    return "pending";
        case TaskStatus::Ready:      return "ready";
        case TaskStatus::InProgress: return "in_progress";
        case TaskStatus::Completed:  return "completed";
        case TaskStatus::Failed:     return "failed";
        case TaskStatus::Blocked:    return "blocked";
        case TaskStatus::Cancelled:  return "cancelled";
    }
    return "unknown";
}

/// Completed, Failed, Blocked and Cancelled end a task's life within a run.
/// A Failed task may still be retried by the scheduler before the run ends.
[[nodiscard]] constexpr bool is_terminal(TaskStatus status) noexcept {
    return status == TaskStatus::Completed
        || status == TaskStatus::Failed
        || status == TaskStatus::Blocked
        || status == TaskStatus::Cancelled;
}

inline constexpr std::array<TaskStatus, kTaskStatusCount> kAllStatuses{
    TaskStatus::Pending, TaskStatus::Ready, TaskStatus::InProgress,
    TaskStatus::Completed, TaskStatus::Failed, TaskStatus::Blocked,
    TaskStatus::Cancelled
};

}  // namespace crew_orchestrator
