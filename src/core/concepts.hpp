/**
 * @file concepts.hpp
 * @brief C++20 concept definitions for CrewOrchestrator interfaces.
 * @author Dimitris Kafetzis
 *
 * Defines compile-time constraints for callables plugged into the engine.
 * The scheduler itself talks to IDelegate; these concepts let plain lambdas
 * be adapted without writing a class per worker type.
 */

#pragma once

#include "core/result.hpp"

#include <concepts>
#include <stop_token>
#include <string>
#include <string_view>

namespace crew_orchestrator {

// Forward declarations
struct Task;

// ─────────────────────────────────────────────
// DelegateCallable
// ─────────────────────────────────────────────

/**
 * @concept DelegateCallable
 * @brief Constrains callables that can perform one task attempt.
 *
 * The stop token is signalled when the scheduler abandons the attempt
 * (deadline expired). Honoring it is up to the callable.
 */
template <typename F>
concept DelegateCallable = requires(F func, const Task& task, std::stop_token stop) {
    { func(task, stop) } -> std::convertible_to<Result<std::string>>;
};

// ─────────────────────────────────────────────
// LogSinkLike
// ─────────────────────────────────────────────

/**
 * @concept LogSinkLike
 * @brief Constrains types usable as a log destination.
 */
template <typename T>
concept LogSinkLike = requires(T sink, std::string_view line) {
    { sink.write(line) } -> std::same_as<void>;
    { sink.flush() } -> std::same_as<void>;
};

}  // namespace crew_orchestrator
