/**
 * @file delegate.hpp
 * @brief The outbound capability the scheduler calls once per task attempt.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/concepts.hpp"
#include "core/result.hpp"
#include "graph/task_graph.hpp"

#include <stop_token>
#include <string>
#include <type_traits>
#include <utility>

namespace crew_orchestrator {

/**
 * @brief Abstract worker capability (runtime polymorphism).
 *
 * execute() is called from pool threads, possibly for several tasks at
 * once, so implementations must be thread-safe. The task is a copy owned
 * by the call. The stop token is signalled when the scheduler stops
 * waiting (deadline expired); the scheduler cannot interrupt a call that
 * ignores it, and such a call keeps running after its failure has been
 * recorded.
 */
class IDelegate {
public:
    virtual ~IDelegate() = default;
    virtual Result<std::string> execute(const Task& task, std::stop_token stop) = 0;
};

/**
 * @brief Adapts any DelegateCallable to IDelegate.
 */
template <DelegateCallable F>
class FunctionDelegate : public IDelegate {
public:
    explicit FunctionDelegate(F func) : func_(std::move(func)) {}

    Result<std::string> execute(const Task& task, std::stop_token stop) override {
        return func_(task, stop);
    }

private:
    F func_;
};

template <typename F>
    requires DelegateCallable<std::decay_t<F>>
FunctionDelegate<std::decay_t<F>> make_delegate(F&& func) {
    return FunctionDelegate<std::decay_t<F>>(std::forward<F>(func));
}

}  // namespace crew_orchestrator
