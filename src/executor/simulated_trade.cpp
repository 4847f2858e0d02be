/**
 * @file simulated_trade.cpp
 * @brief SimulatedTrade implementation with stop-token aware waiting.
 * @author Dimitris Kafetzis
 */

#include "executor/simulated_trade.hpp"

#include <chrono>
#include <condition_variable>
#include <sstream>

namespace crew_orchestrator {

SimulatedTrade::SimulatedTrade(std::string trade, TradeBehavior behavior)
    : trade_(std::move(trade)), behavior_(behavior) {}

Result<std::string> SimulatedTrade::execute(const Task& task, std::stop_token stop) {
    calls_.fetch_add(1);

    uint32_t attempt = 0;
    {
        std::lock_guard lock(attempts_mutex_);
        attempt = ++attempts_[task.id];
    }

    if (!simulate_work(behavior_.work_time, stop)) {
        return Error{ErrorCode::DelegateFailure,
                     trade_ + " abandoned task " + task.id + ": cancelled via stop token"};
    }

    if (behavior_.always_fail || attempt <= behavior_.fail_first_attempts) {
        return Error{ErrorCode::DelegateFailure,
                     trade_ + " could not complete task " + task.id
                     + " (attempt " + std::to_string(attempt) + ")"};
    }

    std::ostringstream summary;
    summary << trade_ << " completed task " << task.id << ": " << task.description;
    if (!task.materials.empty()) {
        summary << " [materials:";
        for (const auto& material : task.materials) {
            summary << ' ' << material << ';';
        }
        summary << ']';
    }
    return summary.str();
}

bool SimulatedTrade::simulate_work(Duration target_duration, std::stop_token stop) {
    if (target_duration <= Duration::zero()) return !stop.stop_requested();

    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_lock lock(mutex);

    // Nothing notifies cv: this returns on timeout or on a stop request.
    cv.wait_for(lock, stop, target_duration, [] { return false; });
    return !stop.stop_requested();
}

}  // namespace crew_orchestrator
