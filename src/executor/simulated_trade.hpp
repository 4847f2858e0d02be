/**
 * @file simulated_trade.hpp
 * @brief Stand-in worker used by the CLI demo, tests and benchmarks.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/types.hpp"
#include "scheduler/delegate.hpp"

#include <atomic>
#include <mutex>
#include <string>
#include <unordered_map>

namespace crew_orchestrator {

struct TradeBehavior {
    Duration work_time{1000};              ///< Simulated time spent per attempt
    uint32_t fail_first_attempts = 0;      ///< Fail this many attempts per task, then succeed
    bool always_fail = false;
};

/**
 * @brief Simulates a trade (carpenter, plumber, ...) performing a task.
 *
 * Waits for the configured work time unless the stop token fires first,
 * then reports a summary of the work or an injected failure.
 */
class SimulatedTrade : public IDelegate {
public:
    explicit SimulatedTrade(std::string trade, TradeBehavior behavior = {});

    Result<std::string> execute(const Task& task, std::stop_token stop) override;

    [[nodiscard]] const std::string& trade() const noexcept { return trade_; }
    [[nodiscard]] uint32_t calls() const noexcept { return calls_.load(); }

private:
    /// Returns false if the stop token fired before the work time elapsed.
    bool simulate_work(Duration target_duration, std::stop_token stop);

    std::string trade_;
    TradeBehavior behavior_;
    std::atomic<uint32_t> calls_{0};
    std::mutex attempts_mutex_;
    std::unordered_map<TaskId, uint32_t> attempts_;
};

}  // namespace crew_orchestrator
