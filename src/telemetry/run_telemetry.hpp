/**
 * @file run_telemetry.hpp
 * @brief Structured event collection for scheduler runs.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"
#include "graph/graph_builder.hpp"
#include "scheduler/final_report.hpp"

#include <memory>
#include <mutex>
#include <string_view>

namespace crew_orchestrator {

/**
 * @brief Collects and logs structured run events as NDJSON.
 */
class RunTelemetry {
public:
    explicit RunTelemetry(std::unique_ptr<ILogSink> sink);

    void record_task_transition(const TaskId& id, TaskStatus from, TaskStatus to,
                                uint32_t attempt);
    void record_pass(uint32_t iteration, size_t newly_ready, size_t dispatched,
                     size_t completed, size_t failed);
    void record_warning(const ValidationWarning& warning);
    void record_run_complete(const FinalReport& report);
    void record_custom(std::string_view event, std::string_view json_payload);

    void flush();

    [[nodiscard]] size_t events_recorded() const noexcept;

private:
    std::unique_ptr<ILogSink> sink_;
    mutable std::mutex write_mutex_;
    size_t events_{0};

    void emit(std::string_view json_line);
};

}  // namespace crew_orchestrator
