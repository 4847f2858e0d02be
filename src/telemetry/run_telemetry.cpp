/**
 * @file run_telemetry.cpp
 * @brief RunTelemetry implementation.
 * @author Dimitris Kafetzis
 */

#include "telemetry/run_telemetry.hpp"

#include <sstream>

namespace crew_orchestrator {

RunTelemetry::RunTelemetry(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void RunTelemetry::record_task_transition(const TaskId& id, TaskStatus from, TaskStatus to,
                                          uint32_t attempt) {
    std::ostringstream oss;
    oss << R"({"event":"task_state_change")"
        << R"(,"task":")" << json_escape(id) << "\""
        << R"(,"from":")" << to_string(from) << "\""
        << R"(,"to":")" << to_string(to) << "\""
        << R"(,"attempt":)" << attempt
        << "}";
    emit(oss.str());
}

void RunTelemetry::record_pass(uint32_t iteration, size_t newly_ready, size_t dispatched,
                               size_t completed, size_t failed) {
    std::ostringstream oss;
    oss << R"({"event":"pass_summary")"
        << R"(,"iteration":)" << iteration
        << R"(,"newly_ready":)" << newly_ready
        << R"(,"dispatched":)" << dispatched
        << R"(,"completed":)" << completed
        << R"(,"failed":)" << failed
        << "}";
    emit(oss.str());
}

void RunTelemetry::record_warning(const ValidationWarning& warning) {
    std::ostringstream oss;
    oss << R"({"event":")" << to_string(warning.kind) << "\""
        << R"(,"task":")" << json_escape(warning.task_id) << "\""
        << R"(,"related":")" << json_escape(warning.related_id) << "\""
        << R"(,"msg":")" << json_escape(warning.message) << "\""
        << "}";
    emit(oss.str());
}

void RunTelemetry::record_run_complete(const FinalReport& report) {
    std::ostringstream oss;
    oss << R"({"event":"run_complete")"
        << R"(,"total":)" << report.total
        << R"(,"completed":)" << report.completed
        << R"(,"failed":)" << report.failed
        << R"(,"blocked":)" << report.blocked
        << R"(,"cancelled":)" << report.cancelled
        << R"(,"stalled":)" << (report.stalled ? "true" : "false")
        << R"(,"cancelled_run":)" << (report.cancelled_run ? "true" : "false")
        << R"(,"iterations":)" << report.iterations
        << R"(,"warnings":)" << report.warnings.size()
        << R"(,"duration_us":)" << report.elapsed.count()
        << "}";
    emit(oss.str());
}

void RunTelemetry::record_custom(std::string_view event, std::string_view json_payload) {
    std::ostringstream oss;
    oss << R"({"event":")" << json_escape(event) << "\""
        << R"(,"data":)" << json_payload
        << "}";
    emit(oss.str());
}

void RunTelemetry::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
    ++events_;
}

void RunTelemetry::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

size_t RunTelemetry::events_recorded() const noexcept {
    std::lock_guard lock(write_mutex_);
    return events_;
}

}  // namespace crew_orchestrator
