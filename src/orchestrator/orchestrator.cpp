/**
 * @file orchestrator.cpp
 * @brief Orchestrator facade implementation.
 * @author Dimitris Kafetzis
 */

#include "orchestrator/orchestrator.hpp"
#include "telemetry/json_sink.hpp"
#include "workload/task_list_loader.hpp"
#include "workload/templates.hpp"

#include <utility>

namespace crew_orchestrator {

namespace {

std::unique_ptr<ILogSink> or_null_sink(std::unique_ptr<ILogSink> sink) {
    if (sink) return sink;
    return std::make_unique<NullSink>();
}

}  // anonymous namespace

Orchestrator::Orchestrator(Options opts)
    : config_(std::move(opts.config))
    , logger_(or_null_sink(std::move(opts.log_sink)), opts.log_level)
    , telemetry_(or_null_sink(std::move(opts.telemetry_sink)))
    , loop_(SchedulerConfig::from(config_), logger_, &telemetry_) {
}

Result<std::vector<RawTask>> Orchestrator::plan_project() {
    const auto& project = config_.project;

    if (!project.task_file.empty()) {
        logger_.info("Loading task list from " + project.task_file.string());
        auto tasks = load_task_list(project.task_file);
        if (!tasks) {
            logger_.error("Could not load task list: " + tasks.error().message);
        }
        return tasks;
    }

    TemplateOptions options{
        .has_electrical = project.has_electrical,
        .has_foundation = project.has_foundation,
        .width_ft = project.width_ft,
        .length_ft = project.length_ft,
        .height_ft = project.height_ft
    };
    auto tasks = ProjectTemplates::make(project.template_name, options);
    if (!tasks) {
        logger_.error(tasks.error().message);
        return tasks;
    }
    logger_.info("Planned " + project.template_name + " project: "
                 + std::to_string(tasks->size()) + " tasks");
    return tasks;
}

Result<FinalReport> Orchestrator::execute(std::vector<RawTask> raw_tasks, IDelegate& delegate,
                                          std::stop_token cancel) {
    logger_.info("Building task graph from " + std::to_string(raw_tasks.size()) + " records");

    auto built = GraphBuilder::build(std::move(raw_tasks));
    if (!built) {
        logger_.error("Task list rejected: " + built.error().message);
        return built.error();
    }

    auto& output = *built;
    for (const auto& warning : output.warnings) {
        logger_.warn("Validation: " + warning.message);
        telemetry_.record_warning(warning);
    }

    auto report = loop_.run(output.graph, delegate, cancel);
    telemetry_.flush();
    logger_.flush();
    if (!report) {
        return report.error();
    }

    auto warnings = std::move(output.warnings);
    warnings.insert(warnings.end(),
                    std::make_move_iterator(report->warnings.begin()),
                    std::make_move_iterator(report->warnings.end()));
    report->warnings = std::move(warnings);

    return report;
}

}  // namespace crew_orchestrator
