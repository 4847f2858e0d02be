/**
 * @file main.cpp
 * @brief CrewOrchestrator command-line entry point.
 * @author Dimitris Kafetzis
 *
 * Wires all modules into one project run:
 *   Config → Logger → Planner (template or task file) → Builder → Scheduler → Report
 *
 * Each owner tag in the task list gets a SimulatedTrade worker.
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "executor/simulated_trade.hpp"
#include "orchestrator/orchestrator.hpp"
#include "scheduler/owner_registry.hpp"
#include "telemetry/json_sink.hpp"
#include "workload/templates.hpp"

#include <chrono>
#include <csignal>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace crew_orchestrator;

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitIncomplete = 1;
constexpr int kExitConfigError = 2;

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

void print_banner() {
    std::cout << R"(
  ╔═══════════════════════════════════════════╗
  ║         CrewOrchestrator v1.0.0           ║
  ║   Dependency-Ordered Task Scheduling      ║
  ║   for Construction Crews                  ║
  ╚═══════════════════════════════════════════╝
)" << std::endl;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    bool config_given = false;
    std::string template_name;
    std::filesystem::path task_file;
    std::vector<std::string> fail_owners;
    std::string log_dir;
    uint32_t work_ms = 50;
    bool stdout_log = false;
};

void print_usage() {
    std::cout << "Usage: crew_orchestrator [OPTIONS]\n"
              << "  --config <path>       Configuration file (default: config/default.toml)\n"
              << "  --template <name>     Project template:";
    for (auto name : ProjectTemplates::names()) std::cout << ' ' << name;
    std::cout << "\n"
              << "  --task-file <path>    Planner task list (TOML), overrides --template\n"
              << "  --fail-owner <owner>  Make every task of this owner fail (repeatable)\n"
              << "  --work-ms <ms>        Simulated work time per task (default: 50)\n"
              << "  --log-dir <path>      Log output directory\n"
              << "  --stdout-log          Write log records to stdout instead of files\n"
              << "  --help, -h            Show this help message\n";
}

Result<CLIArgs> parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;
        if (arg == "--config" && has_value) {
            args.config_path = argv[++i];
            args.config_given = true;
        } else if (arg == "--template" && has_value) {
            args.template_name = argv[++i];
        } else if (arg == "--task-file" && has_value) {
            args.task_file = argv[++i];
        } else if (arg == "--fail-owner" && has_value) {
            args.fail_owners.emplace_back(argv[++i]);
        } else if (arg == "--work-ms" && has_value) {
            try {
                args.work_ms = static_cast<uint32_t>(std::stoul(argv[++i]));
            } catch (const std::exception&) {
                return Error{ErrorCode::InvalidInput, "--work-ms expects a number of milliseconds"};
            }
        } else if (arg == "--log-dir" && has_value) {
            args.log_dir = argv[++i];
        } else if (arg == "--stdout-log") {
            args.stdout_log = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(kExitSuccess);
        } else {
            return Error{ErrorCode::InvalidInput, "unknown or incomplete option: " + arg};
        }
    }
    return args;
}

Result<Config> resolve_config(const CLIArgs& args) {
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        // Only a missing default file falls back to built-in defaults.
        if (args.config_given || config_result.error().code != ErrorCode::NotFound) {
            return config_result.error();
        }
        std::cerr << "No configuration at " << args.config_path.string()
                  << ", using defaults." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    // Apply CLI overrides
    if (!args.template_name.empty()) {
        config.project.template_name = args.template_name;
        config.project.task_file.clear();
    }
    if (!args.task_file.empty()) config.project.task_file = args.task_file;
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;

    return config;
}

void print_report(const FinalReport& report) {
    std::cout << "\n=== Project Report ===\n";

    for (const auto& phase : report.phases) {
        std::cout << "\n[" << phase.phase << "] " << phase.completed << "/" << phase.total
                  << " completed\n";
        for (const auto& task : report.tasks) {
            if (task.phase != phase.phase) continue;
            std::cout << "  " << std::left << std::setw(4) << task.id
                      << std::setw(12) << task.owner
                      << std::setw(12) << to_string(task.status)
                      << task.description;
            if (task.retry_count > 0) std::cout << " (retries: " << task.retry_count << ")";
            std::cout << "\n";
            if (task.error) std::cout << "        " << *task.error << "\n";
        }
    }

    if (!report.warnings.empty()) {
        std::cout << "\nWarnings:\n";
        for (const auto& warning : report.warnings) {
            std::cout << "  [" << to_string(warning.kind) << "] " << warning.message << "\n";
        }
    }

    std::cout << "\nTotal " << report.total << ": " << report.completed << " completed, "
              << report.failed << " failed, " << report.blocked << " blocked, "
              << report.cancelled << " cancelled ("
              << std::fixed << std::setprecision(1) << report.completion_percent << "%) in "
              << report.iterations << " passes, "
              << std::chrono::duration_cast<std::chrono::milliseconds>(report.elapsed).count()
              << " ms\n";
    if (report.stalled) std::cout << "Run stalled: iteration ceiling reached.\n";
    if (report.cancelled_run) std::cout << "Run cancelled.\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    print_banner();

    auto args = parse_args(argc, argv);
    if (!args) {
        std::cerr << args.error().message << std::endl;
        print_usage();
        return kExitConfigError;
    }

    // Load configuration
    auto config = resolve_config(*args);
    if (!config) {
        std::cerr << "Failed to load config: " << config.error().message << std::endl;
        return kExitConfigError;
    }

    // ── Initialize Logging ───────────────────
    auto level = parse_log_level(config->telemetry.log_level).value_or(LogLevel::Info);
    std::unique_ptr<ILogSink> log_sink;
    std::unique_ptr<ILogSink> telemetry_sink;
    if (args->stdout_log || config->telemetry.log_dir.empty()) {
        log_sink = std::make_unique<StdoutSink>();
        telemetry_sink = std::make_unique<NullSink>();
    } else {
        const auto& telemetry = config->telemetry;
        log_sink = std::make_unique<JsonFileSink>(telemetry.log_dir, "crew_orchestrator",
                                                  telemetry.max_file_size_mb,
                                                  telemetry.rotate_count);
        telemetry_sink = std::make_unique<JsonFileSink>(telemetry.log_dir, "run_events",
                                                        telemetry.max_file_size_mb,
                                                        telemetry.rotate_count);
    }

    // Workers are declared before the orchestrator so they outlive its pool.
    OwnerRegistry registry;

    Orchestrator orchestrator(Orchestrator::Options{
        .config = *config,
        .log_sink = std::move(log_sink),
        .telemetry_sink = std::move(telemetry_sink),
        .log_level = level
    });
    auto& logger = orchestrator.logger();
    logger.info("CrewOrchestrator starting...");

    // ── Plan ─────────────────────────────────
    auto raw_tasks = orchestrator.plan_project();
    if (!raw_tasks) {
        std::cerr << "Failed to plan project: " << raw_tasks.error().message << std::endl;
        return kExitConfigError;
    }

    std::set<OwnerTag> owners;
    for (const auto& task : *raw_tasks) owners.insert(task.owner);
    for (const auto& owner : owners) {
        TradeBehavior behavior{.work_time = std::chrono::milliseconds{args->work_ms}};
        for (const auto& failing : args->fail_owners) {
            if (failing == owner) behavior.always_fail = true;
        }
        registry.register_owner(owner, std::make_shared<SimulatedTrade>(owner, behavior));
        logger.info("Registered trade " + owner + (behavior.always_fail ? " (failing)" : ""));
    }

    // Register signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::stop_source cancel;
    std::jthread signal_watcher([&cancel](std::stop_token stop) {
        while (!stop.stop_requested()) {
            if (g_shutdown_requested) {
                cancel.request_stop();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    });

    // ── Run ──────────────────────────────────
    auto report = orchestrator.execute(std::move(*raw_tasks), registry, cancel.get_token());
    signal_watcher.request_stop();

    if (!report) {
        std::cerr << "Run failed: " << report.error().message << std::endl;
        return kExitConfigError;
    }

    print_report(*report);
    logger.info("CrewOrchestrator stopped.");
    return report->succeeded() ? kExitSuccess : kExitIncomplete;
}
