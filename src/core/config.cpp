/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"
#include "core/logger.hpp"

#include <toml++/toml.hpp>

#include <cstdint>
#include <limits>
#include <string_view>

namespace crew_orchestrator {

namespace {

/// Reads `section.key` into `out` when present. Negative, oversized or
/// non-integer values are rejected instead of wrapping.
Result<void> read_count(toml::node_view<toml::node> table, std::string_view section,
                        std::string_view key, uint32_t& out) {
    auto node = table[key];
    if (!node) return {};

    auto value = node.value<int64_t>();
    if (!value || *value < 0 || *value > int64_t{std::numeric_limits<uint32_t>::max()}) {
        return Error{ErrorCode::Config,
                     std::string{section} + "." + std::string{key}
                     + " must be an integer between 0 and "
                     + std::to_string(std::numeric_limits<uint32_t>::max())};
    }
    out = static_cast<uint32_t>(*value);
    return {};
}

}  // anonymous namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::NotFound, "Configuration file not found: " + path.string()};
    }

    Config config;

    try {
        auto tbl = toml::parse_file(path.string());

        // [scheduler]
        if (auto scheduler = tbl["scheduler"]; scheduler.is_table()) {
            auto& sched = config.scheduler;
            if (auto r = read_count(scheduler, "scheduler", "per_task_timeout_ms",
                                    sched.per_task_timeout_ms); !r) return r.error();
            if (auto r = read_count(scheduler, "scheduler", "max_retries",
                                    sched.max_retries); !r) return r.error();
            if (auto r = read_count(scheduler, "scheduler", "max_total_iterations",
                                    sched.max_total_iterations); !r) return r.error();
            if (auto r = read_count(scheduler, "scheduler", "max_parallel",
                                    sched.max_parallel); !r) return r.error();
            sched.order_by_phase = scheduler["order_by_phase"].value_or(true);
        }

        // [executor]
        if (auto executor = tbl["executor"]; executor.is_table()) {
            if (auto r = read_count(executor, "executor", "thread_count",
                                    config.executor.thread_count); !r) return r.error();
        }

        // [project]
        if (auto project = tbl["project"]; project.is_table()) {
            config.project.template_name =
                project["template"].value_or(std::string{"kitchen_remodel"});
            config.project.has_electrical = project["has_electrical"].value_or(false);
            config.project.has_foundation = project["has_foundation"].value_or(true);
            if (auto r = read_count(project, "project", "width_ft",
                                    config.project.width_ft); !r) return r.error();
            if (auto r = read_count(project, "project", "length_ft",
                                    config.project.length_ft); !r) return r.error();
            if (auto r = read_count(project, "project", "height_ft",
                                    config.project.height_ft); !r) return r.error();
            config.project.task_file = project["task_file"].value_or(std::string{});
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{"./logs"});
            if (auto r = read_count(telemetry, "telemetry", "max_file_size_mb",
                                    config.telemetry.max_file_size_mb); !r) return r.error();
            if (auto r = read_count(telemetry, "telemetry", "rotate_count",
                                    config.telemetry.rotate_count); !r) return r.error();
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
        }

    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::Parse,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }

    if (auto valid = validate_config(config); !valid) {
        return valid.error();
    }
    return config;
}

Config default_config() {
    return Config{};
}

Result<void> validate_config(const Config& config) {
    if (config.scheduler.max_total_iterations == 0) {
        return Error{ErrorCode::Config, "scheduler.max_total_iterations must be positive"};
    }
    if (config.scheduler.per_task_timeout_ms == 0) {
        return Error{ErrorCode::Config, "scheduler.per_task_timeout_ms must be positive"};
    }
    if (!parse_log_level(config.telemetry.log_level)) {
        return Error{ErrorCode::Config,
                     "telemetry.log_level is not a known level: " + config.telemetry.log_level};
    }
    return {};
}

}  // namespace crew_orchestrator
