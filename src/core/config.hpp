/**
 * @file config.hpp
 * @brief Engine configuration with TOML deserialization.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

#include "core/result.hpp"

namespace crew_orchestrator {

struct SchedulerSettings {
    uint32_t per_task_timeout_ms = 300000;   ///< 5 minutes per delegate call
    uint32_t max_retries = 2;
    uint32_t max_total_iterations = 50;      ///< Hard ceiling on scheduling passes
    uint32_t max_parallel = 0;               ///< 0 = every ready task of a pass
    bool order_by_phase = true;
};

struct ExecutorConfig {
    uint32_t thread_count = 0;               ///< 0 = hardware_concurrency
};

struct ProjectConfig {
    std::string template_name = "kitchen_remodel";
    bool has_electrical = false;
    bool has_foundation = true;
    uint32_t width_ft = 10;
    uint32_t length_ft = 12;
    uint32_t height_ft = 8;
    std::filesystem::path task_file;         ///< Planner task list, overrides template
};

struct TelemetryConfig {
    std::filesystem::path log_dir = "./logs";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
};

/**
 * @brief Top-level engine configuration.
 */
struct Config {
    SchedulerSettings scheduler;
    ExecutorConfig executor;
    ProjectConfig project;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file.
 *
 * Missing sections and keys keep their defaults. Fails with
 * ErrorCode::NotFound, ErrorCode::Parse or ErrorCode::Config.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

/**
 * @brief Reject values the scheduler cannot honor.
 */
Result<void> validate_config(const Config& config);

}  // namespace crew_orchestrator
