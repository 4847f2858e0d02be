/**
 * @file task_list_loader.hpp
 * @brief Reads planner-produced task lists from TOML files.
 * @author Dimitris Kafetzis
 *
 * Expected layout, one table per task:
 *
 *     [[task]]
 *     id = "3"
 *     owner = "Mason"
 *     description = "Pour concrete foundation slab"
 *     phase = "foundation"
 *     dependencies = ["1"]
 *     materials = ["concrete", "rebar"]
 *     requirements = { area = 120 }
 *
 * Integer ids and dependency ids are accepted and converted to strings.
 * Requirement values of any scalar type are stored as text; arrays are
 * joined with "; ".
 */

#pragma once

#include "core/result.hpp"
#include "graph/graph_builder.hpp"

#include <filesystem>
#include <string_view>
#include <vector>

namespace crew_orchestrator {

/// Load a task list file. Fails with ErrorCode::NotFound or ErrorCode::Parse.
Result<std::vector<RawTask>> load_task_list(const std::filesystem::path& path);

/// Same as load_task_list(), from TOML text already in memory.
Result<std::vector<RawTask>> parse_task_list(std::string_view toml_text,
                                             std::string_view source_name = "task list");

}  // namespace crew_orchestrator
