/**
 * @file templates.hpp
 * @brief Built-in task lists for common construction projects.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/result.hpp"
#include "graph/graph_builder.hpp"

#include <cstdint>
#include <string_view>
#include <vector>

namespace crew_orchestrator {

/**
 * @brief Options consumed by the shed_construction template.
 */
struct TemplateOptions {
    bool has_electrical = false;
    bool has_foundation = true;
    uint32_t width_ft = 10;
    uint32_t length_ft = 12;
    uint32_t height_ft = 8;
};

/**
 * @brief Factory for project task lists, one per project type.
 *
 * Every template yields numbered ids ("1", "2", ...) in dependency order,
 * each task owned by a trade ("Architect", "Permitting", "Carpenter", ...).
 */
class ProjectTemplates {
public:
    /// Names accepted by make(), in a stable order.
    [[nodiscard]] static const std::vector<std::string_view>& names();

    /// Task list for a project type; ErrorCode::NotFound for an unknown name.
    static Result<std::vector<RawTask>> make(std::string_view name,
                                             const TemplateOptions& options = {});

    /// Design → permit → demolition → rough-in → inspection → finishing.
    static std::vector<RawTask> kitchen_remodel();

    static std::vector<RawTask> bathroom_remodel();

    /// Foundation, framing and three parallel rough-in trades.
    static std::vector<RawTask> new_construction();

    static std::vector<RawTask> addition();

    /// Optional foundation and electrical; requirements scale with dimensions.
    static std::vector<RawTask> shed_construction(const TemplateOptions& options);
};

}  // namespace crew_orchestrator
