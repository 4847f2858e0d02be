/**
 * @file templates.cpp
 * @brief Project templates — task lists for each supported project type.
 * @author Dimitris Kafetzis
 *
 * Remodel, new construction and addition templates share one shape: plan,
 * permit, prepare, parallel rough-in trades, an inspection that joins them,
 * then finishing work feeding a final inspection.
 */

#include "workload/templates.hpp"

#include <format>
#include <string>
#include <utility>

namespace crew_orchestrator {

namespace {

RawTask make_task(std::string id, std::string owner, std::string description,
                  std::vector<TaskId> dependencies, std::string phase) {
    return RawTask{
        .id = std::move(id),
        .owner = std::move(owner),
        .description = std::move(description),
        .phase = std::move(phase),
        .dependencies = std::move(dependencies),
        .requirements = {},
        .materials = {}
    };
}

}  // anonymous namespace

const std::vector<std::string_view>& ProjectTemplates::names() {
    static const std::vector<std::string_view> kNames{
        "kitchen_remodel", "bathroom_remodel", "new_construction", "addition",
        "shed_construction"
    };
    return kNames;
}

Result<std::vector<RawTask>> ProjectTemplates::make(std::string_view name,
                                                    const TemplateOptions& options) {
    if (name == "kitchen_remodel") return kitchen_remodel();
    if (name == "bathroom_remodel") return bathroom_remodel();
    if (name == "new_construction") return new_construction();
    if (name == "addition") return addition();
    if (name == "shed_construction") return shed_construction(options);

    return make_error<std::vector<RawTask>>(
        ErrorCode::NotFound, "unknown project template: " + std::string{name});
}

// ─────────────────────────────────────────────
// Remodels
// ─────────────────────────────────────────────

std::vector<RawTask> ProjectTemplates::kitchen_remodel() {
    return {
        make_task("1", "Architect", "Design kitchen layout", {}, "planning"),
        make_task("2", "Permitting", "Apply for building permit", {"1"}, "permitting"),
        make_task("3", "Carpenter", "Remove old cabinets", {"2"}, "demolition"),
        make_task("4", "Plumber", "Update plumbing rough-in", {"3"}, "rough_in"),
        make_task("5", "Electrician", "Update electrical rough-in", {"3"}, "rough_in"),
        make_task("6", "Permitting", "Schedule rough-in inspection", {"4", "5"}, "inspection"),
        make_task("7", "Carpenter", "Install new cabinets", {"6"}, "finishing"),
        make_task("8", "Electrician", "Install lighting fixtures", {"7"}, "finishing"),
        make_task("9", "Plumber", "Install sink and fixtures", {"7"}, "finishing"),
        make_task("10", "Painter", "Paint walls", {"7"}, "finishing"),
        make_task("11", "Permitting", "Final inspection", {"8", "9", "10"}, "final_inspection"),
    };
}

std::vector<RawTask> ProjectTemplates::bathroom_remodel() {
    return {
        make_task("1", "Architect", "Design bathroom layout", {}, "planning"),
        make_task("2", "Permitting", "Apply for permits", {"1"}, "permitting"),
        make_task("3", "Carpenter", "Demolition work", {"2"}, "demolition"),
        make_task("4", "Plumber", "Rough-in plumbing", {"3"}, "rough_in"),
        make_task("5", "Electrician", "Rough-in electrical", {"3"}, "rough_in"),
        make_task("6", "Permitting", "Rough-in inspection", {"4", "5"}, "inspection"),
        make_task("7", "Carpenter", "Install drywall", {"6"}, "finishing"),
        make_task("8", "Painter", "Paint and tile work", {"7"}, "finishing"),
        make_task("9", "Plumber", "Install fixtures", {"8"}, "finishing"),
        make_task("10", "Electrician", "Install light fixtures", {"8"}, "finishing"),
        make_task("11", "Permitting", "Final inspection", {"9", "10"}, "final_inspection"),
    };
}

// ─────────────────────────────────────────────
// Ground-up builds
// ─────────────────────────────────────────────

std::vector<RawTask> ProjectTemplates::new_construction() {
    return {
        make_task("1", "Architect", "Create architectural plans", {}, "planning"),
        make_task("2", "Permitting", "Apply for building permits", {"1"}, "permitting"),
        make_task("3", "Mason", "Pour foundation", {"2"}, "foundation"),
        make_task("4", "Carpenter", "Frame walls and roof", {"3"}, "framing"),
        make_task("5", "Roofer", "Install roof", {"4"}, "framing"),
        make_task("6", "Electrician", "Electrical rough-in", {"4"}, "rough_in"),
        make_task("7", "Plumber", "Plumbing rough-in", {"4"}, "rough_in"),
        make_task("8", "HVAC", "HVAC installation", {"4"}, "rough_in"),
        make_task("9", "Permitting", "Rough-in inspection", {"6", "7", "8"}, "inspection"),
        make_task("10", "Carpenter", "Install drywall", {"9"}, "finishing"),
        make_task("11", "Painter", "Paint interior", {"10"}, "finishing"),
        make_task("12", "Carpenter", "Install flooring and trim", {"11"}, "finishing"),
        make_task("13", "Electrician", "Install fixtures", {"10"}, "finishing"),
        make_task("14", "Plumber", "Install fixtures", {"10"}, "finishing"),
        make_task("15", "Permitting", "Final inspection", {"12", "13", "14"}, "final_inspection"),
    };
}

std::vector<RawTask> ProjectTemplates::addition() {
    return {
        make_task("1", "Architect", "Design addition plans", {}, "planning"),
        make_task("2", "Permitting", "Apply for permits", {"1"}, "permitting"),
        make_task("3", "Mason", "Pour foundation", {"2"}, "foundation"),
        make_task("4", "Carpenter", "Frame addition", {"3"}, "framing"),
        make_task("5", "Roofer", "Extend roof", {"4"}, "framing"),
        make_task("6", "Electrician", "Electrical rough-in", {"4"}, "rough_in"),
        make_task("7", "Plumber", "Plumbing rough-in", {"4"}, "rough_in"),
        make_task("8", "HVAC", "Extend HVAC", {"4"}, "rough_in"),
        make_task("9", "Permitting", "Rough-in inspection", {"6", "7", "8"}, "inspection"),
        make_task("10", "Carpenter", "Drywall and finishing", {"9"}, "finishing"),
        make_task("11", "Painter", "Paint", {"10"}, "finishing"),
        make_task("12", "Permitting", "Final inspection", {"11"}, "final_inspection"),
    };
}

// ─────────────────────────────────────────────
// Shed: ids are numbered as tasks are appended, so they shift when the
// foundation or electrical step is left out.
// ─────────────────────────────────────────────

std::vector<RawTask> ProjectTemplates::shed_construction(const TemplateOptions& options) {
    const auto width = options.width_ft;
    const auto length = options.length_ft;
    const auto height = options.height_ft;

    std::vector<RawTask> tasks;
    uint32_t next_id = 1;
    auto append = [&](std::string owner, std::string description, std::vector<TaskId> deps,
                      std::string phase, std::map<std::string, std::string> requirements,
                      std::vector<std::string> materials) {
        auto task = make_task(std::to_string(next_id++), std::move(owner),
                              std::move(description), std::move(deps), std::move(phase));
        task.requirements = std::move(requirements);
        task.materials = std::move(materials);
        tasks.push_back(std::move(task));
        return tasks.back().id;
    };

    auto planning_id = append(
        "Architect", std::format("Design shed plans ({}x{} ft)", width, length), {}, "planning",
        {{"width", std::to_string(width)}, {"length", std::to_string(length)}},
        {"blueprints", "specifications"});

    TaskId foundation_id = planning_id;
    if (options.has_foundation) {
        foundation_id = append(
            "Mason", "Pour concrete foundation slab", {planning_id}, "foundation",
            {{"area", std::to_string(width * length)}},
            {"concrete", "rebar", "gravel"});
    }

    auto framing_id = append(
        "Carpenter", "Frame walls and install door/window openings", {foundation_id}, "framing",
        {{"wall_count", "4"}, {"door_count", "1"}, {"window_count", "1"}},
        {"2x4 lumber", "plywood", "nails", "door frame", "window frame"});

    auto trusses_id = append(
        "Carpenter", "Build and install roof trusses", {framing_id}, "framing",
        {{"span", std::to_string(width)}},
        {"2x4 lumber", "truss plates", "plywood sheathing"});

    // Roof area carries a 30% allowance for pitch and overhang.
    auto roofing_id = append(
        "Roofer", "Install roofing (shingles and underlayment)", {trusses_id}, "rough_in",
        {{"area", std::format("{}", width * length * 13 / 10.0)}},
        {"asphalt shingles", "roofing felt", "drip edge", "nails"});

    std::vector<TaskId> siding_deps{roofing_id};
    if (options.has_electrical) {
        siding_deps.push_back(append(
            "Electrician", "Install electrical wiring, outlet, and light fixture", {framing_id},
            "rough_in", {{"outlets", "1"}, {"lights", "1"}},
            {"electrical wire", "outlet", "light fixture", "breaker"}));
    }

    auto siding_id = append(
        "Carpenter", "Install exterior siding", siding_deps, "finishing",
        {{"area", std::to_string((width + length) * 2 * height)}},
        {"siding panels", "trim", "corner boards", "nails"});

    auto openings_id = append(
        "Carpenter", "Install door and window", {siding_id}, "finishing",
        {{"door_count", "1"}, {"window_count", "1"}},
        {"entry door", "window", "hinges", "hardware"});

    auto painting_id = append(
        "Painter", "Paint exterior finish", {openings_id}, "finishing",
        {{"coats", "2"}},
        {"exterior paint", "primer", "brushes", "rollers"});

    append("Carpenter", "Final walkthrough and cleanup", {painting_id}, "final_inspection",
           {{"checklist", "doors close properly; roof is sealed; paint is dry"}}, {});

    return tasks;
}

}  // namespace crew_orchestrator
