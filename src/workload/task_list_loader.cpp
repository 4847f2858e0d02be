/**
 * @file task_list_loader.cpp
 * @brief Task list loading using toml++.
 * @author Dimitris Kafetzis
 */

#include "workload/task_list_loader.hpp"

#include <toml++/toml.hpp>

#include <format>
#include <optional>
#include <string>

namespace crew_orchestrator {

namespace {

/// Text form of a scalar or array node; nullopt for tables.
std::optional<std::string> node_text(const toml::node& node) {
    if (const auto* text = node.as_string()) return text->get();
    if (const auto* integer = node.as_integer()) return std::to_string(integer->get());
    if (const auto* floating = node.as_floating_point()) return std::format("{}", floating->get());
    if (const auto* boolean = node.as_boolean()) return boolean->get() ? "true" : "false";
    if (const auto* array = node.as_array()) {
        std::string joined;
        for (const auto& element : *array) {
            auto element_text = node_text(element);
            if (!element_text) return std::nullopt;
            if (!joined.empty()) joined += "; ";
            joined += *element_text;
        }
        return joined;
    }
    return std::nullopt;
}

/// Task ids may be written as strings or integers.
std::optional<TaskId> id_text(const toml::node& node) {
    if (const auto* text = node.as_string()) return text->get();
    if (const auto* integer = node.as_integer()) return std::to_string(integer->get());
    return std::nullopt;
}

Result<RawTask> read_task(const toml::table& entry, size_t index, std::string_view source) {
    auto fail = [&](const std::string& what) {
        return make_error<RawTask>(ErrorCode::Parse,
                                   std::format("{}: task #{} {}", source, index + 1, what));
    };

    RawTask task;

    if (const auto* id = entry.get("id")) {
        auto text = id_text(*id);
        if (!text) return fail("has an id that is neither a string nor an integer");
        task.id = std::move(*text);
    }
    task.owner = entry["owner"].value_or(std::string{});
    task.description = entry["description"].value_or(std::string{});
    task.phase = entry["phase"].value_or(std::string{"construction"});

    if (const auto* deps = entry.get("dependencies")) {
        const auto* array = deps->as_array();
        if (!array) return fail("has a dependencies value that is not an array");
        for (const auto& dep : *array) {
            auto text = id_text(dep);
            if (!text) return fail("lists a dependency that is neither a string nor an integer");
            task.dependencies.push_back(std::move(*text));
        }
    }

    if (const auto* materials = entry.get("materials")) {
        const auto* array = materials->as_array();
        if (!array) return fail("has a materials value that is not an array");
        for (const auto& material : *array) {
            auto text = node_text(material);
            if (!text) return fail("lists a material that is not a plain value");
            task.materials.push_back(std::move(*text));
        }
    }

    if (const auto* requirements = entry.get("requirements")) {
        const auto* table = requirements->as_table();
        if (!table) return fail("has a requirements value that is not a table");
        for (const auto& [key, value] : *table) {
            auto text = node_text(value);
            if (!text) {
                return fail(std::format("has a nested table under requirement '{}'", key.str()));
            }
            task.requirements.emplace(std::string{key.str()}, std::move(*text));
        }
    }

    return task;
}

Result<std::vector<RawTask>> read_tasks(const toml::table& tbl, std::string_view source) {
    const auto* entries = tbl.get_as<toml::array>("task");
    if (!entries) {
        return make_error<std::vector<RawTask>>(
            ErrorCode::Parse, std::format("{}: no [[task]] tables found", source));
    }

    std::vector<RawTask> tasks;
    tasks.reserve(entries->size());

    for (size_t i = 0; i < entries->size(); ++i) {
        const auto* entry = entries->get(i)->as_table();
        if (!entry) {
            return make_error<std::vector<RawTask>>(
                ErrorCode::Parse, std::format("{}: task #{} is not a table", source, i + 1));
        }
        auto task = read_task(*entry, i, source);
        if (!task) return task.error();
        tasks.push_back(std::move(*task));
    }

    return tasks;
}

}  // anonymous namespace

Result<std::vector<RawTask>> load_task_list(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return make_error<std::vector<RawTask>>(
            ErrorCode::NotFound, "Task list file not found: " + path.string());
    }

    try {
        auto tbl = toml::parse_file(path.string());
        return read_tasks(tbl, path.string());
    } catch (const toml::parse_error& err) {
        return make_error<std::vector<RawTask>>(
            ErrorCode::Parse, "TOML parse error in " + path.string() + ": "
                              + std::string{err.description()});
    }
}

Result<std::vector<RawTask>> parse_task_list(std::string_view toml_text,
                                             std::string_view source_name) {
    try {
        auto tbl = toml::parse(toml_text, source_name);
        return read_tasks(tbl, source_name);
    } catch (const toml::parse_error& err) {
        return make_error<std::vector<RawTask>>(
            ErrorCode::Parse, "TOML parse error in " + std::string{source_name} + ": "
                              + std::string{err.description()});
    }
}

}  // namespace crew_orchestrator
