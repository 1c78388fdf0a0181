/**
 * @file pipeline_loader.cpp
 * @brief TOML pipeline parsing using toml++.
 */

#include "workload/pipeline_loader.hpp"

#include <toml++/toml.hpp>

#include <charconv>
#include <memory>
#include <string>
#include <system_error>
#include <utility>

namespace dagbuild {

namespace {

Result<Pipeline> from_table(const toml::table& tbl) {
    auto name = tbl["name"].value<std::string>();
    if (!name || name->empty()) {
        return Error{"Pipeline is missing a non-empty 'name'"};
    }

    Pipeline pipeline{.dag = DAG{*name}, .params = {}};

    // [params]
    if (const auto* params = tbl["params"].as_table()) {
        for (const auto& [key, node] : *params) {
            const std::string param_name{key.str()};
            if (auto b = node.value_exact<bool>()) {
                pipeline.params[param_name] = *b;
            } else if (auto i = node.value_exact<int64_t>()) {
                pipeline.params[param_name] = *i;
            } else if (auto d = node.value_exact<double>()) {
                pipeline.params[param_name] = *d;
            } else if (auto s = node.value_exact<std::string>()) {
                pipeline.params[param_name] = *s;
            } else {
                return Error{"Unsupported type for param '" + param_name + "'"};
            }
        }
    }

    // [[task]]
    const auto* tasks = tbl["task"].as_array();
    if (!tasks) {
        return std::move(pipeline);
    }

    size_t index = 0;
    for (const auto& node : *tasks) {
        const auto* entry = node.as_table();
        if (!entry) {
            return Error{"task #" + std::to_string(index) + " is not a table"};
        }

        auto task_name = (*entry)["name"].value<std::string>();
        auto command = (*entry)["command"].value<std::string>();
        if (!task_name || task_name->empty()) {
            return Error{"task #" + std::to_string(index) + " is missing 'name'"};
        }
        if (!command || command->empty()) {
            return Error{"task \"" + *task_name + "\" is missing 'command'"};
        }

        auto task = std::make_unique<ShellTask>(*task_name, *command);

        auto status = parse_entry_status((*entry)["status"].value_or(std::string{"waiting"}));
        if (!status) {
            return Error{"task \"" + *task_name + "\": " + status.error().message};
        }
        task->set_exec_status(*status);

        if (auto added = pipeline.dag.add_task(std::move(task)); !added) {
            return added.error();
        }
        ++index;
    }

    return std::move(pipeline);
}

}  // namespace

Result<TaskStatus> parse_entry_status(std::string_view text) {
    if (text == "waiting") return TaskStatus::Waiting;
    if (text == "skipped") return TaskStatus::Skipped;
    if (text == "aborted") return TaskStatus::Aborted;
    return Error{"Invalid entry status '" + std::string(text)
                 + "' (expected waiting, skipped or aborted)"};
}

Result<std::pair<std::string, ParamValue>> parse_param_assignment(std::string_view text) {
    const auto eq = text.find('=');
    if (eq == std::string_view::npos || eq == 0) {
        return Error{"Expected key=value, got '" + std::string(text) + "'"};
    }

    std::string key(text.substr(0, eq));
    std::string_view raw = text.substr(eq + 1);

    if (raw == "true") return std::pair<std::string, ParamValue>{key, true};
    if (raw == "false") return std::pair<std::string, ParamValue>{key, false};

    const char* first = raw.data();
    const char* last = raw.data() + raw.size();

    int64_t as_int = 0;
    if (auto [ptr, ec] = std::from_chars(first, last, as_int); ec == std::errc{} && ptr == last && !raw.empty()) {
        return std::pair<std::string, ParamValue>{key, as_int};
    }

    double as_double = 0.0;
    if (auto [ptr, ec] = std::from_chars(first, last, as_double); ec == std::errc{} && ptr == last && !raw.empty()) {
        return std::pair<std::string, ParamValue>{key, as_double};
    }

    return std::pair<std::string, ParamValue>{key, std::string(raw)};
}

Result<Pipeline> PipelineLoader::load_file(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{"Pipeline file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        return from_table(tbl);
    } catch (const toml::parse_error& err) {
        return Error{std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Result<Pipeline> PipelineLoader::parse(std::string_view toml_text) {
    try {
        auto tbl = toml::parse(toml_text);
        return from_table(tbl);
    } catch (const toml::parse_error& err) {
        return Error{std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

}  // namespace dagbuild
