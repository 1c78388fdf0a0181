/**
 * @file pipeline_loader.hpp
 * @brief Build a DAG of shell tasks from a TOML pipeline file.
 *
 * Format:
 *
 *     name = "etl"
 *
 *     [params]
 *     force = true
 *
 *     [[task]]
 *     name = "extract"
 *     command = "./extract.sh"
 *     status = "waiting"        # optional: waiting | skipped | aborted
 *
 * Tasks are added in file order, which must already be a valid build order.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "workload/dag.hpp"

#include <filesystem>
#include <string_view>

namespace dagbuild {

struct Pipeline {
    DAG dag;
    BuildParams params;
};

class PipelineLoader {
public:
    static Result<Pipeline> load_file(const std::filesystem::path& path);
    static Result<Pipeline> parse(std::string_view toml_text);
};

/// Entry statuses a pipeline may declare.
Result<TaskStatus> parse_entry_status(std::string_view text);

/// Parse a `key=value` pair. Values `true`/`false`, integers and decimals
/// are typed; anything else stays a string.
Result<std::pair<std::string, ParamValue>> parse_param_assignment(std::string_view text);

}  // namespace dagbuild
