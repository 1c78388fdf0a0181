/**
 * @file main.cpp
 * @brief dagbuild command-line entry point.
 *
 * Wires the modules into a run:
 *   Config → Logger → Pipeline (or demo DAG) → SerialExecutor
 */

#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "executor/serial_executor.hpp"
#include "telemetry/log_sinks.hpp"
#include "workload/dag.hpp"
#include "workload/pipeline_loader.hpp"
#include "workload/task.hpp"

#include <filesystem>
#include <iostream>
#include <memory>
#include <numeric>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace dagbuild;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitBuildFailed = 1;
constexpr int kExitUsage = 2;

struct CLIArgs {
    std::optional<std::filesystem::path> config_path;
    std::optional<std::filesystem::path> pipeline_path;
    std::string log_dir;
    std::vector<std::string> params;
    bool demo_mode = false;
    bool show_progress = true;
    bool no_subprocess = false;
    bool help = false;
};

void print_usage(std::ostream& out) {
    out << "Usage: dagbuild [OPTIONS]\n"
        << "  --config <path>      Configuration file (TOML)\n"
        << "  --pipeline <path>    Pipeline of shell tasks to build (TOML)\n"
        << "  --demo               Build a small in-memory demo DAG\n"
        << "  --param <key=value>  Build parameter, repeatable\n"
        << "  --log-dir <path>     Write a per-DAG log file to this directory\n"
        << "  --no-subprocess      Build callable tasks in this process\n"
        << "  --no-progress        Do not print progress lines\n"
        << "  --help, -h           Show this help message\n";
}

Result<CLIArgs> parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto needs_value = [&]() -> bool { return i + 1 < argc; };

        if (arg == "--config" && needs_value()) {
            args.config_path = argv[++i];
        } else if (arg == "--pipeline" && needs_value()) {
            args.pipeline_path = argv[++i];
        } else if (arg == "--param" && needs_value()) {
            args.params.emplace_back(argv[++i]);
        } else if (arg == "--log-dir" && needs_value()) {
            args.log_dir = argv[++i];
        } else if (arg == "--demo") {
            args.demo_mode = true;
        } else if (arg == "--no-subprocess") {
            args.no_subprocess = true;
        } else if (arg == "--no-progress") {
            args.show_progress = false;
        } else if (arg == "--help" || arg == "-h") {
            args.help = true;
        } else {
            return Error{"Unknown or incomplete option: " + arg};
        }
    }
    if (!args.help && args.demo_mode == args.pipeline_path.has_value()) {
        return Error{"Exactly one of --pipeline or --demo is required"};
    }
    return args;
}

/**
 * @brief A four-task DAG of in-memory callables; the last one is already
 *        up to date.
 */
Pipeline make_demo_pipeline() {
    Pipeline demo{.dag = DAG{"demo"}, .params = {{"rows", int64_t{100000}}}};

    auto rows = [](const BuildParams& params) -> int64_t {
        auto it = params.find("rows");
        if (it == params.end()) return 0;
        if (const auto* n = std::get_if<int64_t>(&it->second)) return *n;
        throw TaskBuildError("param 'rows' must be an integer");
    };

    auto add = [&demo](std::unique_ptr<Task> task) {
        if (auto added = demo.dag.add_task(std::move(task)); !added) {
            throw std::logic_error(added.error().message);
        }
    };

    add(std::make_unique<CallableTask>("generate", [rows](const BuildParams& params) {
        std::vector<double> data(static_cast<size_t>(rows(params)));
        std::iota(data.begin(), data.end(), 0.0);
    }));
    add(std::make_unique<CallableTask>("aggregate", [rows](const BuildParams& params) {
        std::vector<double> data(static_cast<size_t>(rows(params)), 1.0);
        const double total = std::accumulate(data.begin(), data.end(), 0.0);
        if (total != static_cast<double>(data.size())) {
            throw TaskBuildError("aggregate mismatch");
        }
    }));
    add(std::make_unique<ShellTask>("report", "echo \"rows=$DAGBUILD_PARAM_ROWS\" > /dev/null"));

    auto archive = std::make_unique<CallableTask>("archive", [](const BuildParams&) {});
    archive->set_exec_status(TaskStatus::Skipped);
    add(std::move(archive));

    return demo;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args_result = parse_args(argc, argv);
    if (!args_result) {
        std::cerr << args_result.error().message << "\n";
        print_usage(std::cerr);
        return kExitUsage;
    }
    auto args = std::move(args_result).value();
    if (args.help) {
        print_usage(std::cout);
        return kExitOk;
    }

    // Load configuration
    auto config = default_config();
    if (args.config_path) {
        auto config_result = load_config(*args.config_path);
        if (!config_result) {
            std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
            return kExitUsage;
        }
        config = *config_result;
    }

    // Apply CLI overrides
    if (!args.log_dir.empty()) config.executor.logging_directory = args.log_dir;
    if (args.no_subprocess) config.executor.build_in_subprocess = false;

    // ── Initialize Logger ────────────────────
    Logger logger(std::make_unique<StdoutSink>(), config.log.level);

    // ── Load the DAG ─────────────────────────
    std::optional<Pipeline> pipeline;
    if (args.demo_mode) {
        pipeline = make_demo_pipeline();
    } else {
        auto loaded = PipelineLoader::load_file(*args.pipeline_path);
        if (!loaded) {
            std::cerr << "Failed to load pipeline: " << loaded.error().message << std::endl;
            return kExitUsage;
        }
        pipeline.emplace(std::move(loaded).value());
    }

    for (const auto& assignment : args.params) {
        auto param = parse_param_assignment(assignment);
        if (!param) {
            std::cerr << param.error().message << std::endl;
            return kExitUsage;
        }
        pipeline->params[param->first] = param->second;
    }

    logger.info("DAG \"" + pipeline->dag.name() + "\": " + std::to_string(pipeline->dag.size())
                + " tasks, isolation backend "
                + std::string(to_string(config.executor.isolation_backend)));

    // ── Build ────────────────────────────────
    SerialExecutor executor(config.executor, logger);
    try {
        auto reports = executor(pipeline->dag, args.show_progress, pipeline->params);
        for (const auto& report : reports) {
            std::cout << report.name << "\t" << report.elapsed.count() << "us\n";
        }
    } catch (const DAGBuildError& err) {
        logger.flush();
        std::cerr << err.what() << std::endl;
        return kExitBuildFailed;
    }

    logger.flush();
    return kExitOk;
}
