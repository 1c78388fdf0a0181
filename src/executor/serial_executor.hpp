/**
 * @file serial_executor.hpp
 * @brief Builds the tasks of a DAG one at a time.
 *
 * Tries to build every task that can still be built, even after others
 * fail. Failures are collected along the way and reported together at the
 * end of the run as a single DAGBuildError, one section per failing task.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "executor/failure_collector.hpp"
#include "executor/isolation.hpp"
#include "telemetry/progress.hpp"
#include "workload/dag.hpp"

#include <exception>
#include <memory>
#include <string_view>
#include <vector>

namespace dagbuild {

/// First line of every DAGBuildError message.
inline constexpr std::string_view kBuildFailedPreamble =
    "DAG build failed, the following tasks crashed "
    "(corresponding downstream tasks aborted execution):\n";

class SerialExecutor {
public:
    /**
     * @param config  executor settings.
     * @param logger  receives run events; the run log file is attached to it.
     * @param factory worker factory for isolated builds. Empty selects the
     *                backend named by config.isolation_backend.
     */
    SerialExecutor(ExecutorConfig config, Logger& logger, WorkerFactory factory = {});

    SerialExecutor(const SerialExecutor&) = delete;
    SerialExecutor& operator=(const SerialExecutor&) = delete;

    /**
     * @brief Build every Waiting task of @p dag in order.
     *
     * Skipped and Aborted tasks are passed over. Each other task is built
     * with @p params; a success marks it Executed and keeps its report, a
     * failure marks it Errored and is recorded.
     *
     * On success the run log file is detached and, when builds ran
     * in-process, every DAG client is closed once. Neither happens when the
     * run fails.
     *
     * @return reports of the tasks built successfully, in build order.
     * @throws DAGBuildError if any task failed.
     */
    std::vector<TaskReport> operator()(DAG& dag, bool show_progress, const BuildParams& params);

    /// Replace the default progress output (stderr).
    void set_progress_sink(std::unique_ptr<IProgressSink> sink);

    [[nodiscard]] const ExecutorConfig& config() const noexcept { return config_; }

    /// Isolated workers created over the executor's lifetime.
    [[nodiscard]] size_t workers_spawned() const noexcept { return isolation_.workers_spawned(); }

private:
    void record_build_failure(Task& task, std::exception_ptr eptr, FailureCollector& failures);
    void close_clients(const DAG& dag);

    ExecutorConfig config_;
    Logger& logger_;
    IsolationStrategy isolation_;
    std::unique_ptr<IProgressSink> progress_;
};

}  // namespace dagbuild
