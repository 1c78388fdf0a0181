/**
 * @file serial_executor.cpp
 * @brief SerialExecutor implementation.
 */

#include "executor/serial_executor.hpp"

#include "core/errors.hpp"
#include "telemetry/run_log_handler.hpp"

#include <iostream>
#include <optional>
#include <string>

namespace dagbuild {

namespace {

std::string first_line(const std::string& text) {
    return text.substr(0, text.find('\n'));
}

}  // namespace

SerialExecutor::SerialExecutor(ExecutorConfig config, Logger& logger, WorkerFactory factory)
    : config_(std::move(config))
    , logger_(logger)
    , isolation_(config_.build_in_subprocess,
                 factory ? std::move(factory)
                         : make_worker_factory(config_.isolation_backend, &logger))
    , progress_(std::make_unique<StreamProgress>(std::cerr)) {}

void SerialExecutor::set_progress_sink(std::unique_ptr<IProgressSink> sink) {
    progress_ = std::move(sink);
}

std::vector<TaskReport> SerialExecutor::operator()(DAG& dag, bool show_progress,
                                                   const BuildParams& params) {
    std::optional<RunLogHandler> log_handler;
    if (config_.logging_directory) {
        log_handler.emplace(logger_, dag.name(), *config_.logging_directory, config_.logging_level);
        log_handler->add();
    }

    logger_.info("Building DAG \"" + dag.name() + "\" (" + std::to_string(dag.size())
                 + " tasks, isolation " + (isolation_.enabled() ? "on" : "off") + ")");

    FailureCollector failures;
    std::vector<TaskReport> reports;

    const bool report_progress = show_progress && progress_;
    if (report_progress) progress_->start(dag.size());

    size_t position = 0;
    for (const auto& task : dag.tasks()) {
        ++position;

        if (is_terminal_entry(task->exec_status())) {
            logger_.debug("Not building task \"" + task->name() + "\" ("
                          + std::string(to_string(task->exec_status())) + ")");
            continue;
        }

        if (report_progress) progress_->update(position, task->name());
        logger_.info("Building task \"" + task->name() + "\"");

        std::optional<TaskReport> report;
        try {
            report = isolation_.build(*task, params);
        } catch (...) {
            record_build_failure(*task, std::current_exception(), failures);
            continue;
        }

        try {
            task->set_exec_status(TaskStatus::Executed);
        } catch (...) {
            auto trace = describe_exception(std::current_exception());
            logger_.error("Task \"" + task->name() + "\" built but its status update failed: "
                          + first_line(trace));
            failures.append(std::move(trace), task->describe());
        }

        logger_.debug("Task \"" + task->name() + "\" done in "
                      + std::to_string(report->elapsed.count()) + "us");
        reports.push_back(std::move(*report));
    }

    if (report_progress) progress_->finish();

    if (failures) {
        logger_.error("DAG \"" + dag.name() + "\" build failed: "
                      + std::to_string(failures.size()) + " failure(s)");
        logger_.flush();
        throw DAGBuildError(std::string(kBuildFailedPreamble) + failures.render());
    }

    logger_.info("DAG \"" + dag.name() + "\" built: " + std::to_string(reports.size())
                 + " task(s) executed");

    if (log_handler) {
        log_handler->remove();
    }

    // Isolated builds drop their client state when their worker exits.
    if (!config_.build_in_subprocess) {
        close_clients(dag);
    }

    return reports;
}

void SerialExecutor::record_build_failure(Task& task, std::exception_ptr eptr,
                                          FailureCollector& failures) {
    auto trace = describe_exception(eptr);

    try {
        task.set_exec_status(TaskStatus::Errored);
    } catch (...) {
        trace += "\nWhile marking the task as errored:\n"
                 + describe_exception(std::current_exception());
    }

    logger_.error("Task \"" + task.name() + "\" failed: " + first_line(trace));
    failures.append(std::move(trace), task.describe());
}

void SerialExecutor::close_clients(const DAG& dag) {
    for (const auto& [name, client] : dag.clients()) {
        logger_.debug("Closing client \"" + name + "\"");
        client->close();
    }
}

}  // namespace dagbuild
