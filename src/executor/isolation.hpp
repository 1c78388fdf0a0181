/**
 * @file isolation.hpp
 * @brief Running a build directly or inside a disposable worker.
 *
 * A worker runs exactly one build call and is destroyed right after,
 * whatever the outcome. ProcessWorker forks a child so everything the
 * task's in-memory objects retained goes back to the OS when the child
 * exits. ThreadWorker offers the same call contract on a fresh thread.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "workload/task.hpp"

#include <sys/types.h>

#include <functional>
#include <memory>

namespace dagbuild {

using BuildCall = std::function<TaskReport()>;

// ─────────────────────────────────────────────
// IIsolatedWorker
// ─────────────────────────────────────────────

/**
 * @brief Single-use isolated execution context.
 *
 * run() is called at most once. It blocks until the call returns or
 * throws; there is no timeout. Destroying the worker releases the context.
 */
class IIsolatedWorker {
public:
    virtual ~IIsolatedWorker() = default;

    /**
     * @return the call's report.
     * @throws the call's failure, or IsolatedBuildError when the failure
     *         had to cross a process boundary.
     */
    virtual TaskReport run(const BuildCall& call) = 0;
};

/**
 * @brief Runs the call in a forked child and ships the result over a pipe.
 *
 * A failure in the child is rendered there with describe_exception() and
 * re-thrown in the parent as IsolatedBuildError carrying that text.
 */
class ProcessWorker : public IIsolatedWorker {
public:
    /// @param flush_output invoked in the parent right before fork() and in
    ///        the child before it exits, typically to flush log sinks.
    ///        Standard streams are flushed at both points regardless.
    explicit ProcessWorker(std::function<void()> flush_output = {});
    ~ProcessWorker() override;

    ProcessWorker(const ProcessWorker&) = delete;
    ProcessWorker& operator=(const ProcessWorker&) = delete;

    TaskReport run(const BuildCall& call) override;

private:
    [[noreturn]] static void child_main(int write_fd, const BuildCall& call,
                                        const std::function<void()>& flush_output);
    void release() noexcept;

    std::function<void()> flush_output_;
    pid_t pid_{-1};
    int read_fd_{-1};
};

/**
 * @brief Runs the call on a dedicated thread that is joined before run()
 *        returns. Exceptions cross back unchanged.
 */
class ThreadWorker : public IIsolatedWorker {
public:
    TaskReport run(const BuildCall& call) override;
};

using WorkerFactory = std::function<std::unique_ptr<IIsolatedWorker>()>;

/**
 * @brief Factory producing a fresh worker of @p backend per call.
 *
 * @param logger flushed before each fork and before each child exits,
 *        when non-null.
 */
WorkerFactory make_worker_factory(IsolationBackend backend, Logger* logger = nullptr);

// ─────────────────────────────────────────────
// IsolationStrategy
// ─────────────────────────────────────────────

/**
 * @brief Decides per task whether to isolate, and performs the build.
 *
 * Isolation applies when it is enabled and the task's logic is an
 * in-memory callable. Either way the outcome is the same: a report, or
 * an exception describing the failure.
 */
class IsolationStrategy {
public:
    IsolationStrategy(bool enabled, WorkerFactory factory);

    [[nodiscard]] bool enabled() const noexcept { return enabled_; }
    [[nodiscard]] bool applies_to(const Task& task) const noexcept;

    TaskReport build(Task& task, const BuildParams& params);

    /// Workers created so far; each served exactly one build.
    [[nodiscard]] size_t workers_spawned() const noexcept { return workers_spawned_; }

private:
    bool enabled_;
    WorkerFactory factory_;
    size_t workers_spawned_{0};
};

}  // namespace dagbuild
