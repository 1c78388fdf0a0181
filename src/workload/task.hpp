/**
 * @file task.hpp
 * @brief Buildable task handles.
 *
 * A Task has a name, an exec_status, a source kind and a build operation.
 * The DAG owns tasks; the executor only reads and writes the status and
 * invokes build().
 */

#pragma once

#include "core/types.hpp"

#include <functional>
#include <string>

namespace dagbuild {

/**
 * @brief Abstract unit of build work.
 */
class Task {
public:
    using Hook = std::function<void(const Task&)>;

    Task(TaskId name, SourceKind kind);
    virtual ~Task() = default;

    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    [[nodiscard]] const TaskId& name() const noexcept { return name_; }
    [[nodiscard]] SourceKind source_kind() const noexcept { return kind_; }
    [[nodiscard]] TaskStatus exec_status() const noexcept { return status_; }

    /**
     * @brief Change the status, running the matching hook.
     *
     * Only a Waiting task may change status. Setting the current value
     * again does nothing. The status is updated before the hook runs, so
     * a throwing hook leaves the new status in place.
     *
     * @throws StatusTransitionError on a forbidden transition or when a
     *         hook throws (the hook's exception is nested).
     */
    void set_exec_status(TaskStatus next);

    /// Called after the status becomes Executed.
    void on_finish(Hook hook) { on_finish_ = std::move(hook); }

    /// Called after the status becomes Errored.
    void on_failure(Hook hook) { on_failure_ = std::move(hook); }

    /**
     * @brief Run the task's logic and time it.
     *
     * Does not touch exec_status. Exceptions from the logic propagate.
     */
    TaskReport build(const BuildParams& params);

    /// Textual identity used in failure reports, e.g. `CallableTask: load`.
    [[nodiscard]] virtual std::string describe() const = 0;

protected:
    virtual void run(const BuildParams& params) = 0;

private:
    TaskId name_;
    SourceKind kind_;
    TaskStatus status_ = TaskStatus::Waiting;
    Hook on_finish_;
    Hook on_failure_;
};

/**
 * @brief Task whose logic is an in-memory callable.
 *
 * Eligible for worker isolation.
 */
class CallableTask : public Task {
public:
    using Fn = std::function<void(const BuildParams&)>;

    CallableTask(TaskId name, Fn fn);

    [[nodiscard]] std::string describe() const override;

protected:
    void run(const BuildParams& params) override;

private:
    Fn fn_;
};

/**
 * @brief Task that runs a shell command in a child process.
 *
 * Each build parameter is exported to the command as
 * DAGBUILD_PARAM_<UPPERCASED NAME>. A non-zero exit status or a signal
 * fails the build with TaskBuildError.
 */
class ShellTask : public Task {
public:
    ShellTask(TaskId name, std::string command);

    [[nodiscard]] const std::string& command() const noexcept { return command_; }
    [[nodiscard]] std::string describe() const override;

    /// Environment variable name a parameter is exported under.
    [[nodiscard]] static std::string env_name(const std::string& param);

protected:
    void run(const BuildParams& params) override;

private:
    std::string command_;
};

}  // namespace dagbuild
