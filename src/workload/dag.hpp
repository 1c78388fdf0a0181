/**
 * @file dag.hpp
 * @brief Ordered collection of build tasks plus their shared clients.
 *
 * Tasks are kept in insertion order, which the DAG builder guarantees is
 * a dependency-respecting order. Skip/abort decisions are already baked
 * into each task's exec_status by the time a DAG reaches an executor.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "workload/client.hpp"
#include "workload/task.hpp"

#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace dagbuild {

class DAG {
public:
    explicit DAG(std::string name);

    DAG(DAG&&) = default;
    DAG& operator=(DAG&&) = default;

    // ── Construction ──────────────────────────

    /// Append a task. Fails if the name is already taken.
    Result<void> add_task(std::unique_ptr<Task> task);

    /// Register a client under @p name, replacing any previous one.
    /// Fails on a null client.
    Result<void> add_client(const std::string& name, std::unique_ptr<IClient> client);

    // ── Queries ───────────────────────────────
    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] size_t size() const noexcept { return tasks_.size(); }
    [[nodiscard]] bool empty() const noexcept { return tasks_.empty(); }

    [[nodiscard]] Task* find(const TaskId& name) const;
    [[nodiscard]] std::vector<TaskId> task_names() const;

    /// Tasks in execution order.
    [[nodiscard]] const std::vector<std::unique_ptr<Task>>& tasks() const noexcept { return tasks_; }

    [[nodiscard]] const std::map<std::string, std::unique_ptr<IClient>>& clients() const noexcept {
        return clients_;
    }

    /// Number of tasks currently in @p status.
    [[nodiscard]] size_t count(TaskStatus status) const;

private:
    std::string name_;
    std::vector<std::unique_ptr<Task>> tasks_;
    std::unordered_map<TaskId, size_t> index_;
    std::map<std::string, std::unique_ptr<IClient>> clients_;
};

}  // namespace dagbuild
