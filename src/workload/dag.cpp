/**
 * @file dag.cpp
 * @brief DAG container implementation.
 */

#include "workload/dag.hpp"

#include <algorithm>

namespace dagbuild {

DAG::DAG(std::string name) : name_(std::move(name)) {}

Result<void> DAG::add_task(std::unique_ptr<Task> task) {
    if (!task) {
        return Error{"Cannot add a null task to DAG \"" + name_ + "\""};
    }
    if (index_.count(task->name()) != 0) {
        return Error{"DAG \"" + name_ + "\" already has a task named \"" + task->name() + "\""};
    }
    index_.emplace(task->name(), tasks_.size());
    tasks_.push_back(std::move(task));
    return {};
}

Result<void> DAG::add_client(const std::string& name, std::unique_ptr<IClient> client) {
    if (!client) {
        return Error{"Cannot add a null client \"" + name + "\" to DAG \"" + name_ + "\""};
    }
    clients_[name] = std::move(client);
    return {};
}

Task* DAG::find(const TaskId& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) return nullptr;
    return tasks_[it->second].get();
}

std::vector<TaskId> DAG::task_names() const {
    std::vector<TaskId> names;
    names.reserve(tasks_.size());
    for (const auto& task : tasks_) {
        names.push_back(task->name());
    }
    return names;
}

size_t DAG::count(TaskStatus status) const {
    return static_cast<size_t>(std::count_if(tasks_.begin(), tasks_.end(),
        [status](const auto& task) { return task->exec_status() == status; }));
}

}  // namespace dagbuild
