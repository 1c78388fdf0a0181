/**
 * @file task.cpp
 * @brief Task status transitions and the built-in task kinds.
 */

#include "workload/task.hpp"

#include "core/errors.hpp"

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <iostream>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace dagbuild {

// ─────────────────────────────────────────────
// Task
// ─────────────────────────────────────────────

Task::Task(TaskId name, SourceKind kind)
    : name_(std::move(name)), kind_(kind) {}

void Task::set_exec_status(TaskStatus next) {
    if (next == status_) return;

    if (status_ != TaskStatus::Waiting) {
        throw StatusTransitionError(
            "Cannot change status of " + describe() + " from "
            + std::string(to_string(status_)) + " to " + std::string(to_string(next)));
    }

    status_ = next;

    const Hook* hook = nullptr;
    std::string_view hook_name;
    if (next == TaskStatus::Executed && on_finish_) {
        hook = &on_finish_;
        hook_name = "on_finish";
    } else if (next == TaskStatus::Errored && on_failure_) {
        hook = &on_failure_;
        hook_name = "on_failure";
    }
    if (!hook) return;

    try {
        (*hook)(*this);
    } catch (const std::exception&) {
        std::throw_with_nested(StatusTransitionError(
            "Exception when running " + std::string(hook_name) + " for task \"" + name_ + "\""));
    }
}

TaskReport Task::build(const BuildParams& params) {
    auto start = std::chrono::steady_clock::now();
    run(params);
    auto end = std::chrono::steady_clock::now();

    return TaskReport{
        .name = name_,
        .ran = true,
        .elapsed = std::chrono::duration_cast<Duration>(end - start)
    };
}

// ─────────────────────────────────────────────
// CallableTask
// ─────────────────────────────────────────────

CallableTask::CallableTask(TaskId name, Fn fn)
    : Task(std::move(name), SourceKind::InMemoryCallable), fn_(std::move(fn)) {}

std::string CallableTask::describe() const {
    return "CallableTask: " + name();
}

void CallableTask::run(const BuildParams& params) {
    if (!fn_) {
        throw TaskBuildError("CallableTask \"" + name() + "\" has no callable");
    }
    fn_(params);
}

// ─────────────────────────────────────────────
// ShellTask
// ─────────────────────────────────────────────

ShellTask::ShellTask(TaskId name, std::string command)
    : Task(std::move(name), SourceKind::ExternalCommand), command_(std::move(command)) {}

std::string ShellTask::describe() const {
    return "ShellTask: " + name() + " -> \"" + command_ + "\"";
}

std::string ShellTask::env_name(const std::string& param) {
    std::string out = "DAGBUILD_PARAM_";
    for (char c : param) {
        auto uc = static_cast<unsigned char>(c);
        out += std::isalnum(uc) ? static_cast<char>(std::toupper(uc)) : '_';
    }
    return out;
}

void ShellTask::run(const BuildParams& params) {
    // Prepare everything the child needs before forking.
    std::vector<std::pair<std::string, std::string>> env;
    env.reserve(params.size());
    for (const auto& [key, value] : params) {
        env.emplace_back(env_name(key), param_to_string(value));
    }

    std::cout.flush();
    std::cerr.flush();

    const pid_t pid = fork();
    if (pid < 0) {
        throw std::system_error(errno, std::generic_category(), "fork failed for task \"" + name() + "\"");
    }
    if (pid == 0) {
        for (const auto& [key, value] : env) {
            setenv(key.c_str(), value.c_str(), 1);
        }
        execl("/bin/sh", "sh", "-c", command_.c_str(), static_cast<char*>(nullptr));
        _exit(127);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw std::system_error(errno, std::generic_category(),
                                    "waitpid failed for task \"" + name() + "\"");
        }
    }

    if (WIFEXITED(status)) {
        if (const int code = WEXITSTATUS(status); code != 0) {
            throw TaskBuildError("Command \"" + command_ + "\" exited with status "
                                 + std::to_string(code));
        }
        return;
    }
    if (WIFSIGNALED(status)) {
        const int sig = WTERMSIG(status);
        throw TaskBuildError("Command \"" + command_ + "\" terminated by signal "
                             + std::to_string(sig) + " (" + strsignal(sig) + ")");
    }
    throw TaskBuildError("Command \"" + command_ + "\" ended abnormally");
}

}  // namespace dagbuild
