/**
 * @file types.hpp
 * @brief Fundamental types used throughout dagbuild.
 *
 * Defines TaskId, TaskStatus, SourceKind, build parameters and the
 * TaskReport artifact. All types are designed for value semantics.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <variant>

namespace dagbuild {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using TaskId = std::string;
using Duration = std::chrono::microseconds;

// ─────────────────────────────────────────────
// Task Status
// ─────────────────────────────────────────────

enum class TaskStatus : uint8_t {
    Waiting,       ///< Not built yet in this run
    Skipped,       ///< Up to date, set by the DAG builder
    Aborted,       ///< Upstream failed, set by the DAG builder
    Executed,      ///< Built successfully
    Errored        ///< Build failed
};

[[nodiscard]] constexpr std::string_view to_string(TaskStatus status) noexcept {
    switch (status) {
        case TaskStatus::Waiting:  return "waiting";
        case TaskStatus::Skipped:  return "skipped";
        case TaskStatus::Aborted:  return "aborted";
        case TaskStatus::Executed: return "executed";
        case TaskStatus::Errored:  return "errored";
    }
    return "unknown";
}

/// Skipped and Aborted are decided before the run and never change.
[[nodiscard]] constexpr bool is_terminal_entry(TaskStatus status) noexcept {
    return status == TaskStatus::Skipped || status == TaskStatus::Aborted;
}

// ─────────────────────────────────────────────
// Source Kind
// ─────────────────────────────────────────────

/**
 * @brief Where a task's build logic lives.
 *
 * Only InMemoryCallable tasks are eligible for worker isolation;
 * ExternalCommand tasks already run out-of-process.
 */
enum class SourceKind : uint8_t {
    InMemoryCallable,
    ExternalCommand
};

[[nodiscard]] constexpr std::string_view to_string(SourceKind kind) noexcept {
    switch (kind) {
        case SourceKind::InMemoryCallable: return "callable";
        case SourceKind::ExternalCommand:  return "command";
    }
    return "unknown";
}

// ─────────────────────────────────────────────
// Build Parameters
// ─────────────────────────────────────────────

using ParamValue = std::variant<bool, int64_t, double, std::string>;

/// Parameters forwarded unmodified to every task's build.
using BuildParams = std::map<std::string, ParamValue>;

/**
 * @brief Render a parameter value as plain text.
 */
[[nodiscard]] std::string param_to_string(const ParamValue& value);

// ─────────────────────────────────────────────
// Task Report
// ─────────────────────────────────────────────

/**
 * @brief Artifact produced by a successful build.
 *
 * The executor collects reports without inspecting them.
 */
struct TaskReport {
    TaskId name;
    bool ran{true};
    Duration elapsed{0};

    bool operator==(const TaskReport&) const = default;
};

}  // namespace dagbuild
