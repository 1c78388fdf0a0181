/**
 * @file errors.hpp
 * @brief Exception types raised on the build path.
 *
 * Task failures are exceptions: a build throws, the executor captures the
 * exception as trace text with describe_exception() and moves on. Only
 * DAGBuildError ever leaves the executor.
 */

#pragma once

#include <exception>
#include <stdexcept>
#include <string>

namespace dagbuild {

/**
 * @brief Raised once at the end of a run in which at least one task failed.
 *
 * what() is the full rendered failure report.
 */
class DAGBuildError : public std::runtime_error {
public:
    explicit DAGBuildError(const std::string& message)
        : std::runtime_error(message) {}
};

/// A task's exec_status could not be changed.
class StatusTransitionError : public std::runtime_error {
public:
    explicit StatusTransitionError(const std::string& message)
        : std::runtime_error(message) {}
};

/// A task's own build logic reported failure (e.g. non-zero exit status).
class TaskBuildError : public std::runtime_error {
public:
    explicit TaskBuildError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief A build failed inside an isolated worker.
 *
 * Carries the trace exactly as the worker rendered it, so the captured
 * text matches what an in-process failure of the same logic produces.
 */
class IsolatedBuildError : public std::runtime_error {
public:
    explicit IsolatedBuildError(const std::string& trace)
        : std::runtime_error(trace) {}

    [[nodiscard]] std::string trace() const { return what(); }
};

/**
 * @brief Render an exception as trace text.
 *
 * One line per exception, `<demangled type>: <what()>`, followed by one
 * `  caused by: ...` line per nested exception (std::throw_with_nested).
 * IsolatedBuildError renders as its carried trace, unchanged.
 */
[[nodiscard]] std::string describe_exception(std::exception_ptr eptr);

/// Demangled name of the dynamic type of @p e.
[[nodiscard]] std::string exception_type_name(const std::exception& e);

}  // namespace dagbuild
