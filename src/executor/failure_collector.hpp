/**
 * @file failure_collector.hpp
 * @brief Run-scoped accumulator of per-task failures.
 */

#pragma once

#include <string>
#include <vector>

namespace dagbuild {

struct FailureRecord {
    std::string task_str;   ///< Task::describe() of the failing task
    std::string message;    ///< full trace text
};

/**
 * @brief Collects failures in the order they happen and renders them as
 *        one report, one section per record.
 */
class FailureCollector {
public:
    void append(std::string message, std::string task_str);

    [[nodiscard]] bool empty() const noexcept { return records_.empty(); }
    [[nodiscard]] size_t size() const noexcept { return records_.size(); }
    [[nodiscard]] explicit operator bool() const noexcept { return !records_.empty(); }

    [[nodiscard]] const std::vector<FailureRecord>& records() const noexcept { return records_; }

    /**
     * @brief Render every record as
     *
     *     ==================== <task_str> ====================
     *     <message>
     *
     * with a blank line between sections.
     */
    [[nodiscard]] std::string render() const;

    /// Header line used for a section.
    [[nodiscard]] static std::string section_header(const std::string& task_str);

private:
    std::vector<FailureRecord> records_;
};

}  // namespace dagbuild
