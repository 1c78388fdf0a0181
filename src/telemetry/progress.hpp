/**
 * @file progress.hpp
 * @brief Textual progress reporting for a run.
 */

#pragma once

#include "core/types.hpp"

#include <iosfwd>

namespace dagbuild {

class IProgressSink {
public:
    virtual ~IProgressSink() = default;

    virtual void start(size_t total) = 0;
    /// @param position 1-based index of the task in the DAG.
    virtual void update(size_t position, const TaskId& name) = 0;
    virtual void finish() = 0;
};

/**
 * @brief One line per built task: `[2/5] Building task "name"`.
 */
class StreamProgress : public IProgressSink {
public:
    explicit StreamProgress(std::ostream& out);

    void start(size_t total) override;
    void update(size_t position, const TaskId& name) override;
    void finish() override;

private:
    std::ostream& out_;
    size_t total_{0};
};

}  // namespace dagbuild
