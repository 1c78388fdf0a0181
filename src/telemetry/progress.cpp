/**
 * @file progress.cpp
 * @brief StreamProgress implementation.
 */

#include "telemetry/progress.hpp"

#include <ostream>

namespace dagbuild {

StreamProgress::StreamProgress(std::ostream& out) : out_(out) {}

void StreamProgress::start(size_t total) {
    total_ = total;
}

void StreamProgress::update(size_t position, const TaskId& name) {
    out_ << '[' << position << '/' << total_ << "] Building task \"" << name << "\"\n";
    out_.flush();
}

void StreamProgress::finish() {
    out_.flush();
}

}  // namespace dagbuild
