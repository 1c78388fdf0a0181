/**
 * @file failure_collector.cpp
 * @brief FailureCollector implementation.
 */

#include "executor/failure_collector.hpp"

namespace dagbuild {

namespace {
constexpr size_t kRuleWidth = 20;
}

void FailureCollector::append(std::string message, std::string task_str) {
    records_.push_back(FailureRecord{std::move(task_str), std::move(message)});
}

std::string FailureCollector::section_header(const std::string& task_str) {
    const std::string rule(kRuleWidth, '=');
    return rule + ' ' + task_str + ' ' + rule;
}

std::string FailureCollector::render() const {
    std::string out;
    for (size_t i = 0; i < records_.size(); ++i) {
        if (i > 0) out += "\n\n";
        out += section_header(records_[i].task_str);
        out += '\n';
        out += records_[i].message;
    }
    return out;
}

}  // namespace dagbuild
