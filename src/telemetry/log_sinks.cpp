/**
 * @file log_sinks.cpp
 * @brief Log sink implementations.
 */

#include "telemetry/log_sinks.hpp"

#include <iostream>

namespace dagbuild {

// ── FileSink ─────────────────────────────────

FileSink::FileSink(const std::filesystem::path& path) : path_(path) {
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path());
    }
    file_.open(path_, std::ios::app);
}

FileSink::~FileSink() {
    if (file_.is_open()) {
        file_.flush();
        file_.close();
    }
}

void FileSink::write(std::string_view json_line) {
    if (file_.is_open()) {
        file_ << json_line << '\n';
    }
}

void FileSink::flush() {
    if (file_.is_open()) {
        file_.flush();
    }
}

// ── StdoutSink ───────────────────────────────

void StdoutSink::write(std::string_view json_line) {
    std::cout << json_line << '\n';
}

void StdoutSink::flush() {
    std::cout.flush();
}

}  // namespace dagbuild
