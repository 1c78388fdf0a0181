/**
 * @file log_sinks.hpp
 * @brief ILogSink implementations: NDJSON file, stdout, null.
 */

#pragma once

#include "core/logger.hpp"

#include <filesystem>
#include <fstream>
#include <string>

namespace dagbuild {

/**
 * @brief Appends NDJSON lines to a single file.
 *
 * The parent directory is created if missing.
 */
class FileSink : public ILogSink {
public:
    explicit FileSink(const std::filesystem::path& path);
    ~FileSink() override;

    void write(std::string_view json_line) override;
    void flush() override;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] bool is_open() const { return file_.is_open(); }

private:
    std::filesystem::path path_;
    std::ofstream file_;
};

/**
 * @brief Writes each line to stdout.
 */
class StdoutSink : public ILogSink {
public:
    void write(std::string_view json_line) override;
    void flush() override;
};

/**
 * @brief Discards all output.
 */
class NullSink : public ILogSink {
public:
    void write(std::string_view /*json_line*/) override {}
    void flush() override {}
};

}  // namespace dagbuild
