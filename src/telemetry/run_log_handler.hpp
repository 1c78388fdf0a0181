/**
 * @file run_log_handler.hpp
 * @brief Log file attached to a Logger for the duration of one DAG run.
 */

#pragma once

#include "core/logger.hpp"

#include <filesystem>
#include <string>

namespace dagbuild {

/**
 * @brief Attaches `<directory>/<dag name>.log` to a logger, keyed by the
 *        DAG name.
 *
 * Attachment lasts until remove() is called; destroying the handler does
 * not detach the sink.
 */
class RunLogHandler {
public:
    RunLogHandler(Logger& logger, std::string dag_name,
                  std::filesystem::path directory, LogLevel level);

    void add();
    void remove();

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] const std::string& key() const noexcept { return key_; }

    [[nodiscard]] static std::filesystem::path log_path(const std::filesystem::path& directory,
                                                        const std::string& dag_name);

private:
    Logger& logger_;
    std::string key_;
    std::filesystem::path path_;
    LogLevel level_;
};

}  // namespace dagbuild
