/**
 * @file run_log_handler.cpp
 * @brief RunLogHandler implementation.
 */

#include "telemetry/run_log_handler.hpp"

#include "telemetry/log_sinks.hpp"

#include <memory>

namespace dagbuild {

RunLogHandler::RunLogHandler(Logger& logger, std::string dag_name,
                             std::filesystem::path directory, LogLevel level)
    : logger_(logger)
    , key_("dag:" + dag_name)
    , path_(log_path(directory, dag_name))
    , level_(level) {}

std::filesystem::path RunLogHandler::log_path(const std::filesystem::path& directory,
                                              const std::string& dag_name) {
    return directory / (dag_name + ".log");
}

void RunLogHandler::add() {
    logger_.attach(key_, std::make_unique<FileSink>(path_), level_);
}

void RunLogHandler::remove() {
    logger_.detach(key_);
}

}  // namespace dagbuild
