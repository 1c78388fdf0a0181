/**
 * @file config.hpp
 * @brief Executor configuration with TOML deserialization.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>

namespace dagbuild {

/**
 * @brief Mechanism behind an isolated worker.
 */
enum class IsolationBackend : uint8_t {
    Process,       ///< fork() a child per build; memory is reclaimed on exit
    Thread         ///< single-use thread; no memory reclamation
};

[[nodiscard]] constexpr std::string_view to_string(IsolationBackend backend) noexcept {
    switch (backend) {
        case IsolationBackend::Process: return "process";
        case IsolationBackend::Thread:  return "thread";
    }
    return "unknown";
}

Result<IsolationBackend> parse_isolation_backend(std::string_view text);

/**
 * @brief Settings of a SerialExecutor.
 *
 * Plain value: copyable and free of runtime collaborators. The logger is
 * handed to the executor separately.
 */
struct ExecutorConfig {
    std::optional<std::filesystem::path> logging_directory;   ///< unset = no run log file
    LogLevel logging_level = LogLevel::Info;
    bool build_in_subprocess = true;
    IsolationBackend isolation_backend = IsolationBackend::Process;
};

struct LogConfig {
    LogLevel level = LogLevel::Info;          ///< console logger threshold
};

/**
 * @brief Top-level configuration.
 */
struct Config {
    ExecutorConfig executor;
    LogConfig log;
};

/**
 * @brief Load configuration from a TOML file.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Parse configuration from TOML text.
 */
Result<Config> parse_config(std::string_view toml_text);

/**
 * @brief Create a default configuration.
 */
Config default_config();

}  // namespace dagbuild
