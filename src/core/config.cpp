/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"

#include <toml++/toml.hpp>

#include <string>

namespace dagbuild {

namespace {

Result<Config> from_table(const toml::table& tbl) {
    Config config;

    // [executor]
    if (auto executor = tbl["executor"]; executor.is_table()) {
        if (auto dir = executor["logging_directory"].value<std::string>(); dir && !dir->empty()) {
            config.executor.logging_directory = std::filesystem::path{*dir};
        }

        auto level = parse_log_level(executor["logging_level"].value_or(std::string{"info"}));
        if (!level) return Error{"[executor] " + level.error().message};
        config.executor.logging_level = *level;

        config.executor.build_in_subprocess = executor["build_in_subprocess"].value_or(true);

        auto backend = parse_isolation_backend(
            executor["isolation_backend"].value_or(std::string{"process"}));
        if (!backend) return Error{"[executor] " + backend.error().message};
        config.executor.isolation_backend = *backend;
    }

    // [log]
    if (auto log = tbl["log"]; log.is_table()) {
        auto level = parse_log_level(log["level"].value_or(std::string{"info"}));
        if (!level) return Error{"[log] " + level.error().message};
        config.log.level = *level;
    }

    return config;
}

}  // namespace

Result<IsolationBackend> parse_isolation_backend(std::string_view text) {
    if (text == "process") return IsolationBackend::Process;
    if (text == "thread") return IsolationBackend::Thread;
    return Error{"Unknown isolation backend: '" + std::string(text) + "'"};
}

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{"Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        return from_table(tbl);
    } catch (const toml::parse_error& err) {
        return Error{std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Result<Config> parse_config(std::string_view toml_text) {
    try {
        auto tbl = toml::parse(toml_text);
        return from_table(tbl);
    } catch (const toml::parse_error& err) {
        return Error{std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

}  // namespace dagbuild
