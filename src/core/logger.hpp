/**
 * @file logger.hpp
 * @brief Logging infrastructure with pluggable sinks.
 *
 * Provides ILogSink (virtual interface for runtime-configurable log
 * destinations) and a thread-safe Logger front-end. Besides its primary
 * sink, a Logger accepts keyed sinks that are attached for the duration of
 * a run and detached afterwards.
 */

#pragma once

#include "core/result.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace dagbuild {

// ─────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────

enum class LogLevel : uint8_t {
    Debug,
    Info,
    Warn,
    Error
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
    }
    return "unknown";
}

/**
 * @brief Parse "debug", "info", "warn"/"warning" or "error" (any case).
 */
Result<LogLevel> parse_log_level(std::string_view text);

/// Escape @p text for embedding in a JSON string literal.
[[nodiscard]] std::string json_escape(std::string_view text);

// ─────────────────────────────────────────────
// ILogSink
// ─────────────────────────────────────────────

/**
 * @brief Abstract interface for log output destinations.
 */
class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void write(std::string_view json_line) = 0;
    virtual void flush() = 0;
};

// ─────────────────────────────────────────────
// Logger
// ─────────────────────────────────────────────

/**
 * @brief Thread-safe logger front-end.
 *
 * Each line goes to the primary sink if it passes the logger's level and
 * to every attached sink whose own level it passes.
 */
class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level = LogLevel::Info);

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void debug(std::string_view message);
    void info(std::string_view message);
    void warn(std::string_view message);
    void error(std::string_view message);

    void log(LogLevel level, std::string_view message);
    void flush();

    /// Attach a sink under @p key, replacing any sink already under it.
    void attach(const std::string& key, std::unique_ptr<ILogSink> sink, LogLevel min_level);

    /// Flush and drop the sink under @p key. Returns false if none.
    bool detach(const std::string& key);

    [[nodiscard]] bool is_attached(const std::string& key) const;
    [[nodiscard]] size_t attached_count() const;

    void set_level(LogLevel level);
    [[nodiscard]] LogLevel level() const;

private:
    struct AttachedSink {
        std::unique_ptr<ILogSink> sink;
        LogLevel min_level;
    };

    std::unique_ptr<ILogSink> sink_;
    LogLevel min_level_;
    std::map<std::string, AttachedSink> attached_;
    mutable std::mutex mutex_;
};

}  // namespace dagbuild
