/**
 * @file logger.cpp
 * @brief Logger implementation with ISO 8601 timestamps.
 */

#include "core/logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace dagbuild {

Result<LogLevel> parse_log_level(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "debug") return LogLevel::Debug;
    if (lowered == "info") return LogLevel::Info;
    if (lowered == "warn" || lowered == "warning") return LogLevel::Warn;
    if (lowered == "error") return LogLevel::Error;
    return Error{"Unknown log level: '" + std::string(text) + "'"};
}

std::string json_escape(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    return out;
}

Logger::Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level)
    : sink_(std::move(sink)), min_level_(min_level) {}

void Logger::debug(std::string_view message) { log(LogLevel::Debug, message); }
void Logger::info(std::string_view message)  { log(LogLevel::Info, message); }
void Logger::warn(std::string_view message)  { log(LogLevel::Warn, message); }
void Logger::error(std::string_view message) { log(LogLevel::Error, message); }

void Logger::log(LogLevel level, std::string_view message) {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm utc{};
    gmtime_r(&time_t_now, &utc);

    std::ostringstream oss;
    oss << R"({"level":")" << to_string(level) << R"(",)"
        << R"("ts":")"
        << std::put_time(&utc, "%FT%T")
        << '.' << std::setfill('0') << std::setw(3) << ms.count()
        << R"(Z",)"
        << R"("msg":")" << json_escape(message) << R"("})";
    const auto line = oss.str();

    std::lock_guard lock(mutex_);
    if (sink_ && level >= min_level_) {
        sink_->write(line);
    }
    for (auto& [key, attached] : attached_) {
        if (level >= attached.min_level) {
            attached.sink->write(line);
        }
    }
}

void Logger::flush() {
    std::lock_guard lock(mutex_);
    if (sink_) sink_->flush();
    for (auto& [key, attached] : attached_) {
        attached.sink->flush();
    }
}

void Logger::attach(const std::string& key, std::unique_ptr<ILogSink> sink, LogLevel min_level) {
    std::lock_guard lock(mutex_);
    if (auto it = attached_.find(key); it != attached_.end()) {
        it->second.sink->flush();
    }
    attached_[key] = AttachedSink{std::move(sink), min_level};
}

bool Logger::detach(const std::string& key) {
    std::lock_guard lock(mutex_);
    auto it = attached_.find(key);
    if (it == attached_.end()) return false;
    it->second.sink->flush();
    attached_.erase(it);
    return true;
}

bool Logger::is_attached(const std::string& key) const {
    std::lock_guard lock(mutex_);
    return attached_.count(key) != 0;
}

size_t Logger::attached_count() const {
    std::lock_guard lock(mutex_);
    return attached_.size();
}

void Logger::set_level(LogLevel level) {
    std::lock_guard lock(mutex_);
    min_level_ = level;
}

LogLevel Logger::level() const {
    std::lock_guard lock(mutex_);
    return min_level_;
}

}  // namespace dagbuild
