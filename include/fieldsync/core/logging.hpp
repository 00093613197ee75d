#pragma once

#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fieldsync {

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel {
    Debug = 0,  // per transition, assignment and resolution
    Info = 1,   // per batch
    Warn = 2,   // rejected items, fallbacks
    Error = 3,  // unexpected failures turned into item errors
    Off = 4
};

std::string_view log_level_name(LogLevel level) noexcept;

// Case-insensitive on the usual spellings; anything unknown reads as Info
LogLevel parse_log_level(std::string_view name) noexcept;

// ============================================================================
// Log Entry
// ============================================================================

struct LogEntry {
    LogLevel level = LogLevel::Info;
    std::chrono::system_clock::time_point timestamp;
    std::string message;
    std::string logger_name;

    // Key/value context in insertion order (task id, actor, counters)
    std::vector<std::pair<std::string, std::string>> fields;

    LogEntry& field(std::string key, std::string value) {
        fields.emplace_back(std::move(key), std::move(value));
        return *this;
    }

    LogEntry& field(std::string key, std::string_view value) {
        return field(std::move(key), std::string(value));
    }

    LogEntry& field(std::string key, const char* value) {
        return field(std::move(key), std::string(value));
    }

    template<typename T>
    LogEntry& field(std::string key, T value) {
        std::ostringstream oss;
        oss << value;
        return field(std::move(key), oss.str());
    }
};

// ============================================================================
// Log Sinks
// ============================================================================

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(const LogEntry& entry) = 0;
    virtual void flush() {}
};

// One line per entry on stderr. Field values containing blanks or quotes
// are quoted so the line still splits on spaces.
class ConsoleSink : public LogSink {
    bool colored_ = true;
    std::mutex mutex_;

public:
    explicit ConsoleSink(bool colored = true) : colored_(colored) {}
    void write(const LogEntry& entry) override;
};

// One JSON object per line; fields become top-level members
class JsonSink : public LogSink {
    std::ostream& out_;
    std::mutex mutex_;

public:
    explicit JsonSink(std::ostream& out = std::cerr) : out_(out) {}
    void write(const LogEntry& entry) override;
    void flush() override;
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
    std::string name_;
    LogLevel level_ = LogLevel::Info;
    std::vector<std::shared_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;

public:
    Logger() = default;
    explicit Logger(std::string name) : name_(std::move(name)) {}

    Logger& set_level(LogLevel level);
    Logger& add_sink(std::shared_ptr<LogSink> sink);
    Logger& clear_sinks();

    void log(LogLevel level, std::string message) const;
    void debug(std::string message) const { log(LogLevel::Debug, std::move(message)); }
    void warn(std::string message) const { log(LogLevel::Warn, std::move(message)); }

    // Structured logging: build with entry(), add fields, hand back to log()
    LogEntry entry(LogLevel level, std::string message) const;
    void log(const LogEntry& entry) const;

    bool is_enabled(LogLevel level) const;

    const std::string& name() const { return name_; }
    LogLevel level() const;
};

// ============================================================================
// Global Logger
// ============================================================================

// Process-wide logger named "fieldsync"; starts with a colored console sink
// until Config::configure replaces it.
Logger& default_logger();

inline void log_debug(std::string msg) { default_logger().debug(std::move(msg)); }
inline void log_warn(std::string msg) { default_logger().warn(std::move(msg)); }

} // namespace fieldsync
