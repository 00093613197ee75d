#include "fieldsync/core/logging.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>

#include <nlohmann/json.hpp>

namespace fieldsync {

// ============================================================================
// Log Level Utilities
// ============================================================================

std::string_view log_level_name(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

LogLevel parse_log_level(std::string_view name) noexcept {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "debug" || lowered == "trace") return LogLevel::Debug;
    if (lowered == "warn" || lowered == "warning") return LogLevel::Warn;
    if (lowered == "error") return LogLevel::Error;
    if (lowered == "off" || lowered == "none") return LogLevel::Off;
    return LogLevel::Info;
}

namespace {

const char* level_color(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "\033[36m";
        case LogLevel::Warn:  return "\033[33m";
        case LogLevel::Error: return "\033[31m";
        default: return "\033[32m";
    }
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    auto seconds = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;

    std::tm tm{};
    gmtime_r(&seconds, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

bool needs_quoting(const std::string& value) {
    return value.empty() || value.find_first_of(" \t\"=") != std::string::npos;
}

} // anonymous namespace

// ============================================================================
// Sinks
// ============================================================================

void ConsoleSink::write(const LogEntry& entry) {
    std::ostringstream oss;
    oss << format_timestamp(entry.timestamp) << ' ';

    if (colored_) oss << level_color(entry.level);
    oss << std::left << std::setw(5) << log_level_name(entry.level);
    if (colored_) oss << "\033[0m";

    if (!entry.logger_name.empty()) {
        oss << ' ' << entry.logger_name << ':';
    }
    oss << ' ' << entry.message;

    for (const auto& [key, value] : entry.fields) {
        oss << ' ' << key << '=';
        if (needs_quoting(value)) {
            oss << std::quoted(value);
        } else {
            oss << value;
        }
    }
    oss << '\n';

    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr << oss.str();
}

void JsonSink::write(const LogEntry& entry) {
    nlohmann::json line = {
        {"timestamp", format_timestamp(entry.timestamp)},
        {"level", std::string(log_level_name(entry.level))},
        {"message", entry.message}
    };
    if (!entry.logger_name.empty()) {
        line["logger"] = entry.logger_name;
    }
    for (const auto& [key, value] : entry.fields) {
        line[key] = value;
    }

    // Task names and note text come from clients; replace invalid UTF-8
    auto text = line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

    std::lock_guard<std::mutex> lock(mutex_);
    out_ << text << '\n';
}

void JsonSink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    out_.flush();
}

// ============================================================================
// Logger
// ============================================================================

Logger& Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
    return *this;
}

Logger& Logger::add_sink(std::shared_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
    return *this;
}

Logger& Logger::clear_sinks() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& sink : sinks_) {
        sink->flush();
    }
    sinks_.clear();
    return *this;
}

LogLevel Logger::level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

bool Logger::is_enabled(LogLevel level) const {
    return level != LogLevel::Off && level >= this->level();
}

void Logger::log(LogLevel level, std::string message) const {
    if (!is_enabled(level)) return;
    log(entry(level, std::move(message)));
}

LogEntry Logger::entry(LogLevel level, std::string message) const {
    LogEntry e;
    e.level = level;
    e.timestamp = std::chrono::system_clock::now();
    e.message = std::move(message);
    e.logger_name = name_;
    return e;
}

void Logger::log(const LogEntry& entry) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (entry.level == LogLevel::Off || entry.level < level_) return;
    for (const auto& sink : sinks_) {
        sink->write(entry);
    }
}

Logger& default_logger() {
    static Logger logger("fieldsync");
    static std::once_flag initialized;
    std::call_once(initialized, [] {
        logger.add_sink(std::make_shared<ConsoleSink>());
    });
    return logger;
}

} // namespace fieldsync
