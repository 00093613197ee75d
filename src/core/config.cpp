#include "fieldsync/core/config.hpp"

#include <charconv>
#include <cstdlib>
#include <string_view>

namespace fieldsync {

namespace {

bool parse_flag(std::string_view value, bool fallback) {
    if (value == "1" || value == "true" || value == "yes" || value == "on") return true;
    if (value == "0" || value == "false" || value == "no" || value == "off") return false;
    log_warn("Ignoring unrecognized boolean setting: " + std::string(value));
    return fallback;
}

} // anonymous namespace

Config Config::from_env() {
    return from_lookup([](const char* name) { return std::getenv(name); });
}

Config Config::from_lookup(const Lookup& lookup) {
    Config config;

    // Logging
    if (const char* level = lookup("FIELDSYNC_LOG_LEVEL")) {
        config.log_level = parse_log_level(level);
    }
    if (const char* format = lookup("FIELDSYNC_LOG_FORMAT")) {
        std::string_view value(format);
        if (value == "console" || value == "json") {
            config.log_format = value;
        } else {
            log_warn("Unknown FIELDSYNC_LOG_FORMAT, using console: " + std::string(value));
        }
    }
    if (const char* color = lookup("FIELDSYNC_LOG_COLOR")) {
        config.log_color = parse_flag(color, config.log_color);
    }

    // Sync
    if (const char* workers = lookup("FIELDSYNC_SYNC_WORKERS")) {
        std::string_view value(workers);
        size_t parsed = 0;
        auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
        if (ec == std::errc{} && ptr == value.data() + value.size() && parsed > 0) {
            config.sync_workers = parsed;
        } else {
            log_warn("Invalid FIELDSYNC_SYNC_WORKERS, using 1: " + std::string(value));
        }
    }
    if (const char* audit = lookup("FIELDSYNC_AUDIT_CONFLICTS")) {
        config.audit_conflicts = parse_flag(audit, config.audit_conflicts);
    }
    if (const char* policy = lookup("FIELDSYNC_RESOLUTION_POLICY")) {
        config.resolution_policy = policy;
    }

    return config;
}

void Config::configure(Logger& logger) const {
    logger.clear_sinks();
    logger.set_level(log_level);
    if (log_format == "json") {
        logger.add_sink(std::make_shared<JsonSink>());
    } else {
        logger.add_sink(std::make_shared<ConsoleSink>(log_color));
    }
}

} // namespace fieldsync
