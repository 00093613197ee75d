#pragma once

#include <cstddef>
#include <functional>
#include <string>

#include "fieldsync/core/logging.hpp"

namespace fieldsync {

struct Config {
    // Logging
    LogLevel log_level = LogLevel::Info;
    std::string log_format = "console";   // "console" or "json"
    bool log_color = true;

    // Sync
    size_t sync_workers = 1;              // distinct tasks applied in parallel
    bool audit_conflicts = true;          // write an audit note per resolved merge
    std::string resolution_policy = "hybrid";  // "hybrid", "server_wins", "client_wins"

    // Returns the value of a variable or nullptr when unset
    using Lookup = std::function<const char*(const char*)>;

    // Load configuration from FIELDSYNC_* environment variables
    static Config from_env();
    static Config from_lookup(const Lookup& lookup);

    // Apply level and sinks to a logger (existing sinks are replaced)
    void configure(Logger& logger) const;
};

} // namespace fieldsync
