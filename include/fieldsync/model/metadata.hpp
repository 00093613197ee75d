#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "fieldsync/util/time.hpp"

namespace fieldsync {

// ============================================================================
// Reserved Metadata Keys
// ============================================================================

namespace meta {

inline constexpr std::string_view started_at = "startedAt";
inline constexpr std::string_view paused_at = "pausedAt";
inline constexpr std::string_view resumed_at = "resumedAt";
inline constexpr std::string_view completed_at = "completedAt";
inline constexpr std::string_view cancelled_at = "cancelledAt";
inline constexpr std::string_view progress = "progress";
inline constexpr std::string_view results = "results";
inline constexpr std::string_view location = "location";
inline constexpr std::string_view pause_reason = "pauseReason";
inline constexpr std::string_view issues = "issues";
inline constexpr std::string_view recommendations = "recommendations";
inline constexpr std::string_view synced_at = "syncedAt";
inline constexpr std::string_view synced_by = "syncedBy";
inline constexpr std::string_view conflict_resolution = "conflictResolution";
inline constexpr std::string_view reassign_reason = "reassignReason";
inline constexpr std::string_view reassigned_at = "reassignedAt";

} // namespace meta

// ============================================================================
// Metadata
// ============================================================================

/// Open key/value side data attached to a task.
///
/// Writers never replace the map wholesale: merge() sets the keys it is
/// given and leaves every sibling key in place, so lifecycle stamps written
/// by one path survive a sync payload written by another.
class Metadata {
    nlohmann::json data_ = nlohmann::json::object();

public:
    Metadata() = default;

    // Non-object input is treated as empty
    static Metadata from_json(const nlohmann::json& j);
    const nlohmann::json& to_json() const noexcept { return data_; }

    void set(std::string_view key, nlohmann::json value);
    void stamp(std::string_view key, Timestamp at);
    void merge(const nlohmann::json& patch);
    void merge(const Metadata& other) { merge(other.data_); }

    bool has(std::string_view key) const;
    const nlohmann::json* get(std::string_view key) const;
    std::optional<std::string> get_string(std::string_view key) const;

    size_t size() const noexcept { return data_.size(); }
    bool empty() const noexcept { return data_.empty(); }

    bool operator==(const Metadata& other) const;
};

} // namespace fieldsync
