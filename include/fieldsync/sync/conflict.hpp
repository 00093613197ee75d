#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "fieldsync/model/task.hpp"
#include "fieldsync/util/time.hpp"

namespace fieldsync {

// ============================================================================
// Snapshots
// ============================================================================

// Server side of a comparison: the watched fields of a stored task plus the
// watermarks needed to tell server changes from the client's own edits.
struct ServerSnapshot {
    nlohmann::json fields = nlohmann::json::object();
    Timestamp updated_at{};
    FieldStamps stamps;

    static ServerSnapshot of(const Task& task);
};

// ============================================================================
// Conflicts
// ============================================================================

enum class ConflictKind {
    Create,   // server absent, client present
    Delete,   // client null, server present
    Update    // both present, values differ
};

std::string_view to_string(ConflictKind kind) noexcept;

struct SyncConflict {
    std::string field;
    nlohmann::json server_value;   // null when absent
    nlohmann::json client_value;
    Timestamp server_last_modified{};
    Timestamp client_last_sync{};
    ConflictKind kind = ConflictKind::Update;

    nlohmann::json to_json() const;
};

nlohmann::json to_json_array(const std::vector<SyncConflict>& conflicts);

// Watched fields for a server snapshot. Identity fields (type, name,
// description, priority) are only compared for snapshots that carry a type.
std::vector<std::string_view> watched_fields(const nlohmann::json& server_fields);

// Fields the client does not submit are not compared. Returns an empty list
// when the server has not changed since `client_last_sync`.
std::vector<SyncConflict> detect_conflicts(const ServerSnapshot& server,
                                           const nlohmann::json& client,
                                           Timestamp client_last_sync);

} // namespace fieldsync
