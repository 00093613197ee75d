#include "fieldsync/sync/conflict.hpp"

#include "fieldsync/core/logging.hpp"
#include "fieldsync/util/json.hpp"

namespace fieldsync {

ServerSnapshot ServerSnapshot::of(const Task& task) {
    return ServerSnapshot{task.snapshot(), task.updated_at, task.field_stamps};
}

std::string_view to_string(ConflictKind kind) noexcept {
    switch (kind) {
        case ConflictKind::Create: return "CREATE_CONFLICT";
        case ConflictKind::Delete: return "DELETE_CONFLICT";
        case ConflictKind::Update: return "UPDATE_CONFLICT";
    }
    return "UPDATE_CONFLICT";
}

nlohmann::json SyncConflict::to_json() const {
    return {
        {"field", field},
        {"serverValue", server_value},
        {"clientValue", client_value},
        {"lastModified", {
            {"server", to_iso8601(server_last_modified)},
            {"client", to_iso8601(client_last_sync)}
        }},
        {"conflictType", std::string(to_string(kind))}
    };
}

nlohmann::json to_json_array(const std::vector<SyncConflict>& conflicts) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& c : conflicts) {
        arr.push_back(c.to_json());
    }
    return arr;
}

std::vector<std::string_view> watched_fields(const nlohmann::json& server_fields) {
    std::vector<std::string_view> fields = {
        field::status, field::progress, field::notes, field::metadata
    };
    if (!util::is_absent(util::find(server_fields, std::string(field::type)))) {
        fields.insert(fields.end(), {field::type, field::name, field::description, field::priority});
    }
    return fields;
}

std::vector<SyncConflict> detect_conflicts(const ServerSnapshot& server,
                                           const nlohmann::json& client,
                                           Timestamp client_last_sync)
{
    std::vector<SyncConflict> conflicts;
    if (server.updated_at <= client_last_sync) {
        return conflicts;
    }

    for (auto name : watched_fields(server.fields)) {
        std::string key(name);

        auto* client_value = util::find(client, key);
        if (client_value == nullptr) {
            continue;
        }

        // A field the server has not touched since the client last synced
        // differs only because of the client's own edit
        auto stamp = server.stamps.find(key);
        if (stamp != server.stamps.end() && stamp->second <= client_last_sync) {
            continue;
        }

        auto* server_value = util::find(server.fields, key);
        bool server_absent = util::is_absent(server_value);
        bool client_absent = client_value->is_null();

        ConflictKind kind;
        if (server_absent && client_absent) {
            continue;
        } else if (server_absent) {
            kind = ConflictKind::Create;
        } else if (client_absent) {
            kind = ConflictKind::Delete;
        } else if (util::structurally_equal(*server_value, *client_value)) {
            continue;
        } else {
            kind = ConflictKind::Update;
        }

        SyncConflict conflict;
        conflict.field = key;
        conflict.server_value = server_absent ? nlohmann::json(nullptr) : *server_value;
        conflict.client_value = *client_value;
        conflict.server_last_modified = stamp != server.stamps.end() ? stamp->second : server.updated_at;
        conflict.client_last_sync = client_last_sync;
        conflict.kind = kind;
        conflicts.push_back(std::move(conflict));
    }

    if (!conflicts.empty()) {
        log_debug("Detected " + std::to_string(conflicts.size()) + " sync conflicts");
    }
    return conflicts;
}

} // namespace fieldsync
