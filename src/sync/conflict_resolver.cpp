#include "fieldsync/sync/conflict_resolver.hpp"

#include "fieldsync/core/logging.hpp"
#include "fieldsync/model/metadata.hpp"
#include "fieldsync/util/json.hpp"

namespace fieldsync {

nlohmann::json ResolutionResult::to_json() const {
    return {
        {"resolved", resolved},
        {"finalValue", merged},
        {"strategy", {{"strategy", strategy}, {"reason", reason}}},
        {"conflicts", to_json_array(conflicts)}
    };
}

ConflictResolver::ConflictResolver(std::shared_ptr<const ResolutionPolicy> policy, Clock clock)
    : policy_(std::move(policy))
    , clock_(std::move(clock))
{
    if (!policy_) {
        policy_ = std::make_shared<CriticalFieldsPolicy>();
    }
}

ResolutionResult ConflictResolver::resolve(const nlohmann::json& server,
                                           const nlohmann::json& client,
                                           const std::vector<SyncConflict>& conflicts,
                                           const Actor& actor) const
{
    ResolutionResult result;
    result.merged = client.is_object() ? client : nlohmann::json::object();

    if (conflicts.empty()) {
        result.strategy = "CLIENT_WINS";
        result.reason = "No conflicts detected";
        return result;
    }

    for (const auto& conflict : conflicts) {
        if (policy_->choose(conflict) == Winner::Server) {
            auto* value = util::find(server, conflict.field);
            if (util::is_absent(value)) {
                result.merged.erase(conflict.field);
            } else {
                result.merged[conflict.field] = *value;
            }
            log_debug("Resolved conflict for " + conflict.field + ": server wins");
        } else {
            result.merged[conflict.field] = conflict.client_value;
            log_debug("Resolved conflict for " + conflict.field + ": client wins");
        }
    }

    auto& metadata = result.merged[std::string(field::metadata)];
    if (!metadata.is_object()) {
        metadata = nlohmann::json::object();
    }
    metadata[std::string(meta::conflict_resolution)] = {
        {"resolvedAt", to_iso8601(clock_())},
        {"resolvedBy", actor.id},
        {"conflictsResolved", conflicts.size()},
        {"strategy", std::string(policy_->label())}
    };

    result.strategy = policy_->strategy();
    result.reason = policy_->reason();
    result.conflicts = conflicts;
    return result;
}

Note make_audit_note(const std::string& task_id,
                     const ResolutionResult& result,
                     const Actor& actor,
                     Timestamp at)
{
    nlohmann::json fields = nlohmann::json::array();
    for (const auto& conflict : result.conflicts) {
        auto it = result.merged.find(conflict.field);
        fields.push_back({
            {"field", conflict.field},
            {"conflictType", std::string(to_string(conflict.kind))},
            {"resolvedValue", it != result.merged.end() ? *it : nlohmann::json(nullptr)}
        });
    }

    Note note;
    note.task_id = task_id;
    note.author_id = actor.id;
    note.type = NoteType::General;
    note.content = "Conflict resolution applied: " + std::to_string(result.conflicts.size()) +
                   " conflicts resolved using " + result.strategy + " strategy";
    note.created_at = at;
    note.metadata = {
        {std::string(meta::conflict_resolution), {
            {"entityType", "activity"},
            {"entityId", task_id},
            {"conflicts", std::move(fields)},
            {"strategy", {{"strategy", result.strategy}, {"reason", result.reason}}},
            {"resolvedAt", to_iso8601(at)}
        }}
    };
    return note;
}

} // namespace fieldsync
