#include "fieldsync/model/assignment.hpp"
#include "fieldsync/util/json.hpp"

namespace fieldsync {

std::string_view to_string(AssignmentRole role) noexcept {
    switch (role) {
        case AssignmentRole::Primary: return "PRIMARY";
        case AssignmentRole::Support: return "SUPPORT";
    }
    return "SUPPORT";
}

std::optional<AssignmentRole> parse_role(std::string_view name) noexcept {
    if (name == "PRIMARY") return AssignmentRole::Primary;
    if (name == "SUPPORT") return AssignmentRole::Support;
    return std::nullopt;
}

nlohmann::json Assignment::to_json() const {
    nlohmann::json j = {
        {"id", id},
        {"taskId", task_id},
        {"actorId", actor_id},
        {"role", std::string(to_string(role))},
        {"active", active},
        {"assignedAt", to_iso8601(assigned_at)},
        {"assignedBy", assigned_by}
    };
    if (reassign_reason) {
        j["reassignReason"] = *reassign_reason;
    }
    return j;
}

expected<Assignment, Error> Assignment::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return unexpected(Error::validation("assignment must be a JSON object"));
    }

    auto id = util::string_member(j, "id");
    auto task_id = util::string_member(j, "taskId");
    auto actor_id = util::string_member(j, "actorId");
    auto role = util::string_member(j, "role", "SUPPORT");
    auto assigned_at = util::string_member(j, "assignedAt");
    auto assigned_by = util::string_member(j, "assignedBy");
    if (!id || !task_id || !actor_id || !role || !assigned_at || !assigned_by) {
        return unexpected(Error::validation("assignment fields must be strings"));
    }
    if (actor_id->empty()) {
        return unexpected(Error::validation("assignment actorId is required"));
    }

    Assignment a;
    a.id = std::move(*id);
    a.task_id = std::move(*task_id);
    a.actor_id = std::move(*actor_id);

    auto parsed_role = parse_role(*role);
    if (!parsed_role) {
        return unexpected(Error::validation("unknown assignment role: " + *role));
    }
    a.role = *parsed_role;

    if (auto* active = util::find(j, "active"); active && !active->is_null()) {
        if (!active->is_boolean()) {
            return unexpected(Error::validation("assignment active must be a boolean"));
        }
        a.active = active->get<bool>();
    }
    if (!assigned_at->empty()) {
        auto at = parse_iso8601(*assigned_at);
        if (!at) {
            return unexpected(Error::validation("invalid assignedAt: " + *assigned_at));
        }
        a.assigned_at = *at;
    }
    a.assigned_by = std::move(*assigned_by);

    auto reason = util::string_member(j, "reassignReason");
    if (reason && !reason->empty()) {
        a.reassign_reason = std::move(*reason);
    }
    return a;
}

nlohmann::json to_json_array(const std::vector<Assignment>& assignments) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& assignment : assignments) {
        arr.push_back(assignment.to_json());
    }
    return arr;
}

} // namespace fieldsync
