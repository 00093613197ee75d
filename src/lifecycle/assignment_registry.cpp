#include "fieldsync/lifecycle/assignment_registry.hpp"

#include <algorithm>
#include <iterator>
#include <unordered_set>

#include "fieldsync/core/logging.hpp"

namespace fieldsync {

AssignmentRegistry::AssignmentRegistry(Clock clock) : clock_(std::move(clock)) {}

expected<std::vector<Assignment>, Error> AssignmentRegistry::assign(
    Task& task,
    const std::vector<AssigneeRequest>& actors,
    const Actor& acting_user,
    const AssignOptions& options) const
{
    if (!acting_user.organization_id.empty() && !task.organization_id.empty() &&
        acting_user.organization_id != task.organization_id) {
        return unexpected(Error::forbidden("Access denied to this activity"));
    }
    if (is_terminal(task.status)) {
        return unexpected(Error::validation(
            "Cannot assign users to completed or cancelled activity"));
    }
    if (actors.empty()) {
        return unexpected(Error::validation("At least one assignee is required"));
    }

    std::unordered_set<std::string> seen;
    for (const auto& request : actors) {
        if (request.actor_id.empty()) {
            return unexpected(Error::validation("Assignee id cannot be empty"));
        }
        if (!seen.insert(request.actor_id).second) {
            return unexpected(Error::validation("Duplicate assignee: " + request.actor_id));
        }
    }

    // Build the replacement set aside and swap it in only once complete
    auto at = clock_();
    auto assignments = task.assignments;
    for (auto& existing : assignments) {
        existing.active = false;
    }

    std::vector<Assignment> created;
    created.reserve(actors.size());
    for (size_t i = 0; i < actors.size(); ++i) {
        Assignment a;
        a.id = task.id + "-a" + std::to_string(assignments.size() + 1);
        a.task_id = task.id;
        a.actor_id = actors[i].actor_id;
        a.role = actors[i].role.value_or(i == 0 ? AssignmentRole::Primary : AssignmentRole::Support);
        a.active = true;
        a.assigned_at = at;
        a.assigned_by = acting_user.id;
        a.reassign_reason = options.reassign_reason;
        assignments.push_back(a);
        created.push_back(std::move(a));
    }

    task.assignments = std::move(assignments);
    if (options.reassign_reason) {
        task.metadata.set(meta::reassign_reason, *options.reassign_reason);
        task.metadata.stamp(meta::reassigned_at, at);
    }

    auto entry = default_logger().entry(LogLevel::Debug, "Assigned users to activity");
    entry.field("task", task.id)
         .field("assigned_by", acting_user.id)
         .field("count", created.size());
    default_logger().log(entry);

    return created;
}

expected<void, Error> AssignmentRegistry::unassign(Task& task, const std::string& actor_id) const {
    auto active = std::count_if(task.assignments.begin(), task.assignments.end(),
                                [](const Assignment& a) { return a.active; });

    auto it = std::find_if(task.assignments.begin(), task.assignments.end(),
                           [&](const Assignment& a) { return a.active && a.actor_id == actor_id; });
    if (it == task.assignments.end()) {
        return unexpected(Error::not_found("No active assignment for " + actor_id));
    }
    if (active <= 1) {
        return unexpected(Error::validation("Cannot remove last assignment from activity"));
    }

    it->active = false;
    return {};
}

bool AssignmentRegistry::check_assignment(const Task& task, const std::string& actor_id) {
    return std::any_of(task.assignments.begin(), task.assignments.end(),
                       [&](const Assignment& a) { return a.active && a.actor_id == actor_id; });
}

std::vector<Assignment> AssignmentRegistry::active_assignees(const Task& task) {
    std::vector<Assignment> result;
    std::copy_if(task.assignments.begin(), task.assignments.end(), std::back_inserter(result),
                 [](const Assignment& a) { return a.active; });
    return result;
}

std::optional<Assignment> AssignmentRegistry::primary_assignee(const Task& task) {
    std::optional<Assignment> first_active;
    for (const auto& a : task.assignments) {
        if (!a.active) continue;
        if (a.role == AssignmentRole::Primary) return a;
        if (!first_active) first_active = a;
    }
    return first_active;
}

} // namespace fieldsync
