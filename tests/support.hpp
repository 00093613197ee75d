#pragma once

#include <string>
#include <vector>

#include <fieldsync/fieldsync.hpp>

namespace fieldsync::test {

inline Timestamp at_seconds(int64_t seconds) {
    return from_millis(seconds * 1000);
}

inline Actor worker(std::string id = "alice", std::string org = "org-1") {
    return Actor{std::move(id), std::move(org)};
}

// Task in org-1 created by "manager" with the given active assignees; the
// first assignee is PRIMARY.
inline Task make_task(std::string id,
                      TaskStatus status,
                      std::vector<std::string> assignees = {"alice"},
                      Timestamp updated_at = at_seconds(1000))
{
    Task task;
    task.id = std::move(id);
    task.organization_id = "org-1";
    task.farm_id = "farm-1";
    task.name = "Irrigate north field";
    task.status = status;
    task.created_by = "manager";
    task.updated_at = updated_at;
    for (size_t i = 0; i < assignees.size(); ++i) {
        Assignment a;
        a.id = task.id + "-a" + std::to_string(i + 1);
        a.task_id = task.id;
        a.actor_id = assignees[i];
        a.role = i == 0 ? AssignmentRole::Primary : AssignmentRole::Support;
        a.active = true;
        a.assigned_at = updated_at;
        a.assigned_by = "manager";
        task.assignments.push_back(a);
    }
    return task;
}

} // namespace fieldsync::test
