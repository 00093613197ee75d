#pragma once

#include <optional>
#include <string>
#include <vector>

#include "fieldsync/core/error.hpp"
#include "fieldsync/model/actor.hpp"
#include "fieldsync/model/assignment.hpp"
#include "fieldsync/model/task.hpp"
#include "fieldsync/util/expected.hpp"
#include "fieldsync/util/time.hpp"

namespace fieldsync {

struct AssigneeRequest {
    std::string actor_id;
    std::optional<AssignmentRole> role;  // first assignee defaults to PRIMARY

    AssigneeRequest(std::string id, std::optional<AssignmentRole> r = std::nullopt)
        : actor_id(std::move(id)), role(r) {}
    AssigneeRequest(const char* id) : actor_id(id) {}
};

struct AssignOptions {
    std::optional<std::string> reassign_reason;
};

/// Owns the assignment set of a task.
///
/// Assignments are never deleted: a reassignment deactivates every active
/// row and appends the new set, and an unassignment flips one row to
/// inactive. Both either apply completely or leave the task untouched.
class AssignmentRegistry {
    Clock clock_;

public:
    explicit AssignmentRegistry(Clock clock = system_clock());

    // Replace the active set. Returns the newly created assignments.
    expected<std::vector<Assignment>, Error> assign(Task& task,
                                                    const std::vector<AssigneeRequest>& actors,
                                                    const Actor& acting_user,
                                                    const AssignOptions& options = {}) const;

    // Deactivate one actor's assignment; never removes the last active one
    expected<void, Error> unassign(Task& task, const std::string& actor_id) const;

    // The authorization primitive used by the state machine and batch sync
    static bool check_assignment(const Task& task, const std::string& actor_id);

    static std::vector<Assignment> active_assignees(const Task& task);
    static std::optional<Assignment> primary_assignee(const Task& task);
};

} // namespace fieldsync
