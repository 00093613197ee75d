#include "fieldsync/lifecycle/state_machine.hpp"

#include "fieldsync/core/logging.hpp"
#include "fieldsync/lifecycle/assignment_registry.hpp"

namespace fieldsync {

namespace {

void stamp_transition(Task& task, TaskStatus from, TaskStatus to, Timestamp at) {
    switch (to) {
        case TaskStatus::InProgress:
            if (from == TaskStatus::Paused) {
                task.metadata.stamp(meta::resumed_at, at);
            } else {
                task.metadata.stamp(meta::started_at, at);
            }
            break;
        case TaskStatus::Paused:
            task.metadata.stamp(meta::paused_at, at);
            break;
        case TaskStatus::Completed:
            task.metadata.stamp(meta::completed_at, at);
            task.completed_at = at;
            break;
        case TaskStatus::Cancelled:
            task.metadata.stamp(meta::cancelled_at, at);
            break;
        case TaskStatus::Planned:
            break;
    }
}

} // anonymous namespace

expected<void, Error> authorize(const Task& task, const Actor& actor, bool cancelling) {
    if (actor.organization_id != task.organization_id) {
        return unexpected(Error::forbidden("Access denied to this activity"));
    }
    if (AssignmentRegistry::check_assignment(task, actor.id)) {
        return {};
    }
    if (cancelling && !task.created_by.empty() && task.created_by == actor.id) {
        return {};
    }
    return unexpected(Error::forbidden("User " + actor.id + " is not assigned to activity " + task.id));
}

expected<Task, Error> request_transition(const Task& task,
                                         TaskStatus target,
                                         const Actor& actor,
                                         const TransitionContext& context)
{
    if (!can_transition(task.status, target)) {
        return unexpected(Error::invalid_state(task.status, target));
    }

    auto allowed = authorize(task, actor, target == TaskStatus::Cancelled);
    if (!allowed) {
        return unexpected(allowed.error());
    }

    Task updated = task;
    updated.status = target;
    stamp_transition(updated, task.status, target, context.at);
    if (context.details.is_object()) {
        updated.metadata.merge(context.details);
    }

    auto entry = default_logger().entry(LogLevel::Debug, "Activity status changed");
    entry.field("task", task.id)
         .field("from", to_string(task.status))
         .field("to", to_string(target))
         .field("actor", actor.id);
    default_logger().log(entry);

    return updated;
}

expected<Task, Error> update_progress(const Task& task,
                                      int percent,
                                      const Actor& actor,
                                      const TransitionContext& context)
{
    if (task.status != TaskStatus::InProgress) {
        return unexpected(Error::invalid_state(
            task.status, "Progress can only be recorded on an activity in progress"));
    }

    auto allowed = authorize(task, actor);
    if (!allowed) {
        return unexpected(allowed.error());
    }

    if (percent < 0 || percent > 100) {
        return unexpected(Error::validation("Progress must be between 0 and 100"));
    }

    Task updated = task;
    updated.progress = percent;
    updated.metadata.set(meta::progress, percent);
    if (context.details.is_object()) {
        updated.metadata.merge(context.details);
    }
    return updated;
}

} // namespace fieldsync
