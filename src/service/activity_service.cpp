#include "fieldsync/service/activity_service.hpp"

#include <exception>

#include "fieldsync/core/logging.hpp"

namespace fieldsync {

ActivityService::ActivityService(Repository& repo,
                                 TaskLocks& locks,
                                 UpdateBroadcaster& broadcaster,
                                 Clock clock)
    : repo_(repo)
    , locks_(locks)
    , broadcaster_(broadcaster)
    , clock_(clock)
    , registry_(clock)
{}

std::optional<Task> ActivityService::find(const std::string& task_id) const {
    return repo_.load_task(task_id);
}

template<typename Fn>
expected<Task, Error> ActivityService::mutate(const std::string& task_id, Fn&& change) {
    auto guard = locks_.acquire(task_id);

    auto loaded = repo_.load_task(task_id);
    if (!loaded) {
        return unexpected(Error::not_found("Activity not found: " + task_id));
    }

    expected<Task, Error> changed = change(*loaded);
    if (!changed) {
        return unexpected(changed.error());
    }

    auto saved = repo_.save_task(*changed, loaded->updated_at);
    if (!saved) {
        return unexpected(saved.error());
    }
    notify(*saved);
    return saved;
}

expected<Task, Error> ActivityService::transition(const std::string& task_id,
                                                  TaskStatus target,
                                                  const Actor& actor,
                                                  nlohmann::json details)
{
    TransitionContext context{clock_(), std::move(details)};
    return mutate(task_id, [&](const Task& task) {
        return request_transition(task, target, actor, context);
    });
}

expected<Task, Error> ActivityService::update_progress(const std::string& task_id,
                                                       int percent,
                                                       const Actor& actor,
                                                       nlohmann::json details)
{
    TransitionContext context{clock_(), std::move(details)};
    return mutate(task_id, [&](const Task& task) {
        return fieldsync::update_progress(task, percent, actor, context);
    });
}

expected<std::vector<Assignment>, Error> ActivityService::assign(const std::string& task_id,
                                                                 const std::vector<AssigneeRequest>& actors,
                                                                 const Actor& acting_user,
                                                                 const AssignOptions& options)
{
    std::vector<Assignment> created;
    auto saved = mutate(task_id, [&](const Task& task) -> expected<Task, Error> {
        Task updated = task;
        auto result = registry_.assign(updated, actors, acting_user, options);
        if (!result) {
            return unexpected(result.error());
        }
        created = std::move(*result);
        return updated;
    });
    if (!saved) {
        return unexpected(saved.error());
    }
    return created;
}

expected<void, Error> ActivityService::unassign(const std::string& task_id,
                                                const std::string& actor_id,
                                                const Actor& acting_user)
{
    auto saved = mutate(task_id, [&](const Task& task) -> expected<Task, Error> {
        if (task.organization_id != acting_user.organization_id) {
            return unexpected(Error::forbidden("Access denied to this activity"));
        }
        Task updated = task;
        auto result = registry_.unassign(updated, actor_id);
        if (!result) {
            return unexpected(result.error());
        }
        return updated;
    });
    if (!saved) {
        return unexpected(saved.error());
    }
    return {};
}

expected<Note, Error> ActivityService::add_note(const NoteSubmission& submission, const Actor& actor) {
    if (submission.content.empty()) {
        return unexpected(Error::validation("Note content cannot be empty"));
    }

    auto guard = locks_.acquire(submission.task_id);

    auto task = repo_.load_task(submission.task_id);
    if (!task) {
        return unexpected(Error::not_found("Activity not found: " + submission.task_id));
    }
    if (task->organization_id != actor.organization_id ||
        (!AssignmentRegistry::check_assignment(*task, actor.id) && task->created_by != actor.id)) {
        return unexpected(Error::forbidden("Access denied to this activity"));
    }

    Note note;
    note.task_id = submission.task_id;
    note.author_id = actor.id;
    note.content = submission.content;
    note.type = submission.type;
    note.is_private = submission.is_private;

    auto inserted = repo_.insert_note(std::move(note));
    if (!inserted) {
        return unexpected(inserted.error());
    }
    try {
        broadcaster_.note_added(*inserted);
    } catch (const std::exception& e) {
        log_warn("Broadcast of note " + inserted->id + " failed: " + e.what());
    }
    return inserted;
}

void ActivityService::notify(const Task& task) {
    try {
        broadcaster_.task_updated(task);
    } catch (const std::exception& e) {
        log_warn("Broadcast of activity " + task.id + " failed: " + e.what());
    }
}

} // namespace fieldsync
