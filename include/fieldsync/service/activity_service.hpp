#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "fieldsync/core/error.hpp"
#include "fieldsync/lifecycle/assignment_registry.hpp"
#include "fieldsync/lifecycle/state_machine.hpp"
#include "fieldsync/model/actor.hpp"
#include "fieldsync/model/note.hpp"
#include "fieldsync/model/task.hpp"
#include "fieldsync/store/repository.hpp"
#include "fieldsync/store/task_locks.hpp"
#include "fieldsync/sync/broadcaster.hpp"
#include "fieldsync/util/expected.hpp"
#include "fieldsync/util/time.hpp"

namespace fieldsync {

// Online mutations addressed by task id. Each call holds the task lock for
// its whole load, change and save, and broadcasts the saved state.
class ActivityService {
public:
    ActivityService(Repository& repo,
                    TaskLocks& locks,
                    UpdateBroadcaster& broadcaster,
                    Clock clock = system_clock());

    std::optional<Task> find(const std::string& task_id) const;

    expected<Task, Error> transition(const std::string& task_id,
                                     TaskStatus target,
                                     const Actor& actor,
                                     nlohmann::json details = nlohmann::json::object());

    expected<Task, Error> update_progress(const std::string& task_id,
                                          int percent,
                                          const Actor& actor,
                                          nlohmann::json details = nlohmann::json::object());

    expected<std::vector<Assignment>, Error> assign(const std::string& task_id,
                                                    const std::vector<AssigneeRequest>& actors,
                                                    const Actor& acting_user,
                                                    const AssignOptions& options = {});

    expected<void, Error> unassign(const std::string& task_id,
                                   const std::string& actor_id,
                                   const Actor& acting_user);

    expected<Note, Error> add_note(const NoteSubmission& submission, const Actor& actor);

private:
    template<typename Fn>
    expected<Task, Error> mutate(const std::string& task_id, Fn&& change);

    void notify(const Task& task);

    Repository& repo_;
    TaskLocks& locks_;
    UpdateBroadcaster& broadcaster_;
    Clock clock_;
    AssignmentRegistry registry_;
};

} // namespace fieldsync
