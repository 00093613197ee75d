#pragma once

#include <nlohmann/json.hpp>

#include "fieldsync/core/error.hpp"
#include "fieldsync/model/actor.hpp"
#include "fieldsync/model/task.hpp"
#include "fieldsync/model/task_status.hpp"
#include "fieldsync/util/expected.hpp"
#include "fieldsync/util/time.hpp"

namespace fieldsync {

struct TransitionContext {
    Timestamp at = now();

    // Merged into task metadata: location, pauseReason, results, issues,
    // recommendations, or anything else the caller records with the change
    nlohmann::json details = nlohmann::json::object();
};

// ============================================================================
// Lifecycle Transitions
// ============================================================================
//
// These functions never persist or notify. They return the updated copy of
// the task, and the caller decides whether to save it.

// Move a task to `target`. Fails with InvalidState when the transition table
// does not allow it and Forbidden when the actor may not change this task.
expected<Task, Error> request_transition(const Task& task,
                                         TaskStatus target,
                                         const Actor& actor,
                                         const TransitionContext& context = {});

// Record progress on an IN_PROGRESS task
expected<Task, Error> update_progress(const Task& task,
                                      int percent,
                                      const Actor& actor,
                                      const TransitionContext& context = {});

// Same organization and an active assignment. The creator may also cancel.
expected<void, Error> authorize(const Task& task, const Actor& actor,
                                bool cancelling = false);

} // namespace fieldsync
