#include "fieldsync/sync/sync_orchestrator.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <thread>
#include <unordered_map>

#include "fieldsync/core/logging.hpp"
#include "fieldsync/lifecycle/assignment_registry.hpp"
#include "fieldsync/lifecycle/state_machine.hpp"
#include "fieldsync/sync/conflict.hpp"
#include "fieldsync/util/json.hpp"

namespace fieldsync {

// ============================================================================
// Batch Types
// ============================================================================

TaskUpdate TaskUpdate::from_json(const nlohmann::json& j) {
    TaskUpdate update;
    if (!j.is_object()) {
        return update;
    }
    // A wrongly typed id leaves task_id empty and the item fails validation
    auto* task_id = util::find(j, "taskId");
    update.task_id = util::string_member(j, util::is_absent(task_id) ? "id" : "taskId").value_or("");
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (it.key() == "taskId" || it.key() == "id") continue;
        update.fields[it.key()] = it.value();
    }
    return update;
}

std::string_view to_string(ItemKind kind) noexcept {
    switch (kind) {
        case ItemKind::Update: return "taskUpdate";
        case ItemKind::Note: return "note";
    }
    return "taskUpdate";
}

nlohmann::json SyncItemError::to_json() const {
    return {
        {"kind", std::string(to_string(kind))},
        {"id", item_id},
        {"code", std::string(fieldsync::to_string(code))},
        {"error", message}
    };
}

nlohmann::json SyncResult::to_json() const {
    nlohmann::json errs = nlohmann::json::array();
    for (const auto& e : errors) {
        errs.push_back(e.to_json());
    }
    return {
        {"tasksUpdated", tasks_updated},
        {"notesAdded", notes_added},
        {"notesSkipped", notes_skipped},
        {"conflictsResolved", conflicts_resolved},
        {"failed", errors.size()},
        {"errors", std::move(errs)},
        {"syncedAt", to_iso8601(synced_at)}
    };
}

nlohmann::json OfflinePackage::to_json() const {
    return {
        {"tasks", to_json_array(tasks)},
        {"lastSync", to_iso8601(last_sync)},
        {"totalTasks", tasks.size()}
    };
}

SyncOptions SyncOptions::from_config(const Config& config) {
    SyncOptions options;
    options.workers = std::max<size_t>(1, config.sync_workers);
    options.audit_conflicts = config.audit_conflicts;
    return options;
}

ConflictResolver make_resolver(const Config& config, Clock clock) {
    auto policy = make_policy(config.resolution_policy);
    if (!policy) {
        log_warn(std::string(policy.error().message()) + ", using hybrid");
        return ConflictResolver(std::make_shared<CriticalFieldsPolicy>(), std::move(clock));
    }
    return ConflictResolver(std::move(*policy), std::move(clock));
}

// ============================================================================
// Sync Orchestrator
// ============================================================================

namespace {

struct Indexed {
    size_t index;
    SyncItemError error;
};

expected<int, Error> read_progress(const nlohmann::json& value) {
    if (!value.is_number_integer() && !value.is_number_unsigned()) {
        return unexpected(Error::validation("Progress must be an integer"));
    }
    auto percent = value.get<int64_t>();
    if (percent < 0 || percent > 100) {
        return unexpected(Error::validation("Progress must be between 0 and 100"));
    }
    return static_cast<int>(percent);
}

} // anonymous namespace

SyncOrchestrator::SyncOrchestrator(Repository& repo,
                                   TaskLocks& locks,
                                   UpdateBroadcaster& broadcaster,
                                   ConflictResolver resolver,
                                   SyncOptions options,
                                   Clock clock)
    : repo_(repo)
    , locks_(locks)
    , broadcaster_(broadcaster)
    , resolver_(std::move(resolver))
    , options_(options)
    , clock_(std::move(clock))
    , metrics_(options.metrics ? SyncMetrics(*options.metrics) : SyncMetrics())
{}

SyncResult SyncOrchestrator::sync_batch(const std::vector<TaskUpdate>& updates,
                                        const std::vector<NoteSubmission>& notes,
                                        Timestamp client_last_sync,
                                        const Actor& actor)
{
    SyncMetrics::BatchScope batch_scope(metrics_);

    // Group update indices by task id, keeping first-seen order
    std::vector<std::vector<size_t>> groups;
    std::unordered_map<std::string, size_t> group_of;
    for (size_t i = 0; i < updates.size(); ++i) {
        auto [it, inserted] = group_of.try_emplace(updates[i].task_id, groups.size());
        if (inserted) {
            groups.emplace_back();
        }
        groups[it->second].push_back(i);
    }

    SyncResult result;
    std::vector<Indexed> failures;
    std::mutex result_mutex;
    std::atomic<size_t> next_group{0};

    auto run_item = [&](size_t index, std::vector<Timestamp>& own_saves) {
        const auto& update = updates[index];
        metrics_.items_total->inc();

        expected<Applied, Error> outcome = unexpected(Error::internal("Item not applied"));
        try {
            outcome = apply_update(update, client_last_sync, own_saves, actor);
        } catch (const std::exception& e) {
            auto entry = default_logger().entry(LogLevel::Error, "Unexpected failure applying task update");
            entry.field("task", update.task_id).field("error", e.what());
            default_logger().log(entry);
            outcome = unexpected(Error::internal(e.what()));
        }

        if (outcome) {
            own_saves.push_back(outcome->watermark);
        }

        std::lock_guard lock(result_mutex);
        if (outcome) {
            ++result.tasks_updated;
            result.conflicts_resolved += outcome->conflicts;
        } else {
            failures.push_back({index, SyncItemError{ItemKind::Update, update.task_id,
                                                     outcome.error().errc(),
                                                     std::string(outcome.error().message())}});
        }
    };

    auto worker = [&] {
        for (size_t g = next_group++; g < groups.size(); g = next_group++) {
            std::vector<Timestamp> own_saves;
            for (auto index : groups[g]) {
                run_item(index, own_saves);
            }
        }
    };

    size_t workers = std::min(std::max<size_t>(1, options_.workers), groups.size());
    if (workers <= 1) {
        worker();
    } else {
        std::vector<std::thread> pool;
        pool.reserve(workers);
        for (size_t i = 0; i < workers; ++i) {
            pool.emplace_back(worker);
        }
        for (auto& t : pool) {
            t.join();
        }
    }

    std::sort(failures.begin(), failures.end(),
              [](const Indexed& a, const Indexed& b) { return a.index < b.index; });
    for (auto& f : failures) {
        result.errors.push_back(std::move(f.error));
    }

    // Notes run after every task update so dedup sees the whole batch in order
    for (const auto& submission : notes) {
        metrics_.items_total->inc();

        expected<bool, Error> outcome = unexpected(Error::internal("Note not applied"));
        try {
            outcome = apply_note(submission, client_last_sync, actor);
        } catch (const std::exception& e) {
            auto entry = default_logger().entry(LogLevel::Error, "Unexpected failure adding note");
            entry.field("task", submission.task_id).field("error", e.what());
            default_logger().log(entry);
            outcome = unexpected(Error::internal(e.what()));
        }

        if (!outcome) {
            result.errors.push_back(SyncItemError{ItemKind::Note, submission.task_id,
                                                  outcome.error().errc(),
                                                  std::string(outcome.error().message())});
        } else if (*outcome) {
            ++result.notes_added;
        } else {
            ++result.notes_skipped;
            metrics_.notes_deduplicated_total->inc();
        }
    }

    for (const auto& e : result.errors) {
        auto entry = default_logger().entry(LogLevel::Warn, "Sync item rejected");
        entry.field("kind", to_string(e.kind))
             .field("id", e.item_id)
             .field("code", fieldsync::to_string(e.code))
             .field("error", e.message);
        default_logger().log(entry);
    }

    metrics_.errors_total->inc(result.errors.size());
    metrics_.conflicts_resolved_total->inc(result.conflicts_resolved);

    result.synced_at = repo_.current_watermark();

    auto entry = default_logger().entry(LogLevel::Info, "Offline batch synced");
    entry.field("actor", actor.id)
         .field("tasks_updated", result.tasks_updated)
         .field("notes_added", result.notes_added)
         .field("notes_skipped", result.notes_skipped)
         .field("conflicts", result.conflicts_resolved)
         .field("failed", result.errors.size());
    default_logger().log(entry);

    return result;
}

expected<SyncOrchestrator::Applied, Error> SyncOrchestrator::apply_update(const TaskUpdate& update,
                                                                          Timestamp client_last_sync,
                                                                          const std::vector<Timestamp>& own_saves,
                                                                          const Actor& actor)
{
    if (update.task_id.empty()) {
        return unexpected(Error::validation("Task update is missing taskId"));
    }

    auto guard = locks_.acquire(update.task_id);

    auto loaded = repo_.load_task(update.task_id);
    if (!loaded) {
        return unexpected(Error::not_found("Activity not found: " + update.task_id));
    }
    const Task& server = *loaded;

    auto requested_status = util::find(update.fields, std::string(field::status));
    bool cancelling = requested_status && requested_status->is_string() &&
                      parse_status(requested_status->get<std::string>()) == TaskStatus::Cancelled;
    auto allowed = authorize(server, actor, cancelling);
    if (!allowed) {
        return unexpected(allowed.error());
    }

    // Fields last written by an earlier item of this batch are the client's own
    auto snapshot = ServerSnapshot::of(server);
    for (auto& [name, stamp] : snapshot.stamps) {
        if (std::find(own_saves.begin(), own_saves.end(), stamp) != own_saves.end()) {
            stamp = client_last_sync;
        }
    }
    auto conflicts = detect_conflicts(snapshot, update.fields, client_last_sync);
    auto resolution = resolver_.resolve(snapshot.fields, update.fields, conflicts, actor);
    const auto& merged = resolution.merged;

    auto at = clock_();
    Task task = server;

    // Status goes through the lifecycle table like any other transition
    if (auto* status = util::find(merged, std::string(field::status)); status && !status->is_null()) {
        auto target = status->is_string() ? parse_status(status->get<std::string>()) : std::nullopt;
        if (!target) {
            return unexpected(Error::validation("Unknown status: " + status->dump()));
        }
        if (*target != task.status) {
            auto moved = request_transition(task, *target, actor, TransitionContext{at});
            if (!moved) {
                return unexpected(moved.error());
            }
            task = std::move(*moved);
        }
    }

    if (auto* progress = util::find(merged, std::string(field::progress))) {
        if (progress->is_null()) {
            task.progress.reset();
        } else {
            auto percent = read_progress(*progress);
            if (!percent) {
                return unexpected(percent.error());
            }
            task.progress = *percent;
            task.metadata.set(meta::progress, *percent);
        }
    }

    if (auto* notes = util::find(merged, std::string(field::notes))) {
        if (notes->is_null()) {
            task.notes.reset();
        } else if (notes->is_string()) {
            task.notes = notes->get<std::string>();
        } else {
            return unexpected(Error::validation("Notes must be a string"));
        }
    }

    if (auto* description = util::find(merged, std::string(field::description)); description && description->is_string()) {
        task.description = description->get<std::string>();
    }

    if (auto* priority = util::find(merged, std::string(field::priority)); priority && !priority->is_null()) {
        auto parsed = priority->is_string() ? parse_priority(priority->get<std::string>()) : std::nullopt;
        if (!parsed) {
            return unexpected(Error::validation("Unknown priority: " + priority->dump()));
        }
        task.priority = *parsed;
    }

    if (auto* metadata = util::find(merged, std::string(field::metadata)); metadata && metadata->is_object()) {
        task.metadata.merge(*metadata);
    }

    task.metadata.stamp(meta::synced_at, at);
    task.metadata.set(meta::synced_by, actor.id);

    auto saved = repo_.save_task(task, server.updated_at);
    if (!saved) {
        return unexpected(saved.error());
    }

    if (!conflicts.empty() && options_.audit_conflicts) {
        auto note = repo_.insert_note(make_audit_note(task.id, resolution, actor, at));
        if (!note) {
            log_warn("Failed to record conflict resolution for " + task.id + ": " + note.error().to_string());
        }
    }

    notify(*saved);
    return Applied{conflicts.size(), saved->updated_at};
}

expected<bool, Error> SyncOrchestrator::apply_note(const NoteSubmission& submission,
                                                   Timestamp client_last_sync,
                                                   const Actor& actor)
{
    if (submission.content.empty()) {
        return unexpected(Error::validation("Note content cannot be empty"));
    }

    // Held across the duplicate lookup and the insert so concurrent retries
    // of one batch store the note once
    auto guard = locks_.acquire(submission.task_id);

    auto task = repo_.load_task(submission.task_id);
    if (!task) {
        return unexpected(Error::not_found("Activity not found: " + submission.task_id));
    }
    if (task->organization_id != actor.organization_id ||
        (!AssignmentRegistry::check_assignment(*task, actor.id) && task->created_by != actor.id)) {
        return unexpected(Error::forbidden("Access denied to this activity"));
    }

    auto duplicate = repo_.find_duplicate_note(submission.task_id, actor.id,
                                               submission.content, client_last_sync);
    if (duplicate) {
        log_debug("Skipping duplicate offline note " + duplicate->id);
        return false;
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
    notify(*inserted);
    return true;
}

void SyncOrchestrator::notify(const Task& task) {
    try {
        broadcaster_.task_updated(task);
    } catch (const std::exception& e) {
        log_warn("Broadcast of activity " + task.id + " failed: " + e.what());
    }
}

void SyncOrchestrator::notify(const Note& note) {
    try {
        broadcaster_.note_added(note);
    } catch (const std::exception& e) {
        log_warn("Broadcast of note " + note.id + " failed: " + e.what());
    }
}

OfflinePackage SyncOrchestrator::offline_package(const Actor& actor) const {
    OfflinePackage package;
    package.last_sync = repo_.current_watermark();
    for (auto& task : repo_.list_tasks()) {
        if (task.organization_id != actor.organization_id) continue;
        if (!AssignmentRegistry::check_assignment(task, actor.id)) continue;
        if (task.status != TaskStatus::Planned && task.status != TaskStatus::InProgress &&
            task.status != TaskStatus::Paused) continue;
        package.tasks.push_back(std::move(task));
    }
    return package;
}

} // namespace fieldsync
