#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "fieldsync/core/config.hpp"
#include "fieldsync/core/error.hpp"
#include "fieldsync/core/metrics.hpp"
#include "fieldsync/model/actor.hpp"
#include "fieldsync/model/note.hpp"
#include "fieldsync/model/task.hpp"
#include "fieldsync/store/repository.hpp"
#include "fieldsync/store/task_locks.hpp"
#include "fieldsync/sync/broadcaster.hpp"
#include "fieldsync/sync/conflict_resolver.hpp"
#include "fieldsync/util/expected.hpp"
#include "fieldsync/util/time.hpp"

namespace fieldsync {

// ============================================================================
// Batch Types
// ============================================================================

// Offline edit of one task. `fields` holds only what the client submits.
struct TaskUpdate {
    std::string task_id;
    nlohmann::json fields = nlohmann::json::object();

    // {"taskId": "...", "status": ..., "progress": ..., "metadata": {...}}
    static TaskUpdate from_json(const nlohmann::json& j);
};

enum class ItemKind {
    Update,
    Note
};

std::string_view to_string(ItemKind kind) noexcept;

struct SyncItemError {
    ItemKind kind = ItemKind::Update;
    std::string item_id;
    Errc code = Errc::Internal;
    std::string message;

    nlohmann::json to_json() const;
};

struct SyncResult {
    size_t tasks_updated = 0;
    size_t notes_added = 0;
    size_t notes_skipped = 0;
    size_t conflicts_resolved = 0;
    std::vector<SyncItemError> errors;

    // Watermark the client presents as its next lastSync
    Timestamp synced_at{};

    nlohmann::json to_json() const;
};

// What a mobile client downloads before going offline
struct OfflinePackage {
    std::vector<Task> tasks;
    Timestamp last_sync{};

    nlohmann::json to_json() const;
};

struct SyncOptions {
    size_t workers = 1;
    bool audit_conflicts = true;
    MetricsRegistry* metrics = nullptr;   // default_metrics() when null

    static SyncOptions from_config(const Config& config);
};

// Resolver for config.resolution_policy; unknown names fall back to hybrid
ConflictResolver make_resolver(const Config& config, Clock clock = system_clock());

// ============================================================================
// Sync Orchestrator
// ============================================================================

/// Applies a batch of offline task updates and notes.
///
/// Each item succeeds or fails on its own: a failure is recorded against
/// the item and never aborts its siblings. Updates to distinct tasks may be
/// applied on several workers; updates to one task are applied in
/// submission order under that task's lock.
class SyncOrchestrator {
public:
    SyncOrchestrator(Repository& repo,
                     TaskLocks& locks,
                     UpdateBroadcaster& broadcaster,
                     ConflictResolver resolver = ConflictResolver(),
                     SyncOptions options = {},
                     Clock clock = system_clock());

    SyncResult sync_batch(const std::vector<TaskUpdate>& updates,
                          const std::vector<NoteSubmission>& notes,
                          Timestamp client_last_sync,
                          const Actor& actor);

    OfflinePackage offline_package(const Actor& actor) const;

private:
    struct Applied {
        size_t conflicts = 0;
        Timestamp watermark{};   // the task's watermark after this item's save
    };

    // `own_saves` holds the watermarks earlier items of this batch saved for
    // the same task. Fields stamped with one of them are the client's own
    // edits and never conflict.
    expected<Applied, Error> apply_update(const TaskUpdate& update,
                                          Timestamp client_last_sync,
                                          const std::vector<Timestamp>& own_saves,
                                          const Actor& actor);

    // Returns false when the note was a duplicate and skipped
    expected<bool, Error> apply_note(const NoteSubmission& submission,
                                     Timestamp client_last_sync,
                                     const Actor& actor);

    void notify(const Task& task);
    void notify(const Note& note);

    Repository& repo_;
    TaskLocks& locks_;
    UpdateBroadcaster& broadcaster_;
    ConflictResolver resolver_;
    SyncOptions options_;
    Clock clock_;
    SyncMetrics metrics_;
};

} // namespace fieldsync
