#pragma once

#include <optional>
#include <string>
#include <vector>

#include "fieldsync/core/error.hpp"
#include "fieldsync/model/note.hpp"
#include "fieldsync/model/task.hpp"
#include "fieldsync/util/expected.hpp"
#include "fieldsync/util/time.hpp"

namespace fieldsync {

// ============================================================================
// Repository Interface
// ============================================================================

/// Persistence boundary for tasks and notes.
///
/// Every task write is a compare-and-swap on the watermark the caller loaded.
/// Watermarks issued by one repository are strictly increasing.
class Repository {
public:
    virtual ~Repository() = default;

    virtual std::optional<Task> load_task(const std::string& id) const = 0;

    // Fails with StaleWrite when the stored watermark is not `expected_watermark`
    // and with NotFound when the task does not exist. On success the returned
    // task carries the new watermark and updated field stamps.
    virtual expected<Task, Error> save_task(const Task& task, Timestamp expected_watermark) = 0;

    virtual std::vector<Task> list_tasks() const = 0;

    // Assigns id and creation time when they are empty. A generated creation
    // time is a fresh watermark, so it orders after every earlier write.
    virtual expected<Note, Error> insert_note(Note note) = 0;

    virtual std::optional<Note> find_duplicate_note(const std::string& task_id,
                                                    const std::string& author_id,
                                                    const std::string& content,
                                                    Timestamp created_after) const = 0;

    virtual std::vector<Note> notes_for(const std::string& task_id) const = 0;

    // Highest watermark issued so far
    virtual Timestamp current_watermark() const = 0;
};

} // namespace fieldsync
