#pragma once

#include <mutex>
#include <unordered_map>

#include "fieldsync/store/repository.hpp"

namespace fieldsync {

/// Process-local repository. Suitable for tests and the replay tool.
class MemoryRepository : public Repository {
    std::unordered_map<std::string, Task> tasks_;
    std::vector<Note> notes_;
    mutable std::mutex mutex_;
    Clock clock_;
    Timestamp watermark_{};
    size_t next_note_id_ = 1;

    // Strictly after the previous watermark even if the clock stalls or steps back
    Timestamp next_watermark();

public:
    explicit MemoryRepository(Clock clock = system_clock());

    // Seed a task as-is. Its watermark and field stamps are kept, and the
    // repository watermark advances past them.
    void put_task(Task task);

    std::optional<Task> load_task(const std::string& id) const override;
    expected<Task, Error> save_task(const Task& task, Timestamp expected_watermark) override;
    std::vector<Task> list_tasks() const override;

    expected<Note, Error> insert_note(Note note) override;
    std::optional<Note> find_duplicate_note(const std::string& task_id,
                                            const std::string& author_id,
                                            const std::string& content,
                                            Timestamp created_after) const override;
    std::vector<Note> notes_for(const std::string& task_id) const override;

    Timestamp current_watermark() const override;

    size_t task_count() const;
    size_t note_count() const;
};

} // namespace fieldsync
