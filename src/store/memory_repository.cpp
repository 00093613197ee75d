#include "fieldsync/store/memory_repository.hpp"

#include <algorithm>
#include <iterator>

namespace fieldsync {

MemoryRepository::MemoryRepository(Clock clock) : clock_(std::move(clock)) {}

Timestamp MemoryRepository::next_watermark() {
    auto candidate = clock_();
    if (candidate <= watermark_) {
        candidate = watermark_ + std::chrono::milliseconds(1);
    }
    watermark_ = candidate;
    return watermark_;
}

void MemoryRepository::put_task(Task task) {
    std::lock_guard<std::mutex> lock(mutex_);
    watermark_ = std::max(watermark_, task.updated_at);
    for (const auto& [name, stamp] : task.field_stamps) {
        watermark_ = std::max(watermark_, stamp);
    }
    auto id = task.id;
    tasks_.insert_or_assign(std::move(id), std::move(task));
}

std::optional<Task> MemoryRepository::load_task(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) {
        return std::nullopt;
    }
    return it->second;
}

expected<Task, Error> MemoryRepository::save_task(const Task& task, Timestamp expected_watermark) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = tasks_.find(task.id);
    if (it == tasks_.end()) {
        return unexpected(Error::not_found("Activity not found: " + task.id));
    }
    if (it->second.updated_at != expected_watermark) {
        return unexpected(Error::stale_write(
            "Activity " + task.id + " was modified concurrently (expected " +
            to_iso8601(expected_watermark) + ", found " + to_iso8601(it->second.updated_at) + ")"));
    }

    Task stored = task;
    auto at = next_watermark();
    stamp_changed_fields(it->second, stored, at);
    stored.updated_at = at;
    it->second = stored;
    return stored;
}

std::vector<Task> MemoryRepository::list_tasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Task> result;
    result.reserve(tasks_.size());
    for (const auto& [id, task] : tasks_) {
        result.push_back(task);
    }
    std::sort(result.begin(), result.end(),
              [](const Task& a, const Task& b) { return a.id < b.id; });
    return result;
}

expected<Note, Error> MemoryRepository::insert_note(Note note) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (tasks_.find(note.task_id) == tasks_.end()) {
        return unexpected(Error::not_found("Activity not found: " + note.task_id));
    }
    if (note.id.empty()) {
        note.id = "note-" + std::to_string(next_note_id_++);
    }
    if (note.created_at == Timestamp{}) {
        note.created_at = next_watermark();
    }
    notes_.push_back(note);
    return note;
}

std::optional<Note> MemoryRepository::find_duplicate_note(const std::string& task_id,
                                                          const std::string& author_id,
                                                          const std::string& content,
                                                          Timestamp created_after) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(notes_.begin(), notes_.end(), [&](const Note& n) {
        return n.task_id == task_id && n.author_id == author_id &&
               n.content == content && n.created_at > created_after;
    });
    if (it == notes_.end()) {
        return std::nullopt;
    }
    return *it;
}

std::vector<Note> MemoryRepository::notes_for(const std::string& task_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Note> result;
    std::copy_if(notes_.begin(), notes_.end(), std::back_inserter(result),
                 [&](const Note& n) { return n.task_id == task_id; });
    return result;
}

Timestamp MemoryRepository::current_watermark() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return watermark_;
}

size_t MemoryRepository::task_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

size_t MemoryRepository::note_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return notes_.size();
}

} // namespace fieldsync
