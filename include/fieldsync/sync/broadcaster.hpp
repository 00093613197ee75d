#pragma once

#include <atomic>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <unordered_map>

#include "fieldsync/model/note.hpp"
#include "fieldsync/model/task.hpp"

namespace fieldsync {

// Fire-and-forget notification of merged state. Implementations may throw;
// callers log the failure and carry on.
class UpdateBroadcaster {
public:
    virtual ~UpdateBroadcaster() = default;

    virtual void task_updated(const Task& task) = 0;
    virtual void note_added(const Note& note) = 0;
};

class NullBroadcaster : public UpdateBroadcaster {
public:
    void task_updated(const Task&) override {}
    void note_added(const Note&) override {}
};

// Queues {"type": ..., "data": ...} messages per subscriber until they are
// popped by the subscriber's delivery loop
class MemoryBroadcaster : public UpdateBroadcaster {
public:
    MemoryBroadcaster() = default;

    int subscribe();
    void unsubscribe(int id);

    void task_updated(const Task& task) override;
    void note_added(const Note& note) override;

    void broadcast(const std::string& message);
    std::optional<std::string> pop_message(int id);

    size_t subscriber_count() const;
    size_t published_count() const { return published_.load(); }

private:
    std::unordered_map<int, std::queue<std::string>> pending_messages_;
    mutable std::mutex mutex_;
    std::atomic<int> next_id_{1};
    std::atomic<size_t> published_{0};
};

} // namespace fieldsync
