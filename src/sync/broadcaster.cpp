#include "fieldsync/sync/broadcaster.hpp"

#include "fieldsync/core/logging.hpp"

namespace fieldsync {

int MemoryBroadcaster::subscribe() {
    std::lock_guard lock(mutex_);
    int id = next_id_++;
    pending_messages_[id];
    log_debug("Subscriber added (id=" + std::to_string(id) + ")");
    return id;
}

void MemoryBroadcaster::unsubscribe(int id) {
    std::lock_guard lock(mutex_);
    pending_messages_.erase(id);
}

void MemoryBroadcaster::task_updated(const Task& task) {
    nlohmann::json msg;
    msg["type"] = "task_updated";
    msg["data"] = task.to_json();
    broadcast(msg.dump());
}

void MemoryBroadcaster::note_added(const Note& note) {
    nlohmann::json msg;
    msg["type"] = "note_added";
    msg["data"] = note.to_json();
    broadcast(msg.dump());
}

void MemoryBroadcaster::broadcast(const std::string& message) {
    std::lock_guard lock(mutex_);
    for (auto& [id, queue] : pending_messages_) {
        queue.push(message);
    }
    ++published_;
}

std::optional<std::string> MemoryBroadcaster::pop_message(int id) {
    std::lock_guard lock(mutex_);
    auto it = pending_messages_.find(id);
    if (it == pending_messages_.end() || it->second.empty()) {
        return std::nullopt;
    }
    auto msg = std::move(it->second.front());
    it->second.pop();
    return msg;
}

size_t MemoryBroadcaster::subscriber_count() const {
    std::lock_guard lock(mutex_);
    return pending_messages_.size();
}

} // namespace fieldsync
