#include "fieldsync/store/task_locks.hpp"

namespace fieldsync {

TaskLocks::Guard::Guard(TaskLocks& owner, std::string task_id, std::shared_ptr<std::mutex> m)
    : owner_(&owner)
    , task_id_(std::move(task_id))
    , mutex_(std::move(m))
    , lock_(*mutex_)
{}

TaskLocks::Guard::~Guard() {
    if (!mutex_) return;
    lock_.unlock();
    owner_->release(task_id_, mutex_);
}

TaskLocks::Guard TaskLocks::acquire(const std::string& task_id) {
    std::shared_ptr<std::mutex> m;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& slot = locks_[task_id];
        if (!slot) {
            slot = std::make_shared<std::mutex>();
        }
        m = slot;
    }
    return Guard(*this, task_id, std::move(m));
}

void TaskLocks::release(const std::string& task_id, std::shared_ptr<std::mutex>& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    // Other holders copy the entry under this mutex, so a count of two
    // (the map and this guard) means nobody else can be waiting on it
    auto it = locks_.find(task_id);
    if (it != locks_.end() && it->second == entry && entry.use_count() == 2) {
        locks_.erase(it);
    }
    entry.reset();
}

size_t TaskLocks::size() {
    std::lock_guard<std::mutex> lock(mutex_);
    return locks_.size();
}

} // namespace fieldsync
