#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace fieldsync {

// Keyed mutex: serializes mutations of one task while leaving others free.
// An entry lives only while some caller holds or waits on it, so ids that
// never name a task do not accumulate.
class TaskLocks {
    std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> locks_;

    void release(const std::string& task_id, std::shared_ptr<std::mutex>& entry);

public:
    class Guard {
        TaskLocks* owner_ = nullptr;
        std::string task_id_;
        std::shared_ptr<std::mutex> mutex_;
        std::unique_lock<std::mutex> lock_;

    public:
        Guard(TaskLocks& owner, std::string task_id, std::shared_ptr<std::mutex> m);
        Guard(Guard&& other) noexcept = default;
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;
        Guard& operator=(Guard&&) = delete;
        ~Guard();
    };

    [[nodiscard]] Guard acquire(const std::string& task_id);

    // Number of ids currently held or awaited
    size_t size();
};

} // namespace fieldsync
