#include "fieldsync/model/task_status.hpp"

namespace fieldsync {

std::string_view to_string(TaskStatus status) noexcept {
    switch (status) {
        case TaskStatus::Planned: return "PLANNED";
        case TaskStatus::InProgress: return "IN_PROGRESS";
        case TaskStatus::Paused: return "PAUSED";
        case TaskStatus::Completed: return "COMPLETED";
        case TaskStatus::Cancelled: return "CANCELLED";
    }
    return "PLANNED";
}

std::optional<TaskStatus> parse_status(std::string_view name) noexcept {
    for (auto status : all_statuses) {
        if (name == to_string(status)) return status;
    }
    return std::nullopt;
}

} // namespace fieldsync
