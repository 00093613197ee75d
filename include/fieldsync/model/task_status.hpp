#pragma once

#include <array>
#include <optional>
#include <span>
#include <string_view>

namespace fieldsync {

// ============================================================================
// Task Lifecycle States
// ============================================================================

enum class TaskStatus {
    Planned,
    InProgress,
    Paused,
    Completed,
    Cancelled
};

inline constexpr std::array<TaskStatus, 5> all_statuses = {
    TaskStatus::Planned,
    TaskStatus::InProgress,
    TaskStatus::Paused,
    TaskStatus::Completed,
    TaskStatus::Cancelled
};

// Wire names: PLANNED, IN_PROGRESS, PAUSED, COMPLETED, CANCELLED
std::string_view to_string(TaskStatus status) noexcept;
std::optional<TaskStatus> parse_status(std::string_view name) noexcept;

// ============================================================================
// Transition Table
// ============================================================================

namespace detail {

inline constexpr std::array<TaskStatus, 2> from_planned = {
    TaskStatus::InProgress, TaskStatus::Cancelled
};
inline constexpr std::array<TaskStatus, 3> from_in_progress = {
    TaskStatus::Completed, TaskStatus::Paused, TaskStatus::Cancelled
};
inline constexpr std::array<TaskStatus, 2> from_paused = {
    TaskStatus::InProgress, TaskStatus::Cancelled
};

} // namespace detail

// Allowed targets for a state. Terminal states yield an empty span.
constexpr std::span<const TaskStatus> allowed_transitions(TaskStatus from) noexcept {
    switch (from) {
        case TaskStatus::Planned: return detail::from_planned;
        case TaskStatus::InProgress: return detail::from_in_progress;
        case TaskStatus::Paused: return detail::from_paused;
        case TaskStatus::Completed:
        case TaskStatus::Cancelled:
            return {};
    }
    return {};
}

constexpr bool can_transition(TaskStatus from, TaskStatus to) noexcept {
    for (auto target : allowed_transitions(from)) {
        if (target == to) return true;
    }
    return false;
}

constexpr bool is_terminal(TaskStatus status) noexcept {
    return allowed_transitions(status).empty();
}

} // namespace fieldsync
