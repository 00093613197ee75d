#pragma once

#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "fieldsync/model/task_status.hpp"

namespace fieldsync {

// ============================================================================
// Error Codes
// ============================================================================

enum class Errc {
    Success = 0,
    InvalidState,   // transition not in the allowed table
    Forbidden,      // actor is not an active assignee (or creator, for cancellation)
    Validation,     // e.g. removing the last active assignee
    NotFound,
    StaleWrite,     // watermark moved between load and save
    Persistence,
    Internal
};

} // namespace fieldsync

template<>
struct std::is_error_code_enum<fieldsync::Errc> : std::true_type {};

namespace fieldsync {

const std::error_category& fieldsync_category() noexcept;
std::error_code make_error_code(Errc e) noexcept;

std::string_view to_string(Errc e) noexcept;

// ============================================================================
// Unified Error Type
// ============================================================================

class Error {
    Errc code_ = Errc::Success;
    std::string message_;

    // Populated for Errc::InvalidState only
    TaskStatus current_status_ = TaskStatus::Planned;
    std::vector<TaskStatus> allowed_;

public:
    Error() = default;

    Error(Errc code, std::string message = "")
        : code_(code), message_(std::move(message)) {}

    // Factory methods
    static Error invalid_state(TaskStatus current, TaskStatus requested);
    static Error invalid_state(TaskStatus current, std::string message);

    static Error forbidden(std::string msg) {
        return Error(Errc::Forbidden, std::move(msg));
    }

    static Error validation(std::string msg) {
        return Error(Errc::Validation, std::move(msg));
    }

    static Error not_found(std::string msg) {
        return Error(Errc::NotFound, std::move(msg));
    }

    static Error stale_write(std::string msg) {
        return Error(Errc::StaleWrite, std::move(msg));
    }

    static Error persistence(std::string msg) {
        return Error(Errc::Persistence, std::move(msg));
    }

    static Error internal(std::string msg) {
        return Error(Errc::Internal, std::move(msg));
    }

    // Type checks
    bool is_invalid_state() const noexcept { return code_ == Errc::InvalidState; }
    bool is_forbidden() const noexcept { return code_ == Errc::Forbidden; }
    bool is_validation() const noexcept { return code_ == Errc::Validation; }
    bool is_not_found() const noexcept { return code_ == Errc::NotFound; }
    bool is_stale_write() const noexcept { return code_ == Errc::StaleWrite; }

    // Accessors
    Errc errc() const noexcept { return code_; }
    std::error_code code() const noexcept { return make_error_code(code_); }
    std::string_view message() const noexcept { return message_; }

    TaskStatus current_status() const noexcept { return current_status_; }
    const std::vector<TaskStatus>& allowed_targets() const noexcept { return allowed_; }

    // HTTP-equivalent status for the request layer that surfaces the error
    int status() const noexcept;

    // Full description
    std::string to_string() const;

    bool operator==(const Error& other) const noexcept {
        return code_ == other.code_;
    }

    // true if error
    explicit operator bool() const noexcept {
        return code_ != Errc::Success;
    }
};

} // namespace fieldsync
