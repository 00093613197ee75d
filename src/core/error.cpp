#include "fieldsync/core/error.hpp"

#include <sstream>

namespace fieldsync {

// ============================================================================
// Error Category
// ============================================================================

namespace {

class FieldsyncCategory : public std::error_category {
public:
    const char* name() const noexcept override {
        return "fieldsync";
    }

    std::string message(int ev) const override {
        switch (static_cast<Errc>(ev)) {
            case Errc::Success: return "Success";
            case Errc::InvalidState: return "Invalid state transition";
            case Errc::Forbidden: return "Forbidden";
            case Errc::Validation: return "Validation failed";
            case Errc::NotFound: return "Not found";
            case Errc::StaleWrite: return "Stale write";
            case Errc::Persistence: return "Persistence failure";
            case Errc::Internal: return "Internal error";
            default: return "Unknown fieldsync error";
        }
    }
};

const FieldsyncCategory category_instance{};

} // anonymous namespace

const std::error_category& fieldsync_category() noexcept {
    return category_instance;
}

std::error_code make_error_code(Errc e) noexcept {
    return {static_cast<int>(e), fieldsync_category()};
}

std::string_view to_string(Errc e) noexcept {
    switch (e) {
        case Errc::Success: return "SUCCESS";
        case Errc::InvalidState: return "INVALID_STATE";
        case Errc::Forbidden: return "FORBIDDEN";
        case Errc::Validation: return "VALIDATION";
        case Errc::NotFound: return "NOT_FOUND";
        case Errc::StaleWrite: return "STALE_WRITE";
        case Errc::Persistence: return "PERSISTENCE";
        case Errc::Internal: return "INTERNAL";
    }
    return "UNKNOWN";
}

// ============================================================================
// Error Implementation
// ============================================================================

Error Error::invalid_state(TaskStatus current, TaskStatus requested) {
    std::ostringstream oss;
    oss << "Cannot transition from " << fieldsync::to_string(current)
        << " to " << fieldsync::to_string(requested);
    return invalid_state(current, oss.str());
}

Error Error::invalid_state(TaskStatus current, std::string message) {
    Error e(Errc::InvalidState, std::move(message));
    e.current_status_ = current;
    auto allowed = allowed_transitions(current);
    e.allowed_.assign(allowed.begin(), allowed.end());
    return e;
}

int Error::status() const noexcept {
    switch (code_) {
        case Errc::Success: return 200;
        case Errc::Validation: return 400;
        case Errc::Forbidden: return 403;
        case Errc::NotFound: return 404;
        case Errc::InvalidState:
        case Errc::StaleWrite:
            return 409;
        default: return 500;
    }
}

std::string Error::to_string() const {
    std::ostringstream oss;
    oss << fieldsync::to_string(code_) << " " << fieldsync_category().message(static_cast<int>(code_));

    if (!message_.empty()) {
        oss << " - " << message_;
    }

    if (code_ == Errc::InvalidState) {
        oss << " (current: " << fieldsync::to_string(current_status_) << ", allowed: [";
        for (size_t i = 0; i < allowed_.size(); ++i) {
            if (i > 0) oss << ", ";
            oss << fieldsync::to_string(allowed_[i]);
        }
        oss << "])";
    }

    return oss.str();
}

} // namespace fieldsync
