#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "fieldsync/core/error.hpp"
#include "fieldsync/util/expected.hpp"
#include "fieldsync/util/time.hpp"

namespace fieldsync {

enum class AssignmentRole {
    Primary,
    Support
};

std::string_view to_string(AssignmentRole role) noexcept;
std::optional<AssignmentRole> parse_role(std::string_view name) noexcept;

struct Assignment {
    std::string id;
    std::string task_id;
    std::string actor_id;
    AssignmentRole role = AssignmentRole::Support;
    bool active = true;
    Timestamp assigned_at{};
    std::string assigned_by;
    std::optional<std::string> reassign_reason;

    nlohmann::json to_json() const;
    static expected<Assignment, Error> from_json(const nlohmann::json& j);
};

nlohmann::json to_json_array(const std::vector<Assignment>& assignments);

} // namespace fieldsync
