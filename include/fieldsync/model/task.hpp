#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "fieldsync/core/error.hpp"
#include "fieldsync/model/assignment.hpp"
#include "fieldsync/model/metadata.hpp"
#include "fieldsync/model/task_status.hpp"
#include "fieldsync/util/expected.hpp"
#include "fieldsync/util/time.hpp"

namespace fieldsync {

enum class Priority {
    Low,
    Normal,
    High,
    Urgent
};

std::string_view to_string(Priority priority) noexcept;
std::optional<Priority> parse_priority(std::string_view name) noexcept;

// Watermark at which the server last changed each watched field
using FieldStamps = std::map<std::string, Timestamp>;

// Fields compared during conflict detection, in snapshot key form
namespace field {

inline constexpr std::string_view status = "status";
inline constexpr std::string_view progress = "progress";
inline constexpr std::string_view notes = "notes";
inline constexpr std::string_view metadata = "metadata";
inline constexpr std::string_view type = "type";
inline constexpr std::string_view name = "name";
inline constexpr std::string_view description = "description";
inline constexpr std::string_view priority = "priority";

} // namespace field

struct Task {
    std::string id;
    std::string organization_id;
    std::string farm_id;
    std::string name;
    std::string type;
    std::string description;
    TaskStatus status = TaskStatus::Planned;
    Priority priority = Priority::Normal;
    std::optional<int> progress;
    std::optional<std::string> notes;
    std::optional<Timestamp> scheduled_at;
    std::optional<Timestamp> completed_at;
    std::string created_by;
    std::vector<Assignment> assignments;
    Metadata metadata;
    Timestamp updated_at{};
    FieldStamps field_stamps;

    // Watched fields only, keyed as in a client payload. Unset optional
    // fields are omitted, and so is `type` when the task has none.
    nlohmann::json snapshot() const;

    // Serialization
    nlohmann::json to_json() const;
    static expected<Task, Error> from_json(const nlohmann::json& j);
};

// Records `at` in after.field_stamps for every watched field whose value
// differs between the two versions.
void stamp_changed_fields(const Task& before, Task& after, Timestamp at);

nlohmann::json to_json_array(const std::vector<Task>& tasks);

} // namespace fieldsync
