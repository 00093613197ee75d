#include "fieldsync/model/task.hpp"
#include "fieldsync/util/json.hpp"

namespace fieldsync {

std::string_view to_string(Priority priority) noexcept {
    switch (priority) {
        case Priority::Low: return "LOW";
        case Priority::Normal: return "NORMAL";
        case Priority::High: return "HIGH";
        case Priority::Urgent: return "URGENT";
    }
    return "NORMAL";
}

std::optional<Priority> parse_priority(std::string_view name) noexcept {
    if (name == "LOW") return Priority::Low;
    if (name == "NORMAL") return Priority::Normal;
    if (name == "HIGH") return Priority::High;
    if (name == "URGENT") return Priority::Urgent;
    return std::nullopt;
}

nlohmann::json Task::snapshot() const {
    nlohmann::json j = {
        {std::string(field::status), std::string(to_string(status))},
        {std::string(field::metadata), metadata.to_json()},
        {std::string(field::name), name},
        {std::string(field::description), description},
        {std::string(field::priority), std::string(to_string(priority))}
    };
    if (progress) {
        j[std::string(field::progress)] = *progress;
    }
    if (notes) {
        j[std::string(field::notes)] = *notes;
    }
    if (!type.empty()) {
        j[std::string(field::type)] = type;
    }
    return j;
}

nlohmann::json Task::to_json() const {
    nlohmann::json j = {
        {"id", id},
        {"organizationId", organization_id},
        {"farmId", farm_id},
        {"name", name},
        {"type", type},
        {"description", description},
        {"status", std::string(to_string(status))},
        {"priority", std::string(to_string(priority))},
        {"createdBy", created_by},
        {"assignments", to_json_array(assignments)},
        {"metadata", metadata.to_json()},
        {"updatedAt", to_iso8601(updated_at)}
    };

    j["progress"] = progress ? nlohmann::json(*progress) : nlohmann::json(nullptr);
    j["notes"] = notes ? nlohmann::json(*notes) : nlohmann::json(nullptr);
    j["scheduledAt"] = scheduled_at ? nlohmann::json(to_iso8601(*scheduled_at)) : nlohmann::json(nullptr);
    j["completedAt"] = completed_at ? nlohmann::json(to_iso8601(*completed_at)) : nlohmann::json(nullptr);

    nlohmann::json stamps = nlohmann::json::object();
    for (const auto& [key, at] : field_stamps) {
        stamps[key] = to_iso8601(at);
    }
    j["fieldStamps"] = std::move(stamps);
    return j;
}

namespace {

expected<std::string, Error> read_text(const nlohmann::json& j, const char* key,
                                       std::string fallback = "") {
    auto value = util::string_member(j, key, std::move(fallback));
    if (!value) {
        return unexpected(Error::validation(std::string("task ") + key + " must be a string"));
    }
    return std::move(*value);
}

expected<std::optional<Timestamp>, Error> read_time(const nlohmann::json& j, const char* key) {
    auto text = read_text(j, key);
    if (!text) {
        return unexpected(text.error());
    }
    if (text->empty()) {
        return std::optional<Timestamp>{};
    }
    auto at = parse_iso8601(*text);
    if (!at) {
        return unexpected(Error::validation(std::string("task ") + key + " is not an ISO-8601 timestamp"));
    }
    return std::optional<Timestamp>{*at};
}

} // anonymous namespace

expected<Task, Error> Task::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return unexpected(Error::validation("task must be a JSON object"));
    }

    auto id = read_text(j, "id");
    if (!id) {
        return unexpected(id.error());
    }
    if (id->empty()) {
        return unexpected(Error::validation("task id is required"));
    }

    Task task;
    task.id = std::move(*id);

    for (auto [key, slot] : {std::pair{"organizationId", &task.organization_id},
                             std::pair{"farmId", &task.farm_id},
                             std::pair{"name", &task.name},
                             std::pair{"type", &task.type},
                             std::pair{"description", &task.description},
                             std::pair{"createdBy", &task.created_by}}) {
        auto text = read_text(j, key);
        if (!text) {
            return unexpected(text.error());
        }
        *slot = std::move(*text);
    }

    auto status_name = read_text(j, "status", "PLANNED");
    if (!status_name) {
        return unexpected(status_name.error());
    }
    auto status = parse_status(*status_name);
    if (!status) {
        return unexpected(Error::validation("unknown task status: " + *status_name));
    }
    task.status = *status;

    auto priority_name = read_text(j, "priority", "NORMAL");
    if (!priority_name) {
        return unexpected(priority_name.error());
    }
    auto priority = parse_priority(*priority_name);
    if (!priority) {
        return unexpected(Error::validation("unknown task priority: " + *priority_name));
    }
    task.priority = *priority;

    if (auto* value = util::find(j, "progress"); !util::is_absent(value)) {
        if (!value->is_number_integer()) {
            return unexpected(Error::validation("task progress must be an integer"));
        }
        // Unsigned values beyond int64 wrap negative and fail the range check
        auto percent = value->get<int64_t>();
        if (percent < 0 || percent > 100) {
            return unexpected(Error::validation("task progress must be between 0 and 100"));
        }
        task.progress = static_cast<int>(percent);
    }

    if (auto* value = util::find(j, "notes"); !util::is_absent(value)) {
        if (!value->is_string()) {
            return unexpected(Error::validation("task notes must be a string"));
        }
        task.notes = value->get<std::string>();
    }

    auto scheduled_at = read_time(j, "scheduledAt");
    auto completed_at = read_time(j, "completedAt");
    auto updated_at = read_time(j, "updatedAt");
    for (const auto* parsed : {&scheduled_at, &completed_at, &updated_at}) {
        if (!*parsed) {
            return unexpected(parsed->error());
        }
    }
    task.scheduled_at = *scheduled_at;
    task.completed_at = *completed_at;
    if (*updated_at) {
        task.updated_at = **updated_at;
    }

    if (auto* list = util::find(j, "assignments"); !util::is_absent(list)) {
        if (!list->is_array()) {
            return unexpected(Error::validation("task assignments must be an array"));
        }
        for (const auto& item : *list) {
            auto assignment = Assignment::from_json(item);
            if (!assignment) {
                return unexpected(assignment.error());
            }
            if (assignment->task_id.empty()) assignment->task_id = task.id;
            task.assignments.push_back(std::move(*assignment));
        }
    }

    if (auto* meta = util::find(j, "metadata")) {
        task.metadata = Metadata::from_json(*meta);
    }

    if (auto* stamps = util::find(j, "fieldStamps"); stamps && stamps->is_object()) {
        for (auto it = stamps->begin(); it != stamps->end(); ++it) {
            if (!it.value().is_string()) continue;
            if (auto at = parse_iso8601(it.value().get<std::string>())) {
                task.field_stamps[it.key()] = *at;
            }
        }
    }

    return task;
}

void stamp_changed_fields(const Task& before, Task& after, Timestamp at) {
    auto old_view = before.snapshot();
    auto new_view = after.snapshot();

    for (auto name : {field::status, field::progress, field::notes, field::metadata,
                      field::type, field::name, field::description, field::priority}) {
        std::string key(name);
        auto* old_value = util::find(old_view, key);
        auto* new_value = util::find(new_view, key);

        bool changed = util::is_absent(old_value) != util::is_absent(new_value);
        if (!changed && !util::is_absent(old_value)) {
            changed = !util::structurally_equal(*old_value, *new_value);
        }
        if (changed) {
            after.field_stamps[key] = at;
        }
    }
}

nlohmann::json to_json_array(const std::vector<Task>& tasks) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& task : tasks) {
        arr.push_back(task.to_json());
    }
    return arr;
}

} // namespace fieldsync
