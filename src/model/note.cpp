#include "fieldsync/model/note.hpp"
#include "fieldsync/util/json.hpp"

namespace fieldsync {

std::string_view to_string(NoteType type) noexcept {
    switch (type) {
        case NoteType::Observation: return "OBSERVATION";
        case NoteType::Issue: return "ISSUE";
        case NoteType::Recommendation: return "RECOMMENDATION";
        case NoteType::General: return "GENERAL";
    }
    return "GENERAL";
}

std::optional<NoteType> parse_note_type(std::string_view name) noexcept {
    if (name == "OBSERVATION") return NoteType::Observation;
    if (name == "ISSUE") return NoteType::Issue;
    if (name == "RECOMMENDATION") return NoteType::Recommendation;
    if (name == "GENERAL") return NoteType::General;
    return std::nullopt;
}

nlohmann::json Note::to_json() const {
    return {
        {"id", id},
        {"taskId", task_id},
        {"authorId", author_id},
        {"content", content},
        {"type", std::string(to_string(type))},
        {"isPrivate", is_private},
        {"createdAt", to_iso8601(created_at)},
        {"metadata", metadata}
    };
}

NoteSubmission NoteSubmission::from_json(const nlohmann::json& j) {
    NoteSubmission submission;
    submission.task_id = util::string_member(j, "taskId").value_or("");
    submission.content = util::string_member(j, "content").value_or("");
    auto type = util::string_member(j, "type", "GENERAL").value_or("GENERAL");
    submission.type = parse_note_type(type).value_or(NoteType::General);
    if (auto* is_private = util::find(j, "isPrivate"); is_private && is_private->is_boolean()) {
        submission.is_private = is_private->get<bool>();
    }
    return submission;
}

nlohmann::json to_json_array(const std::vector<Note>& notes) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& note : notes) {
        arr.push_back(note.to_json());
    }
    return arr;
}

} // namespace fieldsync
