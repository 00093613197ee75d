#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "fieldsync/util/time.hpp"

namespace fieldsync {

enum class NoteType {
    Observation,
    Issue,
    Recommendation,
    General
};

std::string_view to_string(NoteType type) noexcept;
std::optional<NoteType> parse_note_type(std::string_view name) noexcept;

struct Note {
    std::string id;
    std::string task_id;
    std::string author_id;
    std::string content;
    NoteType type = NoteType::General;
    bool is_private = false;
    Timestamp created_at{};
    nlohmann::json metadata = nlohmann::json::object();

    nlohmann::json to_json() const;
};

// A note as collected offline by the mobile client
struct NoteSubmission {
    std::string task_id;
    std::string content;
    NoteType type = NoteType::General;
    bool is_private = false;

    static NoteSubmission from_json(const nlohmann::json& j);
};

nlohmann::json to_json_array(const std::vector<Note>& notes);

} // namespace fieldsync
