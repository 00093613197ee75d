#include "fieldsync/model/metadata.hpp"
#include "fieldsync/util/json.hpp"

namespace fieldsync {

Metadata Metadata::from_json(const nlohmann::json& j) {
    Metadata m;
    if (j.is_object()) {
        m.data_ = j;
    }
    return m;
}

void Metadata::set(std::string_view key, nlohmann::json value) {
    data_[std::string(key)] = std::move(value);
}

void Metadata::stamp(std::string_view key, Timestamp at) {
    set(key, to_iso8601(at));
}

void Metadata::merge(const nlohmann::json& patch) {
    util::merge_additive(data_, patch);
}

bool Metadata::has(std::string_view key) const {
    return data_.contains(std::string(key));
}

const nlohmann::json* Metadata::get(std::string_view key) const {
    return util::find(data_, std::string(key));
}

std::optional<std::string> Metadata::get_string(std::string_view key) const {
    auto* value = get(key);
    if (value == nullptr || !value->is_string()) return std::nullopt;
    return value->get<std::string>();
}

bool Metadata::operator==(const Metadata& other) const {
    return util::structurally_equal(data_, other.data_);
}

} // namespace fieldsync
