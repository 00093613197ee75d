#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "fieldsync/core/error.hpp"
#include "fieldsync/util/expected.hpp"

namespace fieldsync::util {

// Structural equality: objects and arrays compare independent of order,
// integers and floats compare by value.
bool structurally_equal(const nlohmann::json& a, const nlohmann::json& b);

// Recursively merges `patch` into `target`. Keys present in `patch` are set,
// nested objects are merged, keys absent from `patch` are left untouched.
void merge_additive(nlohmann::json& target, const nlohmann::json& patch);

// Parse without exceptions; syntax errors become Errc::Validation.
expected<nlohmann::json, Error> parse_json(std::string_view text);

// Null and missing are the same thing for sync comparisons.
inline bool is_absent(const nlohmann::json* value) {
    return value == nullptr || value->is_null();
}

inline const nlohmann::json* find(const nlohmann::json& object, const std::string& key) {
    if (!object.is_object()) return nullptr;
    auto it = object.find(key);
    return it != object.end() ? &*it : nullptr;
}

// String member of an object: `fallback` when missing or null, nullopt when
// present with another type.
std::optional<std::string> string_member(const nlohmann::json& object,
                                         const std::string& key,
                                         std::string fallback = "");

} // namespace fieldsync::util
