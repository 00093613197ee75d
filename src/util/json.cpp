#include "fieldsync/util/json.hpp"

#include <vector>

namespace fieldsync::util {

bool structurally_equal(const nlohmann::json& a, const nlohmann::json& b) {
    if (a.is_object() && b.is_object()) {
        if (a.size() != b.size()) return false;
        for (auto it = a.begin(); it != a.end(); ++it) {
            auto other = b.find(it.key());
            if (other == b.end() || !structurally_equal(it.value(), *other)) {
                return false;
            }
        }
        return true;
    }

    if (a.is_array() && b.is_array()) {
        if (a.size() != b.size()) return false;
        // Multiset match: every element of `a` consumes one equal element of `b`
        std::vector<bool> used(b.size(), false);
        for (const auto& element : a) {
            bool matched = false;
            for (size_t i = 0; i < b.size(); ++i) {
                if (!used[i] && structurally_equal(element, b[i])) {
                    used[i] = true;
                    matched = true;
                    break;
                }
            }
            if (!matched) return false;
        }
        return true;
    }

    if (a.is_number() && b.is_number()) {
        return a == b;
    }

    return a.type() == b.type() && a == b;
}

void merge_additive(nlohmann::json& target, const nlohmann::json& patch) {
    if (!patch.is_object()) return;
    if (!target.is_object()) {
        target = nlohmann::json::object();
    }

    for (auto it = patch.begin(); it != patch.end(); ++it) {
        auto& slot = target[it.key()];
        if (slot.is_object() && it.value().is_object()) {
            merge_additive(slot, it.value());
        } else {
            slot = it.value();
        }
    }
}

expected<nlohmann::json, Error> parse_json(std::string_view text) {
    auto result = nlohmann::json::parse(text.begin(), text.end(), nullptr, false);
    if (result.is_discarded()) {
        return unexpected(Error::validation("Malformed JSON document"));
    }
    return result;
}

std::optional<std::string> string_member(const nlohmann::json& object,
                                         const std::string& key,
                                         std::string fallback) {
    auto* value = find(object, key);
    if (is_absent(value)) return fallback;
    if (!value->is_string()) return std::nullopt;
    return value->get<std::string>();
}

} // namespace fieldsync::util
