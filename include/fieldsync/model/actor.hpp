#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "fieldsync/util/json.hpp"

namespace fieldsync {

// Calling identity as resolved by the (external) authentication layer.
struct Actor {
    std::string id;
    std::string organization_id;

    nlohmann::json to_json() const {
        return {{"id", id}, {"organizationId", organization_id}};
    }

    static Actor from_json(const nlohmann::json& j) {
        return Actor{
            .id = util::string_member(j, "id").value_or(""),
            .organization_id = util::string_member(j, "organizationId").value_or("")
        };
    }
};

} // namespace fieldsync
