#include "fieldsync/sync/resolution_policy.hpp"

#include <array>

namespace fieldsync {

namespace {

constexpr std::array<std::string_view, 3> critical_fields = {
    field::status, field::type, field::name
};

} // anonymous namespace

bool CriticalFieldsPolicy::is_critical(std::string_view name) noexcept {
    for (auto f : critical_fields) {
        if (f == name) return true;
    }
    return false;
}

Winner CriticalFieldsPolicy::choose(const SyncConflict& conflict) const {
    return is_critical(conflict.field) ? Winner::Server : Winner::Client;
}

expected<std::shared_ptr<const ResolutionPolicy>, Error> make_policy(std::string_view name) {
    if (name == "hybrid") return std::make_shared<CriticalFieldsPolicy>();
    if (name == "server_wins") return std::make_shared<ServerWinsPolicy>();
    if (name == "client_wins") return std::make_shared<ClientWinsPolicy>();
    return unexpected(Error::validation("Unknown resolution policy: " + std::string(name)));
}

} // namespace fieldsync
