#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "fieldsync/core/error.hpp"
#include "fieldsync/sync/conflict.hpp"
#include "fieldsync/util/expected.hpp"

namespace fieldsync {

enum class Winner {
    Server,
    Client
};

// ============================================================================
// Resolution Policy Interface
// ============================================================================

class ResolutionPolicy {
public:
    virtual ~ResolutionPolicy() = default;

    // Which side's value a conflicting field takes
    virtual Winner choose(const SyncConflict& conflict) const = 0;

    // Recorded in the audit block (HYBRID, SERVER_WINS, CLIENT_WINS)
    virtual std::string_view label() const = 0;

    // Reported on the result (MERGE, SERVER_WINS, CLIENT_WINS)
    virtual std::string_view strategy() const = 0;

    virtual std::string_view reason() const = 0;
};

// Server wins for status, type and name; client wins for everything else
class CriticalFieldsPolicy : public ResolutionPolicy {
public:
    static bool is_critical(std::string_view field) noexcept;

    Winner choose(const SyncConflict& conflict) const override;
    std::string_view label() const override { return "HYBRID"; }
    std::string_view strategy() const override { return "MERGE"; }
    std::string_view reason() const override {
        return "Hybrid resolution: server wins for critical fields, client wins for others";
    }
};

class ServerWinsPolicy : public ResolutionPolicy {
public:
    Winner choose(const SyncConflict&) const override { return Winner::Server; }
    std::string_view label() const override { return "SERVER_WINS"; }
    std::string_view strategy() const override { return "SERVER_WINS"; }
    std::string_view reason() const override { return "Server value kept for every conflicting field"; }
};

class ClientWinsPolicy : public ResolutionPolicy {
public:
    Winner choose(const SyncConflict&) const override { return Winner::Client; }
    std::string_view label() const override { return "CLIENT_WINS"; }
    std::string_view strategy() const override { return "CLIENT_WINS"; }
    std::string_view reason() const override { return "Client value kept for every conflicting field"; }
};

// "hybrid", "server_wins" or "client_wins"
expected<std::shared_ptr<const ResolutionPolicy>, Error> make_policy(std::string_view name);

} // namespace fieldsync
