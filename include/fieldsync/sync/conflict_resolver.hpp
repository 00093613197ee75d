#pragma once

#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "fieldsync/model/actor.hpp"
#include "fieldsync/model/note.hpp"
#include "fieldsync/sync/conflict.hpp"
#include "fieldsync/sync/resolution_policy.hpp"
#include "fieldsync/util/time.hpp"

namespace fieldsync {

struct ResolutionResult {
    bool resolved = true;
    nlohmann::json merged = nlohmann::json::object();
    std::string strategy;
    std::string reason;
    std::vector<SyncConflict> conflicts;

    nlohmann::json to_json() const;
};

/// Combines a server snapshot and a client payload into one value.
///
/// The merged value starts as the client payload; every conflicting field
/// the policy awards to the server is overwritten with the server value.
/// When conflicts exist an audit block is written to
/// metadata.conflictResolution. Its timestamp comes from the injected clock,
/// so the same inputs always yield the same merged value.
class ConflictResolver {
    std::shared_ptr<const ResolutionPolicy> policy_;
    Clock clock_;

public:
    explicit ConflictResolver(std::shared_ptr<const ResolutionPolicy> policy =
                                  std::make_shared<CriticalFieldsPolicy>(),
                              Clock clock = system_clock());

    ResolutionResult resolve(const nlohmann::json& server,
                             const nlohmann::json& client,
                             const std::vector<SyncConflict>& conflicts,
                             const Actor& actor) const;

    const ResolutionPolicy& policy() const noexcept { return *policy_; }
};

// GENERAL note recording which fields were resolved and to what
Note make_audit_note(const std::string& task_id,
                     const ResolutionResult& result,
                     const Actor& actor,
                     Timestamp at);

} // namespace fieldsync
