#pragma once
#include <map>
#include <optional>
#include <set>
#include <string>
#include "config/GlobalConfiguration.h"
#include "store/ConfigStore.h"
#include "sync/Decision.h"
#include "sync/LockTable.h"
#include "sync/Proposal.h"

enum class ApplyError {
    None,
    RoleConflict,      // entity id reused with an incompatible role
    ConfigConflict,    // entity id already registered, or lost a commit race twice
    UnknownEntity,     // Accept of an id not in the registry
    UnknownProposal,   // decision does not answer this proposal
    AlreadyDecided,    // project already holds a terminal outcome for a New proposal
    InvalidDecision,   // malformed decision (missing entity, project outside the proposal)
    PersistenceError,  // storage failure, rolled back
    Cancelled          // not applied because the run was cancelled
};

std::string applyErrorToString(ApplyError error);

/**
 * @brief Outcome of one apply. Configuration is untouched unless ok is true.
 */
struct ApplyResult {
    bool ok = true;
    ApplyError error = ApplyError::None;
    std::string message;
    long long committedGlobalVersion = 0;
    std::map<std::string, long long> committedProjectVersions;
    bool globalFailure = false;  // persistence failed on a commit that carried a global record

    static ApplyResult failure(ApplyError error, const std::string& message) {
        ApplyResult r;
        r.ok = false;
        r.error = error;
        r.message = message;
        return r;
    }
};

/**
 * @brief Validates decisions and commits their consequences atomically.
 *
 * One apply writes the global record (CreateNew only) and every targeted project record
 * in a single store commit under scoped project locks (sorted) plus, for CreateNew, the
 * process-wide global lock. A commit that loses a version race is retried once after
 * re-reading the configuration.
 */
class DecisionApplicator {
public:
    DecisionApplicator(ConfigStore& store, LockTable& locks) : store(store), locks(locks) {}

    ApplyResult apply(const Proposal& proposal, const Decision& decision);

    /**
     * @brief Administrative removal of one override (ExplicitNone included) in one project.
     */
    ApplyResult clearOverride(const std::string& projectId, const MappingKey& key);

    /**
     * @brief Additive import of entities and default mappings.
     *
     * Identical entries are skipped. The whole import is rejected if one entity would change
     * role (RoleConflict) or one default mapping would be retargeted (ConfigConflict).
     */
    ApplyResult importVocabulary(const GlobalConfiguration& vocabulary);

private:
    ConfigStore& store;
    LockTable& locks;

    // nullopt: the commit lost a version race and may be retried.
    std::optional<ApplyResult> attempt(const Proposal& proposal, const Decision& decision,
                                       const std::set<std::string>& projects);
    std::optional<ApplyResult> attemptClear(const std::string& projectId, const MappingKey& key);
    std::optional<ApplyResult> attemptImport(const GlobalConfiguration& vocabulary);
};
