#pragma once
#include <atomic>
#include <chrono>
#include <map>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "cif/CifTask.h"
#include "decision/IDecisionSource.h"
#include "plugins/DiscoveryRunner.h"
#include "store/ConfigStore.h"
#include "sync/ChangeSet.h"
#include "sync/DecisionApplicator.h"
#include "sync/LockTable.h"
#include "sync/Proposal.h"

/**
 * @brief What happened to one proposal in a sync run.
 */
struct DecisionReport {
    std::string proposalId;
    DecisionOutcome outcome = DecisionOutcome::Defer;
    bool implicit = false;  // no decision was given; deferred without a write
    bool ok = true;
    ApplyError error = ApplyError::None;
    std::string message;

    nlohmann::json toJson() const;
};

struct SyncReport {
    std::set<std::string> projects;
    size_t observations = 0;
    size_t tasks = 0;
    size_t changes = 0;
    std::vector<Proposal> proposals;
    std::vector<DecisionReport> decisions;
    std::vector<PluginFailure> pluginFailures;
    std::set<std::string> partialProjects;
    std::string decisionSourceError;
    bool cancelled = false;
    bool aborted = false;  // a global persistence failure stopped the batch

    size_t applied() const;
    size_t failed() const;
    size_t deferred() const;

    nlohmann::json toJson() const;
};

/**
 * @brief Orchestrates one sync run:
 * discovery -> change detection -> proposals -> decisions -> apply.
 *
 * Detection and proposal generation are side-effect free. Every decision is applied
 * atomically by the DecisionApplicator, so cancelling between decisions leaves the
 * configuration at its last committed state.
 */
class SyncEngine {
public:
    struct Detection {
        DiscoverySnapshot snapshot;
        ChangeSet changes;
        std::vector<Proposal> proposals;
    };

    SyncEngine(ConfigStore& store, DiscoveryRunner& discovery, LockTable& locks)
        : store(store), discovery(discovery), applicator(store, locks) {}

    /** @brief Dry run. @param projects empty means every configured project. */
    Detection detect(const std::set<std::string>& projects = {});

    SyncReport sync(IDecisionSource& source, std::chrono::seconds timeout,
                    const std::set<std::string>& projects = {});

    /**
     * @brief Apply a batch of decisions to the given proposals, in proposal order.
     * Proposals without a decision are deferred implicitly (nothing is written).
     */
    void applyDecisions(const std::vector<Proposal>& proposals, const std::vector<Decision>& decisions,
                        SyncReport& report);

    /** @brief Discover one project and normalize its tasks into CIF. */
    std::vector<CifTask> normalize(const std::string& projectId);

    Resolution resolve(const std::string& projectId, const std::string& tool, const std::string& rawConceptId);

    DecisionApplicator& getApplicator() { return applicator; }

    /** @brief Request cancellation; observed by decision collection and between applies. */
    void cancel() { cancelled.store(true); }
    bool isCancelled() const { return cancelled.load(); }
    void resetCancel() { cancelled.store(false); }

private:
    ConfigStore& store;
    DiscoveryRunner& discovery;
    DecisionApplicator applicator;
    std::atomic<bool> cancelled{false};

    std::map<std::string, ProjectConfiguration> loadProjects(const std::set<std::string>& extra);
};
