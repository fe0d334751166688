#pragma once
#include <optional>
#include <string>
#include <vector>
#include "semantic/SemanticRegistry.h"
#include "sync/ChangeSet.h"
#include "sync/Proposal.h"

/**
 * @brief Turns a ChangeSet into Proposals, one per distinct (tool, rawConceptId).
 *
 * `candidateRole` comes from the plugin hint; `suggestedEntityId` names an existing
 * entity whose id equals the raw label with its tool decoration stripped. Both are
 * suggestions only. Generating proposals has no side effect on configuration.
 */
class ProposalGenerator {
public:
    explicit ProposalGenerator(const SemanticRegistry& registry) : registry(registry) {}

    std::vector<Proposal> generate(const ChangeSet& changeSet) const;

    /** @brief "+Bug" -> "bug", "status:Done" -> "done". */
    static std::string canonicalLabel(const std::string& rawLabel);

private:
    const SemanticRegistry& registry;

    std::optional<std::string> suggestEntity(const DetectedChange& change) const;
};
