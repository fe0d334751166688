#pragma once
#include <ctime>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "semantic/SemanticTypes.h"

enum class DecisionOutcome {
    Accept,     // map to an existing entity
    CreateNew,  // register a new global entity and map to it
    Ignore,     // write ExplicitNone
    Defer       // leave the proposal open
};

std::string outcomeToString(DecisionOutcome outcome);
std::optional<DecisionOutcome> outcomeFromString(const std::string& name);

/**
 * @brief The recorded resolution of a Proposal.
 *
 * tool/rawConceptId are filled in when the decision is recorded in a project, so the
 * decision log can be queried without the proposal at hand.
 */
struct Decision {
    std::string proposalId;
    DecisionOutcome outcome = DecisionOutcome::Defer;
    std::string entityId;                // Accept
    std::optional<SemanticEntity> newEntity;  // CreateNew
    std::vector<std::string> projects;   // empty: every affected project of the proposal
    std::time_t decidedAt = 0;
    std::string note;

    std::string tool;
    std::string rawConceptId;

    static Decision accept(const std::string& proposalId, const std::string& entityId);
    static Decision createNew(const std::string& proposalId, const SemanticEntity& entity);
    static Decision ignore(const std::string& proposalId);
    static Decision defer(const std::string& proposalId, const std::string& note = "");

    /** @brief The mapping target this outcome writes, if any. */
    std::optional<MappingTarget> target() const;

    nlohmann::json toJson() const;
    static Decision fromJson(const nlohmann::json& j);
};
