#pragma once
#include <optional>
#include <set>
#include <string>
#include <nlohmann/json.hpp>
#include "semantic/SemanticTypes.h"
#include "sync/ChangeSet.h"

/**
 * @brief A surfaced, undecided classification question. Inert data.
 *
 * The id is "<tool>:<rawConceptId>", stable across runs.
 */
struct Proposal {
    std::string id;
    std::string tool;
    std::string rawConceptId;
    std::string rawLabel;
    ChangeKind kind = ChangeKind::New;
    std::optional<SemanticRole> candidateRole;      // suggestion only
    std::optional<std::string> suggestedEntityId;  // suggestion only
    std::string currentEntityId;                    // Changed only
    std::set<std::string> affectedProjects;
    bool previouslyDeferred = false;

    MappingKey key() const { return {tool, rawConceptId}; }

    static std::string makeId(const MappingKey& key) { return key.tool + ":" + key.rawConceptId; }

    nlohmann::json toJson() const;
    static Proposal fromJson(const nlohmann::json& j);
};
