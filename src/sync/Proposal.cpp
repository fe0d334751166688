#include "sync/Proposal.h"

nlohmann::json Proposal::toJson() const {
    nlohmann::json j;
    j["id"] = id;
    j["tool"] = tool;
    j["raw_concept_id"] = rawConceptId;
    j["raw_label"] = rawLabel;
    j["kind"] = changeKindToString(kind);
    j["candidate_role"] = candidateRole ? nlohmann::json(roleToString(*candidateRole)) : nlohmann::json("unknown");
    j["suggested_entity_id"] = suggestedEntityId ? nlohmann::json(*suggestedEntityId) : nlohmann::json(nullptr);
    if (kind == ChangeKind::Changed) {
        j["current_entity_id"] = currentEntityId;
    }
    j["affected_projects"] = affectedProjects;
    j["previously_deferred"] = previouslyDeferred;
    return j;
}

Proposal Proposal::fromJson(const nlohmann::json& j) {
    Proposal p;
    p.id = j.at("id").get<std::string>();
    p.tool = j.value("tool", "");
    p.rawConceptId = j.value("raw_concept_id", "");
    p.rawLabel = j.value("raw_label", p.rawConceptId);
    p.kind = j.value("kind", "new") == "changed" ? ChangeKind::Changed : ChangeKind::New;
    if (j.contains("candidate_role") && j["candidate_role"].is_string()) {
        p.candidateRole = roleFromString(j["candidate_role"].get<std::string>());
    }
    if (j.contains("suggested_entity_id") && j["suggested_entity_id"].is_string()) {
        p.suggestedEntityId = j["suggested_entity_id"].get<std::string>();
    }
    p.currentEntityId = j.value("current_entity_id", "");
    p.affectedProjects = j.value("affected_projects", std::set<std::string>{});
    p.previouslyDeferred = j.value("previously_deferred", false);
    return p;
}
