#include "sync/Decision.h"
#include "core/Errors.h"

std::string outcomeToString(DecisionOutcome outcome) {
    switch (outcome) {
        case DecisionOutcome::Accept: return "accept";
        case DecisionOutcome::CreateNew: return "create_new";
        case DecisionOutcome::Ignore: return "ignore";
        case DecisionOutcome::Defer: return "defer";
    }
    return "defer";
}

std::optional<DecisionOutcome> outcomeFromString(const std::string& name) {
    if (name == "accept") return DecisionOutcome::Accept;
    if (name == "create_new") return DecisionOutcome::CreateNew;
    if (name == "ignore") return DecisionOutcome::Ignore;
    if (name == "defer") return DecisionOutcome::Defer;
    return std::nullopt;
}

Decision Decision::accept(const std::string& proposalId, const std::string& entityId) {
    Decision d;
    d.proposalId = proposalId;
    d.outcome = DecisionOutcome::Accept;
    d.entityId = entityId;
    d.decidedAt = std::time(nullptr);
    return d;
}

Decision Decision::createNew(const std::string& proposalId, const SemanticEntity& entity) {
    Decision d;
    d.proposalId = proposalId;
    d.outcome = DecisionOutcome::CreateNew;
    d.newEntity = entity;
    d.decidedAt = std::time(nullptr);
    return d;
}

Decision Decision::ignore(const std::string& proposalId) {
    Decision d;
    d.proposalId = proposalId;
    d.outcome = DecisionOutcome::Ignore;
    d.decidedAt = std::time(nullptr);
    return d;
}

Decision Decision::defer(const std::string& proposalId, const std::string& note) {
    Decision d;
    d.proposalId = proposalId;
    d.outcome = DecisionOutcome::Defer;
    d.note = note;
    d.decidedAt = std::time(nullptr);
    return d;
}

std::optional<MappingTarget> Decision::target() const {
    switch (outcome) {
        case DecisionOutcome::Accept:
            return MappingTarget::entity(entityId);
        case DecisionOutcome::CreateNew:
            if (newEntity) return MappingTarget::entity(newEntity->id);
            return std::nullopt;
        case DecisionOutcome::Ignore:
            return MappingTarget::none();
        case DecisionOutcome::Defer:
            return std::nullopt;
    }
    return std::nullopt;
}

nlohmann::json Decision::toJson() const {
    nlohmann::json j;
    j["proposal_id"] = proposalId;
    j["outcome"] = outcomeToString(outcome);
    if (outcome == DecisionOutcome::Accept) {
        j["entity_id"] = entityId;
    }
    if (newEntity) {
        j["entity"] = newEntity->toJson();
    }
    if (!projects.empty()) {
        j["projects"] = projects;
    }
    j["decided_at"] = static_cast<long long>(decidedAt);
    if (!note.empty()) j["note"] = note;
    if (!tool.empty()) j["tool"] = tool;
    if (!rawConceptId.empty()) j["raw_concept_id"] = rawConceptId;
    return j;
}

Decision Decision::fromJson(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("proposal_id") || !j["proposal_id"].is_string()) {
        throw DecisionFormatError("Decision entry lacks proposal_id: " + j.dump());
    }
    Decision d;
    d.proposalId = j["proposal_id"].get<std::string>();

    std::string outcomeName = j.value("outcome", "defer");
    auto outcome = outcomeFromString(outcomeName);
    if (!outcome) {
        throw DecisionFormatError("Unknown outcome '" + outcomeName + "' for " + d.proposalId);
    }
    d.outcome = *outcome;

    if (d.outcome == DecisionOutcome::Accept) {
        if (!j.contains("entity_id") || !j["entity_id"].is_string() ||
            j["entity_id"].get<std::string>().empty()) {
            throw DecisionFormatError("accept requires entity_id for " + d.proposalId);
        }
        d.entityId = j["entity_id"].get<std::string>();
    }
    if (j.contains("entity") && j["entity"].is_object()) {
        try {
            d.newEntity = SemanticEntity::fromJson(j["entity"]);
        } catch (const std::exception& e) {
            throw DecisionFormatError("Invalid entity for " + d.proposalId + ": " + e.what());
        }
    }
    if (d.outcome == DecisionOutcome::CreateNew && !d.newEntity) {
        throw DecisionFormatError("create_new requires entity for " + d.proposalId);
    }
    if (j.contains("projects") && j["projects"].is_array()) {
        d.projects = j["projects"].get<std::vector<std::string>>();
    }
    d.decidedAt = static_cast<std::time_t>(j.value("decided_at", 0LL));
    d.note = j.value("note", "");
    d.tool = j.value("tool", "");
    d.rawConceptId = j.value("raw_concept_id", "");
    return d;
}
