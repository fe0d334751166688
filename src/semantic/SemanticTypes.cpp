#include "semantic/SemanticTypes.h"
#include "core/Errors.h"

nlohmann::json SemanticEntity::toJson() const {
    nlohmann::json j;
    j["id"] = id;
    j["role"] = roleToString(role);
    j["description"] = description;
    return j;
}

SemanticEntity SemanticEntity::fromJson(const nlohmann::json& j) {
    SemanticEntity e;
    e.id = j.at("id").get<std::string>();
    std::string roleName = j.at("role").get<std::string>();
    auto role = roleFromString(roleName);
    if (!role) {
        throw UtsError("Unknown semantic role '" + roleName + "' for entity " + e.id);
    }
    e.role = *role;
    e.description = j.value("description", "");
    return e;
}

nlohmann::json MappingTarget::toJson() const {
    if (explicitNone) {
        return nlohmann::json{{"explicit_none", true}};
    }
    return nlohmann::json{{"entity", entityId}};
}

MappingTarget MappingTarget::fromJson(const nlohmann::json& j) {
    if (j.value("explicit_none", false)) {
        return MappingTarget::none();
    }
    return MappingTarget::entity(j.at("entity").get<std::string>());
}

std::string Resolution::describe() const {
    std::string what;
    switch (kind) {
        case Kind::Entity: what = entityId; break;
        case Kind::ExplicitNone: what = "<explicit none>"; break;
        case Kind::Unmapped: return "<unmapped>";
    }
    switch (source) {
        case Source::ProjectOverride: return what + " (override in project " + projectId + ")";
        case Source::GlobalDefault: return what + " (global default)";
        case Source::None: break;
    }
    return what;
}

nlohmann::json RawToolEntity::toJson() const {
    nlohmann::json j;
    j["tool"] = tool;
    j["raw_concept_id"] = rawConceptId;
    j["raw_label"] = rawLabel;
    j["attributes"] = attributes;
    return j;
}

RawToolEntity RawToolEntity::fromJson(const nlohmann::json& j) {
    RawToolEntity r;
    r.tool = j.value("tool", "");
    r.rawConceptId = j.at("raw_concept_id").get<std::string>();
    r.rawLabel = j.value("raw_label", r.rawConceptId);
    r.attributes = j.value("attributes", std::map<std::string, std::string>{});
    return r;
}
