#include "semantic/SemanticRegistry.h"

RegisterResult SemanticRegistry::registerEntity(const SemanticEntity& entity) {
    auto it = entities.find(entity.id);
    if (it != entities.end()) {
        if (it->second.role != entity.role) {
            return {false, false, "RoleConflict"};
        }
        return {true, true, ""};
    }
    entities.emplace(entity.id, entity);
    return {true, false, ""};
}

std::optional<SemanticEntity> SemanticRegistry::lookup(const std::string& entityId) const {
    auto it = entities.find(entityId);
    if (it == entities.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::set<SemanticRole> SemanticRegistry::allRoles() {
    return std::set<SemanticRole>(kAllRoles.begin(), kAllRoles.end());
}

std::vector<SemanticEntity> SemanticRegistry::list() const {
    std::vector<SemanticEntity> out;
    out.reserve(entities.size());
    for (const auto& [id, entity] : entities) {
        out.push_back(entity);
    }
    return out;
}

bool SemanticRegistry::isSupersetOf(const SemanticRegistry& prior) const {
    for (const auto& [id, entity] : prior.entities) {
        auto it = entities.find(id);
        if (it == entities.end() || it->second.role != entity.role) {
            return false;
        }
    }
    return true;
}

nlohmann::json SemanticRegistry::toJson() const {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& [id, entity] : entities) {
        arr.push_back(entity.toJson());
    }
    return arr;
}

SemanticRegistry SemanticRegistry::fromJson(const nlohmann::json& j) {
    SemanticRegistry reg;
    if (!j.is_array()) return reg;
    for (const auto& item : j) {
        SemanticEntity e = SemanticEntity::fromJson(item);
        reg.entities.emplace(e.id, e);
    }
    return reg;
}
