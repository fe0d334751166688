#pragma once
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "semantic/SemanticTypes.h"

/**
 * @brief Outcome of SemanticRegistry::registerEntity.
 */
struct RegisterResult {
    bool ok;
    bool alreadyPresent;  // identical id + role was already registered
    std::string error;    // "RoleConflict" when ok == false
};

/**
 * @brief Global vocabulary of semantic entities.
 *
 * Single source of truth for role immutability: an id, once registered, keeps its role
 * in every later snapshot. Entries are only ever appended.
 */
class SemanticRegistry {
public:
    SemanticRegistry() = default;

    /**
     * @brief Register an entity.
     * @return ok=false with error "RoleConflict" if the id exists with a different role.
     *         Registering an id that exists with the same role is a no-op (alreadyPresent).
     */
    RegisterResult registerEntity(const SemanticEntity& entity);

    std::optional<SemanticEntity> lookup(const std::string& entityId) const;

    bool contains(const std::string& entityId) const { return entities.count(entityId) > 0; }

    /** @brief The four roles. Fixed at compile time. */
    static std::set<SemanticRole> allRoles();

    std::vector<SemanticEntity> list() const;
    size_t size() const { return entities.size(); }

    /**
     * @brief True if every entity in @p prior exists here with the same role.
     */
    bool isSupersetOf(const SemanticRegistry& prior) const;

    nlohmann::json toJson() const;
    static SemanticRegistry fromJson(const nlohmann::json& j);

private:
    std::map<std::string, SemanticEntity> entities;
};
