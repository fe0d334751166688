#pragma once
#include <map>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "semantic/SemanticRegistry.h"
#include "semantic/SemanticTypes.h"

/**
 * @brief Shared vocabulary and default mappings. Evolves additively only.
 *
 * Each persisted version is a full record; `version` is the store's counter for the
 * record this object was loaded from (0 = nothing committed yet).
 */
struct GlobalConfiguration {
    long long version = 0;
    SemanticRegistry registry;
    std::map<MappingKey, std::string> defaultMappings;

    /**
     * @brief Append a default mapping.
     * @return false if the key already maps to a different entity (defaults are never edited).
     */
    bool addDefaultMapping(const MappingKey& key, const std::string& entityId);

    std::optional<std::string> defaultFor(const MappingKey& key) const;

    /**
     * @brief True if this record is a valid successor of @p prior:
     * entity set is a superset with identical roles and no default mapping was
     * removed or retargeted.
     */
    bool isAdditiveSuccessorOf(const GlobalConfiguration& prior) const;

    nlohmann::json toJson() const;
    static GlobalConfiguration fromJson(const nlohmann::json& j);
};
