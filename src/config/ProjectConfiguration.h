#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "semantic/SemanticTypes.h"
#include "sync/Decision.h"

/**
 * @brief Per-project overrides and the ordered decision log.
 *
 * Overrides are authoritative over global defaults. A missing key inherits the default;
 * an ExplicitNone target suppresses the concept for this project.
 */
struct ProjectConfiguration {
    std::string projectId;
    long long version = 0;
    std::map<MappingKey, MappingTarget> overrides;
    std::vector<Decision> decisions;

    std::optional<MappingTarget> overrideFor(const MappingKey& key) const;

    bool isExplicitNone(const MappingKey& key) const;

    /**
     * @brief Latest decision recorded for @p key, if any.
     */
    std::optional<Decision> lastDecisionFor(const MappingKey& key) const;

    /**
     * @brief Administrative removal of an override (ExplicitNone included).
     * @return false if there was nothing to clear.
     */
    bool clearOverride(const MappingKey& key);

    nlohmann::json toJson() const;
    static ProjectConfiguration fromJson(const nlohmann::json& j);
};
