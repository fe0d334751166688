#pragma once
#include <map>
#include <optional>
#include <set>
#include <string>
#include "config/GlobalConfiguration.h"
#include "config/ProjectConfiguration.h"
#include "semantic/SemanticTypes.h"

/**
 * @brief Effective mapping of one project: the two-level lookup bound to a project.
 *
 * A view over the configuration snapshots it was built from; it must not outlive them.
 */
class EffectiveMapping {
public:
    EffectiveMapping(const GlobalConfiguration& global, const ProjectConfiguration* project,
                     std::string projectId);

    Resolution resolve(const MappingKey& key) const;

    /** @brief Role lookup goes through the registry, never a cached copy. */
    std::optional<SemanticEntity> entity(const std::string& entityId) const;

    const std::string& projectId() const { return id; }

private:
    const GlobalConfiguration& global;
    const ProjectConfiguration* project;  // null: project has no configuration yet
    std::string id;
};

/**
 * @brief Configuration Merge Resolver.
 *
 * Pure and deterministic given the two snapshots. The project override (ExplicitNone
 * included) always wins; otherwise the global default; otherwise Unmapped. Configurations
 * are not flattened, so the answer keeps its provenance.
 */
class MergeResolver {
public:
    MergeResolver(const GlobalConfiguration& global,
                  const std::map<std::string, ProjectConfiguration>& projects);

    Resolution resolve(const std::string& projectId, const std::string& tool,
                       const std::string& rawConceptId) const;
    Resolution resolve(const std::string& projectId, const MappingKey& key) const;

    EffectiveMapping forProject(const std::string& projectId) const;

    /**
     * @brief Known projects that inherit the global default for @p key (no override).
     * Empty when there is no default for the key.
     */
    std::set<std::string> projectsInheritingDefault(const MappingKey& key) const;

    static Resolution resolve(const GlobalConfiguration& global, const ProjectConfiguration* project,
                              const std::string& projectId, const MappingKey& key);

private:
    const GlobalConfiguration& global;
    const std::map<std::string, ProjectConfiguration>& projects;

    const ProjectConfiguration* find(const std::string& projectId) const;
};
