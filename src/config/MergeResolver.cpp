#include "config/MergeResolver.h"
#include <utility>

EffectiveMapping::EffectiveMapping(const GlobalConfiguration& global, const ProjectConfiguration* project,
                                   std::string projectId)
    : global(global), project(project), id(std::move(projectId)) {}

Resolution EffectiveMapping::resolve(const MappingKey& key) const {
    return MergeResolver::resolve(global, project, id, key);
}

std::optional<SemanticEntity> EffectiveMapping::entity(const std::string& entityId) const {
    return global.registry.lookup(entityId);
}

MergeResolver::MergeResolver(const GlobalConfiguration& global,
                             const std::map<std::string, ProjectConfiguration>& projects)
    : global(global), projects(projects) {}

Resolution MergeResolver::resolve(const GlobalConfiguration& global, const ProjectConfiguration* project,
                                  const std::string& projectId, const MappingKey& key) {
    Resolution r;
    if (project) {
        auto target = project->overrideFor(key);
        if (target) {
            r.source = Resolution::Source::ProjectOverride;
            r.projectId = projectId;
            if (target->explicitNone) {
                r.kind = Resolution::Kind::ExplicitNone;
            } else {
                r.kind = Resolution::Kind::Entity;
                r.entityId = target->entityId;
            }
            return r;
        }
    }

    auto def = global.defaultFor(key);
    if (def) {
        r.kind = Resolution::Kind::Entity;
        r.source = Resolution::Source::GlobalDefault;
        r.entityId = *def;
        return r;
    }
    return r;
}

Resolution MergeResolver::resolve(const std::string& projectId, const std::string& tool,
                                  const std::string& rawConceptId) const {
    return resolve(projectId, MappingKey{tool, rawConceptId});
}

Resolution MergeResolver::resolve(const std::string& projectId, const MappingKey& key) const {
    return resolve(global, find(projectId), projectId, key);
}

EffectiveMapping MergeResolver::forProject(const std::string& projectId) const {
    return EffectiveMapping(global, find(projectId), projectId);
}

std::set<std::string> MergeResolver::projectsInheritingDefault(const MappingKey& key) const {
    std::set<std::string> out;
    if (!global.defaultFor(key)) {
        return out;
    }
    for (const auto& [id, cfg] : projects) {
        if (!cfg.overrideFor(key)) {
            out.insert(id);
        }
    }
    return out;
}

const ProjectConfiguration* MergeResolver::find(const std::string& projectId) const {
    auto it = projects.find(projectId);
    return it == projects.end() ? nullptr : &it->second;
}
