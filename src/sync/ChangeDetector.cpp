#include "sync/ChangeDetector.h"
#include "config/MergeResolver.h"

namespace {
    struct Pending {
        RawToolEntity entity;
        bool isNew = false;
        bool isChanged = false;
        std::set<std::string> projects;
        std::optional<SemanticRole> roleHint;
        std::string currentEntityId;
        bool previouslyDeferred = false;
    };
}

ChangeSet ChangeDetector::detect(const DiscoverySnapshot& snapshot,
                                 const GlobalConfiguration& global,
                                 const std::map<std::string, ProjectConfiguration>& projects) const {
    MergeResolver resolver(global, projects);
    std::map<MappingKey, Pending> pending;

    for (const auto& obs : snapshot.observations) {
        MappingKey key = obs.entity.key();
        Resolution r = resolver.resolve(obs.projectId, key);

        if (r.isExplicitNone()) {
            continue;
        }
        if (r.isEntity() && !obs.conflict) {
            continue;
        }
        if (r.isEntity() && r.source == Resolution::Source::ProjectOverride) {
            // Accepted mappings are terminal for this project; a persisting conflict
            // signal does not re-open them.
            auto projectIt = projects.find(obs.projectId);
            if (projectIt != projects.end()) {
                auto last = projectIt->second.lastDecisionFor(key);
                if (last && last->outcome != DecisionOutcome::Defer) {
                    continue;
                }
            }
        }

        auto [it, inserted] = pending.try_emplace(key);
        Pending& p = it->second;
        if (inserted) {
            p.entity = obs.entity;
        }
        if (!p.roleHint && obs.roleHint) {
            p.roleHint = obs.roleHint;
        }
        p.projects.insert(obs.projectId);

        auto projectIt = projects.find(obs.projectId);
        if (projectIt != projects.end()) {
            auto last = projectIt->second.lastDecisionFor(key);
            if (last && last->outcome == DecisionOutcome::Defer) {
                p.previouslyDeferred = true;
            }
        }

        if (r.isUnmapped()) {
            p.isNew = true;
            continue;
        }

        // Mapped, but the plugin reports a role conflict.
        p.isChanged = true;
        if (p.currentEntityId.empty()) {
            p.currentEntityId = r.entityId;
        }
        if (r.source == Resolution::Source::GlobalDefault) {
            // A correction to the default would ripple into every inheriting project.
            auto inheriting = resolver.projectsInheritingDefault(key);
            p.projects.insert(inheriting.begin(), inheriting.end());
        }
    }

    ChangeSet out;
    for (auto& [key, p] : pending) {
        DetectedChange change;
        change.entity = p.entity;
        change.kind = p.isChanged ? ChangeKind::Changed : ChangeKind::New;
        change.affectedProjects = p.projects;
        change.roleHint = p.roleHint;
        change.currentEntityId = p.currentEntityId;
        change.previouslyDeferred = p.previouslyDeferred;
        out.affectedProjects.insert(p.projects.begin(), p.projects.end());
        out.entries.push_back(std::move(change));
    }
    return out;
}
