#include "cif/CifNormalizer.h"
#include <algorithm>
#include "utils/Logger.h"

CifTask CifNormalizer::normalize(const RawTask& task, const EffectiveMapping& mapping) const {
    CifTask out;
    out.sourceTool = task.tool;
    out.sourceId = task.sourceId;
    out.title = task.title;

    for (const auto& conceptId : task.conceptIds) {
        MappingKey key{task.tool, conceptId};
        Resolution r = mapping.resolve(key);

        switch (r.kind) {
            case Resolution::Kind::ExplicitNone:
                break;
            case Resolution::Kind::Unmapped:
                out.unmapped.insert(conceptId);
                break;
            case Resolution::Kind::Entity: {
                auto entity = mapping.entity(r.entityId);
                if (!entity) {
                    // Override or default names an entity the registry does not know.
                    Logger::getInstance().warn("Mapping " + key.toString() + " -> " + r.describe() +
                                               " references an unregistered entity; treating as unmapped");
                    out.unmapped.insert(conceptId);
                    break;
                }
                auto& values = out.fields[entity->role];
                if (std::find(values.begin(), values.end(), entity->id) == values.end()) {
                    values.push_back(entity->id);
                }
                break;
            }
        }
    }
    return out;
}

CifTask CifNormalizer::normalize(const RawToolEntity& entity, const EffectiveMapping& mapping) const {
    RawTask task;
    task.tool = entity.tool;
    task.projectId = mapping.projectId();
    task.sourceId = entity.rawConceptId;
    task.title = entity.rawLabel;
    task.attributes = entity.attributes;
    task.conceptIds.push_back(entity.rawConceptId);
    return normalize(task, mapping);
}

std::vector<CifTask> CifNormalizer::normalizeAll(const std::vector<RawTask>& tasks,
                                                 const EffectiveMapping& mapping) const {
    std::vector<CifTask> out;
    out.reserve(tasks.size());
    for (const auto& t : tasks) {
        out.push_back(normalize(t, mapping));
    }
    return out;
}
