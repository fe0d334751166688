#pragma once
#include <vector>
#include "cif/CifTask.h"
#include "config/MergeResolver.h"
#include "plugins/DiscoverySnapshot.h"

/**
 * @brief Converts raw tool data into CIF tasks through an effective mapping.
 *
 * Never invents an entity and never guesses:
 * - Entity resolution -> value placed under the entity's registered role
 * - Unmapped          -> raw concept id recorded in `unmapped`
 * - ExplicitNone      -> omitted, and not recorded as unmapped
 */
class CifNormalizer {
public:
    CifTask normalize(const RawTask& task, const EffectiveMapping& mapping) const;

    /**
     * @brief Normalize a single raw concept, treated as an item carrying only itself.
     */
    CifTask normalize(const RawToolEntity& entity, const EffectiveMapping& mapping) const;

    std::vector<CifTask> normalizeAll(const std::vector<RawTask>& tasks, const EffectiveMapping& mapping) const;
};
