#pragma once
#include <map>
#include <string>
#include "config/GlobalConfiguration.h"
#include "config/ProjectConfiguration.h"
#include "plugins/DiscoverySnapshot.h"
#include "sync/ChangeSet.h"

/**
 * @brief Finds unclassified or conflicting semantics in a discovery snapshot.
 *
 * For every observation the project's resolution is computed:
 * - ExplicitNone: excluded, the pair never surfaces again for that project
 * - Unmapped: `new` for the observing project
 * - Entity + plugin conflict signal: `changed`; when the mapping comes from the global
 *   default, every project inheriting that default is affected as well
 *
 * One entry per distinct (tool, rawConceptId), carrying the union of affected projects.
 * The detector never decides what a conflict is; it only reads the plugin's flag.
 * Pure: the same snapshot and configurations always give an equal ChangeSet.
 */
class ChangeDetector {
public:
    ChangeSet detect(const DiscoverySnapshot& snapshot,
                     const GlobalConfiguration& global,
                     const std::map<std::string, ProjectConfiguration>& projects) const;
};
