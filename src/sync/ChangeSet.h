#pragma once
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "semantic/SemanticTypes.h"

enum class ChangeKind {
    New,      // no mapping in the project, no ExplicitNone
    Changed   // mapped, but the plugin signals a role conflict
};

inline std::string changeKindToString(ChangeKind kind) {
    switch (kind) {
        case ChangeKind::New: return "new";
        case ChangeKind::Changed: return "changed";
    }
    return "new";
}

/**
 * @brief One distinct (tool, rawConceptId) that needs a human decision.
 */
struct DetectedChange {
    RawToolEntity entity;
    ChangeKind kind = ChangeKind::New;
    std::set<std::string> affectedProjects;
    std::optional<SemanticRole> roleHint;  // plugin-supplied, never applied
    std::string currentEntityId;           // Changed only
    bool previouslyDeferred = false;

    MappingKey key() const { return entity.key(); }

    bool operator==(const DetectedChange& other) const {
        return entity == other.entity && kind == other.kind &&
               affectedProjects == other.affectedProjects && roleHint == other.roleHint &&
               currentEntityId == other.currentEntityId &&
               previouslyDeferred == other.previouslyDeferred;
    }
};

/**
 * @brief Result of one change-detection pass. Consumed in the same run, never persisted.
 *
 * Entries are ordered by (tool, rawConceptId), so two passes over the same snapshot
 * compare equal.
 */
struct ChangeSet {
    std::vector<DetectedChange> entries;
    std::set<std::string> affectedProjects;

    bool empty() const { return entries.empty(); }

    /** @brief Raw entities classified as new. */
    std::set<RawToolEntity> newEntities() const {
        std::set<RawToolEntity> out;
        for (const auto& e : entries) {
            if (e.kind == ChangeKind::New) out.insert(e.entity);
        }
        return out;
    }

    bool operator==(const ChangeSet& other) const {
        return entries == other.entries && affectedProjects == other.affectedProjects;
    }
};
