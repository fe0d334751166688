#pragma once
#include <map>
#include <iterator>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "semantic/SemanticTypes.h"

/**
 * @brief One occurrence of a raw concept in a project, as reported by a plugin.
 *
 * `conflict` is the plugin's boolean signal that the observed usage conflicts with the
 * concept's currently mapped role. `roleHint` is a suggestion shown to the human.
 */
struct ConceptObservation {
    RawToolEntity entity;
    std::string projectId;
    bool conflict = false;
    std::optional<SemanticRole> roleHint;
};

/**
 * @brief A raw task. `conceptIds` are the attributes that correlate to semantic concepts.
 */
struct RawTask {
    std::string tool;
    std::string projectId;
    std::string sourceId;
    std::string title;
    std::map<std::string, std::string> attributes;
    std::vector<std::string> conceptIds;
};

struct PluginFailure {
    std::string plugin;
    std::string tool;
    std::string projectId;
    std::string message;
};

/**
 * @brief Everything discovery produced in one run, across all plugins.
 */
struct DiscoverySnapshot {
    std::vector<ConceptObservation> observations;
    std::vector<RawTask> tasks;
    std::vector<PluginFailure> failures;
    std::set<std::string> partialProjects;

    /** @brief Projects with at least one observation or task. */
    std::set<std::string> projects() const {
        std::set<std::string> out;
        for (const auto& o : observations) out.insert(o.projectId);
        for (const auto& t : tasks) out.insert(t.projectId);
        return out;
    }

    void append(DiscoverySnapshot&& other) {
        observations.insert(observations.end(),
                            std::make_move_iterator(other.observations.begin()),
                            std::make_move_iterator(other.observations.end()));
        tasks.insert(tasks.end(),
                     std::make_move_iterator(other.tasks.begin()),
                     std::make_move_iterator(other.tasks.end()));
        failures.insert(failures.end(), other.failures.begin(), other.failures.end());
        partialProjects.insert(other.partialProjects.begin(), other.partialProjects.end());
    }
};
