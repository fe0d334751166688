#include "config/ProjectConfiguration.h"

std::optional<MappingTarget> ProjectConfiguration::overrideFor(const MappingKey& key) const {
    auto it = overrides.find(key);
    if (it == overrides.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool ProjectConfiguration::isExplicitNone(const MappingKey& key) const {
    auto it = overrides.find(key);
    return it != overrides.end() && it->second.explicitNone;
}

std::optional<Decision> ProjectConfiguration::lastDecisionFor(const MappingKey& key) const {
    for (auto it = decisions.rbegin(); it != decisions.rend(); ++it) {
        if (it->tool == key.tool && it->rawConceptId == key.rawConceptId) {
            return *it;
        }
    }
    return std::nullopt;
}

bool ProjectConfiguration::clearOverride(const MappingKey& key) {
    return overrides.erase(key) > 0;
}

nlohmann::json ProjectConfiguration::toJson() const {
    nlohmann::json j;
    j["project_id"] = projectId;
    nlohmann::json ov = nlohmann::json::array();
    for (const auto& [key, target] : overrides) {
        nlohmann::json item = target.toJson();
        item["tool"] = key.tool;
        item["raw_concept_id"] = key.rawConceptId;
        ov.push_back(item);
    }
    j["overrides"] = ov;
    nlohmann::json log = nlohmann::json::array();
    for (const auto& d : decisions) {
        log.push_back(d.toJson());
    }
    j["decisions"] = log;
    return j;
}

ProjectConfiguration ProjectConfiguration::fromJson(const nlohmann::json& j) {
    ProjectConfiguration cfg;
    cfg.projectId = j.value("project_id", "");
    if (j.contains("overrides") && j["overrides"].is_array()) {
        for (const auto& item : j["overrides"]) {
            MappingKey key{item.at("tool").get<std::string>(), item.at("raw_concept_id").get<std::string>()};
            cfg.overrides[key] = MappingTarget::fromJson(item);
        }
    }
    if (j.contains("decisions") && j["decisions"].is_array()) {
        for (const auto& item : j["decisions"]) {
            cfg.decisions.push_back(Decision::fromJson(item));
        }
    }
    return cfg;
}
