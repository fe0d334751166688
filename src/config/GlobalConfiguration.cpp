#include "config/GlobalConfiguration.h"

bool GlobalConfiguration::addDefaultMapping(const MappingKey& key, const std::string& entityId) {
    auto it = defaultMappings.find(key);
    if (it != defaultMappings.end()) {
        return it->second == entityId;
    }
    defaultMappings.emplace(key, entityId);
    return true;
}

std::optional<std::string> GlobalConfiguration::defaultFor(const MappingKey& key) const {
    auto it = defaultMappings.find(key);
    if (it == defaultMappings.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool GlobalConfiguration::isAdditiveSuccessorOf(const GlobalConfiguration& prior) const {
    if (!registry.isSupersetOf(prior.registry)) {
        return false;
    }
    for (const auto& [key, entityId] : prior.defaultMappings) {
        auto it = defaultMappings.find(key);
        if (it == defaultMappings.end() || it->second != entityId) {
            return false;
        }
    }
    return true;
}

nlohmann::json GlobalConfiguration::toJson() const {
    nlohmann::json j;
    j["entities"] = registry.toJson();
    nlohmann::json mappings = nlohmann::json::array();
    for (const auto& [key, entityId] : defaultMappings) {
        mappings.push_back({{"tool", key.tool}, {"raw_concept_id", key.rawConceptId}, {"entity", entityId}});
    }
    j["default_mappings"] = mappings;
    return j;
}

GlobalConfiguration GlobalConfiguration::fromJson(const nlohmann::json& j) {
    GlobalConfiguration cfg;
    if (j.contains("entities")) {
        cfg.registry = SemanticRegistry::fromJson(j["entities"]);
    }
    if (j.contains("default_mappings") && j["default_mappings"].is_array()) {
        for (const auto& item : j["default_mappings"]) {
            MappingKey key{item.at("tool").get<std::string>(), item.at("raw_concept_id").get<std::string>()};
            cfg.defaultMappings[key] = item.at("entity").get<std::string>();
        }
    }
    return cfg;
}
