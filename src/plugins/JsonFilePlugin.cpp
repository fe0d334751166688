#include "plugins/JsonFilePlugin.h"
#include <filesystem>
#include <fstream>
#include <set>
#include "core/Errors.h"
#include "utils/Logger.h"

namespace fs = std::filesystem;

namespace {
    std::string scalarToString(const nlohmann::json& v) {
        if (v.is_string()) return v.get<std::string>();
        if (v.is_null()) return "";
        return v.dump();
    }

    std::map<std::string, std::string> readAttributes(const nlohmann::json& item) {
        std::map<std::string, std::string> attrs;
        if (item.contains("attributes") && item["attributes"].is_object()) {
            for (auto& [key, value] : item["attributes"].items()) {
                attrs[key] = scalarToString(value);
            }
        }
        return attrs;
    }
}

DiscoverySnapshot JsonFilePlugin::discover(const std::string& projectId) {
    if (!fs::exists(path)) {
        Logger::getInstance().warn("[" + name + "] Snapshot file not found: " + path);
        return DiscoverySnapshot{};
    }

    std::ifstream f(path);
    if (!f.is_open()) {
        throw PluginDiscoveryError(tool, "Cannot open " + path);
    }
    nlohmann::json doc;
    try {
        f >> doc;
    } catch (const nlohmann::json::parse_error& e) {
        throw PluginDiscoveryError(tool, "Invalid JSON in " + path + ": " + e.what());
    }
    return parse(doc, tool, projectId);
}

DiscoverySnapshot JsonFilePlugin::parse(const nlohmann::json& doc, const std::string& tool,
                                        const std::string& projectId) {
    if (!doc.is_object()) {
        throw PluginDiscoveryError(tool, "Snapshot must be a JSON object");
    }

    DiscoverySnapshot snapshot;
    std::set<std::string> declared;

    try {
        for (const auto& item : doc.value("concepts", nlohmann::json::array())) {
            ConceptObservation obs;
            obs.entity.tool = tool;
            obs.entity.rawConceptId = item.at("raw_concept_id").get<std::string>();
            obs.entity.rawLabel = item.value("raw_label", obs.entity.rawConceptId);
            obs.entity.attributes = readAttributes(item);
            obs.projectId = projectId;
            obs.conflict = item.value("conflict", false);
            std::string hint = item.value("role_hint", "");
            if (!hint.empty()) {
                obs.roleHint = roleFromString(hint);
                if (!obs.roleHint) {
                    throw PluginDiscoveryError(tool, "Unknown role hint '" + hint + "' for " + obs.entity.rawConceptId);
                }
            }
            declared.insert(obs.entity.rawConceptId);
            snapshot.observations.push_back(std::move(obs));
        }

        for (const auto& item : doc.value("tasks", nlohmann::json::array())) {
            RawTask task;
            task.tool = tool;
            task.projectId = projectId;
            task.sourceId = scalarToString(item.at("id"));
            task.title = item.value("title", "");
            task.attributes = readAttributes(item);
            for (const auto& c : item.value("concepts", nlohmann::json::array())) {
                std::string conceptId = c.get<std::string>();
                task.conceptIds.push_back(conceptId);
                if (declared.insert(conceptId).second) {
                    ConceptObservation obs;
                    obs.entity = RawToolEntity{tool, conceptId, conceptId, {}};
                    obs.projectId = projectId;
                    snapshot.observations.push_back(std::move(obs));
                }
            }
            snapshot.tasks.push_back(std::move(task));
        }
    } catch (const nlohmann::json::exception& e) {
        throw PluginDiscoveryError(tool, std::string("Malformed snapshot: ") + e.what());
    }
    return snapshot;
}
