#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "plugins/IDiscoveryPlugin.h"

/**
 * @brief Reads a discovery snapshot exported to a JSON file.
 *
 * Document layout:
 * {
 *   "concepts": [ { "raw_concept_id": "...", "raw_label": "...", "attributes": {...},
 *                   "conflict": false, "role_hint": "label" } ],
 *   "tasks":    [ { "id": "...", "title": "...", "attributes": {...}, "concepts": ["..."] } ]
 * }
 *
 * The tool name comes from the binding, so dumps of any tracker can be fed in. Concepts
 * referenced by a task but not listed under "concepts" are reported as plain observations.
 * A missing file yields an empty snapshot.
 */
class JsonFilePlugin : public IDiscoveryPlugin {
public:
    JsonFilePlugin(const std::string& name, const std::string& tool, const std::string& path)
        : name(name), tool(tool), path(path) {}

    std::string getName() const override { return name; }
    std::string getTool() const override { return tool; }

    DiscoverySnapshot discover(const std::string& projectId) override;

    /**
     * @brief Parse a snapshot document.
     * @throws PluginDiscoveryError on malformed content.
     */
    static DiscoverySnapshot parse(const nlohmann::json& doc, const std::string& tool, const std::string& projectId);

private:
    std::string name;
    std::string tool;
    std::string path;
};
