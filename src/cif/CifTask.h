#pragma once
#include <map>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "semantic/SemanticTypes.h"

/**
 * @brief Common Intermediate Form of a task.
 *
 * `fields` only ever holds entity ids reached through a recorded decision or a
 * pre-existing default. Raw concepts without a mapping land in `unmapped`.
 */
struct CifTask {
    std::string sourceTool;
    std::string sourceId;
    std::string title;
    std::map<SemanticRole, std::vector<std::string>> fields;
    std::set<std::string> unmapped;

    bool has(SemanticRole role) const {
        auto it = fields.find(role);
        return it != fields.end() && !it->second.empty();
    }

    nlohmann::json toJson() const {
        nlohmann::json j;
        j["source_tool"] = sourceTool;
        j["source_id"] = sourceId;
        j["title"] = title;
        nlohmann::json f = nlohmann::json::object();
        for (const auto& [role, values] : fields) {
            f[roleToString(role)] = values;
        }
        j["fields"] = f;
        j["unmapped"] = unmapped;
        return j;
    }
};
