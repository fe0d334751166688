#include "plugins/TaskwarriorPlugin.h"
#include <array>
#include <cstdio>
#include <map>
#include <memory>
#include <set>
#include <sstream>
#include <sys/wait.h>
#include <nlohmann/json.hpp>
#include "core/Errors.h"
#include "utils/Logger.h"

namespace {
    std::string shellQuote(const std::string& arg) {
        std::string out = "'";
        for (char c : arg) {
            if (c == '\'') {
                out += "'\\''";
            } else {
                out += c;
            }
        }
        out += "'";
        return out;
    }

    std::string textOf(const nlohmann::json& task, const char* key) {
        if (!task.contains(key)) return "";
        const auto& v = task[key];
        if (v.is_string()) return v.get<std::string>();
        if (v.is_null()) return "";
        return v.dump();
    }

    struct Seen {
        RawToolEntity entity;
        std::optional<SemanticRole> hint;
    };
}

std::string TaskwarriorPlugin::buildCommand(const std::string& binary, const std::string& filter) {
    std::string cmd = binary + " rc.json.array=on rc.verbose=nothing";
    std::istringstream words(filter);
    std::string word;
    while (words >> word) {
        cmd += " " + shellQuote(word);
    }
    cmd += " export 2>/dev/null";
    return cmd;
}

DiscoverySnapshot TaskwarriorPlugin::discover(const std::string& projectId) {
    std::string cmd = buildCommand(binary, filter);
    Logger::getInstance().debug("[" + name + "] " + cmd);

    FILE* raw = popen(cmd.c_str(), "r");
    if (!raw) {
        throw PluginDiscoveryError(kToolName, "Cannot start '" + binary + "'");
    }
    std::unique_ptr<FILE, decltype(&pclose)> pipe(raw, pclose);

    std::array<char, 4096> buffer;
    std::string output;
    while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe.get()) != nullptr) {
        output += buffer.data();
    }

    int status = pclose(pipe.release());
    if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        int code = (status != -1 && WIFEXITED(status)) ? WEXITSTATUS(status) : -1;
        throw PluginDiscoveryError(kToolName, "'" + binary + " export' failed with status " + std::to_string(code));
    }
    return parseExport(output, projectId);
}

DiscoverySnapshot TaskwarriorPlugin::parseExport(const std::string& exportJson, const std::string& projectId) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(exportJson.empty() ? "[]" : exportJson);
    } catch (const nlohmann::json::parse_error& e) {
        throw PluginDiscoveryError(kToolName, std::string("Invalid export: ") + e.what());
    }
    if (!doc.is_array()) {
        throw PluginDiscoveryError(kToolName, "Export is not a JSON array");
    }

    DiscoverySnapshot snapshot;
    // Ordered by first appearance so observations are reported deterministically.
    std::vector<std::string> order;
    std::map<std::string, Seen> seen;
    std::set<std::string> tagNames;
    std::set<std::string> projectNames;

    auto note = [&](const std::string& conceptId, const std::string& label,
                    const std::string& kind, SemanticRole hint) {
        if (seen.count(conceptId)) return;
        Seen s;
        s.entity = RawToolEntity{kToolName, conceptId, label, {{"kind", kind}}};
        s.hint = hint;
        seen.emplace(conceptId, std::move(s));
        order.push_back(conceptId);
    };

    for (const auto& item : doc) {
        if (!item.is_object()) {
            throw PluginDiscoveryError(kToolName, "Export entry is not an object");
        }
        RawTask task;
        task.tool = kToolName;
        task.projectId = projectId;
        task.sourceId = textOf(item, "uuid");
        if (task.sourceId.empty()) task.sourceId = textOf(item, "id");
        task.title = textOf(item, "description");

        for (const char* key : {"uuid", "status", "project", "priority", "due", "scheduled", "modified"}) {
            std::string value = textOf(item, key);
            if (!value.empty()) task.attributes[key] = value;
        }

        if (item.contains("tags") && item["tags"].is_array()) {
            std::string joined;
            for (const auto& t : item["tags"]) {
                if (!t.is_string()) continue;
                std::string tag = t.get<std::string>();
                note("+" + tag, tag, "tag", SemanticRole::Label);
                task.conceptIds.push_back("+" + tag);
                tagNames.insert(tag);
                if (!joined.empty()) joined += ",";
                joined += tag;
            }
            if (!joined.empty()) task.attributes["tags"] = joined;
        }

        std::string project = textOf(item, "project");
        if (!project.empty()) {
            note("project:" + project, project, "project", SemanticRole::Container);
            task.conceptIds.push_back("project:" + project);
            projectNames.insert(project);
        }

        std::string status = textOf(item, "status");
        if (!status.empty()) {
            note("status:" + status, status, "status", SemanticRole::Status);
            task.conceptIds.push_back("status:" + status);
        }

        std::string priority = textOf(item, "priority");
        if (priority == "H" || priority == "M" || priority == "L") {
            note("priority:" + priority, priority, "priority", SemanticRole::Priority);
            task.conceptIds.push_back("priority:" + priority);
        }

        snapshot.tasks.push_back(std::move(task));
    }

    for (const auto& conceptId : order) {
        const Seen& s = seen.at(conceptId);
        ConceptObservation obs;
        obs.entity = s.entity;
        obs.projectId = projectId;
        obs.roleHint = s.hint;
        const std::string& label = s.entity.rawLabel;
        const std::string& kind = s.entity.attributes.at("kind");
        if ((kind == "tag" || kind == "project") && tagNames.count(label) && projectNames.count(label)) {
            obs.conflict = true;
        }
        snapshot.observations.push_back(std::move(obs));
    }
    return snapshot;
}
