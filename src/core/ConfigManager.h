#pragma once
#include <string>
#include <vector>
#include <set>
#include <fstream>
#include <filesystem>
#include <nlohmann/json.hpp>
#include "core/Errors.h"
#include "core/Paths.h"
#include "plugins/IDiscoveryPlugin.h"
#include "sync/Decision.h"

struct Config {
    struct Store {
        std::string path = Paths::dataFile("state.db");
    } store;

    struct Logging {
        std::string file = Paths::dataFile("uts.log");
        bool debug = false;
    } logging;

    struct Decisions {
        bool interactive = true;
        DecisionOutcome defaultOutcome = DecisionOutcome::Defer;  // only defer or ignore
        int timeoutSeconds = 600;
        std::string editor;  // empty: $VISUAL, $EDITOR, vi
        std::string sessionDir = Paths::dataFile("session");
    } decisions;

    std::string vocabularyPath;  // optional vocabulary imported before each sync
    std::vector<PluginBinding> plugins;

    /** Usable without a file: no plugins, everything else at its default. */
    static Config defaults() {
        return Config{};
    }

    static Config load(const std::string& pathStr) {
        std::filesystem::path path = std::filesystem::u8path(pathStr);
        std::ifstream f(path);
        if (!f.is_open()) {
            throw ConfigError("Could not open config file: " + pathStr);
        }

        std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        f.close();

        nlohmann::json j;
        try {
            j = nlohmann::json::parse(content);
        } catch (const nlohmann::json::parse_error& e) {
            throw ConfigError("JSON Parse Error in " + path.string() + ": " + e.what());
        }
        return fromJson(j, pathStr);
    }

    static nlohmann::json::json_pointer pointerFor(const std::string& key) {
        if (key.empty()) {
            throw ConfigError("Empty config key");
        }
        std::string pointer;
        std::string segment;
        auto flush = [&]() {
            pointer += "/";
            for (char c : segment) {
                if (c == '~') pointer += "~0";
                else if (c == '/') pointer += "~1";
                else pointer += c;
            }
            segment.clear();
        };
        for (char c : key) {
            if (c == '.') flush();
            else segment += c;
        }
        flush();
        return nlohmann::json::json_pointer(pointer);
    }

    static Config fromJson(const nlohmann::json& j, const std::string& source = "<config>") {
        if (!j.is_object()) {
            throw ConfigError(source + ": top level must be an object");
        }
        Config cfg;
        try {
            if (j.contains("store")) {
                cfg.store.path = j.at("store").value("path", cfg.store.path);
            }
            if (j.contains("logging")) {
                cfg.logging.file = j.at("logging").value("file", cfg.logging.file);
                cfg.logging.debug = j.at("logging").value("debug", false);
            }
            if (j.contains("decisions")) {
                const auto& d = j.at("decisions");
                std::string mode = d.value("mode", "interactive");
                if (mode == "interactive") {
                    cfg.decisions.interactive = true;
                } else if (mode == "non_interactive") {
                    cfg.decisions.interactive = false;
                } else {
                    throw ConfigError(source + ": decisions.mode must be interactive or non_interactive");
                }

                std::string outcomeName = d.value("default_outcome", "defer");
                auto outcome = outcomeFromString(outcomeName);
                if (!outcome || (*outcome != DecisionOutcome::Defer && *outcome != DecisionOutcome::Ignore)) {
                    // A default that maps concepts would classify without a human.
                    throw ConfigError(source + ": decisions.default_outcome must be defer or ignore, got '" +
                                      outcomeName + "'");
                }
                cfg.decisions.defaultOutcome = *outcome;

                cfg.decisions.timeoutSeconds = d.value("timeout_seconds", cfg.decisions.timeoutSeconds);
                if (cfg.decisions.timeoutSeconds <= 0) {
                    throw ConfigError(source + ": decisions.timeout_seconds must be positive");
                }
                cfg.decisions.editor = d.value("editor", "");
                cfg.decisions.sessionDir = d.value("session_dir", cfg.decisions.sessionDir);
            }
            cfg.vocabularyPath = j.value("vocabulary", "");

            std::set<std::string> names;
            if (j.contains("plugins")) {
                for (const auto& item : j.at("plugins")) {
                    PluginBinding b;
                    b.tool = item.value("tool", "");
                    b.name = item.value("name", b.tool);
                    b.type = item.value("type", "");
                    b.project = item.value("project", "");
                    b.target = item.value("target", "");
                    if (b.tool.empty()) {
                        throw ConfigError(source + ": plugin '" + b.name + "' has no tool");
                    }
                    if (b.project.empty()) {
                        throw ConfigError(source + ": plugin '" + b.name + "' has no project");
                    }
                    if (!names.insert(b.name).second) {
                        throw ConfigError(source + ": duplicate plugin name '" + b.name + "'");
                    }
                    cfg.plugins.push_back(std::move(b));
                }
            }
        } catch (const nlohmann::json::exception& e) {
            throw ConfigError(source + ": " + e.what());
        }
        return cfg;
    }

    nlohmann::json toJson() const {
        nlohmann::json j;
        j["store"] = {{"path", store.path}};
        j["logging"] = {{"file", logging.file}, {"debug", logging.debug}};
        j["decisions"] = {
            {"mode", decisions.interactive ? "interactive" : "non_interactive"},
            {"default_outcome", outcomeToString(decisions.defaultOutcome)},
            {"timeout_seconds", decisions.timeoutSeconds},
            {"editor", decisions.editor},
            {"session_dir", decisions.sessionDir}
        };
        j["vocabulary"] = vocabularyPath;
        nlohmann::json list = nlohmann::json::array();
        for (const auto& b : plugins) {
            list.push_back({{"name", b.name}, {"tool", b.tool}, {"type", b.type},
                            {"project", b.project}, {"target", b.target}});
        }
        j["plugins"] = list;
        return j;
    }

    /**
     * @brief Look up a dotted key ("decisions.timeout_seconds", "plugins.0.tool").
     * @throws ConfigError if the key does not exist.
     */
    static nlohmann::json getValue(const nlohmann::json& doc, const std::string& key) {
        try {
            return doc.at(pointerFor(key));
        } catch (const nlohmann::json::exception&) {
            throw ConfigError("Unknown config key: " + key);
        }
    }

    /**
     * @brief Return @p doc with @p key set. @p raw is taken as JSON when it parses
     * ("30", "true"), otherwise as a string. The result must still be a valid config.
     * @throws ConfigError when the edited document does not validate.
     */
    static nlohmann::json setValue(nlohmann::json doc, const std::string& key, const std::string& raw) {
        if (!doc.is_object()) {
            doc = nlohmann::json::object();
        }
        nlohmann::json value = nlohmann::json::parse(raw, nullptr, false);
        if (value.is_discarded()) {
            value = raw;
        }
        try {
            doc[pointerFor(key)] = value;
        } catch (const nlohmann::json::exception& e) {
            throw ConfigError("Cannot set " + key + ": " + e.what());
        }
        fromJson(doc, "config");
        return doc;
    }

    std::set<std::string> projects() const {
        std::set<std::string> out;
        for (const auto& p : plugins) out.insert(p.project);
        return out;
    }
};
