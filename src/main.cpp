#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <vector>
#include "core/ConfigManager.h"
#include "core/Errors.h"
#include "core/Paths.h"
#include "decision/EditorDecisionSource.h"
#include "decision/FileDecisionSource.h"
#include "decision/NonInteractiveDecisionSource.h"
#include "engine/InterruptHandler.h"
#include "engine/SyncEngine.h"
#include "plugins/DiscoveryRunner.h"
#include "plugins/PluginRegistry.h"
#include "store/SqliteConfigStore.h"
#include "sync/LockTable.h"
#include "utils/Logger.h"

namespace {
    void printUsage() {
        std::cout << "Usage: uts [-c config.json] <command> [args]\n"
                  << "\n"
                  << "Commands:\n"
                  << "  detect [project...]                       list open proposals (dry run)\n"
                  << "  sync [project...] [--decisions file] [--non-interactive]\n"
                  << "  normalize <project>                       print CIF tasks\n"
                  << "  resolve <project> <tool> <concept>        show the effective mapping\n"
                  << "  vocab list                                print the global vocabulary\n"
                  << "  vocab import <file>                       append entities and default mappings\n"
                  << "  history <project>                         print a project's configuration and decisions\n"
                  << "  clear <project> <tool> <concept>          remove a project override\n"
                  << "  config list                               print the effective configuration\n"
                  << "  config get <key>                          print one value (dotted key)\n"
                  << "  config set <key> <value>                  write one value to the config file\n"
                  << "\n"
                  << "Without -c, ./uts.json is used if present, else $XDG_CONFIG_HOME/uts/config.json.\n";
    }

    GlobalConfiguration loadVocabulary(const std::string& path) {
        std::ifstream f(path);
        if (!f.is_open()) {
            throw ConfigError("Could not open vocabulary file: " + path);
        }
        try {
            nlohmann::json j;
            f >> j;
            return GlobalConfiguration::fromJson(j);
        } catch (const nlohmann::json::exception& e) {
            throw ConfigError("Invalid vocabulary file " + path + ": " + e.what());
        } catch (const ConfigError&) {
            throw;
        } catch (const UtsError& e) {
            throw ConfigError("Invalid vocabulary file " + path + ": " + e.what());
        }
    }

    int runConfig(const Config& cfg, const std::string& configPath, const std::vector<std::string>& args) {
        if (args.size() >= 2 && args[1] == "list") {
            nlohmann::json out = cfg.toJson();
            out["paths"] = {{"config_file", configPath},
                            {"config_home", Paths::configHome()},
                            {"data_home", Paths::dataHome()}};
            std::cout << out.dump(2) << std::endl;
            return 0;
        }
        if (args.size() >= 3 && args[1] == "get") {
            nlohmann::json value = Config::getValue(cfg.toJson(), args[2]);
            std::cout << (value.is_string() ? value.get<std::string>() : value.dump()) << std::endl;
            return 0;
        }
        if (args.size() >= 4 && args[1] == "set") {
            nlohmann::json doc = nlohmann::json::object();
            if (std::filesystem::exists(configPath)) {
                std::ifstream in(configPath);
                doc = nlohmann::json::parse(in, nullptr, false);
                if (doc.is_discarded()) {
                    throw ConfigError("Cannot parse " + configPath);
                }
            }
            doc = Config::setValue(doc, args[2], args[3]);

            std::filesystem::path path(configPath);
            std::error_code ec;
            if (path.has_parent_path()) {
                std::filesystem::create_directories(path.parent_path(), ec);
            }
            std::ofstream out(configPath);
            if (ec || !out.is_open()) {
                throw ConfigError("Cannot write " + configPath);
            }
            out << doc.dump(2) << std::endl;
            std::cout << args[2] << " = " << doc.at(Config::pointerFor(args[2])).dump() << std::endl;
            return 0;
        }
        printUsage();
        return 1;
    }

    std::set<std::string> positionalProjects(const std::vector<std::string>& args, size_t from) {
        std::set<std::string> out;
        for (size_t i = from; i < args.size(); ++i) {
            if (args[i].rfind("--", 0) == 0) {
                if (args[i] == "--decisions") ++i;
                continue;
            }
            out.insert(args[i]);
        }
        return out;
    }

    int run(const Config& cfg, const std::vector<std::string>& args) {
        const std::string& command = args[0];
        auto& logger = Logger::getInstance();

        SqliteConfigStore store(cfg.store.path);
        LockTable locks;
        DiscoveryRunner discovery;
        PluginRegistry plugins;
        for (const auto& binding : cfg.plugins) {
            discovery.add(binding.project, plugins.create(binding));
        }
        SyncEngine engine(store, discovery, locks);
        InterruptHandler::setTarget(&engine);
        struct Detach {
            ~Detach() { InterruptHandler::setTarget(nullptr); }
        } detach;

        if (command == "detect") {
            auto detection = engine.detect(positionalProjects(args, 1));
            nlohmann::json out = nlohmann::json::array();
            for (const auto& p : detection.proposals) out.push_back(p.toJson());
            std::cout << out.dump(2) << std::endl;
            return 0;
        }

        if (command == "sync") {
            bool nonInteractive = !cfg.decisions.interactive;
            std::string decisionsFile;
            for (size_t i = 1; i < args.size(); ++i) {
                if (args[i] == "--non-interactive") {
                    nonInteractive = true;
                } else if (args[i] == "--decisions") {
                    if (i + 1 >= args.size()) {
                        std::cerr << "--decisions needs a file" << std::endl;
                        return 1;
                    }
                    decisionsFile = args[++i];
                }
            }

            if (!cfg.vocabularyPath.empty()) {
                ApplyResult imported = engine.getApplicator().importVocabulary(loadVocabulary(cfg.vocabularyPath));
                if (!imported.ok) {
                    logger.warn("Vocabulary not imported: " + imported.message);
                }
            }

            std::unique_ptr<IDecisionSource> source;
            if (!decisionsFile.empty()) {
                source = std::make_unique<FileDecisionSource>(decisionsFile);
            } else if (nonInteractive) {
                source = std::make_unique<NonInteractiveDecisionSource>(cfg.decisions.defaultOutcome);
            } else {
                std::string editor = cfg.decisions.editor.empty() ? EditorDecisionSource::defaultEditor()
                                                                  : cfg.decisions.editor;
                source = std::make_unique<EditorDecisionSource>(editor, cfg.decisions.sessionDir);
            }

            SyncReport report = engine.sync(*source, std::chrono::seconds(cfg.decisions.timeoutSeconds),
                                            positionalProjects(args, 1));
            std::cout << report.toJson().dump(2) << std::endl;
            if (report.aborted) return 2;
            if (!report.decisionSourceError.empty()) return 1;
            return 0;
        }

        if (command == "normalize") {
            if (args.size() < 2) {
                printUsage();
                return 1;
            }
            nlohmann::json out = nlohmann::json::array();
            for (const auto& task : engine.normalize(args[1])) out.push_back(task.toJson());
            std::cout << out.dump(2) << std::endl;
            return 0;
        }

        if (command == "resolve") {
            if (args.size() < 4) {
                printUsage();
                return 1;
            }
            Resolution r = engine.resolve(args[1], args[2], args[3]);
            std::cout << r.describe() << std::endl;
            return 0;
        }

        if (command == "vocab") {
            if (args.size() >= 2 && args[1] == "list") {
                GlobalConfiguration global = store.loadGlobal();
                nlohmann::json out = global.toJson();
                out["version"] = global.version;
                std::cout << out.dump(2) << std::endl;
                return 0;
            }
            if (args.size() >= 3 && args[1] == "import") {
                ApplyResult r = engine.getApplicator().importVocabulary(loadVocabulary(args[2]));
                if (!r.ok) {
                    std::cerr << applyErrorToString(r.error) << ": " << r.message << std::endl;
                    return r.globalFailure ? 2 : 1;
                }
                return 0;
            }
            printUsage();
            return 1;
        }

        if (command == "history") {
            if (args.size() < 2) {
                printUsage();
                return 1;
            }
            ProjectConfiguration project = store.loadProject(args[1]);
            nlohmann::json out = project.toJson();
            out["version"] = project.version;
            out["global_versions"] = store.globalVersions();
            std::cout << out.dump(2) << std::endl;
            return 0;
        }

        if (command == "clear") {
            if (args.size() < 4) {
                printUsage();
                return 1;
            }
            ApplyResult r = engine.getApplicator().clearOverride(args[1], MappingKey{args[2], args[3]});
            if (!r.ok) {
                std::cerr << applyErrorToString(r.error) << ": " << r.message << std::endl;
                return 1;
            }
            return 0;
        }

        printUsage();
        return 1;
    }
}

int main(int argc, char* argv[]) {
    std::string configPath;
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            printUsage();
            return 0;
        } else {
            args.push_back(arg);
        }
    }
    if (args.empty()) {
        printUsage();
        return 1;
    }

    if (configPath.empty()) {
        configPath = std::filesystem::exists("uts.json") ? "uts.json" : Paths::userConfigFile();
    }

    Config cfg = Config::defaults();
    try {
        if (std::filesystem::exists(configPath)) {
            cfg = Config::load(configPath);
        }
        if (args[0] == "config") {
            return runConfig(cfg, configPath, args);
        }
    } catch (const ConfigError& e) {
        std::cerr << "Failed to load config: " << e.what() << std::endl;
        return 1;
    }

    Logger::getInstance().setLogFile(cfg.logging.file);
    Logger::getInstance().setDebugEnabled(cfg.logging.debug);

    try {
        InterruptHandler::install();
        int code = run(cfg, args);
        return code;
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    } catch (const PersistenceError& e) {
        std::cerr << "Storage error: " << e.what() << std::endl;
        return 2;
    } catch (const UtsError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
