#pragma once
#include <string>
#include "plugins/IDiscoveryPlugin.h"

/**
 * @brief Discovers concepts from a local Taskwarrior database.
 *
 * Runs `task rc.json.array=on <filter> export` and reports:
 *   tags      -> "+<tag>"             (hint: label)
 *   project   -> "project:<name>"     (hint: container)
 *   status    -> "status:<value>"     (hint: status)
 *   priority  -> "priority:<H|M|L>"   (hint: priority)
 *
 * Conflict signal: a name used both as a tag and as a project in the same export flags
 * both observations.
 */
class TaskwarriorPlugin : public IDiscoveryPlugin {
public:
    static constexpr const char* kToolName = "taskwarrior";

    TaskwarriorPlugin(const std::string& name, const std::string& filter, const std::string& binary = "task")
        : name(name), filter(filter), binary(binary) {}

    std::string getName() const override { return name; }
    std::string getTool() const override { return kToolName; }

    DiscoverySnapshot discover(const std::string& projectId) override;

    /**
     * @brief Parse the output of `task export`.
     * @throws PluginDiscoveryError if the text is not a JSON array of tasks.
     */
    static DiscoverySnapshot parseExport(const std::string& exportJson, const std::string& projectId);

    /** @brief Export command line for a filter, arguments single-quoted. */
    static std::string buildCommand(const std::string& binary, const std::string& filter);

private:
    std::string name;
    std::string filter;
    std::string binary;
};
