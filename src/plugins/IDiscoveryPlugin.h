#pragma once
#include <string>
#include "plugins/DiscoverySnapshot.h"

/**
 * @brief One configured discovery source, as listed under "plugins" in the config file.
 *
 * `type` selects the implementation ("json", "taskwarrior"); empty means use `tool`.
 * `target` is implementation specific: a file path, a filter expression.
 */
struct PluginBinding {
    std::string name;
    std::string tool;
    std::string type;
    std::string project;
    std::string target;

    std::string effectiveType() const { return type.empty() ? tool : type; }
};

/**
 * @brief Discovery plugin contract.
 *
 * A plugin is a pure reader of external state. It reports raw concepts (with an optional
 * conflict signal and role hint) and raw tasks. It never sees the registry or any
 * configuration, and plugins share no mutable state, so several may run concurrently.
 */
class IDiscoveryPlugin {
public:
    virtual ~IDiscoveryPlugin() = default;

    /** @brief Binding name, unique within one configuration. */
    virtual std::string getName() const = 0;

    /** @brief Tool identifier stamped on every raw entity. */
    virtual std::string getTool() const = 0;

    /**
     * @brief Read the tool's current state for one project.
     * @throws PluginDiscoveryError when the tool cannot be read.
     */
    virtual DiscoverySnapshot discover(const std::string& projectId) = 0;
};
