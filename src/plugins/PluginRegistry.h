#pragma once
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include "plugins/IDiscoveryPlugin.h"

/**
 * @brief Factory table from plugin type to implementation.
 *
 * "json" and "taskwarrior" are registered on construction; tests and embedders may add
 * their own types.
 */
class PluginRegistry {
public:
    using Factory = std::function<std::unique_ptr<IDiscoveryPlugin>(const PluginBinding&)>;

    PluginRegistry();

    void registerFactory(const std::string& type, Factory factory);

    bool hasType(const std::string& type) const;

    std::vector<std::string> listTypes() const;

    /**
     * @brief Instantiate the plugin for a binding.
     * @throws ConfigError if the binding's type is unknown.
     */
    std::unique_ptr<IDiscoveryPlugin> create(const PluginBinding& binding) const;

private:
    std::unordered_map<std::string, Factory> factories;
};
