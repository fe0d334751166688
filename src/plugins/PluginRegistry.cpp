#include "plugins/PluginRegistry.h"
#include <algorithm>
#include "core/Errors.h"
#include "plugins/JsonFilePlugin.h"
#include "plugins/TaskwarriorPlugin.h"
#include "utils/Logger.h"

PluginRegistry::PluginRegistry() {
    registerFactory("json", [](const PluginBinding& b) {
        return std::make_unique<JsonFilePlugin>(b.name, b.tool, b.target);
    });
    registerFactory("taskwarrior", [](const PluginBinding& b) {
        return std::make_unique<TaskwarriorPlugin>(b.name, b.target);
    });
}

void PluginRegistry::registerFactory(const std::string& type, Factory factory) {
    if (!factory) return;
    if (factories.count(type)) {
        Logger::getInstance().debug("Replacing plugin factory for type '" + type + "'");
    }
    factories[type] = std::move(factory);
}

bool PluginRegistry::hasType(const std::string& type) const {
    return factories.count(type) > 0;
}

std::vector<std::string> PluginRegistry::listTypes() const {
    std::vector<std::string> types;
    for (const auto& [type, factory] : factories) {
        types.push_back(type);
    }
    std::sort(types.begin(), types.end());
    return types;
}

std::unique_ptr<IDiscoveryPlugin> PluginRegistry::create(const PluginBinding& binding) const {
    std::string type = binding.effectiveType();
    auto it = factories.find(type);
    if (it == factories.end()) {
        throw ConfigError("Plugin '" + binding.name + "': unknown type '" + type + "'");
    }
    return it->second(binding);
}
