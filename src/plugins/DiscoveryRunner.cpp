#include "plugins/DiscoveryRunner.h"
#include <future>
#include "core/Errors.h"
#include "utils/Logger.h"

void DiscoveryRunner::add(const std::string& projectId, std::unique_ptr<IDiscoveryPlugin> plugin) {
    if (!plugin) return;
    bindings.push_back({projectId, std::move(plugin)});
}

std::set<std::string> DiscoveryRunner::projects() const {
    std::set<std::string> out;
    for (const auto& b : bindings) {
        out.insert(b.projectId);
    }
    return out;
}

DiscoverySnapshot DiscoveryRunner::run(const std::set<std::string>& onlyProjects) {
    auto& logger = Logger::getInstance();

    std::vector<std::pair<Binding*, std::future<DiscoverySnapshot>>> futures;
    for (auto& b : bindings) {
        if (!onlyProjects.empty() && onlyProjects.count(b.projectId) == 0) {
            continue;
        }
        logger.info("Discovering " + b.plugin->getTool() + " (" + b.plugin->getName() + ") for " + b.projectId);
        IDiscoveryPlugin* plugin = b.plugin.get();
        std::string projectId = b.projectId;
        futures.push_back({&b, std::async(std::launch::async, [plugin, projectId]() {
            return plugin->discover(projectId);
        })});
    }

    DiscoverySnapshot merged;
    for (auto& [binding, future] : futures) {
        const std::string tool = binding->plugin->getTool();
        const std::string name = binding->plugin->getName();
        try {
            DiscoverySnapshot part = future.get();
            for (auto& obs : part.observations) {
                if (obs.projectId.empty()) obs.projectId = binding->projectId;
                if (obs.entity.tool.empty()) obs.entity.tool = tool;
            }
            for (auto& task : part.tasks) {
                if (task.projectId.empty()) task.projectId = binding->projectId;
                if (task.tool.empty()) task.tool = tool;
            }
            logger.info("Discovered " + std::to_string(part.observations.size()) + " concepts and " +
                        std::to_string(part.tasks.size()) + " tasks from " + name);
            merged.append(std::move(part));
        } catch (const PluginDiscoveryError& e) {
            logger.error("Discovery failed for " + name + ": " + e.what());
            merged.failures.push_back({name, tool, binding->projectId, e.what()});
            merged.partialProjects.insert(binding->projectId);
        } catch (const std::exception& e) {
            logger.error("Discovery failed for " + name + " (unexpected): " + e.what());
            merged.failures.push_back({name, tool, binding->projectId, e.what()});
            merged.partialProjects.insert(binding->projectId);
        }
    }
    return merged;
}
