#pragma once
#include <memory>
#include <set>
#include <string>
#include <vector>
#include "plugins/IDiscoveryPlugin.h"

/**
 * @brief Runs every bound plugin in parallel and joins the results.
 *
 * One std::async task per binding. A plugin that throws is isolated: its failure is
 * logged and recorded, and its project is reported as partial. Other plugins are
 * unaffected.
 */
class DiscoveryRunner {
public:
    void add(const std::string& projectId, std::unique_ptr<IDiscoveryPlugin> plugin);

    size_t size() const { return bindings.size(); }

    std::set<std::string> projects() const;

    /**
     * @brief Run discovery.
     * @param onlyProjects restrict to these projects; empty runs every binding.
     */
    DiscoverySnapshot run(const std::set<std::string>& onlyProjects = {});

private:
    struct Binding {
        std::string projectId;
        std::unique_ptr<IDiscoveryPlugin> plugin;
    };
    std::vector<Binding> bindings;
};
