#pragma once

#include "bbhunt/config.h"
#include "bbhunt/kvstore.h"
#include "bbhunt/log.h"
#include "bbhunt/orchestrator.h"
#include "bbhunt/registry.h"
#include "bbhunt/resource_manager.h"
#include "bbhunt/sysprobe.h"
#include "bbhunt/targets.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace bbhunt {

using NamedSource = std::pair<std::string, RegistrationFn>;

// Everything one process needs, built once and passed down explicitly.
class Context {
public:
    Context(CoreConfig cfg,
            std::unique_ptr<IKeyValueStore> store,
            std::unique_ptr<ISystemProbe> probe,
            ContainerRuntime runtime,
            const std::vector<NamedSource>& sources);

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

    const CoreConfig& config() const { return cfg_; }
    IKeyValueStore& store() { return *store_; }
    EventLog& log() { return log_; }
    TargetStore& targets() { return targets_; }
    PluginRegistry& registry() { return registry_; }
    ResourceManager& resources() { return resources_; }
    Orchestrator& orchestrator() { return orchestrator_; }

private:
    CoreConfig cfg_;
    std::unique_ptr<IKeyValueStore> store_;
    EventLog log_;
    TargetStore targets_;
    PluginRegistry registry_;
    ResourceManager resources_;
    Orchestrator orchestrator_;
};

// Environment + <config_dir>/bbhunt.json, Linux probe, BBHUNT_CONTAINER_CMD
// runtime (default docker).
std::unique_ptr<Context> make_default_context(const std::vector<NamedSource>& sources);

} // namespace bbhunt
