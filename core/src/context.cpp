#include "bbhunt/context.h"

#include <utility>

namespace bbhunt {

static std::unique_ptr<IKeyValueStore> store_or_memory(std::unique_ptr<IKeyValueStore> store) {
    if (store) return store;
    return std::make_unique<MemoryStore>();
}

static std::unique_ptr<ISystemProbe> probe_or_linux(std::unique_ptr<ISystemProbe> probe,
                                                    const std::string& net_host) {
    if (probe) return probe;
    return std::make_unique<LinuxSystemProbe>(net_host);
}

Context::Context(CoreConfig cfg,
                 std::unique_ptr<IKeyValueStore> store,
                 std::unique_ptr<ISystemProbe> probe,
                 ContainerRuntime runtime,
                 const std::vector<NamedSource>& sources)
    : cfg_(std::move(cfg)),
      store_(store_or_memory(std::move(store))),
      log_(cfg_.event_log),
      targets_(cfg_.data_dir),
      registry_(cfg_.plugin_dir),
      resources_(ceilings_from(cfg_),
                 probe_or_linux(std::move(probe), cfg_.net_probe_host),
                 std::move(runtime),
                 ".",
                 cfg_.container_log_tail),
      orchestrator_(registry_, resources_, *store_, log_, cfg_) {
    for (const auto& s : sources) registry_.addSource(s.first, s.second);
}

std::unique_ptr<Context> make_default_context(const std::vector<NamedSource>& sources) {
    // config_dir itself comes from the environment; the store can then
    // supply the remaining overrides.
    const CoreConfig env_only = load_core_config(nullptr);
    auto store = std::make_unique<JsonFileStore>(env_only.config_dir / "bbhunt.json");
    CoreConfig cfg = load_core_config(store.get());
    ContainerRuntime runtime = ContainerRuntime::fromCommandLine(cfg.container_cmd);

    return std::make_unique<Context>(std::move(cfg), std::move(store), nullptr,
                                     std::move(runtime), sources);
}

} // namespace bbhunt
