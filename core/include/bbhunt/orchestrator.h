#pragma once

#include "bbhunt/config.h"
#include "bbhunt/kvstore.h"
#include "bbhunt/log.h"
#include "bbhunt/registry.h"
#include "bbhunt/resource_manager.h"
#include "bbhunt/types.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace bbhunt {

// Set from any thread; the container polling loop checks it between slices.
class CancelToken {
public:
    void cancel() { cancelled_.store(true); }
    bool cancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

// Asked when admission fails and a container runtime is present.
// Returning true dispatches the run to a container.
using FallbackDecision = std::function<bool(const PluginDesc& desc, const AdmissionVerdict& verdict)>;

struct RunRequest {
    std::string name;
    std::optional<std::string> target; // absent = stored current_target
    std::string options_json{"{}"};
    bool force_container{false};
    bool skip_admission{false};         // in-container entry point; the host already admitted
    FallbackDecision confirm_fallback;  // empty = CoreConfig::container_fallback
    const CancelToken* cancel{nullptr};
};

constexpr const char* kCurrentTargetKey = "current_target";

// Drives one run through
//   RESOLVING -> ADMITTING -> DISPATCH_LOCAL | DISPATCH_CONTAINER -> COMPLETED | FAILED
// and turns every fault into a failed RunResult. Collaborators are borrowed
// and must outlive the orchestrator.
class Orchestrator {
public:
    Orchestrator(PluginRegistry& registry,
                 ResourceManager& resources,
                 IKeyValueStore& store,
                 EventLog& log,
                 CoreConfig cfg);

    // Descriptor catalog, optionally restricted to one category.
    Catalog list_plugins(const std::string& category = "");

    RunResult run(const RunRequest& req);
    RunResult run(const std::string& name,
                  const std::optional<std::string>& target = std::nullopt,
                  const std::string& options_json = "{}");

    ResourceSnapshot resource_usage();

    // Admission dry run; an unknown plugin is reported as not admitted.
    AdmissionVerdict check(const std::string& name);

    const CoreConfig& config() const { return cfg_; }

private:
    RunResult run_phases(const std::string& run_id, const RunRequest& req);

    RunResult dispatch_local(const std::string& run_id,
                             const PluginEntry& entry,
                             const ResourceRequirement& requirement,
                             const std::optional<std::string>& target,
                             const std::string& options_json);

    RunResult dispatch_container(const std::string& run_id,
                                 const PluginEntry& entry,
                                 const std::optional<std::string>& target,
                                 const std::string& options_json,
                                 const CancelToken* cancel);

    ContainerSpec container_spec(const PluginEntry& entry,
                                 const std::optional<std::string>& target,
                                 const std::string& options_json) const;

    // Sleeps one poll interval in short slices. False once the run is
    // cancelled or poll_timeout_ms (if set) has elapsed since started.
    bool wait_next_poll(const CancelToken* cancel,
                        std::chrono::steady_clock::time_point started) const;

    void enter(const std::string& run_id, RunPhase phase);

    PluginRegistry& registry_;
    ResourceManager& resources_;
    IKeyValueStore& store_;
    EventLog& log_;
    CoreConfig cfg_;
};

} // namespace bbhunt
