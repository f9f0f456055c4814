#include "bbhunt/orchestrator.h"
#include "bbhunt/errors.h"
#include "bbhunt/json_mini.h"

#include <unistd.h>

#include <algorithm>
#include <iostream>
#include <memory>
#include <thread>
#include <utility>

namespace fs = std::filesystem;

namespace bbhunt {

namespace {

constexpr int64_t kPollSliceMs = 50;
constexpr const char* kContainerDefaultMemory = "500MB";
constexpr double kContainerDefaultCpus = 1.0;
// Mount point of the host data directory; docker/Dockerfile creates it.
constexpr const char* kContainerDataDir = "/app/data";

RunResult failed(FailureKind kind, std::string message, std::string payload_json = "{}") {
    RunResult r = RunResult::error(std::move(message), std::move(payload_json));
    r.failure = kind;
    return r;
}

// Runs cleanup() once when the dispatch scope ends, whichever way it ends.
class CleanupGuard {
public:
    explicit CleanupGuard(IPlugin* p) : p_(p) {}
    CleanupGuard(const CleanupGuard&) = delete;
    CleanupGuard& operator=(const CleanupGuard&) = delete;
    ~CleanupGuard() {
        try {
            p_->cleanup();
        } catch (const std::exception& e) {
            std::cerr << "[warn] cleanup failed: " << e.what() << "\n";
        } catch (...) {
            std::cerr << "[warn] cleanup failed: unknown exception\n";
        }
    }

private:
    IPlugin* p_;
};

struct TrackGuard {
    ResourceManager& rm;
    int pid;
    ~TrackGuard() { rm.untrack_process(pid); }
};

std::string short_id(const std::string& id) {
    return id.size() > 12 ? id.substr(0, 12) : id;
}

} // namespace

Orchestrator::Orchestrator(PluginRegistry& registry,
                           ResourceManager& resources,
                           IKeyValueStore& store,
                           EventLog& log,
                           CoreConfig cfg)
    : registry_(registry), resources_(resources), store_(store), log_(log), cfg_(std::move(cfg)) {}

Catalog Orchestrator::list_plugins(const std::string& category) {
    return filter_catalog(registry_.discover(), category);
}

ResourceSnapshot Orchestrator::resource_usage() {
    return resources_.get_resource_usage();
}

AdmissionVerdict Orchestrator::check(const std::string& name) {
    auto entry = registry_.resolve(name);
    if (!entry) return {false, "Plugin '" + name + "' not found"};
    return resources_.check_resources(parse_requirement(entry->desc.resources));
}

RunResult Orchestrator::run(const std::string& name,
                            const std::optional<std::string>& target,
                            const std::string& options_json) {
    RunRequest req;
    req.name = name;
    req.target = target;
    req.options_json = options_json;
    return run(req);
}

void Orchestrator::enter(const std::string& run_id, RunPhase phase) {
    log_.event(run_id, "phase", "{\"phase\":" + json_mini::quote(phase_to_str(phase)) + "}");
}

RunResult Orchestrator::run(const RunRequest& req) {
    const std::string run_id = gen_run_id();
    {
        json_mini::Doc p(json_object_new_object());
        json_object_object_add(p.root, "plugin", json_mini::new_string(req.name));
        json_object_object_add(p.root, "target",
            req.target ? json_mini::new_string(*req.target) : nullptr);
        json_object_object_add(p.root, "force_container", json_object_new_boolean(req.force_container));
        log_.event(run_id, "run_start", json_mini::to_plain(p.root));
    }

    RunResult r = run_phases(run_id, req);
    enter(run_id, r.phase);

    json_mini::Doc p(json_object_new_object());
    json_object_object_add(p.root, "status", json_mini::new_string(runstatus_to_str(r.status)));
    json_object_object_add(p.root, "failure", json_mini::new_string(failure_to_str(r.failure)));
    json_object_object_add(p.root, "dispatch", json_mini::new_string(dispatch_to_str(r.dispatch)));
    json_object_object_add(p.root, "elapsed_ms", json_object_new_int64(r.elapsed_ms));
    json_object_object_add(p.root, "message", json_mini::new_string(r.message));
    log_.event(run_id, "run_end", json_mini::to_plain(p.root));
    return r;
}

RunResult Orchestrator::run_phases(const std::string& run_id, const RunRequest& req) {
    enter(run_id, RunPhase::RESOLVING);
    auto entry = registry_.resolve(req.name);
    if (!entry) {
        return failed(FailureKind::NOT_FOUND, "Plugin '" + req.name + "' not found");
    }

    std::optional<std::string> target;
    if (req.target && !req.target->empty()) {
        store_.set(kCurrentTargetKey, *req.target);
    }
    if (entry->desc.category != kCategoryUtility) {
        if (req.target && !req.target->empty()) {
            target = req.target;
        } else {
            std::string stored = store_.get(kCurrentTargetKey);
            if (!stored.empty()) target = stored;
        }
        if (!target) {
            return failed(FailureKind::NO_TARGET, "No target selected");
        }
    }

    const std::string options = req.options_json.empty() ? "{}" : req.options_json;

    enter(run_id, RunPhase::ADMITTING);
    const ResourceRequirement requirement = parse_requirement(entry->desc.resources);

    if (req.skip_admission) {
        return dispatch_local(run_id, *entry, requirement, target, options);
    }

    if (req.force_container) {
        if (!resources_.containerAvailable()) {
            return failed(FailureKind::CAPABILITY_UNAVAILABLE, "Container execution is not available");
        }
        return dispatch_container(run_id, *entry, target, options, req.cancel);
    }

    AdmissionVerdict verdict = resources_.check_resources(requirement);
    {
        json_mini::Doc p(json_object_new_object());
        json_object_object_add(p.root, "admitted", json_object_new_boolean(verdict.admitted));
        json_object_object_add(p.root, "reason", json_mini::new_string(verdict.reason));
        json_object_object_add(p.root, "memory_mb", json_object_new_int64(requirement.memory_mb));
        json_object_object_add(p.root, "cpu_cores", json_object_new_double(requirement.cpu_cores));
        json_object_object_add(p.root, "disk_mb", json_object_new_int64(requirement.disk_mb));
        json_object_object_add(p.root, "network", json_object_new_boolean(requirement.network));
        log_.event(run_id, "admission", json_mini::to_plain(p.root));
    }

    if (verdict.admitted) {
        return dispatch_local(run_id, *entry, requirement, target, options);
    }

    if (resources_.containerAvailable()) {
        const bool fallback = req.confirm_fallback
            ? req.confirm_fallback(entry->desc, verdict)
            : cfg_.container_fallback;
        if (fallback) {
            std::cerr << "[warn] " << verdict.reason << "; running '" << entry->desc.name
                      << "' in a container\n";
            return dispatch_container(run_id, *entry, target, options, req.cancel);
        }
    }

    return failed(FailureKind::ADMISSION_DENIED, verdict.reason);
}

RunResult Orchestrator::dispatch_local(const std::string& run_id,
                                       const PluginEntry& entry,
                                       const ResourceRequirement& requirement,
                                       const std::optional<std::string>& target,
                                       const std::string& options_json) {
    enter(run_id, RunPhase::DISPATCH_LOCAL);
    log_.event(run_id, "dispatch_local", "{\"plugin\":" + json_mini::quote(entry.desc.name) + "}");

    std::unique_ptr<IPlugin> plugin;
    try {
        plugin = entry.create();
    } catch (const std::exception& e) {
        RunResult r = failed(FailureKind::EXECUTION_ERROR,
                             "Failed to instantiate plugin '" + entry.desc.name + "': " + e.what());
        r.dispatch = DispatchMode::LOCAL;
        return r;
    } catch (...) {
        RunResult r = failed(FailureKind::EXECUTION_ERROR,
                             "Failed to instantiate plugin '" + entry.desc.name + "': unknown exception");
        r.dispatch = DispatchMode::LOCAL;
        return r;
    }
    if (!plugin) {
        RunResult r = failed(FailureKind::EXECUTION_ERROR,
                             "Failed to instantiate plugin '" + entry.desc.name + "'");
        r.dispatch = DispatchMode::LOCAL;
        return r;
    }

    const int pid = static_cast<int>(::getpid());
    resources_.track_process(pid, entry.desc.name, requirement);
    TrackGuard tracked{resources_, pid};

    RunResult r;
    int64_t elapsed_ms = 0;
    {
        CleanupGuard guard(plugin.get());
        try {
            plugin->setup();
        } catch (const std::exception& e) {
            std::cerr << "[warn] setup of '" << entry.desc.name << "' failed: " << e.what() << "\n";
        } catch (...) {
            std::cerr << "[warn] setup of '" << entry.desc.name << "' failed: unknown exception\n";
        }

        const auto t0 = std::chrono::steady_clock::now();
        try {
            r = plugin->execute(target, options_json);
        } catch (const std::exception& e) {
            r = RunResult::error(std::string("Error executing plugin: ") + e.what());
        } catch (...) {
            r = RunResult::error("Error executing plugin: unknown exception");
        }
        elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - t0).count();
    }

    r.dispatch = DispatchMode::LOCAL;
    r.elapsed_ms = elapsed_ms;
    if (r.payload_json.empty()) r.payload_json = "{}";
    if (r.ok()) {
        r.failure = FailureKind::NONE;
        r.phase = RunPhase::COMPLETED;
    } else {
        r.failure = FailureKind::EXECUTION_ERROR;
        r.phase = RunPhase::FAILED;
    }
    return r;
}

ContainerSpec Orchestrator::container_spec(const PluginEntry& entry,
                                           const std::optional<std::string>& target,
                                           const std::string& options_json) const {
    ContainerSpec spec;
    spec.image = cfg_.container_image;
    spec.command = {cfg_.container_exe, "standalone", entry.desc.name};
    if (target) {
        spec.command.push_back("-t");
        spec.command.push_back(*target);
    }
    if (options_json != "{}") {
        spec.command.push_back("-o");
        spec.command.push_back(options_json);
    }

    std::error_code ec;
    fs::path data = fs::absolute(cfg_.data_dir, ec);
    if (ec) data = cfg_.data_dir;
    spec.volumes[data.string()] = kContainerDataDir;
    spec.environment["BBHUNT_MODE"] = "standalone";
    spec.environment["BBHUNT_DATA_DIR"] = kContainerDataDir;

    const ResourceDecl& decl = entry.desc.resources;
    spec.limits.memory_mb = parse_size_mb(decl.memory.empty() ? kContainerDefaultMemory : decl.memory);
    spec.limits.cpus = parse_cpu_cores(decl.cpu, kContainerDefaultCpus);
    return spec;
}

bool Orchestrator::wait_next_poll(const CancelToken* cancel,
                                  std::chrono::steady_clock::time_point started) const {
    using namespace std::chrono;
    const auto wake = steady_clock::now() + milliseconds(cfg_.poll_interval_ms);
    for (;;) {
        if (cancel && cancel->cancelled()) return false;
        const auto now = steady_clock::now();
        if (cfg_.poll_timeout_ms > 0 && now - started >= milliseconds(cfg_.poll_timeout_ms)) return false;
        if (now >= wake) return true;
        auto slice = std::min(duration_cast<milliseconds>(wake - now), milliseconds(kPollSliceMs));
        std::this_thread::sleep_for(slice);
    }
}

RunResult Orchestrator::dispatch_container(const std::string& run_id,
                                           const PluginEntry& entry,
                                           const std::optional<std::string>& target,
                                           const std::string& options_json,
                                           const CancelToken* cancel) {
    enter(run_id, RunPhase::DISPATCH_CONTAINER);
    const ContainerSpec spec = container_spec(entry, target, options_json);
    const auto started = std::chrono::steady_clock::now();

    auto finish = [&](RunResult r) {
        r.dispatch = DispatchMode::CONTAINER;
        r.elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started).count();
        return r;
    };

    std::string id;
    try {
        id = resources_.run_in_container(spec);
    } catch (const CapabilityError& e) {
        return finish(failed(FailureKind::CAPABILITY_UNAVAILABLE, e.what()));
    } catch (const DispatchError& e) {
        return finish(failed(FailureKind::DISPATCH_ERROR, e.what()));
    }

    {
        json_mini::Doc p(json_object_new_object());
        json_object_object_add(p.root, "container_id", json_mini::new_string(id));
        json_object_object_add(p.root, "image", json_mini::new_string(spec.image));
        json_object_object_add(p.root, "command", json_mini::new_string_array(spec.command));
        log_.event(run_id, "dispatch_container", json_mini::to_plain(p.root));
    }
    std::cerr << "[container] started " << short_id(id) << " for '" << entry.desc.name << "'\n";

    std::string last_logs;
    for (;;) {
        ContainerStatus st;
        try {
            st = resources_.get_container_status(id);
        } catch (const std::exception& e) {
            if (!resources_.stop_container(id)) {
                std::cerr << "[warn] could not stop container " << short_id(id) << "\n";
            }
            return finish(failed(FailureKind::DISPATCH_ERROR,
                                 "Failed to query container " + short_id(id) + ": " + e.what()));
        }

        {
            json_mini::Doc p(json_object_new_object());
            json_object_object_add(p.root, "container_id", json_mini::new_string(id));
            json_object_object_add(p.root, "state", json_mini::new_string(st.state));
            log_.event(run_id, "container_poll", json_mini::to_plain(p.root));
        }
        if (!st.logs.empty() && st.logs != last_logs) {
            std::cerr << "[container] " << short_id(id) << " (" << st.state << ")\n" << st.logs;
            if (st.logs.back() != '\n') std::cerr << "\n";
            last_logs = st.logs;
        }

        if (container_state_terminal(st.state)) {
            json_mini::Doc p(json_object_new_object());
            json_object_object_add(p.root, "container_id", json_mini::new_string(id));
            json_object_object_add(p.root, "state", json_mini::new_string(st.state));
            if (st.exit_code) json_object_object_add(p.root, "exit_code", json_object_new_int(*st.exit_code));
            json_object_object_add(p.root, "logs", json_mini::new_string(st.logs));
            std::string payload = json_mini::to_plain(p.root);

            if (st.state == kStateNotFound) {
                return finish(failed(FailureKind::DISPATCH_ERROR,
                                     "Container " + short_id(id) + " is no longer known to the runtime",
                                     payload));
            }
            if (st.exit_code && *st.exit_code == 0) {
                RunResult r = RunResult::success("Plugin executed in container", payload);
                return finish(std::move(r));
            }
            if (!st.exit_code) {
                if (!resources_.stop_container(id)) {
                    std::cerr << "[warn] could not stop container " << short_id(id) << "\n";
                }
                return finish(failed(FailureKind::EXECUTION_ERROR,
                                     "Container left the running state as '" + st.state + "'", payload));
            }
            return finish(failed(FailureKind::EXECUTION_ERROR,
                                 "Container exited with code " + std::to_string(*st.exit_code), payload));
        }

        if (!wait_next_poll(cancel, started)) {
            const bool was_cancelled = cancel && cancel->cancelled();
            if (!resources_.stop_container(id)) {
                std::cerr << "[warn] could not stop container " << short_id(id) << "\n";
            }
            return finish(failed(FailureKind::EXECUTION_ERROR,
                                 was_cancelled ? "Container run cancelled"
                                               : "Container run timed out after "
                                                 + std::to_string(cfg_.poll_timeout_ms) + "ms"));
        }
    }
}

} // namespace bbhunt
