#pragma once

#include "bbhunt/container.h"
#include "bbhunt/resources.h"
#include "bbhunt/sysprobe.h"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <string>

namespace bbhunt {

// Upper bounds this process may hand out, whatever the host has free.
struct ResourceCeilings {
    int64_t max_memory_mb{4096};
    double max_cpu{1.0};
};

struct TrackedProcess {
    int pid{0};
    std::string name;
    ResourceRequirement requirement;
    std::chrono::system_clock::time_point start_time;
};

struct ProcessUsage {
    std::string name;
    double memory_mb{0};
    double cpu_percent{0};
    double runtime_s{0};
};

// Point-in-time read; recomputed on every query.
struct ResourceSnapshot {
    MemoryUsage memory;
    CpuUsage cpu;
    DiskUsage disk;
    std::map<int, ProcessUsage> processes; // pid -> live usage of tracked runs
};

struct AdmissionVerdict {
    bool admitted{false};
    std::string reason;
};

constexpr const char* kAdmissionOk = "Sufficient resources available";

// Pure admission rule. Dimensions are checked memory -> CPU -> disk ->
// network and the first failure is returned on its own; network_probe is only
// called when every other dimension passed and the requirement asks for it.
AdmissionVerdict evaluate_requirement(const ResourceRequirement& req,
                                      const ResourceSnapshot& snap,
                                      const ResourceCeilings& ceilings,
                                      const std::function<bool()>& network_probe);

std::string snapshot_to_json(const ResourceSnapshot& snap);

// Queries live availability, admits work, dispatches containers and tracks
// local runs. Not thread-safe: one admission + dispatch at a time per
// instance.
class ResourceManager {
public:
    ResourceManager(ResourceCeilings ceilings,
                    std::unique_ptr<ISystemProbe> probe,
                    ContainerRuntime runtime,
                    std::filesystem::path work_volume = ".",
                    int log_tail_lines = 10);

    const ResourceCeilings& ceilings() const { return ceilings_; }

    // Probed once at construction.
    bool containerAvailable() const { return container_available_; }

    AdmissionVerdict check_resources(const ResourceRequirement& req);

    // Throws CapabilityError without a runtime, DispatchError on launch failure.
    std::string run_in_container(const ContainerSpec& spec);

    // Unknown id maps to state "not_found". Throws CapabilityError without a
    // runtime and DispatchError on unreadable inspect output.
    ContainerStatus get_container_status(const std::string& id);

    // Best effort.
    bool stop_container(const std::string& id);

    void track_process(int pid, const std::string& name, const ResourceRequirement& req);
    void untrack_process(int pid);
    size_t tracked_count() const { return active_.size(); }

    // Drops tracked pids that can no longer be inspected.
    ResourceSnapshot get_resource_usage();

private:
    ResourceSnapshot system_snapshot();

    ResourceCeilings ceilings_;
    std::unique_ptr<ISystemProbe> probe_;
    ContainerRuntime runtime_;
    std::filesystem::path work_volume_;
    int log_tail_lines_;
    bool container_available_{false};
    std::map<int, TrackedProcess> active_;
};

} // namespace bbhunt
