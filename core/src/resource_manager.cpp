#include "bbhunt/resource_manager.h"
#include "bbhunt/errors.h"
#include "bbhunt/json_mini.h"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <utility>
#include <vector>

namespace bbhunt {

static std::string fixed1(double v) {
    std::ostringstream o;
    o << std::fixed << std::setprecision(1) << v;
    return o.str();
}

static std::string plain_num(double v) {
    std::ostringstream o;
    o << v;
    return o.str();
}

AdmissionVerdict evaluate_requirement(const ResourceRequirement& req,
                                      const ResourceSnapshot& snap,
                                      const ResourceCeilings& ceilings,
                                      const std::function<bool()>& network_probe) {
    double avail_memory = std::min(snap.memory.available_mb, (double)ceilings.max_memory_mb);
    if ((double)req.memory_mb > avail_memory) {
        return {false, "Not enough memory. Required: " + std::to_string(req.memory_mb)
                       + "MB, Available: " + fixed1(std::max(avail_memory, 0.0)) + "MB"};
    }

    const double cores = (double)snap.cpu.cores;
    double avail_cpu = cores - snap.cpu.percent / 100.0 * cores;
    avail_cpu = std::min(avail_cpu, ceilings.max_cpu);
    if (req.cpu_cores > avail_cpu) {
        return {false, "Not enough CPU. Required: " + plain_num(req.cpu_cores)
                       + " cores, Available: " + fixed1(std::max(avail_cpu, 0.0)) + " cores"};
    }

    if (req.disk_mb > 0 && (double)req.disk_mb > snap.disk.free_mb) {
        return {false, "Not enough disk space. Required: " + std::to_string(req.disk_mb)
                       + "MB, Available: " + fixed1(snap.disk.free_mb) + "MB"};
    }

    if (req.network && !(network_probe && network_probe())) {
        return {false, "Network connectivity check failed"};
    }

    return {true, kAdmissionOk};
}

std::string snapshot_to_json(const ResourceSnapshot& snap) {
    json_mini::Doc root(json_object_new_object());

    json_object* mem = json_object_new_object();
    json_object_object_add(mem, "total", json_object_new_double(snap.memory.total_mb));
    json_object_object_add(mem, "available", json_object_new_double(snap.memory.available_mb));
    json_object_object_add(mem, "used", json_object_new_double(snap.memory.used_mb));
    json_object_object_add(mem, "percent", json_object_new_double(snap.memory.percent));
    json_object_object_add(root.root, "memory", mem);

    json_object* cpu = json_object_new_object();
    json_object_object_add(cpu, "cores", json_object_new_int(snap.cpu.cores));
    json_object_object_add(cpu, "percent", json_object_new_double(snap.cpu.percent));
    json_object_object_add(root.root, "cpu", cpu);

    json_object* disk = json_object_new_object();
    json_object_object_add(disk, "total", json_object_new_double(snap.disk.total_mb));
    json_object_object_add(disk, "free", json_object_new_double(snap.disk.free_mb));
    json_object_object_add(disk, "used", json_object_new_double(snap.disk.used_mb));
    json_object_object_add(disk, "percent", json_object_new_double(snap.disk.percent));
    json_object_object_add(root.root, "disk", disk);

    json_object* procs = json_object_new_object();
    for (const auto& kv : snap.processes) {
        json_object* p = json_object_new_object();
        json_object_object_add(p, "name", json_mini::new_string(kv.second.name));
        json_object_object_add(p, "memory_mb", json_object_new_double(kv.second.memory_mb));
        json_object_object_add(p, "cpu_percent", json_object_new_double(kv.second.cpu_percent));
        json_object_object_add(p, "runtime", json_object_new_double(kv.second.runtime_s));
        json_object_object_add(procs, std::to_string(kv.first).c_str(), p);
    }
    json_object_object_add(root.root, "processes", procs);

    return json_mini::to_plain(root.root);
}

ResourceManager::ResourceManager(ResourceCeilings ceilings,
                                 std::unique_ptr<ISystemProbe> probe,
                                 ContainerRuntime runtime,
                                 std::filesystem::path work_volume,
                                 int log_tail_lines)
    : ceilings_(ceilings),
      probe_(std::move(probe)),
      runtime_(std::move(runtime)),
      work_volume_(std::move(work_volume)),
      log_tail_lines_(log_tail_lines > 0 ? log_tail_lines : 10) {
    if (!probe_) probe_ = std::make_unique<LinuxSystemProbe>();
    container_available_ = runtime_.probe();
}

ResourceSnapshot ResourceManager::system_snapshot() {
    ResourceSnapshot s;
    s.memory = probe_->memory();
    s.cpu = probe_->cpu();
    s.disk = probe_->disk(work_volume_);
    return s;
}

AdmissionVerdict ResourceManager::check_resources(const ResourceRequirement& req) {
    ResourceSnapshot snap = system_snapshot();
    return evaluate_requirement(req, snap, ceilings_, [this]() { return probe_->network_reachable(); });
}

std::string ResourceManager::run_in_container(const ContainerSpec& spec) {
    if (!container_available_) throw CapabilityError("Container runtime is not available");
    return runtime_.runDetached(spec);
}

ContainerStatus ResourceManager::get_container_status(const std::string& id) {
    if (!container_available_) throw CapabilityError("Container runtime is not available");

    auto st = runtime_.inspect(id);
    if (!st) {
        ContainerStatus nf;
        nf.state = kStateNotFound;
        return nf;
    }
    st->logs = runtime_.logsTail(id, log_tail_lines_);
    return *st;
}

bool ResourceManager::stop_container(const std::string& id) {
    if (!container_available_) return false;
    return runtime_.stop(id);
}

void ResourceManager::track_process(int pid, const std::string& name, const ResourceRequirement& req) {
    TrackedProcess tp;
    tp.pid = pid;
    tp.name = name;
    tp.requirement = req;
    tp.start_time = std::chrono::system_clock::now();
    active_[pid] = std::move(tp);
}

void ResourceManager::untrack_process(int pid) {
    active_.erase(pid);
}

ResourceSnapshot ResourceManager::get_resource_usage() {
    ResourceSnapshot snap = system_snapshot();

    const auto now = std::chrono::system_clock::now();
    std::vector<int> gone;
    for (const auto& kv : active_) {
        auto stats = probe_->process(kv.first);
        if (!stats) {
            gone.push_back(kv.first);
            continue;
        }
        ProcessUsage u;
        u.name = kv.second.name;
        u.memory_mb = stats->rss_mb;
        u.cpu_percent = stats->cpu_percent;
        u.runtime_s = std::chrono::duration<double>(now - kv.second.start_time).count();
        snap.processes[kv.first] = u;
    }
    for (int pid : gone) untrack_process(pid);
    return snap;
}

} // namespace bbhunt
