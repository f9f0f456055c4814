#include "test_common.h"
#include "test_fakes.h"
#include "bbhunt/errors.h"
#include "bbhunt/resource_manager.h"

#include <unistd.h>

using namespace bbhunt;

static ResourceSnapshot snapshot(double avail_mb, int cores, double busy_pct, double free_disk_mb) {
    ResourceSnapshot s;
    s.memory.total_mb = avail_mb * 2;
    s.memory.available_mb = avail_mb;
    s.cpu.cores = cores;
    s.cpu.percent = busy_pct;
    s.disk.free_mb = free_disk_mb;
    return s;
}

static ResourceRequirement req(int64_t mem, double cpu, int64_t disk, bool net) {
    ResourceRequirement r;
    r.memory_mb = mem;
    r.cpu_cores = cpu;
    r.disk_mb = disk;
    r.network = net;
    return r;
}

int main() {
    const ResourceCeilings ceilings{4096, 4.0};
    int probes = 0;
    auto net_up = [&probes]() { probes++; return true; };
    auto net_down = [&probes]() { probes++; return false; };

    // Test 1: Small requirement is admitted
    {
        auto v = evaluate_requirement(req(10, 0.1, 1, false), snapshot(4096, 4, 0, 50000), ceilings, net_up);
        expect_true(v.admitted, "echo_ok should be admitted");
        expect_eq_str(v.reason, "Sufficient resources available", "success reason");
        expect_eq_ll(probes, 0, "network not probed when not required");
    }

    // Test 2: Memory shortfall, message format
    {
        auto v = evaluate_requirement(req(102400, 0.1, 1, false), snapshot(4096, 4, 0, 50000), ceilings, net_up);
        expect_true(!v.admitted, "100GB should be denied");
        expect_eq_str(v.reason, "Not enough memory. Required: 102400MB, Available: 4096.0MB", "memory reason");
    }

    // Test 3: Memory ceiling caps availability
    {
        ResourceCeilings small{512, 4.0};
        auto v = evaluate_requirement(req(1024, 0.1, 1, false), snapshot(8192, 4, 0, 50000), small, net_up);
        expect_true(!v.admitted, "ceiling should deny");
        expect_eq_str(v.reason, "Not enough memory. Required: 1024MB, Available: 512.0MB", "ceiling reason");
    }

    // Test 4: CPU is checked after memory; memory failure wins
    {
        auto v = evaluate_requirement(req(102400, 16, 1, false), snapshot(4096, 4, 0, 50000), ceilings, net_up);
        expect_true(v.reason.rfind("Not enough memory", 0) == 0, "first failing dimension is memory");

        v = evaluate_requirement(req(10, 3, 1, false), snapshot(4096, 4, 50, 50000), ceilings, net_up);
        expect_true(!v.admitted, "3 cores on a half-busy 4-core host");
        expect_eq_str(v.reason, "Not enough CPU. Required: 3 cores, Available: 2.0 cores", "cpu reason");

        ResourceCeilings one_core{4096, 1.0};
        v = evaluate_requirement(req(10, 1.5, 1, false), snapshot(4096, 8, 0, 50000), one_core, net_up);
        expect_true(!v.admitted, "cpu ceiling caps availability");
    }

    // Test 5: Disk only checked when requested
    {
        auto v = evaluate_requirement(req(10, 0.1, 200, false), snapshot(4096, 4, 0, 100), ceilings, net_up);
        expect_true(!v.admitted, "disk shortfall");
        expect_eq_str(v.reason, "Not enough disk space. Required: 200MB, Available: 100.0MB", "disk reason");

        v = evaluate_requirement(req(10, 0.1, 0, false), snapshot(4096, 4, 0, 0), ceilings, net_up);
        expect_true(v.admitted, "zero disk requirement skips the check");
    }

    // Test 6: Network probed last and only when required
    {
        probes = 0;
        auto v = evaluate_requirement(req(102400, 0.1, 1, true), snapshot(4096, 4, 0, 50000), ceilings, net_down);
        expect_eq_ll(probes, 0, "network not probed after an earlier failure");

        v = evaluate_requirement(req(10, 0.1, 1, true), snapshot(4096, 4, 0, 50000), ceilings, net_down);
        expect_true(!v.admitted, "network down");
        expect_eq_str(v.reason, "Network connectivity check failed", "network reason");
        expect_eq_ll(probes, 1, "probed once");

        v = evaluate_requirement(req(10, 0.1, 1, true), snapshot(4096, 4, 0, 50000), ceilings, net_up);
        expect_true(v.admitted, "network up");
    }

    // Test 7: ResourceManager over a fake probe
    {
        auto state = std::make_shared<fakes::ProbeState>();
        auto script = std::make_shared<fakes::RuntimeScript>();
        script->available = false;
        ResourceManager rm(ceilings, std::make_unique<fakes::FakeProbe>(state), fakes::scripted_runtime(script));

        expect_true(!rm.containerAvailable(), "runtime probe failed");
        expect_true(rm.check_resources(req(10, 0.1, 1, false)).admitted, "fake host admits small run");
        expect_true(!rm.check_resources(req(102400, 0.1, 1, false)).admitted, "fake host denies 100GB");

        state->memory.available_mb = 0;
        expect_true(!rm.check_resources(req(10, 0.1, 1, false)).admitted, "fresh snapshot on each check");

        bool threw = false;
        try {
            rm.run_in_container(ContainerSpec{});
        } catch (const CapabilityError&) {
            threw = true;
        }
        expect_true(threw, "run_in_container without runtime throws CapabilityError");

        threw = false;
        try {
            rm.get_container_status("abc");
        } catch (const CapabilityError&) {
            threw = true;
        }
        expect_true(threw, "get_container_status without runtime throws CapabilityError");
        expect_true(!rm.stop_container("abc"), "stop without runtime is a no-op");
    }

    // Test 8: Tracked processes and lazy cleanup
    {
        auto state = std::make_shared<fakes::ProbeState>();
        auto script = std::make_shared<fakes::RuntimeScript>();
        ResourceManager rm(ceilings, std::make_unique<fakes::FakeProbe>(state), fakes::scripted_runtime(script));

        state->processes[100] = {42.0, 12.5};
        rm.track_process(100, "alive", req(10, 0.1, 1, false));
        rm.track_process(200, "gone", req(10, 0.1, 1, false));
        expect_eq_ll((long long)rm.tracked_count(), 2, "two tracked");

        ResourceSnapshot s = rm.get_resource_usage();
        expect_eq_ll((long long)s.processes.size(), 1, "dead pid not reported");
        expect_true(s.processes.count(100) == 1, "live pid reported");
        expect_eq_str(s.processes[100].name, "alive", "tracked name");
        expect_true(s.processes[100].memory_mb == 42.0, "rss from probe");
        expect_true(s.processes[100].runtime_s >= 0.0, "runtime non-negative");
        expect_eq_ll((long long)rm.tracked_count(), 1, "dead pid dropped during the query");

        rm.untrack_process(100);
        expect_eq_ll((long long)rm.tracked_count(), 0, "untracked");
        rm.untrack_process(100);
        expect_eq_ll((long long)rm.tracked_count(), 0, "untrack is idempotent");
    }

    // Test 9: The real probe reads this process
    {
        LinuxSystemProbe probe;
        auto mem = probe.memory();
        expect_true(mem.total_mb > 0, "host memory readable");
        auto self = probe.process((int)::getpid());
        expect_true(self.has_value(), "own pid visible");
        expect_true(!probe.process(-1).has_value(), "invalid pid");
        expect_true(probe.cpu().cores >= 1, "at least one core");
    }

    std::cerr << "test_admission: ALL PASSED" << std::endl;
    return 0;
}
