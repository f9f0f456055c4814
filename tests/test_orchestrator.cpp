#include "test_common.h"
#include "test_fakes.h"
#include "bbhunt/json_mini.h"
#include "bbhunt/orchestrator.h"

#include <fstream>
#include <stdexcept>
#include <thread>

using namespace bbhunt;
namespace fs = std::filesystem;

namespace {

fakes::Calls g_calls;
fakes::Behavior g_behavior = fakes::Behavior::SUCCEED;
std::optional<std::string> g_last_target;
bool g_cleanup_throws = false;

class ScriptedPlugin : public IPlugin {
public:
    void setup() override { g_calls.setup++; }
    RunResult execute(const std::optional<std::string>& target, const std::string& options_json) override {
        g_calls.execute++;
        g_last_target = target;
        switch (g_behavior) {
            case fakes::Behavior::FAIL: return RunResult::error("scripted failure");
            case fakes::Behavior::THROW: throw std::runtime_error("scripted throw");
            case fakes::Behavior::THROW_OTHER: throw 42;
            case fakes::Behavior::SUCCEED: break;
        }
        return RunResult::success("done", "{\"options\":" + options_json + "}");
    }
    void cleanup() override {
        g_calls.cleanup++;
        if (g_cleanup_throws) throw "cleanup exploded";
    }
};

IPlugin* create_scripted() { return new ScriptedPlugin(); }

PluginDesc make_desc(const std::string& name, const std::string& category,
                     const std::string& mem, const std::string& cpu,
                     const std::string& disk, const std::string& net) {
    PluginDesc d;
    d.name = name;
    d.category = category;
    d.resources = ResourceDecl{mem, cpu, disk, net};
    return d;
}

void register_scenarios(IPluginRegistrar& host) {
    host.register_plugin(make_desc("echo_ok", kCategoryUtility, "10MB", "0.1", "1MB", "false"), &create_scripted);
    host.register_plugin(make_desc("hungry", kCategoryUtility, "100GB", "0.1", "1MB", "false"), &create_scripted);
    host.register_plugin(make_desc("recon_ok", "recon", "10MB", "0.1", "1MB", "false"), &create_scripted);
    host.register_plugin(make_desc("needs_net", "recon", "10MB", "0.1", "1MB", "true"), &create_scripted);
}

struct Harness {
    std::shared_ptr<fakes::ProbeState> probe = std::make_shared<fakes::ProbeState>();
    std::shared_ptr<fakes::RuntimeScript> runtime = std::make_shared<fakes::RuntimeScript>();
    PluginRegistry registry;
    MemoryStore store;
    EventLog log;
    CoreConfig cfg;
    std::unique_ptr<ResourceManager> rm;
    std::unique_ptr<Orchestrator> orch;

    Harness(bool container, const std::string& log_path = "") : log(log_path) {
        runtime->available = container;
        registry.addSource("scenarios", &register_scenarios);
        cfg.max_memory_mb = 4096;
        cfg.max_cpu = 4;
        cfg.poll_interval_ms = 1;
        cfg.poll_timeout_ms = 0;
        cfg.container_fallback = false;
        cfg.data_dir = "/tmp/bbhunt-data";
        rm = std::make_unique<ResourceManager>(ResourceCeilings{cfg.max_memory_mb, cfg.max_cpu},
                                               std::make_unique<fakes::FakeProbe>(probe),
                                               fakes::scripted_runtime(runtime));
        orch = std::make_unique<Orchestrator>(registry, *rm, store, log, cfg);
    }

    // Rebuild the orchestrator after changing cfg.
    void reconfigure() { orch = std::make_unique<Orchestrator>(registry, *rm, store, log, cfg); }
};

void reset() {
    g_calls = fakes::Calls{};
    g_behavior = fakes::Behavior::SUCCEED;
    g_last_target.reset();
    g_cleanup_throws = false;
}

bool argv_has(const std::vector<std::string>& argv, const std::string& s) {
    for (const auto& a : argv) if (a == s) return true;
    return false;
}

} // namespace

int main() {
    // Test 1: echo_ok runs locally
    {
        reset();
        Harness h(false);
        expect_true(h.orch->check("echo_ok").admitted, "echo_ok admitted");
        expect_eq_str(h.orch->check("echo_ok").reason, "Sufficient resources available", "admission reason");

        RunResult r = h.orch->run("echo_ok", std::nullopt, "{\"k\":\"v\"}");
        expect_true(r.ok(), "echo_ok succeeds: " + r.message);
        expect_true(r.status == RunStatus::SUCCESS, "status success");
        expect_true(r.failure == FailureKind::NONE, "no failure kind");
        expect_true(r.phase == RunPhase::COMPLETED, "completed");
        expect_true(r.dispatch == DispatchMode::LOCAL, "local dispatch");
        expect_eq_str(r.payload_json, "{\"options\":{\"k\":\"v\"}}", "payload passed through");
        expect_eq_ll(g_calls.setup, 1, "setup once");
        expect_eq_ll(g_calls.execute, 1, "execute once");
        expect_eq_ll(g_calls.cleanup, 1, "cleanup once");
        expect_true(!g_last_target.has_value(), "utility gets no target");
        expect_eq_ll((long long)h.rm->tracked_count(), 0, "untracked after the run");
    }

    // Test 2: hungry is denied without a container runtime; execute never runs
    {
        reset();
        Harness h(false);
        AdmissionVerdict v = h.orch->check("hungry");
        expect_true(!v.admitted, "hungry denied");
        expect_true(v.reason.rfind("Not enough memory", 0) == 0, "memory reason: " + v.reason);

        RunResult r = h.orch->run("hungry");
        expect_true(!r.ok(), "hungry fails");
        expect_true(r.failure == FailureKind::ADMISSION_DENIED, "admission denied");
        expect_eq_str(r.message, v.reason, "reason carried into the result");
        expect_eq_ll(g_calls.execute, 0, "execute never invoked");
        expect_eq_ll(g_calls.cleanup, 0, "nothing to clean up");
    }

    // Test 3: Unknown plugin
    {
        reset();
        Harness h(false);
        RunResult r = h.orch->run("nonexistent");
        expect_true(!r.ok(), "not found fails");
        expect_true(r.failure == FailureKind::NOT_FOUND, "NOT_FOUND");
        expect_eq_str(r.message, "Plugin 'nonexistent' not found", "not found message");
        AdmissionVerdict v = h.orch->check("nonexistent");
        expect_true(!v.admitted, "check on unknown plugin");
        expect_eq_str(v.reason, "Plugin 'nonexistent' not found", "check message");
    }

    // Test 4: cleanup exactly once on error status and on throw
    {
        reset();
        Harness h(false);
        g_behavior = fakes::Behavior::FAIL;
        RunResult r = h.orch->run("echo_ok");
        expect_true(!r.ok(), "error status propagates");
        expect_true(r.failure == FailureKind::EXECUTION_ERROR, "EXECUTION_ERROR on error status");
        expect_eq_str(r.message, "scripted failure", "plugin message kept");
        expect_eq_ll(g_calls.cleanup, 1, "cleanup after error status");

        g_behavior = fakes::Behavior::THROW;
        r = h.orch->run("echo_ok");
        expect_true(!r.ok(), "throw becomes a failed result");
        expect_true(r.failure == FailureKind::EXECUTION_ERROR, "EXECUTION_ERROR on throw");
        expect_true(r.message.find("scripted throw") != std::string::npos, "exception text: " + r.message);
        expect_true(r.phase == RunPhase::FAILED, "failed phase");
        expect_eq_ll(g_calls.cleanup, 2, "cleanup after throw");
        expect_eq_ll(g_calls.execute, 2, "two executes");
        expect_eq_ll((long long)h.rm->tracked_count(), 0, "untracked after a throw");

        g_behavior = fakes::Behavior::THROW_OTHER;
        r = h.orch->run("echo_ok");
        expect_true(!r.ok(), "non-std throw becomes a failed result");
        expect_true(r.failure == FailureKind::EXECUTION_ERROR, "EXECUTION_ERROR on non-std throw");
        expect_eq_str(r.message, "Error executing plugin: unknown exception", "non-std throw message");
        expect_eq_ll(g_calls.cleanup, 3, "cleanup after non-std throw");

        g_behavior = fakes::Behavior::SUCCEED;
        g_cleanup_throws = true;
        r = h.orch->run("echo_ok");
        expect_true(r.ok(), "a throwing cleanup does not change the result: " + r.message);
        expect_eq_ll(g_calls.cleanup, 4, "cleanup ran once more");
        expect_eq_ll((long long)h.rm->tracked_count(), 0, "untracked after a throwing cleanup");
    }

    // Test 5: Target selection and persistence
    {
        reset();
        Harness h(false);
        RunResult r = h.orch->run("recon_ok");
        expect_true(r.failure == FailureKind::NO_TARGET, "no target selected");
        expect_eq_str(r.message, "No target selected", "no target message");
        expect_eq_ll(g_calls.execute, 0, "not executed without a target");

        r = h.orch->run("recon_ok", std::string("example.com"));
        expect_true(r.ok(), "explicit target");
        expect_true(g_last_target && *g_last_target == "example.com", "target passed to execute");
        expect_eq_str(h.store.get(kCurrentTargetKey), "example.com", "target persisted");

        r = h.orch->run("recon_ok");
        expect_true(r.ok(), "stored target reused");
        expect_true(g_last_target && *g_last_target == "example.com", "stored target passed");
    }

    // Test 6: Network requirement
    {
        reset();
        Harness h(false);
        h.probe->network = false;
        RunResult r = h.orch->run("needs_net", std::string("example.com"));
        expect_true(r.failure == FailureKind::ADMISSION_DENIED, "network down denies");
        expect_eq_str(r.message, "Network connectivity check failed", "network message");
    }

    // Test 7: Fallback to a container via config, then exit code mapping
    {
        reset();
        Harness h(true);
        h.cfg.container_fallback = true;
        h.reconfigure();
        h.runtime->states = {"created", "running", "exited"};
        h.runtime->exit_code = 0;

        RunResult r = h.orch->run("hungry", std::nullopt, "{\"deep\":true}");
        expect_true(r.ok(), "container run succeeds: " + r.message);
        expect_true(r.dispatch == DispatchMode::CONTAINER, "container dispatch");
        expect_eq_ll(g_calls.execute, 0, "not executed in-process");
        expect_eq_ll((long long)h.runtime->inspect_calls, 3, "polled until terminal");

        std::vector<std::string> run_argv;
        for (const auto& c : h.runtime->calls) {
            if (c.size() > 1 && c[1] == "run") run_argv = c;
        }
        expect_true(!run_argv.empty(), "run issued");
        expect_true(argv_has(run_argv, "bbhunt:latest"), "image from config");
        expect_true(argv_has(run_argv, "standalone"), "standalone entry point");
        expect_true(argv_has(run_argv, "{\"deep\":true}"), "options forwarded");
        expect_true(argv_has(run_argv, "BBHUNT_MODE=standalone"), "mode env");
        expect_true(argv_has(run_argv, "/tmp/bbhunt-data:/app/data"), "data volume");
        expect_true(argv_has(run_argv, "BBHUNT_DATA_DIR=/app/data"), "data dir env points at the mount");
        expect_true(argv_has(run_argv, "102400m"), "memory limit from declaration");

        json_mini::Doc p = json_mini::parse_object(r.payload_json);
        expect_true((bool)p, "payload json");
        expect_eq_ll(json_mini::get_int(p.root, "exit_code").value_or(-1), 0, "exit code in payload");

        reset();
        h.runtime->inspect_calls = 0;
        h.runtime->states = {"exited"};
        h.runtime->exit_code = 2;
        r = h.orch->run("hungry");
        expect_true(!r.ok(), "non-zero exit fails");
        expect_true(r.failure == FailureKind::EXECUTION_ERROR, "EXECUTION_ERROR for exit 2");
        expect_eq_str(r.message, "Container exited with code 2", "exit code message");
    }

    // Test 8: Fallback declined by the caller
    {
        reset();
        Harness h(true);
        h.cfg.container_fallback = true;
        h.reconfigure();
        int asked = 0;
        RunRequest req;
        req.name = "hungry";
        req.confirm_fallback = [&asked](const PluginDesc& d, const AdmissionVerdict& v) {
            asked++;
            expect_eq_str(d.name, "hungry", "descriptor passed to the prompt");
            expect_true(!v.admitted, "verdict passed to the prompt");
            return false;
        };
        RunResult r = h.orch->run(req);
        expect_eq_ll(asked, 1, "asked once");
        expect_true(r.failure == FailureKind::ADMISSION_DENIED, "declined fallback is a denial");
    }

    // Test 9: Forced container without a runtime
    {
        reset();
        Harness h(false);
        RunRequest req;
        req.name = "echo_ok";
        req.force_container = true;
        RunResult r = h.orch->run(req);
        expect_true(r.failure == FailureKind::CAPABILITY_UNAVAILABLE, "capability unavailable");
        expect_eq_ll(g_calls.execute, 0, "not executed");
    }

    // Test 10: Launch failure and vanished container
    {
        reset();
        Harness h(true);
        RunRequest req;
        req.name = "echo_ok";
        req.force_container = true;

        h.runtime->run_fails = true;
        RunResult r = h.orch->run(req);
        expect_true(r.failure == FailureKind::DISPATCH_ERROR, "launch failure");
        expect_true(r.message.find("Failed to start container") != std::string::npos, "launch message");

        h.runtime->run_fails = false;
        h.runtime->states = {"running", "not_found"};
        r = h.orch->run(req);
        expect_true(r.failure == FailureKind::DISPATCH_ERROR, "container vanished");

        // Any state other than created/running ends the poll.
        h.runtime->inspect_calls = 0;
        h.runtime->states = {"running", "paused"};
        h.runtime->exit_code = 0;
        r = h.orch->run(req);
        expect_true(!r.ok(), "paused container fails the run");
        expect_true(r.failure == FailureKind::EXECUTION_ERROR, "EXECUTION_ERROR for paused");
        expect_eq_ll((long long)h.runtime->inspect_calls, 2, "polling stopped at paused");
        expect_eq_str(r.message, "Container left the running state as 'paused'", "paused message");
    }

    // Test 11: Poll timeout and cancellation stop the container
    {
        reset();
        Harness h(true);
        h.cfg.poll_timeout_ms = 30;
        h.reconfigure();
        h.runtime->states = {"running"};

        RunRequest req;
        req.name = "echo_ok";
        req.force_container = true;
        RunResult r = h.orch->run(req);
        expect_true(!r.ok(), "timeout fails");
        expect_true(r.message.find("timed out") != std::string::npos, "timeout message: " + r.message);
        expect_eq_ll(h.runtime->stop_calls, 1, "container stopped on timeout");

        h.cfg.poll_timeout_ms = 0;
        h.cfg.poll_interval_ms = 5000;
        h.reconfigure();
        CancelToken token;
        req.cancel = &token;
        std::thread canceller([&token]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            token.cancel();
        });
        r = h.orch->run(req);
        canceller.join();
        expect_true(!r.ok(), "cancel fails the run");
        expect_eq_str(r.message, "Container run cancelled", "cancel message");
        expect_true(r.elapsed_ms < 5000, "cancel observed before the next poll");
        expect_eq_ll(h.runtime->stop_calls, 2, "container stopped on cancel");
    }

    // Test 12: Event log records the state machine
    {
        reset();
        fs::path dir = fresh_temp_dir("bbhunt_test_orch");
        const std::string path = (dir / "events.jsonl").string();
        setenv("BBHUNT_DETERMINISTIC_RUN_ID", "1", 1);
        const std::string fixed_id = gen_run_id();
        {
            Harness h(false, path);
            h.orch->run("echo_ok");
            h.orch->run("nonexistent");
        }
        unsetenv("BBHUNT_DETERMINISTIC_RUN_ID");
        expect_eq_ll((long long)fixed_id.size(), 32, "run id is 32 hex chars");
        expect_true(gen_run_id() != gen_run_id(), "random run ids differ");
        std::ifstream in(path);
        std::string line;
        std::vector<std::string> events;
        long long last_seq = 0;
        while (std::getline(in, line)) {
            json_mini::Doc d = json_mini::parse_object(line);
            expect_true((bool)d, "event line is a JSON object: " + line);
            events.push_back(json_mini::get_string(d.root, "event").value_or(""));
            long long seq = json_mini::get_int(d.root, "seq").value_or(0);
            expect_true(seq > last_seq, "seq increases");
            last_seq = seq;
            expect_eq_str(json_mini::get_string(d.root, "run_id").value_or(""), fixed_id, "stable run_id");
            expect_true(line.find("{\"event\":") == 0, "keys sorted");
        }
        expect_true(!events.empty(), "events written");
        expect_eq_str(events.front(), "run_start", "first event");
        expect_eq_str(events.back(), "run_end", "last event");
        bool saw_admission = false, saw_local = false;
        for (const auto& e : events) {
            if (e == "admission") saw_admission = true;
            if (e == "dispatch_local") saw_local = true;
        }
        expect_true(saw_admission && saw_local, "admission and dispatch recorded");
        fs::remove_all(dir);
    }

    // Test 13: Catalog listing through the orchestrator
    {
        Harness h(false);
        Catalog all = h.orch->list_plugins();
        expect_eq_ll((long long)all.size(), 2, "utility + recon");
        Catalog recon = h.orch->list_plugins("recon");
        expect_eq_ll((long long)recon["recon"].size(), 2, "two recon plugins");
        expect_true(h.orch->resource_usage().memory.available_mb == 4096, "usage from probe");
    }

    std::cerr << "test_orchestrator: ALL PASSED" << std::endl;
    return 0;
}
