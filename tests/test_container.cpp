#include "test_common.h"
#include "test_fakes.h"
#include "bbhunt/container.h"
#include "bbhunt/errors.h"
#include "bbhunt/resource_manager.h"

#include <algorithm>

using namespace bbhunt;

static bool has_pair(const std::vector<std::string>& argv, const std::string& flag, const std::string& value) {
    for (size_t i = 0; i + 1 < argv.size(); i++) {
        if (argv[i] == flag && argv[i + 1] == value) return true;
    }
    return false;
}

int main() {
    // Test 1: run argv layout
    {
        ContainerRuntime rt({"sudo", "docker"});
        ContainerSpec spec;
        spec.image = "bbhunt:latest";
        spec.command = {"bbhunt_cli", "standalone", "echo"};
        spec.volumes["/srv/data"] = "/app/data";
        spec.environment["BBHUNT_MODE"] = "standalone";
        spec.limits.memory_mb = 500;
        spec.limits.cpus = 1.5;

        auto a = rt.buildRunArgv(spec);
        expect_eq_str(a[0], "run", "run first");
        expect_eq_str(a[1], "-d", "detached");
        expect_true(has_pair(a, "-v", "/srv/data:/app/data"), "volume");
        expect_true(has_pair(a, "-e", "BBHUNT_MODE=standalone"), "environment");
        expect_true(has_pair(a, "--memory", "500m"), "memory limit");
        expect_true(has_pair(a, "--cpus", "1.5"), "cpu limit");
        auto img = std::find(a.begin(), a.end(), "bbhunt:latest");
        expect_true(img != a.end(), "image present");
        expect_eq_str(*(img + 1), "bbhunt_cli", "command follows image");
        expect_eq_str(a.back(), "echo", "command last");

        ContainerSpec bare;
        bare.image = "x";
        auto b = rt.buildRunArgv(bare);
        expect_true(std::find(b.begin(), b.end(), "--memory") == b.end(), "no memory flag when unlimited");
    }

    // Test 2: Base command from a quoted command line
    {
        auto rt = ContainerRuntime::fromCommandLine("sudo 'docker'");
        expect_eq_ll((long long)rt.baseCommand().size(), 2, "two tokens");
        expect_eq_str(rt.baseCommand()[1], "docker", "quotes stripped");
        expect_eq_str(ContainerRuntime::fromCommandLine("").baseCommand()[0], "docker", "empty -> docker");
    }

    // Test 3: Launch takes the last output line as the id; failure throws
    {
        auto s = std::make_shared<fakes::RuntimeScript>();
        s->run_output = "Unable to find image locally\nPulling...\n  deadbeef0001  \n\n";
        auto rt = fakes::scripted_runtime(s);
        ContainerSpec spec;
        spec.image = "bbhunt:latest";
        expect_eq_str(rt.runDetached(spec), "deadbeef0001", "id after pull progress");
        expect_eq_str(s->calls.back()[0], "docker", "base command prefix");

        s->run_fails = true;
        bool threw = false;
        try {
            rt.runDetached(spec);
        } catch (const DispatchError& e) {
            threw = true;
            expect_true(std::string(e.what()).find("no such image") != std::string::npos,
                        "runtime text carried: " + std::string(e.what()));
        }
        expect_true(threw, "non-zero exit throws DispatchError");
    }

    // Test 4: inspect parsing
    {
        auto s = std::make_shared<fakes::RuntimeScript>();
        auto rt = fakes::scripted_runtime(s);

        s->states = {"running"};
        auto st = rt.inspect("abc");
        expect_true(st.has_value(), "running container");
        expect_eq_str(st->state, "running", "state");
        expect_true(!st->exit_code.has_value(), "no exit code while running");

        s->states = {"exited"};
        s->exit_code = 3;
        st = rt.inspect("abc");
        expect_true(st && st->exit_code && *st->exit_code == 3, "exit code for exited");

        s->states = {"not_found"};
        expect_true(!rt.inspect("abc").has_value(), "unknown id");

        s->states = {"running"};
        s->inspect_garbage = true;
        bool threw = false;
        try {
            rt.inspect("abc");
        } catch (const DispatchError&) {
            threw = true;
        }
        expect_true(threw, "unparseable inspect throws");
    }

    // Test 5: Manager status adds the log tail and maps unknown ids
    {
        auto state = std::make_shared<fakes::ProbeState>();
        auto s = std::make_shared<fakes::RuntimeScript>();
        ResourceManager rm(ResourceCeilings{}, std::make_unique<fakes::FakeProbe>(state),
                           fakes::scripted_runtime(s), ".", 7);
        expect_true(rm.containerAvailable(), "runtime available");

        s->states = {"exited"};
        s->exit_code = 0;
        ContainerStatus st = rm.get_container_status("abc");
        expect_eq_str(st.state, "exited", "exited");
        expect_eq_str(st.logs, "line1\nline2\n", "log tail");
        expect_true(has_pair(s->calls.back(), "--tail", "7"), "configured tail length");

        s->states = {"not_found"};
        st = rm.get_container_status("gone");
        expect_eq_str(st.state, kStateNotFound, "not_found state");
        expect_true(container_state_terminal(st.state), "not_found is terminal");
        expect_true(!container_state_terminal("running"), "running is not terminal");
        expect_true(!container_state_terminal("created"), "created is not terminal");
        expect_true(container_state_terminal("paused"), "paused ends the poll");
        expect_true(container_state_terminal("restarting"), "restarting ends the poll");

        expect_true(rm.stop_container("abc"), "stop");
        expect_eq_ll(s->stop_calls, 1, "stop issued");
    }

    std::cerr << "test_container: ALL PASSED" << std::endl;
    return 0;
}
