#include "bbhunt/container.h"
#include "bbhunt/errors.h"
#include "bbhunt/json_mini.h"

#include <sstream>
#include <utility>

namespace bbhunt {

static constexpr int kInfoTimeoutMs = 10000;
static constexpr int kRunTimeoutMs = 120000;  // may include an image pull
static constexpr int kInspectTimeoutMs = 10000;
static constexpr int kStopTimeoutMs = 30000;

bool container_state_terminal(const std::string& state) {
    return state != "running" && state != "created";
}

static std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

// `run -d` prints the id last; pull progress may precede it on the merged stream.
static std::string last_nonempty_line(const std::string& out) {
    std::istringstream in(out);
    std::string line, last;
    while (std::getline(in, line)) {
        std::string t = trim(line);
        if (!t.empty()) last = t;
    }
    return last;
}

ContainerRuntime::ContainerRuntime(std::vector<std::string> base_cmd, CommandRunner runner)
    : base_cmd_(std::move(base_cmd)), runner_(std::move(runner)) {
    if (base_cmd_.empty()) base_cmd_ = {"docker"};
    if (!runner_) {
        runner_ = [](const std::vector<std::string>& argv, const ProcLimits& lim, ProcResult* res) {
            return proc_run_capture(argv, "", lim, res);
        };
    }
}

ContainerRuntime ContainerRuntime::fromCommandLine(const std::string& cmd, CommandRunner runner) {
    return ContainerRuntime(split_argv_quoted(cmd), std::move(runner));
}

bool ContainerRuntime::exec(const std::vector<std::string>& args, int timeout_ms, ProcResult* res) const {
    std::vector<std::string> argv = base_cmd_;
    argv.insert(argv.end(), args.begin(), args.end());
    ProcLimits lim;
    lim.timeout_ms = timeout_ms;
    lim.output_max_bytes = 1024 * 1024;
    return runner_(argv, lim, res);
}

bool ContainerRuntime::probe() const {
    ProcResult pr;
    if (!exec({"info"}, kInfoTimeoutMs, &pr)) return false;
    return !pr.timed_out && pr.exit_code == 0;
}

std::vector<std::string> ContainerRuntime::buildRunArgv(const ContainerSpec& spec) const {
    std::vector<std::string> a = {"run", "-d"};
    for (const auto& kv : spec.volumes) {
        a.push_back("-v");
        a.push_back(kv.first + ":" + kv.second);
    }
    for (const auto& kv : spec.environment) {
        a.push_back("-e");
        a.push_back(kv.first + "=" + kv.second);
    }
    if (spec.limits.memory_mb > 0) {
        a.push_back("--memory");
        a.push_back(std::to_string(spec.limits.memory_mb) + "m");
    }
    if (spec.limits.cpus > 0) {
        std::ostringstream c;
        c << spec.limits.cpus;
        a.push_back("--cpus");
        a.push_back(c.str());
    }
    a.push_back(spec.image);
    a.insert(a.end(), spec.command.begin(), spec.command.end());
    return a;
}

std::string ContainerRuntime::runDetached(const ContainerSpec& spec) const {
    if (spec.image.empty()) throw DispatchError("Failed to start container: empty image name");

    ProcResult pr;
    if (!exec(buildRunArgv(spec), kRunTimeoutMs, &pr)) {
        throw DispatchError("Failed to start container: " + pr.error);
    }
    if (pr.timed_out) {
        throw DispatchError("Failed to start container: runtime timed out");
    }
    if (pr.exit_code != 0) {
        throw DispatchError("Failed to start container: " + trim(pr.output));
    }
    std::string id = last_nonempty_line(pr.output);
    if (id.empty()) throw DispatchError("Failed to start container: runtime printed no container id");
    return id;
}

std::optional<ContainerStatus> ContainerRuntime::inspect(const std::string& id) const {
    ProcResult pr;
    if (!exec({"inspect", id}, kInspectTimeoutMs, &pr)) {
        throw DispatchError("inspect failed: " + pr.error);
    }
    if (pr.timed_out) throw DispatchError("inspect timed out for " + id);
    if (pr.exit_code != 0) return std::nullopt;

    json_mini::Doc doc = json_mini::parse(pr.output);
    if (!doc || !json_object_is_type(doc.root, json_type_array) ||
        json_object_array_length(doc.root) == 0) {
        throw DispatchError("unreadable inspect output for " + id + ": " + trim(pr.output));
    }
    json_object* info = json_object_array_get_idx(doc.root, 0);
    json_object* state = json_mini::member(info, "State");
    auto status = json_mini::get_string(state, "Status");
    if (!status) {
        throw DispatchError("inspect output for " + id + " has no State.Status");
    }

    ContainerStatus st;
    st.state = *status;
    if (st.state == "exited" || st.state == "dead") {
        auto code = json_mini::get_int(state, "ExitCode");
        st.exit_code = code ? (int)*code : -1;
    }
    return st;
}

std::string ContainerRuntime::logsTail(const std::string& id, int lines) const {
    ProcResult pr;
    if (!exec({"logs", "--tail", std::to_string(lines > 0 ? lines : 10), id}, kInspectTimeoutMs, &pr)) {
        return "";
    }
    if (pr.timed_out || pr.exit_code != 0) return "";
    return pr.output;
}

bool ContainerRuntime::stop(const std::string& id) const {
    ProcResult pr;
    if (!exec({"stop", id}, kStopTimeoutMs, &pr)) return false;
    return !pr.timed_out && pr.exit_code == 0;
}

} // namespace bbhunt
