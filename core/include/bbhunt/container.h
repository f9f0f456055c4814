#pragma once

#include "bbhunt/proc.h"

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace bbhunt {

struct ContainerLimits {
    int64_t memory_mb{0}; // 0 = no limit
    double cpus{0.0};     // 0 = no limit
};

struct ContainerSpec {
    std::string image;
    std::vector<std::string> command;
    std::map<std::string, std::string> volumes;     // host path -> container path
    std::map<std::string, std::string> environment;
    ContainerLimits limits;
};

// Runtime view of one container. state is the runtime's own word
// ("created", "running", "exited", "dead", ...) or "not_found".
struct ContainerStatus {
    std::string state;
    std::string logs;              // bounded tail
    std::optional<int> exit_code;  // only for terminal states
};

constexpr const char* kStateNotFound = "not_found";

// exited, dead and not_found end a monitoring loop.
bool container_state_terminal(const std::string& state);

// Executes one runtime command. Swappable so tests can script the runtime.
using CommandRunner = std::function<bool(const std::vector<std::string>& argv,
                                         const ProcLimits& lim,
                                         ProcResult* res)>;

// Narrow docker-compatible command surface:
//   info | run -d | inspect | logs --tail N | stop
// base_cmd is the runtime invocation, e.g. {"docker"} or {"sudo", "podman"}.
class ContainerRuntime {
public:
    explicit ContainerRuntime(std::vector<std::string> base_cmd = {"docker"},
                              CommandRunner runner = {});

    // Parses a quoted command line such as "sudo docker".
    static ContainerRuntime fromCommandLine(const std::string& cmd, CommandRunner runner = {});

    // `info` exits 0.
    bool probe() const;

    std::vector<std::string> buildRunArgv(const ContainerSpec& spec) const;

    // Returns the container id. Throws DispatchError on non-zero exit.
    std::string runDetached(const ContainerSpec& spec) const;

    // std::nullopt when the runtime does not know the id.
    // Throws DispatchError when inspect output cannot be parsed.
    std::optional<ContainerStatus> inspect(const std::string& id) const;

    // Empty string when logs cannot be fetched.
    std::string logsTail(const std::string& id, int lines) const;

    bool stop(const std::string& id) const;

    const std::vector<std::string>& baseCommand() const { return base_cmd_; }

private:
    bool exec(const std::vector<std::string>& args, int timeout_ms, ProcResult* res) const;

    std::vector<std::string> base_cmd_;
    CommandRunner runner_;
};

} // namespace bbhunt
