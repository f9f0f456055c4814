#pragma once

#include <optional>
#include <string>
#include <vector>

namespace bbhunt {

struct ProcLimits {
    int timeout_ms{10000};            // <= 0 disables the timeout
    size_t output_max_bytes{256 * 1024};
};

struct ProcResult {
    int exit_code{127};
    bool timed_out{false};
    bool output_truncated{false};
    std::string output; // stdout+stderr merged
    std::string error;  // internal runner error, not child stderr
};

// Run a process (argv[0] is looked up on PATH), capture stdout+stderr
// (merged) and enforce the timeout by killing the child's process group.
// Returns true if the process was started; exit status is in res.
bool proc_run_capture(const std::vector<std::string>& argv,
                      const std::string& cwd,
                      const ProcLimits& lim,
                      ProcResult* res);

// Split a command string into argv tokens.
// Supports single/double quotes and backslash escaping inside double quotes.
// Returns empty vector on parse error.
std::vector<std::string> split_argv_quoted(const std::string& cmd);

// PATH lookup of an executable name. Names containing '/' are checked as-is.
std::optional<std::string> find_executable(const std::string& name);

} // namespace bbhunt
