#pragma once

#include "bbhunt/context.h"
#include "bbhunt/types.h"

#include <optional>
#include <string>

namespace bbhunt {

// Flags shared by `run` and `standalone`.
struct RunArgs {
    std::string plugin;
    std::optional<std::string> target;
    std::string options_json{"{}"};
    bool options_given{false};
    bool container{false};
};

// argv[2] is the plugin name; then -t/--target, -o/--options, -c/--container.
// Returns false (after printing why) on malformed input.
bool parse_run_args(int argc, char** argv, int first, RunArgs* out);

// True for a JSON object text.
bool is_json_object(const std::string& s);

// Yes/no prompt on stdin; empty answer picks defv.
bool prompt_yes_no(const std::string& question, bool defv);

bool stdin_is_tty();

void print_result(const RunResult& r);

int cmd_plugins(Context& ctx, int argc, char** argv);
int cmd_run(Context& ctx, int argc, char** argv);
int cmd_standalone(Context& ctx, int argc, char** argv);
int cmd_check(Context& ctx, int argc, char** argv);
int cmd_resources(Context& ctx, int argc, char** argv);
int cmd_targets(Context& ctx, int argc, char** argv);
int cmd_target(Context& ctx, int argc, char** argv);

} // namespace bbhunt
