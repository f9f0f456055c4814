#include "runner_utils.h"
#include "plugins/builtin/builtin.h"

#include "bbhunt/config.h"
#include "bbhunt/context.h"

#include <iostream>
#include <string>

int main(int argc, char** argv) {
    using namespace bbhunt;
    if (argc < 2) {
        std::cerr << "bbhunt_cli <plugins|run|check|resources|targets|target|standalone> ...\n";
        return 2;
    }

    apply_profile_defaults(detect_profile());

    std::unique_ptr<Context> ctx;
    try {
        ctx = make_default_context({NamedSource("builtin", &register_builtin_plugins)});
    } catch (const std::exception& e) {
        std::cerr << "[bbhunt] startup failed: " << e.what() << "\n";
        return 1;
    }

    const std::string cmd = argv[1];
    if (cmd == "plugins") return cmd_plugins(*ctx, argc, argv);
    if (cmd == "run") return cmd_run(*ctx, argc, argv);
    if (cmd == "standalone") return cmd_standalone(*ctx, argc, argv);
    if (cmd == "check") return cmd_check(*ctx, argc, argv);
    if (cmd == "resources") return cmd_resources(*ctx, argc, argv);
    if (cmd == "targets") return cmd_targets(*ctx, argc, argv);
    if (cmd == "target") return cmd_target(*ctx, argc, argv);
    std::cerr << "unknown command: " << cmd << "\n";
    return 2;
}
