#include "runner_utils.h"
#include "bbhunt/json_mini.h"

#include <iostream>
#include <memory>

namespace bbhunt {

// Prompts for each interactive option; only used when no -o was given.
static std::string prompt_options(const PluginEntry& entry) {
    std::unique_ptr<IPlugin> probe = entry.create();
    if (!probe) return "{}";
    auto specs = probe->interactive_options();
    if (specs.empty()) return "{}";

    json_mini::Doc opts(json_object_new_object());
    for (const auto& o : specs) {
        if (o.type == "confirm") {
            const bool defv = o.default_value == "true" || o.default_value == "y";
            json_object_object_add(opts.root, o.name.c_str(),
                json_object_new_boolean(prompt_yes_no(o.message, defv)));
            continue;
        }
        if (o.type != "input") {
            json_object_object_add(opts.root, o.name.c_str(), json_mini::new_string(o.default_value));
            continue;
        }
        std::cout << o.message;
        if (!o.default_value.empty()) std::cout << " [" << o.default_value << "]";
        std::cout << " " << std::flush;
        std::string line;
        if (!std::getline(std::cin, line) || line.empty()) line = o.default_value;
        json_object_object_add(opts.root, o.name.c_str(), json_mini::new_string(line));
    }
    return json_mini::to_plain(opts.root);
}

int cmd_run(Context& ctx, int argc, char** argv) {
    RunArgs args;
    if (!parse_run_args(argc, argv, 2, &args)) {
        std::cerr << "usage: bbhunt_cli run <plugin> [-t target] [-o json] [-c]\n";
        return 2;
    }

    RunRequest req;
    req.name = args.plugin;
    req.target = args.target;
    req.options_json = args.options_json;
    req.force_container = args.container;

    const bool interactive = stdin_is_tty();
    if (interactive) {
        if (!args.options_given) {
            if (auto entry = ctx.registry().resolve(args.plugin)) {
                try {
                    req.options_json = prompt_options(*entry);
                } catch (const std::exception& e) {
                    std::cerr << "[warn] could not read options for '" << args.plugin << "': " << e.what() << "\n";
                }
            }
        }
        req.confirm_fallback = [](const PluginDesc&, const AdmissionVerdict& v) {
            std::cout << "Insufficient resources: " << v.reason << "\n";
            return prompt_yes_no("Run in a container instead?", true);
        };
    }

    RunResult r = ctx.orchestrator().run(req);
    print_result(r);
    return r.ok() ? 0 : 1;
}

// Entry point inside the container: no admission, payload JSON on stdout.
int cmd_standalone(Context& ctx, int argc, char** argv) {
    RunArgs args;
    if (!parse_run_args(argc, argv, 2, &args)) {
        std::cerr << "usage: bbhunt_cli standalone <plugin> [-t target] [-o json]\n";
        return 2;
    }

    RunRequest req;
    req.name = args.plugin;
    req.target = args.target;
    req.options_json = args.options_json;
    req.skip_admission = true;

    RunResult r = ctx.orchestrator().run(req);
    std::cerr << "[standalone] " << args.plugin << ": " << runstatus_to_str(r.status)
              << " - " << r.message << "\n";
    std::cout << r.payload_json << "\n";
    return r.ok() ? 0 : 1;
}

int cmd_check(Context& ctx, int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: bbhunt_cli check <plugin>\n";
        return 2;
    }
    AdmissionVerdict v = ctx.orchestrator().check(argv[2]);
    std::cout << (v.admitted ? "OK: " : "DENIED: ") << v.reason << "\n";
    return v.admitted ? 0 : 1;
}

} // namespace bbhunt
