#include "runner_utils.h"

#include <iomanip>
#include <iostream>

namespace bbhunt {

int cmd_plugins(Context& ctx, int argc, char** argv) {
    const std::string category = argc >= 3 ? argv[2] : "";
    Catalog cat = ctx.orchestrator().list_plugins(category);
    if (cat.empty()) {
        std::cout << (category.empty() ? "No plugins available.\n"
                                       : "No plugins in category '" + category + "'.\n");
        return 0;
    }
    for (const auto& c : cat) {
        std::cout << c.first << ":\n";
        for (const auto& p : c.second) {
            const PluginDesc& d = p.second.desc;
            const ResourceRequirement r = parse_requirement(d.resources);
            std::cout << "  " << d.name << " v" << d.version << " - " << d.description << "\n"
                      << "      memory " << format_mb(r.memory_mb)
                      << ", cpu " << r.cpu_cores
                      << ", disk " << format_mb(r.disk_mb)
                      << (r.network ? ", network" : "") << "\n";
        }
    }
    for (const auto& e : ctx.registry().lastErrors()) std::cerr << "[registry] " << e << "\n";
    return 0;
}

int cmd_resources(Context& ctx, int, char**) {
    ResourceSnapshot s = ctx.orchestrator().resource_usage();
    const auto& c = ctx.resources().ceilings();
    std::cout << std::fixed << std::setprecision(1)
              << "Memory: " << s.memory.available_mb << "MB available of " << s.memory.total_mb
              << "MB (" << s.memory.percent << "% used, limit " << c.max_memory_mb << "MB)\n"
              << "CPU:    " << s.cpu.cores << " cores, " << s.cpu.percent << "% busy (limit "
              << c.max_cpu << " cores)\n"
              << "Disk:   " << s.disk.free_mb << "MB free of " << s.disk.total_mb
              << "MB (" << s.disk.percent << "% used)\n"
              << "Container runtime: " << (ctx.resources().containerAvailable() ? "available" : "unavailable")
              << "\n";
    if (!s.processes.empty()) {
        std::cout << "Running plugins:\n";
        for (const auto& kv : s.processes) {
            std::cout << "  pid " << kv.first << " " << kv.second.name << ": "
                      << kv.second.memory_mb << "MB, " << kv.second.cpu_percent << "% cpu, "
                      << kv.second.runtime_s << "s\n";
        }
    }
    return 0;
}

int cmd_targets(Context& ctx, int, char**) {
    const std::string current = ctx.store().get(kCurrentTargetKey);
    auto list = ctx.targets().list_targets();
    if (list.empty()) {
        std::cout << "No targets. Add one with: bbhunt_cli target add <domain>\n";
        return 0;
    }
    for (const auto& t : list) {
        std::cout << (t == current ? "* " : "  ") << t << "\n";
    }
    return 0;
}

int cmd_target(Context& ctx, int argc, char** argv) {
    if (argc < 4) {
        std::cerr << "usage: bbhunt_cli target <add|select|show> <domain> [notes]\n";
        return 2;
    }
    const std::string sub = argv[2];
    const std::string domain = argv[3];

    if (sub == "add") {
        std::string err;
        if (!ctx.targets().add_target(domain, &err, argc >= 5 ? argv[4] : "")) {
            std::cerr << err << "\n";
            return 1;
        }
        ctx.store().set(kCurrentTargetKey, domain);
        std::cout << "Added target: " << domain << "\n";
        return 0;
    }
    if (sub == "select") {
        if (!ctx.targets().has_target(domain)) {
            std::cerr << "Target '" << domain << "' not found.\n";
            return 1;
        }
        ctx.store().set(kCurrentTargetKey, domain);
        std::cout << "Selected target: " << domain << "\n";
        return 0;
    }
    if (sub == "show") {
        auto m = ctx.targets().load_metadata(domain);
        if (!m) {
            std::cerr << "Target '" << domain << "' not found.\n";
            return 1;
        }
        std::cout << "domain: " << m->domain << "\n"
                  << "added:  " << m->added << "\n"
                  << "notes:  " << m->notes << "\n"
                  << "scope:  ";
        for (size_t i = 0; i < m->scope.size(); i++) std::cout << (i ? ", " : "") << m->scope[i];
        std::cout << "\n";
        return 0;
    }
    std::cerr << "unknown target command: " << sub << "\n";
    return 2;
}

} // namespace bbhunt
