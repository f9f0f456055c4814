#include "builtin.h"
#include "bbhunt/resource_manager.h"
#include "bbhunt/sysprobe.h"

#include <cstdlib>

namespace bbhunt {

namespace {

// One system snapshot as payload. Inside a container this reports the
// container's own view of the host.
class ResourceReportPlugin : public IPlugin {
public:
    RunResult execute(const std::optional<std::string>&, const std::string&) override {
        const char* host = std::getenv("BBHUNT_NET_PROBE_HOST");
        LinuxSystemProbe probe(host && *host ? host : "8.8.8.8");

        ResourceSnapshot snap;
        snap.memory = probe.memory();
        snap.cpu = probe.cpu();
        snap.disk = probe.disk(".");
        return RunResult::success("Resource snapshot", snapshot_to_json(snap));
    }
};

IPlugin* create_resource_report() { return new ResourceReportPlugin(); }

} // namespace

void register_resource_report_plugin(IPluginRegistrar& host) {
    PluginDesc d;
    d.name = "resource_report";
    d.category = kCategoryUtility;
    d.description = "Report memory, CPU and disk availability";
    d.resources.memory = "10MB";
    d.resources.cpu = "0.1";
    d.resources.disk = "0";
    host.register_plugin(d, &create_resource_report);
}

} // namespace bbhunt
