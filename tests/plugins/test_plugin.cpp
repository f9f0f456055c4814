#include "bbhunt/plugin_api.h"

using namespace bbhunt;

namespace {

// Wraps its options in {"echo":...}; no bbhunt_core symbols needed.
class TestEchoPlugin : public IPlugin {
public:
    RunResult execute(const std::optional<std::string>& target,
                      const std::string& options_json) override {
        std::string payload = "{\"echo\":" + (options_json.empty() ? std::string("{}") : options_json);
        if (target) payload += ",\"target\":\"" + *target + "\"";
        payload += "}";
        return RunResult::success("test echo", payload);
    }
};

IPlugin* create_test_echo() { return new TestEchoPlugin(); }

} // namespace

extern "C" int bbhunt_plugin_abi_version() {
    return BBHUNT_ABI_VERSION;
}

extern "C" void bbhunt_plugin_init(IPluginRegistrar* host) {
    PluginDesc d;
    d.name = "test_echo";
    d.category = kCategoryUtility;
    d.description = "Echo options from a shared object";
    d.resources.memory = "1MB";
    d.resources.cpu = "0.01";
    d.resources.disk = "0";
    host->register_plugin(d, &create_test_echo);

    PluginDesc r = d;
    r.name = "test_recon";
    r.category = "recon";
    host->register_plugin(r, &create_test_echo);
}
