#include "builtin.h"
#include "bbhunt/json_mini.h"

namespace bbhunt {

namespace {

// Returns its inputs. Used to smoke-test dispatch end to end.
class EchoPlugin : public IPlugin {
public:
    RunResult execute(const std::optional<std::string>& target,
                      const std::string& options_json) override {
        json_mini::Doc opts = json_mini::parse_object(options_json.empty() ? "{}" : options_json);
        if (!opts) return RunResult::error("Invalid options: expected a JSON object");

        json_mini::Doc out(json_object_new_object());
        json_object_object_add(out.root, "target", target ? json_mini::new_string(*target) : nullptr);
        json_object_object_add(out.root, "options", opts.release());
        return RunResult::success("echo", json_mini::to_plain(out.root));
    }

    std::vector<OptionSpec> cli_options() const override {
        return {{"message", "input", "Text to echo back", ""}};
    }
};

IPlugin* create_echo() { return new EchoPlugin(); }

} // namespace

void register_echo_plugin(IPluginRegistrar& host) {
    PluginDesc d;
    d.name = "echo";
    d.category = kCategoryUtility;
    d.description = "Echo the target and options back as the payload";
    d.resources.memory = "10MB";
    d.resources.cpu = "0.1";
    d.resources.disk = "1MB";
    host.register_plugin(d, &create_echo);
}

} // namespace bbhunt
