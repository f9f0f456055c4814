#pragma once

// Plugin contract (ABI v1).
//
// Every unit of work implements IPlugin and is enrolled through an
// IPluginRegistrar, either by a built-in registration function linked into
// the host or by a shared object exporting bbhunt_plugin_init(). Plugins do
// not link against bbhunt_core; they only see this header and the headers it
// pulls in.

#include "bbhunt/resources.h"
#include "bbhunt/types.h"

#include <optional>
#include <string>
#include <vector>

// Shared-object plugins must export bbhunt_plugin_abi_version() returning
// this value (unless BBHUNT_PLUGIN_ABI_LAX=1).
#define BBHUNT_ABI_VERSION 1

namespace bbhunt {

// Reserved name of the abstract base; never enrolled.
constexpr const char* kDefaultPluginName = "base_plugin";

constexpr const char* kCategoryUtility = "utility";

// Static metadata attached to a plugin implementation.
struct PluginDesc {
    std::string name;        // registry key, unique
    std::string category;    // "recon", "scan", "exploit", "utility", ...
    std::string description;
    std::string version{"1.0.0"};
    std::vector<std::string> dependencies; // advisory only
    ResourceDecl resources;
};

// Declarative description of one configurable parameter. Only the CLI reads
// these; the orchestrator never does.
struct OptionSpec {
    std::string name;
    std::string type{"input"}; // "input" | "confirm" | "flag"
    std::string message;
    std::string default_value;
};

class IPlugin {
public:
    virtual ~IPlugin() = default;

    // Idempotent. May probe for external tools; reports problems through
    // logging and must not throw.
    virtual void setup() {}

    // target is empty for utility plugins. options_json is a JSON object.
    virtual RunResult execute(const std::optional<std::string>& target,
                              const std::string& options_json) = 0;

    // Runs after every execute(), whatever its outcome.
    virtual void cleanup() {}

    virtual std::vector<OptionSpec> cli_options() const { return {}; }
    virtual std::vector<OptionSpec> interactive_options() const { return {}; }
};

// Factory in C-callable form so shared objects can hand it across the
// boundary. The host takes ownership of the returned object.
using PluginCreateFn = IPlugin* (*)();

// Host callback interface. Registration functions and shared-object init
// functions call register_plugin() once per plugin they provide.
struct IPluginRegistrar {
    virtual ~IPluginRegistrar() = default;
    virtual void register_plugin(const PluginDesc& desc, PluginCreateFn create) = 0;
};

} // namespace bbhunt

// Shared-object entry points (C linkage):
//   extern "C" void bbhunt_plugin_init(bbhunt::IPluginRegistrar* host);
//   extern "C" int  bbhunt_plugin_abi_version();
extern "C" {
    typedef void (*bbhunt_plugin_init_fn)(bbhunt::IPluginRegistrar* host);
    typedef int (*bbhunt_plugin_abi_version_fn)();
}
