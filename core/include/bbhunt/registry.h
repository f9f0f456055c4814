#pragma once
#include "bbhunt/plugin_api.h"
#include "bbhunt/plugin_loader.h"

#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace bbhunt {

using PluginFactory = std::function<std::unique_ptr<IPlugin>()>;

struct PluginEntry {
    PluginDesc desc;
    PluginFactory create;
    std::string source; // registration source label or shared object path
};

// category -> name -> entry. Ordered so two discoveries compare equal.
using CategoryMap = std::map<std::string, PluginEntry>;
using Catalog = std::map<std::string, CategoryMap>;

// A built-in registration function (explicit enrollment, no reflection).
using RegistrationFn = std::function<void(IPluginRegistrar&)>;

// Registry of plugin implementations. Nothing is cached between calls: every
// discover()/resolve() rebuilds the catalog from the registration sources and
// the plugin directory, so a plugin dropped into the directory is visible on
// the next call.
class PluginRegistry {
public:
    PluginRegistry() = default;
    explicit PluginRegistry(std::filesystem::path plugin_dir);

    void addSource(std::string label, RegistrationFn fn);
    void setPluginDir(const std::filesystem::path& dir) { plugin_dir_ = dir; }
    const std::filesystem::path& pluginDir() const { return plugin_dir_; }

    // Build a fresh catalog. A source or library that fails is logged and
    // skipped; the remaining ones are still enrolled.
    Catalog discover();

    // Fresh discovery, then first exact name match across categories.
    std::optional<PluginEntry> resolve(const std::string& name);

    // Problems seen by the most recent discover().
    const std::vector<std::string>& lastErrors() const { return last_errors_; }

private:
    struct Source {
        std::string label;
        RegistrationFn fn;
    };

    std::vector<Source> sources_;
    std::filesystem::path plugin_dir_;
    PluginManager loader_;
    std::vector<std::string> last_errors_;
};

// Keep only one category (empty = all).
Catalog filter_catalog(const Catalog& catalog, const std::string& category);

// Descriptor-only JSON view: {"<category>":{"<name>":{...}}}.
std::string catalog_to_json(const Catalog& catalog);

} // namespace bbhunt
