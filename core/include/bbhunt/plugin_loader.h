#pragma once

#include <filesystem>
#include <string>
#include <unordered_map>
#include <vector>

#include "bbhunt/plugin_api.h"

namespace bbhunt {

// Loads shared objects that export bbhunt_plugin_init(...).
// Handles stay mapped for the process lifetime: plugin objects created from a
// library must never outlive it.
class PluginManager {
public:
    PluginManager() = default;
    PluginManager(const PluginManager&) = delete;
    PluginManager& operator=(const PluginManager&) = delete;
    ~PluginManager();

    // Load one plugin (or reuse the already-mapped handle) and run its init
    // function against registrar. Returns false on failure (err is filled).
    bool load_plugin(const std::filesystem::path& path,
                     IPluginRegistrar* registrar,
                     std::string* err);

    // Run every shared object in dir (non-recursive, sorted by filename)
    // against registrar. A failing library is reported in errors and skipped.
    // Returns the number of libraries whose init ran.
    size_t register_from_dir(const std::filesystem::path& dir,
                             IPluginRegistrar* registrar,
                             std::vector<std::string>* errors);

    bool is_loaded(const std::filesystem::path& path) const;
    size_t loaded_count() const { return handles_.size(); }

private:
    struct Handle {
        std::string canonical;
        void* handle{nullptr};
        bbhunt_plugin_init_fn init{nullptr};
    };

    bool run_init(const Handle& h, IPluginRegistrar* registrar, std::string* err);

    std::vector<Handle> handles_;
    std::unordered_map<std::string, size_t> by_path_;
};

} // namespace bbhunt
