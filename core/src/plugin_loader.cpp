#include "bbhunt/plugin_loader.h"

#include <algorithm>
#include <cstdlib>
#include <stdexcept>

#include <dlfcn.h>

namespace bbhunt {

PluginManager::~PluginManager() {
    for (auto& h : handles_) {
        if (!h.handle) continue;
        dlclose(h.handle);
        h.handle = nullptr;
    }
    handles_.clear();
    by_path_.clear();
}

static std::string canonical_str(const std::filesystem::path& p) {
    std::error_code ec;
    auto c = std::filesystem::weakly_canonical(p, ec);
    return ec ? p.string() : c.string();
}

static bool abi_lax() {
    const char* lax = std::getenv("BBHUNT_PLUGIN_ABI_LAX");
    return lax && std::string(lax) == "1";
}

bool PluginManager::is_loaded(const std::filesystem::path& path) const {
    return by_path_.count(canonical_str(path)) > 0;
}

bool PluginManager::run_init(const Handle& h, IPluginRegistrar* registrar, std::string* err) {
    // init crosses a library boundary; a throwing plugin must not take the
    // rest of discovery down with it.
    try {
        h.init(registrar);
    } catch (const std::exception& e) {
        if (err) *err = "bbhunt_plugin_init threw for " + h.canonical + ": " + e.what();
        return false;
    }
    return true;
}

bool PluginManager::load_plugin(const std::filesystem::path& path,
                                IPluginRegistrar* registrar,
                                std::string* err) {
    if (!registrar) {
        if (err) *err = "registrar is null";
        return false;
    }

    auto canonical = canonical_str(path);
    auto it = by_path_.find(canonical);
    if (it != by_path_.end()) {
        return run_init(handles_[it->second], registrar, err);
    }

    if (!std::filesystem::exists(path)) {
        if (err) *err = "plugin not found: " + path.string();
        return false;
    }

    void* h = dlopen(path.string().c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!h) {
        const char* dl_err = dlerror();  // call once: dlerror() clears on read
        if (err) *err = std::string("dlopen failed: ") + (dl_err ? dl_err : "(unknown)");
        return false;
    }

    dlerror(); // clear
    auto abi_fn = (bbhunt_plugin_abi_version_fn)dlsym(h, "bbhunt_plugin_abi_version");
    dlerror(); // clear, abi_fn is checked directly
    if (abi_fn) {
        int plugin_abi = abi_fn();
        if (plugin_abi != BBHUNT_ABI_VERSION) {
            if (err) *err = "ABI version mismatch: host=" + std::to_string(BBHUNT_ABI_VERSION)
                          + " plugin=" + std::to_string(plugin_abi)
                          + " for " + path.string();
            dlclose(h);
            return false;
        }
    } else if (!abi_lax()) {
        if (err) *err = "plugin missing bbhunt_plugin_abi_version() export: " + path.string()
                      + " (set BBHUNT_PLUGIN_ABI_LAX=1 to allow)";
        dlclose(h);
        return false;
    }

    dlerror(); // clear
    auto init = (bbhunt_plugin_init_fn)dlsym(h, "bbhunt_plugin_init");
    const char* sym_err = dlerror();
    if (sym_err != nullptr || !init) {
        if (err) *err = std::string("dlsym(bbhunt_plugin_init) failed: ") + (sym_err ? sym_err : "(null)");
        dlclose(h);
        return false;
    }

    handles_.push_back({canonical, h, init});
    by_path_[canonical] = handles_.size() - 1;
    return run_init(handles_.back(), registrar, err);
}

size_t PluginManager::register_from_dir(const std::filesystem::path& dir,
                                        IPluginRegistrar* registrar,
                                        std::vector<std::string>* errors) {
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) return 0;

    std::vector<std::filesystem::path> candidates;
    for (const auto& ent : std::filesystem::directory_iterator(dir, ec)) {
        if (!ent.is_regular_file(ec)) continue;
        auto p = ent.path();
#if defined(__APPLE__)
        if (p.extension() != ".dylib" && p.extension() != ".so") continue;
#else
        if (p.extension() != ".so") continue;
#endif
        candidates.push_back(p);
    }
    std::sort(candidates.begin(), candidates.end());

    size_t ran = 0;
    for (const auto& p : candidates) {
        std::string e;
        if (load_plugin(p, registrar, &e)) {
            ran++;
        } else if (errors) {
            errors->push_back(p.filename().string() + ": " + e);
        }
    }
    return ran;
}

} // namespace bbhunt
