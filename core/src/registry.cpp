#include "bbhunt/registry.h"
#include "bbhunt/json_mini.h"

#include <iostream>
#include <stdexcept>
#include <unordered_set>

namespace bbhunt {

namespace {

// Collects registrations into one catalog, enforcing descriptor rules.
class CatalogRegistrar : public IPluginRegistrar {
public:
    CatalogRegistrar(Catalog& catalog, std::vector<std::string>& errors)
        : catalog_(catalog), errors_(errors) {}

    void setSource(const std::string& source) { source_ = source; }

    void register_plugin(const PluginDesc& desc, PluginCreateFn create) override {
        if (desc.name.empty() || desc.name == kDefaultPluginName) {
            reject(desc, "missing or default plugin name");
            return;
        }
        if (desc.category.empty()) {
            reject(desc, "missing category");
            return;
        }
        if (!create) {
            reject(desc, "null factory");
            return;
        }
        if (!names_.insert(desc.name).second) {
            reject(desc, "duplicate plugin name (first registration wins)");
            return;
        }

        PluginEntry e;
        e.desc = desc;
        e.create = [create]() { return std::unique_ptr<IPlugin>(create()); };
        e.source = source_;
        catalog_[desc.category][desc.name] = std::move(e);
    }

private:
    void reject(const PluginDesc& desc, const std::string& why) {
        errors_.push_back(source_ + ": rejected '" + desc.name + "': " + why);
    }

    Catalog& catalog_;
    std::vector<std::string>& errors_;
    std::unordered_set<std::string> names_;
    std::string source_;
};

} // namespace

PluginRegistry::PluginRegistry(std::filesystem::path plugin_dir)
    : plugin_dir_(std::move(plugin_dir)) {}

void PluginRegistry::addSource(std::string label, RegistrationFn fn) {
    if (!fn) return;
    sources_.push_back({std::move(label), std::move(fn)});
}

Catalog PluginRegistry::discover() {
    Catalog catalog;
    std::vector<std::string> errors;
    CatalogRegistrar registrar(catalog, errors);

    for (const auto& s : sources_) {
        registrar.setSource(s.label);
        try {
            s.fn(registrar);
        } catch (const std::exception& e) {
            errors.push_back(s.label + ": registration failed: " + e.what());
        }
    }

    if (!plugin_dir_.empty()) {
        registrar.setSource(plugin_dir_.string());
        loader_.register_from_dir(plugin_dir_, &registrar, &errors);
    }

    for (const auto& e : errors) {
        std::cerr << "[registry] " << e << "\n";
    }
    last_errors_ = std::move(errors);
    return catalog;
}

std::optional<PluginEntry> PluginRegistry::resolve(const std::string& name) {
    Catalog catalog = discover();
    for (auto& kv : catalog) {
        auto it = kv.second.find(name);
        if (it != kv.second.end()) return std::move(it->second);
    }
    return std::nullopt;
}

Catalog filter_catalog(const Catalog& catalog, const std::string& category) {
    if (category.empty()) return catalog;
    Catalog out;
    auto it = catalog.find(category);
    if (it != catalog.end()) out[it->first] = it->second;
    return out;
}

std::string catalog_to_json(const Catalog& catalog) {
    json_mini::Doc root(json_object_new_object());
    for (const auto& cat : catalog) {
        json_object* plugins = json_object_new_object();
        for (const auto& kv : cat.second) {
            const PluginDesc& d = kv.second.desc;
            json_object* o = json_object_new_object();
            json_object_object_add(o, "category", json_mini::new_string(d.category));
            json_object_object_add(o, "description", json_mini::new_string(d.description));
            json_object_object_add(o, "version", json_mini::new_string(d.version));
            json_object_object_add(o, "dependencies", json_mini::new_string_array(d.dependencies));

            json_object* res = json_object_new_object();
            json_object_object_add(res, "memory", json_mini::new_string(d.resources.memory));
            json_object_object_add(res, "cpu", json_mini::new_string(d.resources.cpu));
            json_object_object_add(res, "disk", json_mini::new_string(d.resources.disk));
            json_object_object_add(res, "network", json_mini::new_string(d.resources.network));
            json_object_object_add(o, "resources", res);

            json_object_object_add(plugins, kv.first.c_str(), o);
        }
        json_object_object_add(root.root, cat.first.c_str(), plugins);
    }
    return json_mini::to_plain(root.root);
}

} // namespace bbhunt
