#include "bbhunt/targets.h"
#include "bbhunt/json_mini.h"
#include "bbhunt/log.h"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <utility>

namespace fs = std::filesystem;

namespace bbhunt {

TargetStore::TargetStore(fs::path data_dir) : root_(std::move(data_dir) / "targets") {}

bool TargetStore::valid_domain(const std::string& domain) {
    if (domain.empty() || domain.size() > 253) return false;
    if (domain == "." || domain == ".." || domain[0] == '.') return false;
    for (unsigned char c : domain) {
        if (c == '/' || c == '\\' || c < 0x20 || c == 0x7f) return false;
    }
    return true;
}

fs::path TargetStore::target_dir(const std::string& domain) const {
    return root_ / domain;
}

bool TargetStore::has_target(const std::string& domain) const {
    if (!valid_domain(domain)) return false;
    std::error_code ec;
    return fs::is_directory(target_dir(domain), ec);
}

bool TargetStore::add_target(const std::string& domain, std::string* err,
                             const std::string& notes,
                             const std::vector<std::string>& scope) {
    if (!valid_domain(domain)) {
        if (err) *err = "invalid target name: '" + domain + "'";
        return false;
    }
    if (has_target(domain)) {
        if (err) *err = "Target '" + domain + "' already exists";
        return false;
    }

    const fs::path dir = target_dir(domain);
    std::error_code ec;
    for (const char* sub : kTargetSubdirs) {
        fs::create_directories(dir / sub, ec);
        if (ec) {
            if (err) *err = "cannot create " + (dir / sub).string() + ": " + ec.message();
            return false;
        }
    }

    json_mini::Doc meta(json_object_new_object());
    json_object_object_add(meta.root, "domain", json_mini::new_string(domain));
    json_object_object_add(meta.root, "added", json_mini::new_string(iso_now()));
    json_object_object_add(meta.root, "notes", json_mini::new_string(notes));
    json_object_object_add(meta.root, "scope", json_mini::new_string_array(scope));

    std::ofstream out(dir / "metadata.json", std::ios::out | std::ios::trunc);
    if (!out) {
        if (err) *err = "cannot write " + (dir / "metadata.json").string();
        return false;
    }
    out << json_object_to_json_string_ext(meta.root, JSON_C_TO_STRING_PRETTY) << "\n";
    if (!out.good()) {
        if (err) *err = "write failed: " + (dir / "metadata.json").string();
        return false;
    }
    return true;
}

std::vector<std::string> TargetStore::list_targets() const {
    std::vector<std::string> out;
    std::error_code ec;
    if (!fs::is_directory(root_, ec)) return out;
    for (const auto& e : fs::directory_iterator(root_, ec)) {
        if (e.is_directory(ec)) out.push_back(e.path().filename().string());
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::optional<TargetMetadata> TargetStore::load_metadata(const std::string& domain) const {
    if (!has_target(domain)) return std::nullopt;
    std::ifstream f(target_dir(domain) / "metadata.json");
    if (!f) return std::nullopt;
    std::stringstream ss;
    ss << f.rdbuf();

    json_mini::Doc doc = json_mini::parse_object(ss.str());
    if (!doc) return std::nullopt;

    TargetMetadata m;
    m.domain = json_mini::get_string(doc.root, "domain").value_or(domain);
    m.added = json_mini::get_string(doc.root, "added").value_or("");
    m.notes = json_mini::get_string(doc.root, "notes").value_or("");
    m.scope = json_mini::get_array_strings(doc.root, "scope");
    return m;
}

} // namespace bbhunt
