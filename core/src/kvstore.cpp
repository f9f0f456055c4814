#include "bbhunt/kvstore.h"
#include "bbhunt/json_mini.h"

#include <fstream>
#include <iostream>
#include <sstream>
#include <utility>

namespace bbhunt {

std::string MemoryStore::get(const std::string& key, const std::string& defv) const {
    auto it = values_.find(key);
    return it == values_.end() ? defv : it->second;
}

void MemoryStore::set(const std::string& key, const std::string& value) {
    values_[key] = value;
}

JsonFileStore::JsonFileStore(std::filesystem::path path) : path_(std::move(path)) {
    std::ifstream f(path_);
    if (!f) return;
    std::stringstream ss;
    ss << f.rdbuf();

    json_mini::Doc doc = json_mini::parse_object(ss.str());
    if (!doc) {
        std::cerr << "[config] ignoring unreadable store " << path_ << "\n";
        return;
    }
    json_object_object_foreach(doc.root, k, v) {
        if (json_object_is_type(v, json_type_string)) {
            values_[k] = json_object_get_string(v);
        } else {
            values_[k] = json_mini::to_plain(v);
        }
    }
}

std::string JsonFileStore::get(const std::string& key, const std::string& defv) const {
    auto it = values_.find(key);
    return it == values_.end() ? defv : it->second;
}

void JsonFileStore::set(const std::string& key, const std::string& value) {
    values_[key] = value;
    std::string err;
    if (!save(&err)) {
        std::cerr << "[config] could not save " << path_ << ": " << err << "\n";
    }
}

// Write to a sibling temp file, then rename over the target.
bool JsonFileStore::save(std::string* err) const {
    json_mini::Doc root(json_object_new_object());
    for (const auto& kv : values_) {
        json_object_object_add(root.root, kv.first.c_str(), json_mini::new_string(kv.second));
    }
    const std::string body = json_object_to_json_string_ext(root.root, JSON_C_TO_STRING_PRETTY);

    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            if (err) *err = ec.message();
            return false;
        }
    }

    auto tmp = path_;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::out | std::ios::trunc);
        if (!out) {
            if (err) *err = "cannot open " + tmp.string();
            return false;
        }
        out << body << "\n";
        if (!out.good()) {
            if (err) *err = "write failed: " + tmp.string();
            return false;
        }
    }
    std::filesystem::rename(tmp, path_, ec);
    if (ec) {
        if (err) *err = ec.message();
        return false;
    }
    return true;
}

} // namespace bbhunt
