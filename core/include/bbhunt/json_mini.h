#pragma once

// json_mini.h
//
// Thin RAII + accessor layer over json-c. Options, payloads, the key/value
// store file, target metadata and container inspect output all pass through
// here.

#include <json-c/json.h>

#include <algorithm>
#include <climits>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace bbhunt::json_mini {

// Owns one reference to a json_object.
struct Doc {
    json_object* root{nullptr};

    Doc() = default;
    explicit Doc(json_object* r) : root(r) {}
    Doc(const Doc&) = delete;
    Doc& operator=(const Doc&) = delete;

    Doc(Doc&& other) noexcept : root(other.root) { other.root = nullptr; }
    Doc& operator=(Doc&& other) noexcept {
        if (this != &other) {
            if (root) json_object_put(root);
            root = other.root;
            other.root = nullptr;
        }
        return *this;
    }

    ~Doc() {
        if (root) json_object_put(root);
    }

    explicit operator bool() const { return root != nullptr; }

    // Hand the reference to the caller (e.g. json_object_object_add).
    json_object* release() {
        json_object* r = root;
        root = nullptr;
        return r;
    }
};

// Parse a complete document. Returns an empty Doc on any tokener error.
inline Doc parse(const std::string& json) {
    json_tokener* tok = json_tokener_new();
    if (!tok) return Doc{};
    json_object* obj = json_tokener_parse_ex(tok, json.c_str(),
        static_cast<int>(std::min(json.size(), static_cast<size_t>(INT_MAX))));
    json_tokener_error jerr = json_tokener_get_error(tok);
    json_tokener_free(tok);
    if (jerr != json_tokener_success) {
        if (obj) json_object_put(obj);
        return Doc{};
    }
    return Doc{obj};
}

// Parse and require a JSON object at the top level.
inline Doc parse_object(const std::string& json) {
    Doc d = parse(json);
    if (!d || !json_object_is_type(d.root, json_type_object)) return Doc{};
    return d;
}

inline std::string to_plain(json_object* o) {
    if (!o) return "null";
    return json_object_to_json_string_ext(o, JSON_C_TO_STRING_PLAIN);
}

inline std::string quote(const std::string& s) {
    json_object* o = json_object_new_string_len(s.c_str(), (int)s.size());
    if (!o) return "\"\"";
    std::string out = json_object_to_json_string_ext(o, JSON_C_TO_STRING_PLAIN);
    json_object_put(o);
    return out;
}

inline json_object* member(json_object* o, const char* key) {
    if (!o || !json_object_is_type(o, json_type_object)) return nullptr;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, key, &v)) return nullptr;
    return v;
}

inline std::optional<std::string> get_string(json_object* o, const char* key) {
    json_object* v = member(o, key);
    if (!v || !json_object_is_type(v, json_type_string)) return std::nullopt;
    return std::string(json_object_get_string(v));
}

inline std::optional<int64_t> get_int(json_object* o, const char* key) {
    json_object* v = member(o, key);
    if (!v || !json_object_is_type(v, json_type_int)) return std::nullopt;
    return static_cast<int64_t>(json_object_get_int64(v));
}

inline std::optional<double> get_number(json_object* o, const char* key) {
    json_object* v = member(o, key);
    if (!v) return std::nullopt;
    if (!(json_object_is_type(v, json_type_double) || json_object_is_type(v, json_type_int))) return std::nullopt;
    return json_object_get_double(v);
}

inline std::optional<bool> get_bool(json_object* o, const char* key) {
    json_object* v = member(o, key);
    if (!v || !json_object_is_type(v, json_type_boolean)) return std::nullopt;
    return json_object_get_boolean(v) != 0;
}

inline std::vector<std::string> get_array_strings(json_object* o, const char* key) {
    std::vector<std::string> out;
    json_object* arr = member(o, key);
    if (!arr || !json_object_is_type(arr, json_type_array)) return out;
    const size_t n = json_object_array_length(arr);
    out.reserve(n);
    for (size_t i = 0; i < n; i++) {
        json_object* el = json_object_array_get_idx(arr, static_cast<int>(i));
        if (el && json_object_is_type(el, json_type_string)) {
            out.emplace_back(json_object_get_string(el));
        }
    }
    return out;
}

inline json_object* new_string(const std::string& s) {
    return json_object_new_string_len(s.c_str(), (int)s.size());
}

inline json_object* new_string_array(const std::vector<std::string>& items) {
    json_object* arr = json_object_new_array();
    for (const auto& s : items) json_object_array_add(arr, new_string(s));
    return arr;
}

} // namespace bbhunt::json_mini
