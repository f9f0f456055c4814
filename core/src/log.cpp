#include "bbhunt/log.h"
#include "bbhunt/json_mini.h"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>
#include <vector>

namespace bbhunt {

std::string iso_now() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

// Recursively serialize with sorted object keys.
static void canonical_serialize(json_object* obj, std::ostringstream& out) {
    if (!obj) { out << "null"; return; }

    switch (json_object_get_type(obj)) {
    case json_type_object: {
        std::vector<std::string> keys;
        json_object_object_foreach(obj, k, v) {
            (void)v;
            keys.emplace_back(k);
        }
        std::sort(keys.begin(), keys.end());

        out << "{";
        for (size_t i = 0; i < keys.size(); i++) {
            if (i > 0) out << ",";
            out << json_mini::quote(keys[i]) << ":";
            canonical_serialize(json_mini::member(obj, keys[i].c_str()), out);
        }
        out << "}";
        break;
    }
    case json_type_array: {
        out << "[";
        const size_t len = json_object_array_length(obj);
        for (size_t i = 0; i < len; i++) {
            if (i > 0) out << ",";
            canonical_serialize(json_object_array_get_idx(obj, static_cast<int>(i)), out);
        }
        out << "]";
        break;
    }
    default:
        out << json_object_to_json_string_ext(obj, JSON_C_TO_STRING_PLAIN);
        break;
    }
}

std::string canonicalize_json(const std::string& raw) {
    json_mini::Doc doc = json_mini::parse(raw);
    if (!doc) return raw;
    std::ostringstream out;
    canonical_serialize(doc.root, out);
    return out.str();
}

EventLog::EventLog(const std::string& path) : path_(path) {
    if (path_.empty()) return;
    out_.open(path_, std::ios::out | std::ios::app);
    if (!out_) {
        std::cerr << "[log] cannot open event log " << path_ << "\n";
    }
}

void EventLog::event(const std::string& run_id, const std::string& name, const std::string& payload_json) {
    if (!out_.is_open()) return;

    json_mini::Doc rec(json_object_new_object());
    json_object_object_add(rec.root, "event", json_mini::new_string(name));

    json_mini::Doc payload = json_mini::parse(payload_json);
    json_object_object_add(rec.root, "payload",
        payload ? payload.release() : json_mini::new_string(payload_json));

    json_object_object_add(rec.root, "run_id", json_mini::new_string(run_id));
    json_object_object_add(rec.root, "seq", json_object_new_int64(static_cast<int64_t>(++seq_)));
    json_object_object_add(rec.root, "ts", json_mini::new_string(iso_now()));

    std::ostringstream line;
    canonical_serialize(rec.root, line);
    out_ << line.str() << "\n";
    out_.flush();
}

std::string gen_run_id() {
    const char* det = std::getenv("BBHUNT_DETERMINISTIC_RUN_ID");

    uint64_t seed = 0;
    if (det && std::string(det) == "1") {
        seed = 1234567ULL;
    } else {
        uint64_t t = (uint64_t)std::chrono::high_resolution_clock::now().time_since_epoch().count();
        uint64_t r = 0;
        try {
            std::random_device rd;
            r = ((uint64_t)rd() << 32) ^ (uint64_t)rd();
        } catch (const std::exception&) {
            r = 0x9e3779b97f4a7c15ULL;
        }
        seed = t ^ r;
    }

    std::mt19937_64 rng{seed};
    uint64_t a = rng();
    uint64_t b = rng();
    std::ostringstream oss;
    oss << std::hex << std::setw(16) << std::setfill('0') << a
        << std::setw(16) << std::setfill('0') << b;
    return oss.str();
}

} // namespace bbhunt
