#include "bbhunt/resources.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>

namespace bbhunt {

static std::string trim_upper(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace((unsigned char)s[b])) b++;
    while (e > b && std::isspace((unsigned char)s[e - 1])) e--;
    std::string out = s.substr(b, e - b);
    for (auto& c : out) c = (char)std::toupper((unsigned char)c);
    return out;
}

static bool ends_with(const std::string& s, const char* suf) {
    const size_t n = std::char_traits<char>::length(suf);
    return s.size() >= n && s.compare(s.size() - n, n, suf) == 0;
}

// Whole-string float parse. Rejects "", "12abc", "nan", "inf".
static bool parse_number(const std::string& s, double* out) {
    if (s.empty()) return false;
    const char* begin = s.c_str();
    char* end = nullptr;
    double v = std::strtod(begin, &end);
    if (end == begin) return false;
    while (*end && std::isspace((unsigned char)*end)) end++;
    if (*end != '\0') return false;
    if (!std::isfinite(v)) return false;
    *out = v;
    return true;
}

int64_t parse_size_mb(const std::string& text) {
    const std::string s = trim_upper(text);

    // Two-letter suffixes must be tried before their one-letter prefixes.
    struct Unit { const char* suffix; double to_mb; };
    static const Unit kUnits[] = {
        {"GB", 1024.0},
        {"G",  1024.0},
        {"MB", 1.0},
        {"M",  1.0},
        {"KB", 1.0 / 1024.0},
        {"K",  1.0 / 1024.0},
    };

    double factor = 1.0;
    std::string num = s;
    for (const auto& u : kUnits) {
        if (ends_with(s, u.suffix)) {
            num = s.substr(0, s.size() - std::char_traits<char>::length(u.suffix));
            factor = u.to_mb;
            break;
        }
    }

    double v = 0.0;
    if (!parse_number(num, &v) || v < 0.0) return kFallbackSizeMb;
    return (int64_t)(v * factor);
}

double parse_cpu_cores(const std::string& text, double defv) {
    const std::string s = trim_upper(text);
    double v = 0.0;
    if (!parse_number(s, &v) || v < 0.0) return defv;
    return v;
}

bool parse_flag(const std::string& text, bool defv) {
    std::string s = trim_upper(text);
    if (s.empty()) return defv;
    return s == "1" || s == "TRUE" || s == "YES" || s == "ON";
}

ResourceRequirement parse_requirement(const ResourceDecl& decl) {
    ResourceRequirement r;
    r.memory_mb = decl.memory.empty() ? kDefaultMemoryMb : parse_size_mb(decl.memory);
    r.cpu_cores = parse_cpu_cores(decl.cpu, kDefaultCpuCores);
    r.disk_mb = decl.disk.empty() ? kDefaultDiskMb : parse_size_mb(decl.disk);
    r.network = parse_flag(decl.network, false);
    return r;
}

std::string format_mb(int64_t mb) {
    return std::to_string(std::max<int64_t>(mb, 0)) + "MB";
}

} // namespace bbhunt
