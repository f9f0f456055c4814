#include "builtin.h"
#include "bbhunt/config.h"
#include "bbhunt/json_mini.h"
#include "bbhunt/proc.h"
#include "bbhunt/targets.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace bbhunt {

namespace {

constexpr int64_t kDefaultToolTimeoutS = 300;

struct EnumTool {
    const char* name;
    std::vector<std::string> (*argv)(const std::string& domain);
};

std::vector<std::string> subfinder_argv(const std::string& d) {
    return {"subfinder", "-d", d, "-silent"};
}

std::vector<std::string> assetfinder_argv(const std::string& d) {
    return {"assetfinder", "--subs-only", d};
}

const EnumTool kTools[] = {
    {"subfinder", &subfinder_argv},
    {"assetfinder", &assetfinder_argv},
};

std::string lower_trim(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ' || s.back() == '\t')) s.pop_back();
    size_t i = 0;
    while (i < s.size() && (s[i] == ' ' || s[i] == '\t')) i++;
    if (i) s.erase(0, i);
    for (char& c : s) {
        if (c >= 'A' && c <= 'Z') c = (char)(c - 'A' + 'a');
    }
    return s;
}

// Tool output also carries banners and warnings; keep names under domain.
bool is_subdomain_of(const std::string& host, const std::string& domain) {
    if (host.empty() || host.find_first_of(" \t/:") != std::string::npos) return false;
    if (host == domain) return true;
    return host.size() > domain.size() + 1
        && host.compare(host.size() - domain.size(), domain.size(), domain) == 0
        && host[host.size() - domain.size() - 1] == '.';
}

class SubdomainEnumPlugin : public IPlugin {
public:
    void setup() override {
        available_.clear();
        for (const auto& t : kTools) {
            if (find_executable(t.name)) available_.push_back(&t);
        }
        if (available_.empty()) {
            std::cerr << "[subdomain_enum] no enumeration tools found on PATH\n";
        }
    }

    RunResult execute(const std::optional<std::string>& target,
                      const std::string& options_json) override {
        if (!target || target->empty()) return RunResult::error("Target domain required");
        if (available_.empty()) return RunResult::error("No subdomain enumeration tools available");

        json_mini::Doc opts = json_mini::parse_object(options_json.empty() ? "{}" : options_json);
        if (!opts) return RunResult::error("Invalid options: expected a JSON object");
        int64_t timeout_s = json_mini::get_int(opts.root, "timeout").value_or(kDefaultToolTimeoutS);
        if (timeout_s <= 0) timeout_s = kDefaultToolTimeoutS;

        const std::string domain = lower_trim(*target);
        if (!TargetStore::valid_domain(domain)) {
            return RunResult::error("Invalid target domain: '" + *target + "'");
        }
        const TargetStore targets(load_core_config().data_dir);
        const fs::path out_dir = targets.target_dir(domain) / "recon";
        std::error_code ec;
        fs::create_directories(out_dir, ec);
        if (ec) return RunResult::error("Cannot create " + out_dir.string() + ": " + ec.message());

        std::set<std::string> found;
        std::map<std::string, int64_t> sources;
        for (const EnumTool* t : available_) {
            ProcLimits lim;
            lim.timeout_ms = static_cast<int>(std::min<int64_t>(timeout_s * 1000, 24 * 3600 * 1000));
            lim.output_max_bytes = 16 * 1024 * 1024;
            ProcResult pr;
            if (!proc_run_capture(t->argv(domain), "", lim, &pr)) {
                std::cerr << "[subdomain_enum] " << t->name << " failed to start: " << pr.error << "\n";
                continue;
            }
            if (pr.timed_out) {
                std::cerr << "[subdomain_enum] " << t->name << " timed out after " << timeout_s << "s\n";
            } else if (pr.exit_code != 0) {
                std::cerr << "[subdomain_enum] " << t->name << " exited with " << pr.exit_code << "\n";
            }

            int64_t n = 0;
            std::istringstream in(pr.output);
            std::string line;
            while (std::getline(in, line)) {
                std::string host = lower_trim(line);
                if (!is_subdomain_of(host, domain)) continue;
                n++;
                found.insert(host);
            }
            sources[t->name] = n;
        }

        const fs::path out_file = out_dir / "subdomains.txt";
        std::ofstream out(out_file, std::ios::out | std::ios::trunc);
        if (!out) return RunResult::error("Cannot write " + out_file.string());
        for (const auto& h : found) out << h << "\n";
        if (!out.good()) return RunResult::error("Write failed: " + out_file.string());

        json_mini::Doc payload(json_object_new_object());
        json_object_object_add(payload.root, "subdomains",
            json_mini::new_string_array(std::vector<std::string>(found.begin(), found.end())));
        json_object* src = json_object_new_object();
        for (const auto& kv : sources) {
            json_object_object_add(src, kv.first.c_str(), json_object_new_int64(kv.second));
        }
        json_object_object_add(payload.root, "sources", src);
        json_object_object_add(payload.root, "total", json_object_new_int64((int64_t)found.size()));
        json_object_object_add(payload.root, "output", json_mini::new_string(out_file.string()));

        return RunResult::success("Found " + std::to_string(found.size()) + " subdomains",
                                  json_mini::to_plain(payload.root));
    }

    std::vector<OptionSpec> cli_options() const override {
        return {{"timeout", "input", "Per-tool timeout in seconds", std::to_string(kDefaultToolTimeoutS)}};
    }

private:
    std::vector<const EnumTool*> available_;
};

IPlugin* create_subdomain_enum() { return new SubdomainEnumPlugin(); }

} // namespace

void register_subdomain_enum_plugin(IPluginRegistrar& host) {
    PluginDesc d;
    d.name = "subdomain_enum";
    d.category = "recon";
    d.description = "Enumerate subdomains with subfinder and assetfinder";
    d.resources.memory = "500MB";
    d.resources.cpu = "1";
    d.resources.disk = "50MB";
    d.resources.network = "true";

    bool have_tool = false;
    for (const auto& t : kTools) {
        if (find_executable(t.name)) have_tool = true;
    }
    if (!have_tool) {
        std::cerr << "[registry] skipping '" << d.name << "': neither subfinder nor assetfinder is on PATH\n";
        return;
    }
    host.register_plugin(d, &create_subdomain_enum);
}

} // namespace bbhunt
