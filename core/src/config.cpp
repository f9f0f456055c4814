#include "bbhunt/config.h"
#include "bbhunt/resources.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <thread>

namespace bbhunt {

namespace {

std::string env_or(const char* name, const std::string& defv) {
    const char* v = std::getenv(name);
    if (!v || !*v) return defv;
    return v;
}

int64_t env_int(const char* name, int64_t defv, int64_t min_v) {
    const char* v = std::getenv(name);
    if (!v || !*v) return defv;
    errno = 0;
    char* end = nullptr;
    long long n = std::strtoll(v, &end, 10);
    if (errno != 0 || end == v || *end != '\0' || n < min_v) {
        std::cerr << "[config] ignoring " << name << "=" << v << "\n";
        return defv;
    }
    return static_cast<int64_t>(n);
}

} // namespace

Profile detect_profile() {
    const char* env = std::getenv("BBHUNT_PROFILE");
    if (!env) return Profile::DEV;

    std::string val(env);
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (val == "prod" || val == "production") return Profile::PROD;
    return Profile::DEV;
}

const char* profile_name(Profile p) {
    switch (p) {
        case Profile::PROD: return "prod";
        case Profile::DEV:  return "dev";
    }
    return "dev";
}

void apply_profile_defaults(Profile p) {
    // Call before any worker threads exist; setenv() races with getenv().
    constexpr int NO_OVERWRITE = 0;

    switch (p) {
        case Profile::DEV:
            setenv("BBHUNT_CONTAINER_FALLBACK", "1", NO_OVERWRITE);
            setenv("BBHUNT_PLUGIN_ABI_LAX",     "1", NO_OVERWRITE);
            setenv("BBHUNT_POLL_TIMEOUT_MS",    "0", NO_OVERWRITE);
            break;

        case Profile::PROD:
            setenv("BBHUNT_CONTAINER_FALLBACK", "0",       NO_OVERWRITE);
            setenv("BBHUNT_PLUGIN_ABI_LAX",     "0",       NO_OVERWRITE);
            setenv("BBHUNT_POLL_TIMEOUT_MS",    "3600000", NO_OVERWRITE);
            break;
    }
}

int host_cores() {
    unsigned n = std::thread::hardware_concurrency();
    return n == 0 ? 1 : static_cast<int>(n);
}

CoreConfig load_core_config(const IKeyValueStore* store) {
    CoreConfig cfg;

    std::string mem = env_or("BBHUNT_MAX_MEMORY", store ? store->get("max_memory", "4G") : "4G");
    cfg.max_memory_mb = parse_size_mb(mem);

    std::string cpu = env_or("BBHUNT_MAX_CPU", store ? store->get("max_cpu") : "");
    cfg.max_cpu = parse_cpu_cores(cpu, static_cast<double>(host_cores()));

    cfg.data_dir = env_or("BBHUNT_DATA_DIR", "data");
    cfg.config_dir = env_or("BBHUNT_CONFIG_DIR", "config");
    cfg.plugin_dir = env_or("BBHUNT_PLUGIN_DIR", "plugins.d");

    cfg.container_cmd = env_or("BBHUNT_CONTAINER_CMD", "docker");
    cfg.container_image = env_or("BBHUNT_CONTAINER_IMAGE", "bbhunt:latest");
    cfg.container_exe = env_or("BBHUNT_CONTAINER_EXE", "bbhunt_cli");
    cfg.poll_interval_ms = env_int("BBHUNT_POLL_INTERVAL_MS", 5000, 1);
    cfg.poll_timeout_ms = env_int("BBHUNT_POLL_TIMEOUT_MS", 0, 0);
    cfg.container_fallback = parse_flag(env_or("BBHUNT_CONTAINER_FALLBACK", ""), true);
    cfg.container_log_tail = static_cast<int>(env_int("BBHUNT_CONTAINER_LOG_TAIL", 10, 1));

    cfg.net_probe_host = env_or("BBHUNT_NET_PROBE_HOST", "8.8.8.8");
    cfg.event_log = env_or("BBHUNT_EVENT_LOG", "");
    return cfg;
}

ResourceCeilings ceilings_from(const CoreConfig& cfg) {
    ResourceCeilings c;
    c.max_memory_mb = cfg.max_memory_mb;
    c.max_cpu = cfg.max_cpu;
    return c;
}

} // namespace bbhunt
