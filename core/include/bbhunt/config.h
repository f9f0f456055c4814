#pragma once
#include "bbhunt/kvstore.h"
#include "bbhunt/resource_manager.h"

#include <cstdint>
#include <filesystem>
#include <string>

namespace bbhunt {

enum class Profile { DEV, PROD };

// Detect profile from BBHUNT_PROFILE env var. Default: DEV.
Profile detect_profile();

const char* profile_name(Profile p);

// Apply profile defaults: sets env vars that are not already set.
// DEV: container fallback on, lax plugin ABI check, unbounded container polling
// PROD: container fallback off, strict ABI check, one hour polling bound
void apply_profile_defaults(Profile p);

// Process-wide settings, read once at startup.
struct CoreConfig {
    int64_t max_memory_mb{4096};
    double max_cpu{1.0};

    std::filesystem::path data_dir{"data"};
    std::filesystem::path config_dir{"config"};
    std::filesystem::path plugin_dir{"plugins.d"};

    std::string container_cmd{"docker"};
    std::string container_image{"bbhunt:latest"};
    std::string container_exe{"bbhunt_cli"};
    int64_t poll_interval_ms{5000};
    int64_t poll_timeout_ms{0}; // 0 = unbounded
    bool container_fallback{true};
    int container_log_tail{10};

    std::string net_probe_host{"8.8.8.8"};
    std::string event_log; // empty = no file
};

// Environment first, then the store ("max_memory", "max_cpu"), then defaults.
CoreConfig load_core_config(const IKeyValueStore* store = nullptr);

ResourceCeilings ceilings_from(const CoreConfig& cfg);

// Host logical core count, at least 1.
int host_cores();

} // namespace bbhunt
