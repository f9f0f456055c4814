#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace bbhunt {

struct MemoryUsage {
    double total_mb{0};
    double available_mb{0};
    double used_mb{0};
    double percent{0};
};

struct CpuUsage {
    int cores{0};
    double percent{0}; // busy share across all cores, 0..100
};

struct DiskUsage {
    double total_mb{0};
    double free_mb{0};
    double used_mb{0};
    double percent{0};
};

struct ProcessStats {
    double rss_mb{0};
    double cpu_percent{0};
};

// Source of live system measurements. The resource manager takes one of
// these so admission can be exercised against fixed numbers in tests.
//
// Implementations never throw: a failed read reports zero availability
// (memory/disk), a fully busy CPU, or an unreachable network.
class ISystemProbe {
public:
    virtual ~ISystemProbe() = default;

    virtual MemoryUsage memory() = 0;
    virtual CpuUsage cpu() = 0;
    virtual DiskUsage disk(const std::filesystem::path& volume) = 0;

    // std::nullopt when the process is gone or cannot be inspected.
    virtual std::optional<ProcessStats> process(int pid) = 0;

    // Blocking reachability test against an external host.
    virtual bool network_reachable() = 0;
};

// /proc + statvfs implementation. The network test runs `ping` once.
class LinuxSystemProbe : public ISystemProbe {
public:
    explicit LinuxSystemProbe(std::string net_probe_host = "8.8.8.8",
                              int cpu_sample_ms = 100);

    MemoryUsage memory() override;
    CpuUsage cpu() override;
    DiskUsage disk(const std::filesystem::path& volume) override;
    std::optional<ProcessStats> process(int pid) override;
    bool network_reachable() override;

private:
    std::string net_probe_host_;
    int cpu_sample_ms_;
};

} // namespace bbhunt
