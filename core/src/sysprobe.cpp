#include "bbhunt/sysprobe.h"
#include "bbhunt/proc.h"

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <thread>
#include <utility>
#include <vector>

#include <sys/statvfs.h>
#include <unistd.h>

namespace bbhunt {

static long long parse_first_integer(const std::string& s) {
    long long v = 0;
    bool saw = false;
    for (char c : s) {
        if (c >= '0' && c <= '9') {
            saw = true;
            v = v * 10 + (c - '0');
        } else if (saw) {
            break;
        }
    }
    return saw ? v : 0;
}

static double to_double(const std::string& s) {
    return std::strtod(s.c_str(), nullptr);
}

struct CpuTimes {
    unsigned long long busy{0};
    unsigned long long total{0};
};

// Aggregate "cpu" line of /proc/stat.
static bool read_cpu_times(CpuTimes* out) {
    std::ifstream f("/proc/stat");
    std::string label;
    if (!(f >> label) || label != "cpu") return false;

    std::vector<unsigned long long> fields;
    unsigned long long v = 0;
    while (fields.size() < 10 && (f >> v)) fields.push_back(v);
    if (fields.size() < 4) return false;

    // user nice system idle iowait irq softirq steal [guest guest_nice]
    // guest time is already folded into user/nice.
    unsigned long long total = 0;
    for (size_t i = 0; i < fields.size() && i < 8; i++) total += fields[i];
    unsigned long long idle = fields[3] + (fields.size() > 4 ? fields[4] : 0);
    out->total = total;
    out->busy = total - idle;
    return true;
}

LinuxSystemProbe::LinuxSystemProbe(std::string net_probe_host, int cpu_sample_ms)
    : net_probe_host_(std::move(net_probe_host)), cpu_sample_ms_(cpu_sample_ms) {}

MemoryUsage LinuxSystemProbe::memory() {
    MemoryUsage m;
    long long total_kb = 0, avail_kb = -1, free_kb = 0, buffers_kb = 0, cached_kb = 0;

    std::ifstream f("/proc/meminfo");
    std::string line;
    while (std::getline(f, line)) {
        if (line.rfind("MemTotal:", 0) == 0) total_kb = parse_first_integer(line);
        else if (line.rfind("MemAvailable:", 0) == 0) avail_kb = parse_first_integer(line);
        else if (line.rfind("MemFree:", 0) == 0) free_kb = parse_first_integer(line);
        else if (line.rfind("Buffers:", 0) == 0) buffers_kb = parse_first_integer(line);
        else if (line.rfind("Cached:", 0) == 0) cached_kb = parse_first_integer(line);
    }
    if (total_kb <= 0) return m;
    // Kernels before 3.14 lack MemAvailable.
    if (avail_kb < 0) avail_kb = free_kb + buffers_kb + cached_kb;

    m.total_mb = total_kb / 1024.0;
    m.available_mb = avail_kb / 1024.0;
    m.used_mb = (total_kb - avail_kb) / 1024.0;
    m.percent = (double)(total_kb - avail_kb) * 100.0 / (double)total_kb;
    return m;
}

CpuUsage LinuxSystemProbe::cpu() {
    CpuUsage c;
    long n = sysconf(_SC_NPROCESSORS_ONLN);
    c.cores = n > 0 ? (int)n : 1;
    c.percent = 100.0;

    CpuTimes a, b;
    if (!read_cpu_times(&a)) return c;
    std::this_thread::sleep_for(std::chrono::milliseconds(cpu_sample_ms_));
    if (!read_cpu_times(&b)) return c;

    if (b.total <= a.total) return c;
    unsigned long long dt = b.total - a.total;
    unsigned long long db = b.busy >= a.busy ? b.busy - a.busy : 0;
    c.percent = (double)db * 100.0 / (double)dt;
    return c;
}

DiskUsage LinuxSystemProbe::disk(const std::filesystem::path& volume) {
    DiskUsage d;
    struct statvfs st;
    if (statvfs(volume.c_str(), &st) != 0) return d;

    const double bs = (double)st.f_frsize;
    const double mb = 1024.0 * 1024.0;
    d.total_mb = bs * (double)st.f_blocks / mb;
    d.free_mb = bs * (double)st.f_bavail / mb;
    d.used_mb = bs * (double)(st.f_blocks - st.f_bfree) / mb;
    // same definition as df: used / (used + available to unprivileged users)
    double denom = d.used_mb + d.free_mb;
    d.percent = denom > 0 ? d.used_mb * 100.0 / denom : 0.0;
    return d;
}

std::optional<ProcessStats> LinuxSystemProbe::process(int pid) {
    if (pid <= 0) return std::nullopt;
    const std::string base = "/proc/" + std::to_string(pid);

    std::ifstream sf(base + "/stat");
    std::string stat_line;
    if (!sf || !std::getline(sf, stat_line)) return std::nullopt;

    // comm may contain spaces; fields resume after the last ')'.
    size_t rp = stat_line.rfind(')');
    if (rp == std::string::npos) return std::nullopt;
    std::istringstream rest(stat_line.substr(rp + 1));
    std::vector<std::string> fields;
    std::string tok;
    while (rest >> tok) fields.push_back(tok);
    // fields[0] = state (field 3), utime = field 14, stime = 15, starttime = 22
    if (fields.size() < 20) return std::nullopt;
    if (fields[0] == "Z" || fields[0] == "X") return std::nullopt;

    ProcessStats ps;
    {
        std::ifstream st(base + "/status");
        std::string line;
        while (std::getline(st, line)) {
            if (line.rfind("VmRSS:", 0) == 0) {
                ps.rss_mb = parse_first_integer(line) / 1024.0;
                break;
            }
        }
    }

    const double ticks = (double)sysconf(_SC_CLK_TCK);
    double uptime_s = 0.0;
    {
        std::ifstream up("/proc/uptime");
        up >> uptime_s;
    }
    if (ticks > 0 && uptime_s > 0) {
        double cpu_s = (to_double(fields[11]) + to_double(fields[12])) / ticks;
        double age_s = uptime_s - to_double(fields[19]) / ticks;
        if (age_s > 0) ps.cpu_percent = cpu_s * 100.0 / age_s;
    }
    return ps;
}

bool LinuxSystemProbe::network_reachable() {
    if (net_probe_host_.empty()) return false;
    ProcLimits lim;
    lim.timeout_ms = 5000;
    lim.output_max_bytes = 4096;
    ProcResult pr;
    if (!proc_run_capture({"ping", "-c", "1", "-W", "2", net_probe_host_}, "", lim, &pr)) {
        return false;
    }
    return !pr.timed_out && pr.exit_code == 0;
}

} // namespace bbhunt
