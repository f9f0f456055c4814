#pragma once
#include <cstdint>
#include <fstream>
#include <string>

namespace bbhunt {

// Lifecycle event log, one canonical JSON object per line:
//   {"event":..,"payload":{..},"run_id":..,"seq":N,"ts":"..."}
// Keys are sorted at every level so lines diff cleanly across runs.
// An empty path gives a disabled log; event() is then a no-op.
class EventLog {
public:
    EventLog() = default;
    explicit EventLog(const std::string& path);

    EventLog(const EventLog&) = delete;
    EventLog& operator=(const EventLog&) = delete;

    void event(const std::string& run_id, const std::string& name, const std::string& payload_json);

    bool enabled() const { return out_.is_open(); }
    const std::string& path() const { return path_; }
    uint64_t seq() const { return seq_; }

private:
    std::string path_;
    std::ofstream out_;
    uint64_t seq_{0};
};

// Random 32 hex char id. BBHUNT_DETERMINISTIC_RUN_ID=1 fixes the seed.
std::string gen_run_id();

// Re-serialize with sorted keys; input returned unchanged if not JSON.
std::string canonicalize_json(const std::string& raw);

std::string iso_now();

} // namespace bbhunt
