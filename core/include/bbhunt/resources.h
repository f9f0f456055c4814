#pragma once
#include <cstdint>
#include <string>

namespace bbhunt {

// Raw resource declaration as written by a plugin author.
// Every field is free text; an empty field means "not declared".
//   memory / disk: "2G", "500MB", "10KB", "256" (MB)
//   cpu:           "0.5", "2"
//   network:       "true", "1", "yes", "on" (anything else is false)
struct ResourceDecl {
    std::string memory;
    std::string cpu;
    std::string disk;
    std::string network;
};

// Normalized requirement used by the admission check.
struct ResourceRequirement {
    int64_t memory_mb{0};
    double cpu_cores{0.0};
    int64_t disk_mb{0};
    bool network{false};
};

constexpr int64_t kFallbackSizeMb = 100;  // unparseable magnitude
constexpr int64_t kDefaultMemoryMb = 100;
constexpr double  kDefaultCpuCores = 0.5;
constexpr int64_t kDefaultDiskMb = 10;

// Parse a magnitude string into megabytes. Suffixes are matched
// longest-first (GB before G, MB before M, KB before K); fractional results
// truncate toward zero. Never fails: garbage or negative input yields
// kFallbackSizeMb.
int64_t parse_size_mb(const std::string& text);

// Numeric coercion for cpu; empty, unparseable or negative -> defv.
double parse_cpu_cores(const std::string& text, double defv = kDefaultCpuCores);

// Boolean coercion for network; empty -> defv.
bool parse_flag(const std::string& text, bool defv = false);

// Build the normalized requirement, filling undeclared fields with defaults.
ResourceRequirement parse_requirement(const ResourceDecl& decl);

// "2048MB" style rendering used in messages and container limits.
std::string format_mb(int64_t mb);

} // namespace bbhunt
