#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace bbhunt {

struct TargetMetadata {
    std::string domain;
    std::string added; // ISO-8601 UTC
    std::string notes;
    std::vector<std::string> scope;
};

// Per-target workspace under <data_dir>/targets/<domain>/:
//   recon/ scan/ exploit/ report/ metadata.json
class TargetStore {
public:
    explicit TargetStore(std::filesystem::path data_dir);

    // Creates the tree and metadata. Fails if the target exists or the
    // domain is not a plain directory name.
    bool add_target(const std::string& domain, std::string* err,
                    const std::string& notes = "",
                    const std::vector<std::string>& scope = {});

    // Sorted directory names.
    std::vector<std::string> list_targets() const;

    bool has_target(const std::string& domain) const;

    std::optional<TargetMetadata> load_metadata(const std::string& domain) const;

    std::filesystem::path target_dir(const std::string& domain) const;

    static bool valid_domain(const std::string& domain);

private:
    std::filesystem::path root_;
};

constexpr const char* kTargetSubdirs[] = {"recon", "scan", "exploit", "report"};

} // namespace bbhunt
