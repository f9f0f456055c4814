#pragma once

#include <filesystem>
#include <map>
#include <string>

namespace bbhunt {

// Narrow key/value view of persisted settings. The core only keeps the
// selected target and a few overrides here; values are opaque strings.
class IKeyValueStore {
public:
    virtual ~IKeyValueStore() = default;
    virtual std::string get(const std::string& key, const std::string& defv = "") const = 0;
    virtual void set(const std::string& key, const std::string& value) = 0;
};

class MemoryStore : public IKeyValueStore {
public:
    std::string get(const std::string& key, const std::string& defv = "") const override;
    void set(const std::string& key, const std::string& value) override;

private:
    std::map<std::string, std::string> values_;
};

// Flat JSON object on disk ({"key":"value",...}), rewritten on every set().
// A missing or unreadable file starts empty.
class JsonFileStore : public IKeyValueStore {
public:
    explicit JsonFileStore(std::filesystem::path path);

    std::string get(const std::string& key, const std::string& defv = "") const override;
    void set(const std::string& key, const std::string& value) override;

    const std::filesystem::path& path() const { return path_; }

private:
    bool save(std::string* err) const;

    std::filesystem::path path_;
    std::map<std::string, std::string> values_;
};

} // namespace bbhunt
