#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace zipline::storage {

// Persistence hook for history and save locations.
class KeyValueStore {
public:
    virtual ~KeyValueStore() = default;

    virtual std::optional<nlohmann::json> get(const std::string& key) const = 0;
    virtual void set(const std::string& key, const nlohmann::json& value) = 0;
    virtual void remove(const std::string& key) = 0;
};

class MemoryStore : public KeyValueStore {
public:
    std::optional<nlohmann::json> get(const std::string& key) const override;
    void set(const std::string& key, const nlohmann::json& value) override;
    void remove(const std::string& key) override;

private:
    mutable std::mutex mutex_;
    std::map<std::string, nlohmann::json> values_;
};

// One JSON object on disk, rewritten on every change. A missing or corrupt
// file loads as empty. Write failures throw IOError.
class JsonFileStore : public KeyValueStore {
public:
    explicit JsonFileStore(std::filesystem::path path);

    std::optional<nlohmann::json> get(const std::string& key) const override;
    void set(const std::string& key, const nlohmann::json& value) override;
    void remove(const std::string& key) override;

    const std::filesystem::path& path() const { return path_; }

private:
    void flush() const;

    std::filesystem::path path_;
    mutable std::mutex mutex_;
    nlohmann::json data_;
};

} // namespace zipline::storage
