#include "storage/key_value_store.hpp"
#include "errors.hpp"
#include <fstream>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace zipline::storage {

// --- MemoryStore ---

std::optional<nlohmann::json> MemoryStore::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = values_.find(key);
    if (it == values_.end()) return std::nullopt;
    return it->second;
}

void MemoryStore::set(const std::string& key, const nlohmann::json& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    values_[key] = value;
}

void MemoryStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    values_.erase(key);
}

// --- JsonFileStore ---

JsonFileStore::JsonFileStore(fs::path path) : path_(std::move(path)), data_(nlohmann::json::object()) {
    std::ifstream in(path_);
    if (!in.is_open()) return;

    try {
        nlohmann::json loaded;
        in >> loaded;
        if (loaded.is_object()) {
            data_ = std::move(loaded);
        } else {
            spdlog::warn("State file {} is not a JSON object, starting empty", path_.string());
        }
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("State file {} is corrupt, starting empty: {}", path_.string(), e.what());
    }
}

std::optional<nlohmann::json> JsonFileStore::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = data_.find(key);
    if (it == data_.end()) return std::nullopt;
    return *it;
}

void JsonFileStore::set(const std::string& key, const nlohmann::json& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_[key] = value;
    flush();
}

void JsonFileStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.erase(key);
    flush();
}

void JsonFileStore::flush() const {
    std::error_code ec;
    if (path_.has_parent_path()) fs::create_directories(path_.parent_path(), ec);

    // Write beside the target, then rename over it.
    fs::path tmp = path_;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) {
            throw IOError("Could not write state file: " + tmp.string());
        }
        out << data_.dump(2);
        if (!out) throw IOError("Could not write state file: " + tmp.string());
    }
    fs::rename(tmp, path_, ec);
    if (ec) throw IOError("Could not replace state file " + path_.string() + ": " + ec.message());
}

} // namespace zipline::storage
