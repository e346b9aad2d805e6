#include "storage/save_locations.hpp"
#include <spdlog/spdlog.h>

namespace zipline::storage {

SaveLocations::SaveLocations(std::shared_ptr<KeyValueStore> store) : store_(std::move(store)) {}

std::map<std::string, std::string> SaveLocations::all_peer_locations() const {
    std::map<std::string, std::string> out;
    auto stored = store_->get(kSaveLocationsKey);
    if (!stored || !stored->is_object()) return out;

    for (auto it = stored->begin(); it != stored->end(); ++it) {
        if (it.value().is_string()) out[it.key()] = it.value().get<std::string>();
    }
    return out;
}

void SaveLocations::set_peer_location(const std::string& signature, const std::string& path) {
    auto locations = all_peer_locations();
    locations[signature] = path;
    store_->set(kSaveLocationsKey, locations);
    spdlog::debug("Save location for {} set to {}", signature, path);
}

std::optional<std::string> SaveLocations::peer_location(const std::string& signature) const {
    auto locations = all_peer_locations();
    auto it = locations.find(signature);
    if (it == locations.end()) return std::nullopt;
    return it->second;
}

void SaveLocations::remove_peer_location(const std::string& signature) {
    auto locations = all_peer_locations();
    if (locations.erase(signature) == 0) return;
    store_->set(kSaveLocationsKey, locations);
}

void SaveLocations::set_default_location(const std::string& path) {
    store_->set(kDefaultSaveLocationKey, path);
}

std::optional<std::string> SaveLocations::default_location() const {
    auto stored = store_->get(kDefaultSaveLocationKey);
    if (!stored || !stored->is_string()) return std::nullopt;
    return stored->get<std::string>();
}

std::optional<std::string> SaveLocations::best_location_for(const std::string& signature) const {
    if (auto location = peer_location(signature)) return location;
    return default_location();
}

void SaveLocations::clear_all() {
    store_->remove(kSaveLocationsKey);
    store_->remove(kDefaultSaveLocationKey);
}

} // namespace zipline::storage
