#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include "storage/key_value_store.hpp"

namespace zipline::storage {

inline constexpr const char* kSaveLocationsKey = "zipline_save_locations";
inline constexpr const char* kDefaultSaveLocationKey = "zipline_default_save_location";

// Remembers where files from each peer (by signature) should be saved.
class SaveLocations {
public:
    explicit SaveLocations(std::shared_ptr<KeyValueStore> store);

    void set_peer_location(const std::string& signature, const std::string& path);
    std::optional<std::string> peer_location(const std::string& signature) const;
    void remove_peer_location(const std::string& signature);
    std::map<std::string, std::string> all_peer_locations() const;

    void set_default_location(const std::string& path);
    std::optional<std::string> default_location() const;

    // Peer location, else default location, else none.
    std::optional<std::string> best_location_for(const std::string& signature) const;

    // Forgets every peer location and the default.
    void clear_all();

private:
    std::shared_ptr<KeyValueStore> store_;
};

} // namespace zipline::storage
