#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace zipline::models {

// One reachable network path to a device. A device reachable over several
// interfaces shows up as several peers with distinct ids.
struct Peer {
    std::string id;              // "address:port:connection-type"
    std::string signature;
    std::string name;
    std::string address;
    uint16_t port = 0;
    std::string platform;
    std::string connection_type;
    std::string adapter_name;
    std::string avatar_url;
    std::chrono::steady_clock::time_point last_seen{};

    std::string display_name() const { return name.empty() ? address : name; }
};

std::string make_peer_id(const std::string& address, uint16_t port, const std::string& connection_type);

// Builds a peer from a HELLO, deriving name, platform and adapter from the signature.
Peer make_peer(const std::string& address, uint16_t port, const std::string& signature,
               const std::string& connection_type, const std::string& adapter_name = "");

// Placeholder for a TCP sender that never announced itself.
Peer unknown_peer(const std::string& address, uint16_t port);

// last_seen is process-local and not serialized.
void to_json(nlohmann::json& j, const Peer& p);
void from_json(const nlohmann::json& j, Peer& p);

} // namespace zipline::models
