#include "models/peer.hpp"
#include "protocol/signature.hpp"

namespace zipline::models {

std::string make_peer_id(const std::string& address, uint16_t port, const std::string& connection_type) {
    return address + ":" + std::to_string(port) + ":" + connection_type;
}

Peer make_peer(const std::string& address, uint16_t port, const std::string& signature,
               const std::string& connection_type, const std::string& adapter_name) {
    auto info = protocol::parse_signature(signature);

    Peer peer;
    peer.id = make_peer_id(address, port, connection_type);
    peer.signature = signature;
    if (!info.user.empty() && !info.host.empty())
        peer.name = info.user + " at " + info.host;
    else
        peer.name = info.host.empty() ? info.user : info.host;
    peer.address = address;
    peer.port = port;
    peer.platform = info.platform;
    peer.connection_type = connection_type;
    peer.adapter_name = !info.adapter_name.empty() ? info.adapter_name : adapter_name;
    peer.avatar_url = "http://" + address + ":" + std::to_string(port + 1) + "/avatar";
    peer.last_seen = std::chrono::steady_clock::now();
    return peer;
}

Peer unknown_peer(const std::string& address, uint16_t port) {
    Peer peer;
    peer.id = "unknown_" + address;
    peer.signature = "Unknown at " + address;
    peer.name = "Unknown";
    peer.address = address;
    peer.port = port;
    peer.platform = "Unknown";
    peer.last_seen = std::chrono::steady_clock::now();
    return peer;
}

void to_json(nlohmann::json& j, const Peer& p) {
    j = nlohmann::json{
        {"id", p.id},
        {"signature", p.signature},
        {"name", p.name},
        {"address", p.address},
        {"port", p.port},
        {"platform", p.platform},
        {"connection_type", p.connection_type},
        {"adapter_name", p.adapter_name},
        {"avatar_url", p.avatar_url},
    };
}

void from_json(const nlohmann::json& j, Peer& p) {
    j.at("id").get_to(p.id);
    j.at("address").get_to(p.address);
    j.at("port").get_to(p.port);
    p.signature = j.value("signature", "");
    p.name = j.value("name", "");
    p.platform = j.value("platform", "");
    p.connection_type = j.value("connection_type", "");
    p.adapter_name = j.value("adapter_name", "");
    p.avatar_url = j.value("avatar_url", "");
}

} // namespace zipline::models
