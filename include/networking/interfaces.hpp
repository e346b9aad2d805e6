#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace zipline::networking {

enum class InterfaceType {
    HOTSPOT,
    WIFI,
    ETHERNET,
    VIRTUAL,
    BLUETOOTH,
    MOBILE,
    TUNNEL,
    LOOPBACK,
    NETWORK
};

const char* to_string(InterfaceType type);

struct InterfaceInfo {
    std::string name;
    std::string address;
    InterfaceType type = InterfaceType::NETWORK;
    std::string subnet_mask;        // empty when the OS did not report one
    std::string broadcast_address;
    bool is_active = true;
    bool is_loopback = false;

    // Loopback, Teredo, ISATAP, 6to4 and other tunnels are kept for
    // incoming-address checks but never used for broadcasting.
    bool broadcast_eligible() const;
};

// Every IPv4 address on every interface. Throws InterfaceError.
std::vector<InterfaceInfo> list_interfaces();

// Case-insensitive name match; Hotspot wins over WiFi, then Ethernet,
// Virtual, Bluetooth, Mobile, Tunnel, else Network.
InterfaceType classify(const std::string& name);

// ip | ~mask. Without a mask: /16 for 172.16/12 and 169.254/16, else /24.
// Returns an empty string for an unparseable address.
std::string broadcast_address(const std::string& ip, const std::string& mask = "");

bool same_subnet(const std::string& a, const std::string& b, const std::string& mask);

// Connection type of the local interface sharing a subnet with remote;
// falls back to Ethernet for link-local senders and Network otherwise.
std::string connection_type_for(const std::string& remote,
                                const std::vector<InterfaceInfo>& interfaces);

// Local address on the same /24 as remote, suitable as a TCP source address.
std::optional<std::string> local_address_for(const std::string& remote,
                                             const std::vector<InterfaceInfo>& interfaces);

// Stable fingerprint used to detect interface changes.
std::string interfaces_fingerprint(const std::vector<InterfaceInfo>& interfaces);

struct PortAvailability {
    bool available = true;
    std::string conflicting_app;    // empty when unknown
};

// Tries to bind port for TCP and UDP; on failure asks the OS which
// process holds it.
PortAvailability port_availability(uint16_t port);

// Name of the process holding port, or empty when unknown
// (netstat/tasklist on Windows, lsof elsewhere).
std::string find_port_owner(uint16_t port);

} // namespace zipline::networking
