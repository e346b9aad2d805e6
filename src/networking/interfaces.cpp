#include "networking/interfaces.hpp"
#include "errors.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <sstream>
#include <boost/asio.hpp>

#ifdef _WIN32
  #include <winsock2.h>
  #include <ws2tcpip.h>
  #include <iphlpapi.h>
  #include <windows.h>
  #define popen _popen
  #define pclose _pclose
#else
  #include <arpa/inet.h>
  #include <ifaddrs.h>
  #include <net/if.h>
  #include <netinet/in.h>
#endif

using boost::asio::ip::address_v4;

namespace zipline::networking {

namespace {

struct NameRule {
    const char* pattern;
    bool prefix_only;   // short Linux names such as "eth0" or "tun0"
};

struct TypeRules {
    InterfaceType type;
    std::vector<NameRule> rules;
};

const std::vector<TypeRules>& classification_rules() {
    static const std::vector<TypeRules> rules = {
        {InterfaceType::HOTSPOT, {{"wi-fi direct virtual", false}, {"hosted network", false},
                                  {"soft ap", false}, {"softap", false}, {"hotspot", false},
                                  {"ap0", true}}},
        {InterfaceType::WIFI, {{"wi-fi", false}, {"wifi", false}, {"wireless", false},
                               {"wlan", false}, {"802.11", false}, {"wlp", true}, {"wlo", true},
                               {"wlx", true}}},
        {InterfaceType::ETHERNET, {{"ethernet", false}, {"local area connection", false},
                                   {"gigabit", false}, {"eth", true}, {"enp", true},
                                   {"eno", true}, {"ens", true}, {"enx", true}, {"em", true}}},
        {InterfaceType::VIRTUAL, {{"vmware", false}, {"virtualbox", false}, {"hyper-v", false},
                                  {"vbox", false}, {"docker", false}, {"virbr", false},
                                  {"vmnet", false}, {"veth", true}, {"br-", true},
                                  {"lxc", true}, {"lxd", true}}},
        {InterfaceType::BLUETOOTH, {{"bluetooth", false}, {"bnep", true}}},
        {InterfaceType::MOBILE, {{"mobile", false}, {"cellular", false}, {"wwan", false},
                                 {"rmnet", true}, {"usb", false}}},
        {InterfaceType::TUNNEL, {{"teredo", false}, {"isatap", false}, {"6to4", false},
                                 {"vpn", false}, {"tunnel", false}, {"wireguard", false},
                                 {"tailscale", false}, {"zerotier", false}, {"tun", true},
                                 {"tap", true}, {"utun", true}, {"wg", true}, {"ppp", true},
                                 {"sit", true}, {"gre", true}}},
    };
    return rules;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool parse_v4(const std::string& text, address_v4& out) {
    boost::system::error_code ec;
    out = boost::asio::ip::make_address_v4(text, ec);
    return !ec;
}

std::string run_command(const std::string& command) {
    std::string output;
    FILE* pipe = popen(command.c_str(), "r");
    if (!pipe) return output;
    std::array<char, 512> buf;
    while (fgets(buf.data(), static_cast<int>(buf.size()), pipe)) {
        output += buf.data();
    }
    pclose(pipe);
    return output;
}

std::vector<std::string> split_ws(const std::string& line) {
    std::vector<std::string> parts;
    std::istringstream iss(line);
    std::string token;
    while (iss >> token) parts.push_back(token);
    return parts;
}

InterfaceInfo make_info(const std::string& name, const std::string& address,
                        const std::string& mask, bool loopback, bool up) {
    InterfaceInfo info;
    info.name = name;
    info.address = address;
    info.subnet_mask = mask;
    info.is_loopback = loopback;
    info.is_active = up;
    info.type = loopback ? InterfaceType::LOOPBACK : classify(name);
    info.broadcast_address = broadcast_address(address, mask);
    return info;
}

} // namespace

const char* to_string(InterfaceType type) {
    switch (type) {
    case InterfaceType::HOTSPOT: return "Hotspot";
    case InterfaceType::WIFI: return "WiFi";
    case InterfaceType::ETHERNET: return "Ethernet";
    case InterfaceType::VIRTUAL: return "Virtual";
    case InterfaceType::BLUETOOTH: return "Bluetooth";
    case InterfaceType::MOBILE: return "Mobile";
    case InterfaceType::TUNNEL: return "Tunnel";
    case InterfaceType::LOOPBACK: return "Loopback";
    case InterfaceType::NETWORK: return "Network";
    }
    return "Network";
}

bool InterfaceInfo::broadcast_eligible() const {
    if (is_loopback || !is_active) return false;
    if (type == InterfaceType::TUNNEL || type == InterfaceType::LOOPBACK) return false;
    address_v4 addr;
    return parse_v4(address, addr) && !addr.is_unspecified();
}

InterfaceType classify(const std::string& name) {
    const std::string lower = to_lower(name);

    // Hyper-V switches are named "vEthernet (...)".
    if (lower.find("vethernet") != std::string::npos) return InterfaceType::VIRTUAL;

    for (const auto& group : classification_rules()) {
        for (const auto& rule : group.rules) {
            bool hit = rule.prefix_only ? lower.rfind(rule.pattern, 0) == 0
                                        : lower.find(rule.pattern) != std::string::npos;
            if (hit) return group.type;
        }
    }
    return InterfaceType::NETWORK;
}

std::string broadcast_address(const std::string& ip, const std::string& mask) {
    address_v4 addr;
    if (!parse_v4(ip, addr)) return "";

    uint32_t ip_bits = addr.to_uint();
    uint32_t mask_bits;
    address_v4 mask_addr;
    if (!mask.empty() && parse_v4(mask, mask_addr) && mask_addr.to_uint() != 0) {
        mask_bits = mask_addr.to_uint();
    } else {
        uint8_t a = static_cast<uint8_t>(ip_bits >> 24);
        uint8_t b = static_cast<uint8_t>(ip_bits >> 16);
        bool class_b_private = (a == 172 && b >= 16 && b <= 31) || (a == 169 && b == 254);
        mask_bits = class_b_private ? 0xFFFF0000u : 0xFFFFFF00u;
    }
    return address_v4(ip_bits | ~mask_bits).to_string();
}

bool same_subnet(const std::string& a, const std::string& b, const std::string& mask) {
    address_v4 addr_a, addr_b, mask_addr;
    if (!parse_v4(a, addr_a) || !parse_v4(b, addr_b)) return false;
    uint32_t m = (!mask.empty() && parse_v4(mask, mask_addr)) ? mask_addr.to_uint() : 0xFFFFFF00u;
    return (addr_a.to_uint() & m) == (addr_b.to_uint() & m);
}

std::string connection_type_for(const std::string& remote,
                                const std::vector<InterfaceInfo>& interfaces) {
    for (const auto& iface : interfaces) {
        if (iface.address == remote) return to_string(iface.type);
    }
    for (const auto& iface : interfaces) {
        if (same_subnet(iface.address, remote, iface.subnet_mask)) return to_string(iface.type);
    }
    if (remote.rfind("169.254.", 0) == 0) return to_string(InterfaceType::ETHERNET);
    return to_string(InterfaceType::NETWORK);
}

std::optional<std::string> local_address_for(const std::string& remote,
                                             const std::vector<InterfaceInfo>& interfaces) {
    for (const auto& iface : interfaces) {
        if (!iface.is_active) continue;
        if (iface.is_loopback && remote.rfind("127.", 0) != 0) continue;
        if (same_subnet(iface.address, remote, "255.255.255.0")) return iface.address;
    }
    return std::nullopt;
}

std::string interfaces_fingerprint(const std::vector<InterfaceInfo>& interfaces) {
    std::vector<std::string> parts;
    for (const auto& iface : interfaces) {
        parts.push_back(iface.name + "=" + iface.address + "/" + iface.subnet_mask +
                        (iface.is_active ? "+" : "-"));
    }
    std::sort(parts.begin(), parts.end());
    std::string out;
    for (const auto& p : parts) out += p + ";";
    return out;
}

#ifdef _WIN32

std::vector<InterfaceInfo> list_interfaces() {
    std::vector<InterfaceInfo> result;
    ULONG size = 16 * 1024;
    std::vector<uint8_t> buffer(size);
    ULONG flags = GAA_FLAG_SKIP_ANYCAST | GAA_FLAG_SKIP_MULTICAST | GAA_FLAG_SKIP_DNS_SERVER;
    ULONG rc = GetAdaptersAddresses(AF_INET, flags, nullptr,
                                    reinterpret_cast<PIP_ADAPTER_ADDRESSES>(buffer.data()), &size);
    if (rc == ERROR_BUFFER_OVERFLOW) {
        buffer.resize(size);
        rc = GetAdaptersAddresses(AF_INET, flags, nullptr,
                                  reinterpret_cast<PIP_ADAPTER_ADDRESSES>(buffer.data()), &size);
    }
    if (rc != NO_ERROR) {
        throw InterfaceError("GetAdaptersAddresses failed: " + std::to_string(rc));
    }

    for (auto* adapter = reinterpret_cast<PIP_ADAPTER_ADDRESSES>(buffer.data()); adapter;
         adapter = adapter->Next) {
        char name[256] = {0};
        WideCharToMultiByte(CP_UTF8, 0, adapter->FriendlyName, -1, name, sizeof(name) - 1,
                            nullptr, nullptr);
        bool loopback = adapter->IfType == IF_TYPE_SOFTWARE_LOOPBACK;
        bool up = adapter->OperStatus == IfOperStatusUp;

        for (auto* ua = adapter->FirstUnicastAddress; ua; ua = ua->Next) {
            if (ua->Address.lpSockaddr->sa_family != AF_INET) continue;
            auto* sin = reinterpret_cast<sockaddr_in*>(ua->Address.lpSockaddr);
            address_v4 addr(ntohl(sin->sin_addr.s_addr));
            uint8_t prefix = ua->OnLinkPrefixLength;
            uint32_t mask_bits = prefix == 0 ? 0 : (0xFFFFFFFFu << (32 - prefix));
            std::string mask = prefix == 0 ? "" : address_v4(mask_bits).to_string();
            result.push_back(make_info(name, addr.to_string(), mask, loopback, up));
        }
    }
    return result;
}

#else

std::vector<InterfaceInfo> list_interfaces() {
    std::vector<InterfaceInfo> result;
    struct ifaddrs* interfaces = nullptr;
    if (getifaddrs(&interfaces) != 0) {
        throw InterfaceError(std::string("getifaddrs failed: ") + std::strerror(errno));
    }

    for (struct ifaddrs* ifa = interfaces; ifa != nullptr; ifa = ifa->ifa_next) {
        if (!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET) continue;

        auto* addr = reinterpret_cast<struct sockaddr_in*>(ifa->ifa_addr);
        std::string ip = address_v4(ntohl(addr->sin_addr.s_addr)).to_string();
        std::string mask;
        if (ifa->ifa_netmask) {
            auto* netmask = reinterpret_cast<struct sockaddr_in*>(ifa->ifa_netmask);
            mask = address_v4(ntohl(netmask->sin_addr.s_addr)).to_string();
        }
        bool loopback = (ifa->ifa_flags & IFF_LOOPBACK) != 0;
        bool up = (ifa->ifa_flags & IFF_UP) != 0 && (ifa->ifa_flags & IFF_RUNNING) != 0;
        result.push_back(make_info(ifa->ifa_name, ip, mask, loopback, up));
    }

    freeifaddrs(interfaces);
    return result;
}

#endif

std::string find_port_owner(uint16_t port) {
    const std::string port_str = std::to_string(port);
#ifdef _WIN32
    std::istringstream lines(run_command("netstat -ano -p TCP"));
    std::string line;
    while (std::getline(lines, line)) {
        if (line.find(":" + port_str + " ") == std::string::npos) continue;
        if (line.find("LISTENING") == std::string::npos) continue;
        auto parts = split_ws(line);
        if (parts.size() < 5) continue;
        std::string tasks = run_command("tasklist /FI \"PID eq " + parts.back() + "\" /FO CSV /NH");
        std::string first = tasks.substr(0, tasks.find(','));
        first.erase(std::remove(first.begin(), first.end(), '"'), first.end());
        return first;
    }
    return "";
#else
    std::istringstream lines(run_command("lsof -nP -i :" + port_str + " 2>/dev/null"));
    std::string line;
    std::getline(lines, line);    // header
    if (std::getline(lines, line)) {
        auto parts = split_ws(line);
        if (!parts.empty()) return parts.front();
    }
    return "";
#endif
}

PortAvailability port_availability(uint16_t port) {
    PortAvailability result;
    boost::asio::io_context io_context;
    boost::system::error_code ec;

    boost::asio::ip::tcp::acceptor acceptor(io_context);
    acceptor.open(boost::asio::ip::tcp::v4(), ec);
    if (!ec) acceptor.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (!ec) acceptor.bind({boost::asio::ip::tcp::v4(), port}, ec);
    if (!ec) acceptor.listen(boost::asio::socket_base::max_listen_connections, ec);

    if (!ec) {
        boost::asio::ip::udp::socket udp(io_context);
        udp.open(boost::asio::ip::udp::v4(), ec);
        if (!ec) udp.bind({boost::asio::ip::udp::v4(), port}, ec);
    }

    if (ec) {
        result.available = false;
        result.conflicting_app = find_port_owner(port);
    }
    return result;
}

} // namespace zipline::networking
