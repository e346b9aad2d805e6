#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace zipline {

constexpr uint16_t kDefaultPort = 6442;

struct Config {
    uint16_t listen_port = kDefaultPort;
    std::string device_name;   // host part of the signature; empty = host name
    std::string user_name;     // empty = login name
    std::string platform;      // empty = compile-time platform
    std::string download_directory;
    std::string state_file;    // JSON key/value store; empty = in-memory only

    std::chrono::seconds peer_timeout{120};
    std::chrono::seconds heartbeat_interval{60};
    std::chrono::seconds initial_discovery_interval{3};
    int initial_discovery_rounds = 5;
    std::chrono::milliseconds broadcast_min_gap{1000};
    std::chrono::seconds network_watch_interval{60};

    std::size_t buffer_size = 1024 * 1024;
    std::size_t progress_update_interval = 256 * 1024;
    std::chrono::seconds tcp_connect_timeout{10};
    int socket_buffer_size = 2 * 1024 * 1024;

    bool accept_unsolicited = true;

    // Throws ConfigError.
    void validate() const;

    std::string signature() const;
};

// Reads a JSON object; keys absent from the file keep their defaults.
// Throws ConfigError when the file cannot be read or parsed.
Config load_config(const std::string& path);

} // namespace zipline
