#include "config.hpp"
#include "errors.hpp"
#include "protocol/signature.hpp"
#include "system_info.hpp"
#include <fstream>
#include <nlohmann/json.hpp>

namespace zipline {

void Config::validate() const {
    if (listen_port == 0) {
        throw ConfigError("Invalid listen port: 0");
    }
    if (download_directory.empty()) {
        throw ConfigError("No download directory configured");
    }
    if (peer_timeout.count() <= 0 || heartbeat_interval.count() <= 0 ||
        initial_discovery_interval.count() <= 0 || network_watch_interval.count() <= 0 ||
        tcp_connect_timeout.count() <= 0) {
        throw ConfigError("Timer intervals must be positive");
    }
    if (broadcast_min_gap.count() < 0 || initial_discovery_rounds < 0) {
        throw ConfigError("Discovery pacing must not be negative");
    }
    if (buffer_size == 0 || progress_update_interval == 0) {
        throw ConfigError("Buffer size and progress interval must be positive");
    }
}

std::string Config::signature() const {
    return protocol::build_signature(
        user_name.empty() ? system_info::user_name() : user_name,
        device_name.empty() ? system_info::host_name() : device_name,
        platform.empty() ? system_info::platform_name() : platform);
}

Config load_config(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ConfigError("Could not open config file: " + path);
    }

    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("Malformed config file " + path + ": " + e.what());
    }
    if (!j.is_object()) {
        throw ConfigError("Config file must contain a JSON object: " + path);
    }

    Config cfg;
    try {
        int port = j.value("listen_port", static_cast<int>(cfg.listen_port));
        if (port < 0 || port > 65535) {
            throw ConfigError("listen_port out of range: " + std::to_string(port));
        }
        cfg.listen_port = static_cast<uint16_t>(port);
        cfg.device_name = j.value("device_name", cfg.device_name);
        cfg.user_name = j.value("user_name", cfg.user_name);
        cfg.platform = j.value("platform", cfg.platform);
        cfg.download_directory = j.value("download_directory", cfg.download_directory);
        cfg.state_file = j.value("state_file", cfg.state_file);

        cfg.peer_timeout = std::chrono::seconds(
            j.value("peer_timeout_seconds", static_cast<int64_t>(cfg.peer_timeout.count())));
        cfg.heartbeat_interval = std::chrono::seconds(
            j.value("heartbeat_interval_seconds", static_cast<int64_t>(cfg.heartbeat_interval.count())));
        cfg.initial_discovery_interval = std::chrono::seconds(
            j.value("initial_discovery_interval_seconds",
                    static_cast<int64_t>(cfg.initial_discovery_interval.count())));
        cfg.initial_discovery_rounds = j.value("initial_discovery_rounds", cfg.initial_discovery_rounds);
        cfg.broadcast_min_gap = std::chrono::milliseconds(
            j.value("broadcast_min_gap_ms", static_cast<int64_t>(cfg.broadcast_min_gap.count())));
        cfg.network_watch_interval = std::chrono::seconds(
            j.value("network_watch_interval_seconds",
                    static_cast<int64_t>(cfg.network_watch_interval.count())));

        cfg.buffer_size = j.value("buffer_size", cfg.buffer_size);
        cfg.progress_update_interval = j.value("progress_update_interval", cfg.progress_update_interval);
        cfg.tcp_connect_timeout = std::chrono::seconds(
            j.value("tcp_connect_timeout_seconds", static_cast<int64_t>(cfg.tcp_connect_timeout.count())));
        cfg.socket_buffer_size = j.value("socket_buffer_size", cfg.socket_buffer_size);
        cfg.accept_unsolicited = j.value("accept_unsolicited", cfg.accept_unsolicited);
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("Invalid value in config file " + path + ": " + e.what());
    }
    return cfg;
}

} // namespace zipline
