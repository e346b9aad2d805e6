#pragma once

#include <atomic>
#include <chrono>
#include <deque>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "config.hpp"
#include "event_stream.hpp"
#include "networking/discovery.hpp"
#include "storage/key_value_store.hpp"
#include "storage/save_locations.hpp"
#include "storage/session_registry.hpp"
#include "transfer/receiver.hpp"

namespace zipline::networking {

// An incoming transfer_request waiting for accept_request / decline_request.
struct PendingRequest {
    std::string transfer_id;
    std::string address;
    uint16_t port = 0;
    models::Peer peer;
    protocol::ControlPayload payload;
    std::chrono::system_clock::time_point received_at;
};

// One device on the network: discovery, the TCP listener, the session
// registry and the save-location service wired together.
class Node {
public:
    // A null store means config.state_file, or memory when that is empty.
    explicit Node(Config config, std::shared_ptr<storage::KeyValueStore> store = nullptr);
    ~Node();

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    // Throws ConfigError or NetworkBindError; nothing is left running on failure.
    void start();
    void stop();
    bool is_running() const { return running_; }

    const Config& config() const { return config_; }
    std::vector<models::Peer> peers() const;

    // Matches "address[:port]" first, then a name or signature substring.
    std::optional<models::Peer> find_peer(const std::string& query) const;

    // Block until the session is terminal. Source problems throw
    // ConfigError or IOError before any session exists.
    models::TransferSession send(const models::Peer& peer, const std::vector<std::filesystem::path>& paths);
    models::TransferSession send_text(const models::Peer& peer, const std::string& text);

    // Returns false when session_id is not active.
    bool cancel(const std::string& session_id);

    // save_path overrides the remembered location for this transfer only.
    // Both return false for an unknown transfer_id.
    bool accept_request(const std::string& transfer_id, std::optional<std::string> save_path = std::nullopt);
    bool decline_request(const std::string& transfer_id, const std::string& reason);
    std::vector<PendingRequest> pending_requests() const;

    void set_auto_accept(bool enabled) { auto_accept_ = enabled; }

    void clear_history() { registry_.clear_history(); }
    nlohmann::json diagnostics() const;

    DiscoveryService& discovery() { return discovery_; }
    transfer::TransferListener& listener() { return listener_; }
    storage::SessionRegistry& registry() { return registry_; }
    storage::SaveLocations& save_locations() { return save_locations_; }

    EventStream<models::Peer>& on_peer_found() { return discovery_.on_peer_found; }
    EventStream<models::Peer>& on_peer_lost() { return discovery_.on_peer_lost; }
    EventStream<transfer::TextReceived>& on_text_received() { return listener_.on_text_received; }
    EventStream<PendingRequest> on_transfer_request;

private:
    models::TransferSession run_send(models::TransferSession session);
    std::optional<transfer::IncomingTransfer> resolve_connection(const std::string& address, uint16_t port);
    std::string save_directory_for(const std::string& signature) const;
    models::Peer peer_for(const std::string& address, uint16_t port, const std::string& signature) const;

    void handle_request(const IncomingControl& control);
    void handle_cancel(const IncomingControl& control);

    Config config_;
    std::shared_ptr<storage::KeyValueStore> store_;
    storage::SessionRegistry registry_;
    storage::SaveLocations save_locations_;
    DiscoveryService discovery_;
    transfer::TransferListener listener_;

    std::atomic<bool> running_{false};
    std::atomic<bool> auto_accept_{false};

    mutable std::mutex mutex_;
    std::map<std::string, PendingRequest> pending_;
    std::map<std::string, std::deque<transfer::IncomingTransfer>> accepted_;   // by sender address
};

} // namespace zipline::networking
