#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include <boost/asio.hpp>
#include "config.hpp"
#include "event_stream.hpp"
#include "models/peer.hpp"
#include "networking/interfaces.hpp"
#include "protocol/discovery_message.hpp"

namespace zipline::networking {

// Answer to an outbound transfer_request. data carries the save path hint
// for an accept and the reason for a decline or cancel.
struct ControlResponse {
    bool accepted = false;
    std::optional<std::string> data;
};

// A transfer_request or transfer_cancel received from address:port. The
// port is the sender's discovery port, which is also where it listens.
struct IncomingControl {
    std::string address;
    uint16_t port = 0;
    protocol::ControlPayload payload;
};

// UDP peer discovery plus the request/accept/decline/cancel control channel.
//
// One socket bound to 0.0.0.0:port carries everything. The io_context runs
// on its own thread; sends from other threads are posted onto it. The peer
// table and the filtering sets are guarded by one mutex and handlers are
// always invoked outside of it.
class DiscoveryService {
public:
    using Clock = std::chrono::steady_clock;
    using InterfaceProvider = std::function<std::vector<InterfaceInfo>()>;

    static constexpr int kEchoLimit = 5;
    static constexpr std::chrono::seconds kRefreshGap{2};
    static constexpr std::chrono::seconds kCleanupInterval{5};

    explicit DiscoveryService(const Config& config);
    ~DiscoveryService();

    DiscoveryService(const DiscoveryService&) = delete;
    DiscoveryService& operator=(const DiscoveryService&) = delete;

    // Binds the socket and starts the beacon timers. Throws NetworkBindError.
    void start();

    // Sends GOODBYE and joins the io thread. Safe to call twice.
    void stop();

    bool is_running() const { return running_; }
    uint16_t port() const { return config_.listen_port; }
    const std::string& signature() const { return signature_; }

    std::vector<models::Peer> peers() const;

    // First known peer announced from address, if any.
    std::optional<models::Peer> find_peer_by_address(const std::string& address) const;

    // Broadcast HELLO on every eligible interface. Returns false when
    // suppressed by the one-per-broadcast_min_gap limit.
    bool say_hello();
    void say_hello_to(const std::string& address, uint16_t port);
    void say_goodbye();

    void send_control(const std::string& address, uint16_t port,
                      const protocol::DiscoveryMessage& message);

    // The returned future is fulfilled by the first accept, decline or
    // cancel carrying transfer_id. There is no timeout.
    std::future<ControlResponse> expect_response(const std::string& transfer_id);
    void abandon_response(const std::string& transfer_id);

    // Entry point for every received datagram; public for tests.
    void handle_datagram(const uint8_t* data, size_t length, const std::string& sender,
                         uint16_t sender_port = kDefaultPort);

    // Removes peers idle for longer than peer_timeout, emitting peer-lost.
    void expire_peers(Clock::time_point now);

    // Re-reads the interface list. Returns true when it changed.
    bool refresh_interfaces();

    void set_interface_provider(InterfaceProvider provider);
    std::vector<InterfaceInfo> interfaces() const;
    bool is_local_address(const std::string& address) const;
    bool is_bad_address(const std::string& address) const;

    EventStream<models::Peer> on_peer_found;
    EventStream<models::Peer> on_peer_lost;
    EventStream<IncomingControl> on_transfer_request;
    EventStream<IncomingControl> on_transfer_cancel;

private:
    void start_receive();
    void schedule_burst(int remaining);
    void schedule_heartbeat();
    void schedule_cleanup();
    void schedule_network_watch();

    // Directed broadcast on every eligible interface, then 255.255.255.255,
    // to every known peer port plus the default port. io thread only.
    void broadcast_datagram(const std::vector<uint8_t>& bytes);
    void send_datagram(const std::vector<uint8_t>& bytes, const std::string& address, uint16_t port);
    void send_datagram_now(const std::vector<uint8_t>& bytes,
                           const boost::asio::ip::udp::endpoint& endpoint);

    // Returns false when the datagram must be dropped.
    bool accept_source(const std::string& sender, const std::string& signature, bool is_hello);
    void touch_address(const std::string& address);

    void handle_hello(const protocol::HelloMessage& hello, const std::string& sender);
    void handle_goodbye(const std::string& sender);
    void resolve_response(const std::string& transfer_id, ControlResponse response);
    void drop_unreachable_peers();

    Config config_;
    std::string signature_;
    std::string own_display_;

    boost::asio::io_context io_context_;
    boost::asio::ip::udp::socket socket_;
    boost::asio::steady_timer burst_timer_;
    boost::asio::steady_timer heartbeat_timer_;
    boost::asio::steady_timer cleanup_timer_;
    boost::asio::steady_timer network_timer_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_;
    std::thread thread_;
    std::atomic<bool> running_{false};

    std::array<uint8_t, 65536> recv_buffer_;
    boost::asio::ip::udp::endpoint recv_endpoint_;

    mutable std::mutex mutex_;
    std::map<std::string, models::Peer> peers_;
    std::set<std::string> local_addresses_;
    std::map<std::string, int> echo_counts_;
    std::set<std::string> bad_addresses_;
    std::vector<InterfaceInfo> interfaces_;
    std::string interfaces_fingerprint_;
    InterfaceProvider interface_provider_;
    std::optional<Clock::time_point> last_broadcast_;

    std::mutex responses_mutex_;
    std::map<std::string, std::promise<ControlResponse>> pending_responses_;
};

} // namespace zipline::networking
