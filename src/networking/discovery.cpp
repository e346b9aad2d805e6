#include "networking/discovery.hpp"
#include "errors.hpp"
#include "protocol/signature.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

using boost::asio::ip::udp;

namespace zipline::networking {

namespace {

const std::string* signature_of(const protocol::DiscoveryMessage& message) {
    if (auto* hello = std::get_if<protocol::HelloMessage>(&message)) return &hello->signature;
    if (auto* bye = std::get_if<protocol::GoodbyeMessage>(&message)) return &bye->signature;
    if (auto* req = std::get_if<protocol::TransferRequest>(&message)) return &req->payload.signature;
    if (auto* acc = std::get_if<protocol::TransferAccept>(&message)) return &acc->payload.signature;
    if (auto* dec = std::get_if<protocol::TransferDecline>(&message)) return &dec->payload.signature;
    if (auto* can = std::get_if<protocol::TransferCancel>(&message)) return &can->payload.signature;
    return nullptr;
}

std::string adapter_for(const std::string& remote, const std::vector<InterfaceInfo>& interfaces) {
    for (const auto& iface : interfaces) {
        if (iface.address == remote) return iface.name;
    }
    for (const auto& iface : interfaces) {
        if (same_subnet(iface.address, remote, iface.subnet_mask)) return iface.name;
    }
    return "";
}

} // namespace

DiscoveryService::DiscoveryService(const Config& config)
    : config_(config),
      signature_(config.signature()),
      own_display_(protocol::strip_adapter_markers(signature_)),
      socket_(io_context_),
      burst_timer_(io_context_),
      heartbeat_timer_(io_context_),
      cleanup_timer_(io_context_),
      network_timer_(io_context_),
      interface_provider_(list_interfaces) {}

DiscoveryService::~DiscoveryService() {
    stop();
}

// --- Lifecycle ---

void DiscoveryService::start() {
    if (running_) return;

    refresh_interfaces();

    boost::system::error_code ec;
    socket_.open(udp::v4(), ec);
    if (!ec) socket_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (!ec) socket_.set_option(boost::asio::socket_base::broadcast(true), ec);
    if (!ec) socket_.bind(udp::endpoint(udp::v4(), config_.listen_port), ec);
    if (ec) {
        boost::system::error_code ignored;
        socket_.close(ignored);
        throw NetworkBindError("Could not bind UDP port " + std::to_string(config_.listen_port) +
                               ": " + ec.message(),
                               find_port_owner(config_.listen_port));
    }

    io_context_.restart();
    work_.emplace(boost::asio::make_work_guard(io_context_));
    running_ = true;

    start_receive();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_broadcast_.reset();
    }
    say_hello();
    schedule_burst(config_.initial_discovery_rounds);
    schedule_heartbeat();
    schedule_cleanup();
    schedule_network_watch();

    thread_ = std::thread([this]() {
        try {
            io_context_.run();
        } catch (std::exception& e) {
            spdlog::error("Discovery thread stopped: {}", e.what());
        }
    });

    spdlog::info("Discovery listening on UDP {} as \"{}\"", config_.listen_port, signature_);
}

void DiscoveryService::stop() {
    if (!running_.exchange(false)) return;

    say_goodbye();
    boost::asio::post(io_context_, [this]() {
        burst_timer_.cancel();
        heartbeat_timer_.cancel();
        cleanup_timer_.cancel();
        network_timer_.cancel();
        boost::system::error_code ignored;
        socket_.close(ignored);
    });

    work_.reset();
    if (thread_.joinable()) thread_.join();
    spdlog::info("Discovery stopped");
}

// --- Timers ---

void DiscoveryService::start_receive() {
    socket_.async_receive_from(
        boost::asio::buffer(recv_buffer_), recv_endpoint_,
        [this](const boost::system::error_code& ec, std::size_t length) {
            if (ec == boost::asio::error::operation_aborted || !socket_.is_open()) return;
            if (ec) {
                spdlog::trace("UDP receive error: {}", ec.message());
            } else {
                try {
                    handle_datagram(recv_buffer_.data(), length,
                                    recv_endpoint_.address().to_string(), recv_endpoint_.port());
                } catch (std::exception& e) {
                    spdlog::trace("Dropped datagram from {}: {}",
                                  recv_endpoint_.address().to_string(), e.what());
                }
            }
            start_receive();
        });
}

void DiscoveryService::schedule_burst(int remaining) {
    if (remaining <= 0) return;
    burst_timer_.expires_after(config_.initial_discovery_interval);
    burst_timer_.async_wait([this, remaining](const boost::system::error_code& ec) {
        if (ec || !running_) return;
        say_hello();
        schedule_burst(remaining - 1);
    });
}

void DiscoveryService::schedule_heartbeat() {
    heartbeat_timer_.expires_after(config_.heartbeat_interval);
    heartbeat_timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec || !running_) return;
        say_hello();
        schedule_heartbeat();
    });
}

void DiscoveryService::schedule_cleanup() {
    cleanup_timer_.expires_after(kCleanupInterval);
    cleanup_timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec || !running_) return;
        expire_peers(Clock::now());
        schedule_cleanup();
    });
}

void DiscoveryService::schedule_network_watch() {
    network_timer_.expires_after(config_.network_watch_interval);
    network_timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec || !running_) return;
        if (refresh_interfaces()) {
            spdlog::info("Network interfaces changed, re-announcing");
            drop_unreachable_peers();
            {
                std::lock_guard<std::mutex> lock(mutex_);
                last_broadcast_.reset();
            }
            say_hello();
        }
        schedule_network_watch();
    });
}

// --- Sending ---

bool DiscoveryService::say_hello() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = Clock::now();
        if (last_broadcast_ && now - *last_broadcast_ < config_.broadcast_min_gap) {
            spdlog::trace("HELLO broadcast suppressed by rate limit");
            return false;
        }
        last_broadcast_ = now;
    }

    protocol::HelloMessage hello;
    hello.broadcast = true;
    hello.with_port = true;
    hello.port = config_.listen_port;
    hello.signature = signature_;
    auto bytes = protocol::encode_message(hello);
    boost::asio::post(io_context_, [this, bytes]() { broadcast_datagram(bytes); });
    return true;
}

void DiscoveryService::say_hello_to(const std::string& address, uint16_t port) {
    protocol::HelloMessage hello;
    hello.broadcast = false;
    hello.with_port = true;
    hello.port = config_.listen_port;
    hello.signature = signature_;
    send_datagram(protocol::encode_message(hello), address, port);
}

void DiscoveryService::say_goodbye() {
    auto bytes = protocol::encode_message(protocol::GoodbyeMessage{signature_});
    boost::asio::post(io_context_, [this, bytes]() { broadcast_datagram(bytes); });
}

void DiscoveryService::send_control(const std::string& address, uint16_t port,
                                    const protocol::DiscoveryMessage& message) {
    spdlog::debug("Sending {} to {}:{}", protocol::to_string(protocol::message_type(message)),
                  address, port);
    send_datagram(protocol::encode_message(message), address, port);
}

void DiscoveryService::broadcast_datagram(const std::vector<uint8_t>& bytes) {
    std::set<uint16_t> ports{kDefaultPort, config_.listen_port};
    std::set<std::string> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : peers_) ports.insert(entry.second.port);
        for (const auto& iface : interfaces_) {
            if (!iface.broadcast_eligible() || bad_addresses_.count(iface.address)) continue;
            local_addresses_.insert(iface.address);
            if (!iface.broadcast_address.empty()) targets.insert(iface.broadcast_address);
        }
    }

    for (const auto& target : targets) {
        boost::system::error_code ec;
        auto addr = boost::asio::ip::make_address_v4(target, ec);
        if (ec) continue;
        for (uint16_t port : ports) send_datagram_now(bytes, udp::endpoint(addr, port));
    }
    for (uint16_t port : ports) {
        send_datagram_now(bytes, udp::endpoint(boost::asio::ip::address_v4::broadcast(), port));
    }
}

void DiscoveryService::send_datagram(const std::vector<uint8_t>& bytes,
                                     const std::string& address, uint16_t port) {
    boost::system::error_code ec;
    auto addr = boost::asio::ip::make_address_v4(address, ec);
    if (ec) {
        spdlog::trace("Not sending to unparseable address '{}'", address);
        return;
    }
    udp::endpoint endpoint(addr, port);
    boost::asio::post(io_context_, [this, bytes, endpoint]() { send_datagram_now(bytes, endpoint); });
}

void DiscoveryService::send_datagram_now(const std::vector<uint8_t>& bytes,
                                         const udp::endpoint& endpoint) {
    boost::system::error_code ec;
    socket_.send_to(boost::asio::buffer(bytes), endpoint, 0, ec);
    if (ec) {
        spdlog::trace("UDP send to {}:{} failed: {}", endpoint.address().to_string(),
                      endpoint.port(), ec.message());
    }
}

// --- Receiving ---

void DiscoveryService::handle_datagram(const uint8_t* data, size_t length, const std::string& sender,
                                       uint16_t sender_port) {
    auto message = protocol::parse_message(data, length, kDefaultPort);
    if (!protocol::is_valid(message)) {
        spdlog::trace("Dropped invalid datagram ({} bytes) from {}", length, sender);
        return;
    }

    bool is_hello = std::holds_alternative<protocol::HelloMessage>(message);
    bool is_goodbye = std::holds_alternative<protocol::GoodbyeMessage>(message);
    const std::string* sig = signature_of(message);
    if (!accept_source(sender, sig ? *sig : std::string(), is_hello || is_goodbye)) return;

    if (auto* hello = std::get_if<protocol::HelloMessage>(&message)) {
        handle_hello(*hello, sender);
        return;
    }
    if (is_goodbye) {
        handle_goodbye(sender);
        return;
    }

    touch_address(sender);

    if (auto* req = std::get_if<protocol::TransferRequest>(&message)) {
        spdlog::info("Transfer request {} from {} ({})", req->payload.transfer_id,
                     req->payload.signature, sender);
        on_transfer_request.emit(IncomingControl{sender, sender_port, req->payload});
    } else if (auto* acc = std::get_if<protocol::TransferAccept>(&message)) {
        resolve_response(acc->payload.transfer_id, ControlResponse{true, acc->payload.data});
    } else if (auto* dec = std::get_if<protocol::TransferDecline>(&message)) {
        resolve_response(dec->payload.transfer_id, ControlResponse{false, dec->payload.data});
    } else if (auto* can = std::get_if<protocol::TransferCancel>(&message)) {
        resolve_response(can->payload.transfer_id, ControlResponse{false, can->payload.data});
        on_transfer_cancel.emit(IncomingControl{sender, sender_port, can->payload});
    }
}

bool DiscoveryService::accept_source(const std::string& sender, const std::string& signature,
                                     bool is_hello) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (bad_addresses_.count(sender)) return false;

    if (!signature.empty() && protocol::strip_adapter_markers(signature) == own_display_) {
        // Our own packet came back. From one of our addresses that is just
        // broadcast loopback; from anywhere else it is an echo.
        if (!local_addresses_.count(sender) && ++echo_counts_[sender] >= kEchoLimit) {
            bad_addresses_.insert(sender);
            spdlog::warn("Ignoring {} from now on: it keeps echoing our own packets", sender);
        }
        return false;
    }

    if (is_hello && local_addresses_.count(sender)) return false;
    return true;
}

void DiscoveryService::touch_address(const std::string& address) {
    auto now = Clock::now();
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& entry : peers_) {
        if (entry.second.address == address) entry.second.last_seen = now;
    }
}

void DiscoveryService::handle_hello(const protocol::HelloMessage& hello, const std::string& sender) {
    std::optional<models::Peer> found;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::string type = connection_type_for(sender, interfaces_);
        std::string id = models::make_peer_id(sender, hello.port, type);
        auto now = Clock::now();

        auto it = peers_.find(id);
        if (it == peers_.end()) {
            auto peer = models::make_peer(sender, hello.port, hello.signature, type,
                                          adapter_for(sender, interfaces_));
            peers_.emplace(id, peer);
            found = peer;
        } else if (now - it->second.last_seen > kRefreshGap) {
            it->second.last_seen = now;
            if (it->second.signature != hello.signature) {
                auto refreshed = models::make_peer(sender, hello.port, hello.signature, type,
                                                   it->second.adapter_name);
                it->second = refreshed;
            }
        }
    }

    if (found) {
        spdlog::info("Peer found: {} at {}:{} via {}", found->display_name(), sender, hello.port,
                     found->connection_type);
        on_peer_found.emit(*found);
    }

    if (hello.broadcast) say_hello_to(sender, hello.port);
}

void DiscoveryService::handle_goodbye(const std::string& sender) {
    std::vector<models::Peer> lost;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = peers_.begin(); it != peers_.end();) {
            if (it->second.address == sender) {
                lost.push_back(it->second);
                it = peers_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (const auto& peer : lost) {
        spdlog::info("Peer left: {} ({})", peer.display_name(), peer.id);
        on_peer_lost.emit(peer);
    }
}

void DiscoveryService::expire_peers(Clock::time_point now) {
    std::vector<models::Peer> lost;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = peers_.begin(); it != peers_.end();) {
            if (now - it->second.last_seen > config_.peer_timeout) {
                lost.push_back(it->second);
                it = peers_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (const auto& peer : lost) {
        spdlog::info("Peer timed out: {} ({})", peer.display_name(), peer.id);
        on_peer_lost.emit(peer);
    }
}

void DiscoveryService::drop_unreachable_peers() {
    std::vector<models::Peer> lost;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (interfaces_.empty()) return;
        for (auto it = peers_.begin(); it != peers_.end();) {
            bool reachable = std::any_of(interfaces_.begin(), interfaces_.end(),
                [&](const InterfaceInfo& iface) {
                    return iface.is_active &&
                           (iface.address == it->second.address ||
                            same_subnet(iface.address, it->second.address, iface.subnet_mask));
                });
            if (reachable) {
                ++it;
            } else {
                lost.push_back(it->second);
                it = peers_.erase(it);
            }
        }
    }
    for (const auto& peer : lost) on_peer_lost.emit(peer);
}

// --- Control responses ---

std::future<ControlResponse> DiscoveryService::expect_response(const std::string& transfer_id) {
    std::lock_guard<std::mutex> lock(responses_mutex_);
    std::promise<ControlResponse> promise;
    auto future = promise.get_future();
    pending_responses_[transfer_id] = std::move(promise);
    return future;
}

void DiscoveryService::abandon_response(const std::string& transfer_id) {
    std::lock_guard<std::mutex> lock(responses_mutex_);
    pending_responses_.erase(transfer_id);
}

void DiscoveryService::resolve_response(const std::string& transfer_id, ControlResponse response) {
    std::lock_guard<std::mutex> lock(responses_mutex_);
    auto it = pending_responses_.find(transfer_id);
    if (it == pending_responses_.end()) {
        spdlog::trace("No pending request for transfer {}", transfer_id);
        return;
    }
    spdlog::debug("Transfer {} {}", transfer_id, response.accepted ? "accepted" : "refused");
    it->second.set_value(std::move(response));
    pending_responses_.erase(it);
}

// --- Interfaces ---

bool DiscoveryService::refresh_interfaces() {
    std::vector<InterfaceInfo> fresh;
    try {
        fresh = interface_provider_();
    } catch (const InterfaceError& e) {
        spdlog::warn("Interface enumeration failed, keeping last list: {}", e.what());
        return false;
    }

    std::string fingerprint = interfaces_fingerprint(fresh);
    std::lock_guard<std::mutex> lock(mutex_);
    bool changed = fingerprint != interfaces_fingerprint_;
    interfaces_ = std::move(fresh);
    interfaces_fingerprint_ = fingerprint;
    for (const auto& iface : interfaces_) {
        if (!iface.is_loopback) local_addresses_.insert(iface.address);
    }
    return changed;
}

void DiscoveryService::set_interface_provider(InterfaceProvider provider) {
    interface_provider_ = std::move(provider);
    refresh_interfaces();
}

std::vector<InterfaceInfo> DiscoveryService::interfaces() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return interfaces_;
}

bool DiscoveryService::is_local_address(const std::string& address) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return local_addresses_.count(address) > 0;
}

bool DiscoveryService::is_bad_address(const std::string& address) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bad_addresses_.count(address) > 0;
}

// --- Snapshots ---

std::vector<models::Peer> DiscoveryService::peers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<models::Peer> out;
    out.reserve(peers_.size());
    for (const auto& entry : peers_) out.push_back(entry.second);
    return out;
}

std::optional<models::Peer> DiscoveryService::find_peer_by_address(const std::string& address) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : peers_) {
        if (entry.second.address == address) return entry.second;
    }
    return std::nullopt;
}

} // namespace zipline::networking
