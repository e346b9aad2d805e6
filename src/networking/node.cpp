#include "networking/node.hpp"
#include "errors.hpp"
#include "transfer/sender.hpp"
#include "transfer/source_walker.hpp"
#include <algorithm>
#include <cctype>
#include <spdlog/spdlog.h>

namespace zipline::networking {

namespace {

std::shared_ptr<storage::KeyValueStore> default_store(const Config& config) {
    if (config.state_file.empty()) return std::make_shared<storage::MemoryStore>();
    return std::make_shared<storage::JsonFileStore>(std::filesystem::u8path(config.state_file));
}

bool contains_case_insensitive(const std::string& haystack, const std::string& needle) {
    auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                          [](char a, char b) {
                              return std::tolower(static_cast<unsigned char>(a)) ==
                                     std::tolower(static_cast<unsigned char>(b));
                          });
    return it != haystack.end();
}

} // namespace

Node::Node(Config config, std::shared_ptr<storage::KeyValueStore> store)
    : config_(std::move(config)),
      store_(store ? std::move(store) : default_store(config_)),
      registry_(store_),
      save_locations_(store_),
      discovery_(config_),
      listener_(config_, registry_,
                [this](const std::string& address, uint16_t port) { return resolve_connection(address, port); }) {
    discovery_.on_transfer_request.subscribe([this](const IncomingControl& c) { handle_request(c); });
    discovery_.on_transfer_cancel.subscribe([this](const IncomingControl& c) { handle_cancel(c); });
}

Node::~Node() {
    stop();
}

// --- Lifecycle ---

void Node::start() {
    if (running_) return;
    config_.validate();
    registry_.load_history();

    // TCP first: its bind fails loudly where UDP port sharing would not.
    listener_.start();
    try {
        discovery_.start();
    } catch (...) {
        listener_.stop();
        throw;
    }
    running_ = true;
    spdlog::info("Node started as \"{}\" on port {}", discovery_.signature(), config_.listen_port);
}

void Node::stop() {
    if (!running_.exchange(false)) return;
    for (const auto& session : registry_.active_sessions()) registry_.request_cancel(session.id);
    discovery_.stop();
    listener_.stop();
    spdlog::info("Node stopped");
}

// --- Peers ---

std::vector<models::Peer> Node::peers() const {
    return discovery_.peers();
}

std::optional<models::Peer> Node::find_peer(const std::string& query) const {
    if (query.empty()) return std::nullopt;
    auto all = discovery_.peers();

    std::string address = query;
    std::optional<uint16_t> port;
    auto colon = query.rfind(':');
    if (colon != std::string::npos) {
        try {
            int p = std::stoi(query.substr(colon + 1));
            if (p > 0 && p <= 65535) {
                address = query.substr(0, colon);
                port = static_cast<uint16_t>(p);
            }
        } catch (const std::exception&) {
            // not a port suffix
        }
    }

    for (const auto& peer : all) {
        if (peer.address == address && (!port || peer.port == *port)) return peer;
    }

    boost::system::error_code ec;
    boost::asio::ip::make_address_v4(address, ec);
    if (!ec) {
        // A literal address that never said hello; classic peers may not.
        return models::unknown_peer(address, port.value_or(kDefaultPort));
    }

    for (const auto& peer : all) {
        if (contains_case_insensitive(peer.name, query) || contains_case_insensitive(peer.signature, query)) {
            return peer;
        }
    }
    return std::nullopt;
}

// --- Sending ---

models::TransferSession Node::send(const models::Peer& peer, const std::vector<std::filesystem::path>& paths) {
    auto walk = transfer::walk_sources(paths);

    models::TransferSession session;
    session.id = models::next_session_id();
    session.peer = peer;
    session.items = std::move(walk.items);
    session.direction = models::TransferDirection::SENDING;
    session.total_size = walk.total_size;
    session.total_files = walk.total_files;
    session.started_at = std::chrono::system_clock::now();
    return run_send(std::move(session));
}

models::TransferSession Node::send_text(const models::Peer& peer, const std::string& text) {
    models::TransferSession session;
    session.id = models::next_session_id();
    session.peer = peer;
    session.items.push_back(transfer::make_text_item(text));
    session.direction = models::TransferDirection::SENDING;
    transfer::accumulate_totals(session.items, session.total_size, session.total_files);
    session.started_at = std::chrono::system_clock::now();
    return run_send(std::move(session));
}

models::TransferSession Node::run_send(models::TransferSession session) {
    session.status = models::TransferStatus::PENDING;
    registry_.start(session);
    transfer::TransferSender sender(config_, discovery_, registry_);
    return sender.run(std::move(session));
}

bool Node::cancel(const std::string& session_id) {
    return registry_.request_cancel(session_id);
}

// --- Incoming requests ---

std::string Node::save_directory_for(const std::string& signature) const {
    auto location = save_locations_.best_location_for(signature);
    return location ? *location : config_.download_directory;
}

models::Peer Node::peer_for(const std::string& address, uint16_t port, const std::string& signature) const {
    if (auto known = discovery_.find_peer_by_address(address)) return *known;
    if (!signature.empty()) {
        return models::make_peer(address, port, signature,
                                 connection_type_for(address, discovery_.interfaces()));
    }
    return models::unknown_peer(address, port);
}

void Node::handle_request(const IncomingControl& control) {
    PendingRequest request;
    request.transfer_id = control.payload.transfer_id;
    request.address = control.address;
    request.port = control.port;
    request.peer = peer_for(control.address, control.port, control.payload.signature);
    request.payload = control.payload;
    request.received_at = std::chrono::system_clock::now();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_[request.transfer_id] = request;
    }
    on_transfer_request.emit(request);

    if (auto_accept_) accept_request(request.transfer_id);
}

void Node::handle_cancel(const IncomingControl& control) {
    const auto& id = control.payload.transfer_id;
    bool known = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        known = pending_.erase(id) > 0;
        auto it = accepted_.find(control.address);
        if (it != accepted_.end()) {
            auto& queue = it->second;
            auto before = queue.size();
            queue.erase(std::remove_if(queue.begin(), queue.end(),
                                       [&](const transfer::IncomingTransfer& t) { return t.session_id == id; }),
                        queue.end());
            known = known || queue.size() != before;
        }
    }

    std::string reason = control.payload.data.value_or("Cancelled by sender");
    if (known) registry_.reject_request(storage::RequestRejection{id, control.address, reason});
    registry_.request_cancel(id);
}

bool Node::accept_request(const std::string& transfer_id, std::optional<std::string> save_path) {
    PendingRequest request;
    std::string directory;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(transfer_id);
        if (it == pending_.end()) return false;
        request = it->second;
        pending_.erase(it);

        directory = save_path ? *save_path : save_directory_for(request.payload.signature);
        accepted_[request.address].push_back(
            transfer::IncomingTransfer{transfer_id, request.peer, directory});
    }

    protocol::ControlPayload payload;
    payload.signature = discovery_.signature();
    payload.transfer_id = transfer_id;
    payload.data = directory;
    discovery_.send_control(request.address, request.port, protocol::TransferAccept{payload});
    spdlog::info("Accepted transfer {} from {} into {}", transfer_id, request.peer.display_name(), directory);
    return true;
}

bool Node::decline_request(const std::string& transfer_id, const std::string& reason) {
    PendingRequest request;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(transfer_id);
        if (it == pending_.end()) return false;
        request = it->second;
        pending_.erase(it);
    }

    protocol::ControlPayload payload;
    payload.signature = discovery_.signature();
    payload.transfer_id = transfer_id;
    payload.data = reason;
    discovery_.send_control(request.address, request.port, protocol::TransferDecline{payload});
    registry_.reject_request(storage::RequestRejection{transfer_id, request.address, reason});
    return true;
}

std::vector<PendingRequest> Node::pending_requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PendingRequest> out;
    for (const auto& entry : pending_) out.push_back(entry.second);
    return out;
}

std::optional<transfer::IncomingTransfer> Node::resolve_connection(const std::string& address, uint16_t port) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = accepted_.find(address);
        if (it != accepted_.end() && !it->second.empty()) {
            auto incoming = it->second.front();
            it->second.pop_front();
            if (it->second.empty()) accepted_.erase(it);
            return incoming;
        }
    }

    if (!config_.accept_unsolicited) {
        spdlog::warn("Refusing unsolicited transfer from {}", address);
        return std::nullopt;
    }

    auto peer = peer_for(address, port, "");
    return transfer::IncomingTransfer{models::next_session_id(), peer, save_directory_for(peer.signature)};
}

// --- Diagnostics ---

nlohmann::json Node::diagnostics() const {
    return nlohmann::json{
        {"service", "zipline"},
        {"active_sessions", registry_.active_sessions().size()},
        {"completed_sessions", registry_.completed_sessions().size()},
        {"server_running", listener_.is_running()},
        {"listen_port", config_.listen_port},
        {"peers", discovery_.peers().size()},
    };
}

} // namespace zipline::networking
