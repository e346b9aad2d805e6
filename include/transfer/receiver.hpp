#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <boost/asio.hpp>
#include "config.hpp"
#include "event_stream.hpp"
#include "models/transfer_session.hpp"
#include "storage/session_registry.hpp"
#include "transfer/connection.hpp"

namespace zipline::transfer {

// Who is on the other end of an accepted connection and where it saves.
struct IncomingTransfer {
    std::string session_id;
    models::Peer peer;
    std::string save_directory;
};

struct TextReceived {
    std::string session_id;
    models::Peer peer;
    std::string text;
};

// Maps a connecting sender to its session. nullopt refuses the connection.
using ConnectionResolver =
    std::function<std::optional<IncomingTransfer>(const std::string& address, uint16_t port)>;

// Runs one received transfer stream to a terminal session. The connection
// is read until every announced element has arrived; unexpected EOF fails
// the session and a raised cancel flag cancels it.
models::TransferSession receive_transfer(Connection& connection, const IncomingTransfer& incoming,
                                         const Config& config, storage::SessionRegistry& registry,
                                         const EventStream<TextReceived>& on_text);

// The always-on TCP listener. Each accepted connection gets its own
// io_context and thread.
class TransferListener {
public:
    TransferListener(const Config& config, storage::SessionRegistry& registry,
                     ConnectionResolver resolver);
    ~TransferListener();

    TransferListener(const TransferListener&) = delete;
    TransferListener& operator=(const TransferListener&) = delete;

    // Throws NetworkBindError naming the conflicting process when known.
    void start();

    // Cancels running receives and joins their threads.
    void stop();

    bool is_running() const { return running_; }
    uint16_t port() const { return port_; }

    EventStream<TextReceived> on_text_received;

private:
    struct Task {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> finished;
        std::shared_ptr<Connection> connection;
    };

    void accept_next();
    void spawn(std::shared_ptr<Connection> connection);
    void run_connection(const std::shared_ptr<Connection>& connection);
    void reap_finished();

    Config config_;
    storage::SessionRegistry& registry_;
    ConnectionResolver resolver_;

    boost::asio::io_context io_context_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    uint16_t port_ = 0;

    std::mutex tasks_mutex_;
    std::list<Task> tasks_;
};

} // namespace zipline::transfer
