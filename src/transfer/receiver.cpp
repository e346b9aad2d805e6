#include "transfer/receiver.hpp"
#include "errors.hpp"
#include "networking/interfaces.hpp"
#include "protocol/wire.hpp"
#include "transfer/frame_parser.hpp"
#include "transfer/path_mapper.hpp"
#include "transfer/speed_calculator.hpp"
#include <filesystem>
#include <fstream>
#include <vector>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;
using boost::asio::ip::tcp;

namespace zipline::transfer {

namespace {

// Materializes one inbound stream on disk and keeps the session current.
class ReceiveSink : public FrameSink {
public:
    ReceiveSink(Connection& connection, const IncomingTransfer& incoming, const Config& config,
                storage::SessionRegistry& registry, const EventStream<TextReceived>& on_text)
        : connection_(connection), incoming_(incoming), config_(config),
          registry_(registry), on_text_(on_text) {
        session_.id = incoming.session_id;
        session_.peer = incoming.peer;
        session_.direction = models::TransferDirection::RECEIVING;
        session_.save_directory = incoming.save_directory;
        session_.started_at = std::chrono::system_clock::now();
    }

    void on_header(int64_t total_elements, int64_t total_size) override {
        session_.total_files = total_elements;
        session_.total_size = total_size;
        session_.status = models::TransferStatus::IN_PROGRESS;
        session_.data_transfer_started_at = std::chrono::system_clock::now();

        connection_.set_cancel_flag(registry_.cancel_token(session_.id));
        registry_.start(session_);
        started_ = true;
        speed_.record(0);

        if (session_.save_directory.empty()) {
            throw ConfigError("No download directory configured");
        }
        fs::path root = fs::u8path(session_.save_directory);
        std::error_code ec;
        fs::create_directories(root, ec);
        if (ec) throw IOError("Could not create " + root.string() + ": " + ec.message());
        mapper_.emplace(root);
    }

    void on_folder(const std::string& name) override {
        fs::path dir = mapper_->map_folder(name);
        spdlog::debug("Created folder {}", dir.string());

        models::TransferItem item;
        item.type = models::ItemType::FOLDER;
        item.name = name;
        item.size = protocol::kFolderSize;
        item.path = dir.u8string();
        item.status = models::TransferStatus::COMPLETED;
        session_.items.push_back(std::move(item));

        session_.completed_files += 1;
        session_.current_file_name = name;
        publish();
    }

    void on_element_start(const std::string& name, int64_t size, bool is_text) override {
        models::TransferItem item;
        item.name = name;
        item.size = size;
        item.status = models::TransferStatus::IN_PROGRESS;

        if (is_text) {
            item.type = models::ItemType::TEXT;
            text_.clear();
            session_.current_file_name = "Text snippet";
        } else {
            item.type = models::ItemType::FILE;
            fs::path target = mapper_->map_file(name);
            // map_file created target empty and exclusively for this session.
            file_.open(target, std::ios::binary);
            if (!file_.is_open()) {
                throw IOError("Could not open file for writing: " + target.string());
            }
            item.path = target.u8string();
            session_.current_file_name = name;
        }
        session_.items.push_back(std::move(item));
    }

    void on_element_data(const uint8_t* data, std::size_t length) override {
        auto& item = session_.items.back();
        if (item.type == models::ItemType::TEXT) {
            text_.append(reinterpret_cast<const char*>(data), length);
        } else {
            file_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(length));
            if (!file_) throw IOError("Write failed: " + item.path);
        }

        session_.transferred_size += static_cast<int64_t>(length);
        since_update_ += length;
        if (since_update_ >= config_.progress_update_interval) publish();
    }

    void on_element_end() override {
        auto& item = session_.items.back();
        if (item.type == models::ItemType::TEXT) {
            if (!protocol::is_valid_utf8(text_)) throw ProtocolError("Received text is not valid UTF-8");
            item.text_content = text_;
            spdlog::info("Text received from {} ({} bytes)", session_.peer.display_name(), text_.size());
            on_text_.emit(TextReceived{session_.id, session_.peer, text_});
        } else {
            file_.close();
            if (file_.fail()) throw IOError("Could not finish writing " + item.path);
            spdlog::debug("Received {}", item.path);
        }
        item.status = models::TransferStatus::COMPLETED;
        session_.completed_files += 1;
        publish();
    }

    void complete() {
        if (session_.transferred_size != session_.total_size) {
            throw ProtocolError("Received " + std::to_string(session_.transferred_size) +
                                " bytes but " + std::to_string(session_.total_size) + " were announced");
        }
        session_.status = models::TransferStatus::COMPLETED;
        session_.completed_at = std::chrono::system_clock::now();
        session_.current_speed = speed_.average_speed();
        registry_.finish(session_);
    }

    void fail(models::TransferStatus status, const std::string& message) {
        if (file_.is_open()) file_.close();
        session_.status = status;
        session_.error = message;
        session_.completed_at = std::chrono::system_clock::now();
        session_.current_speed = 0.0;
        if (started_) {
            registry_.finish(session_);
        } else {
            spdlog::warn("Connection from {} dropped before the transfer began: {}",
                         incoming_.peer.address, message);
        }
    }

    const models::TransferSession& session() const { return session_; }

private:
    void publish() {
        since_update_ = 0;
        speed_.record(session_.transferred_size);
        session_.current_speed = speed_.current_speed();
        registry_.update(session_);
    }

    Connection& connection_;
    const IncomingTransfer& incoming_;
    const Config& config_;
    storage::SessionRegistry& registry_;
    const EventStream<TextReceived>& on_text_;

    models::TransferSession session_;
    std::optional<PathMapper> mapper_;
    std::ofstream file_;
    std::string text_;
    std::size_t since_update_ = 0;
    SpeedCalculator speed_;
    bool started_ = false;
};

} // namespace

models::TransferSession receive_transfer(Connection& connection, const IncomingTransfer& incoming,
                                         const Config& config, storage::SessionRegistry& registry,
                                         const EventStream<TextReceived>& on_text) {
    ReceiveSink sink(connection, incoming, config, registry, on_text);
    FrameParser parser(sink);
    std::vector<uint8_t> buffer(config.buffer_size);

    try {
        while (!parser.done()) {
            std::size_t n = connection.read_some(buffer.data(), buffer.size());
            if (n == 0) {
                throw PeerGone("Connection closed before the transfer completed (" +
                               std::to_string(parser.elements_received()) + " of " +
                               std::to_string(parser.total_elements()) + " elements)");
            }
            std::size_t used = parser.feed(buffer.data(), n);
            if (used < n) spdlog::debug("Ignoring {} bytes after the last element", n - used);
        }
        sink.complete();
    } catch (const Cancelled& e) {
        sink.fail(models::TransferStatus::CANCELLED, e.what());
    } catch (const std::exception& e) {
        sink.fail(models::TransferStatus::FAILED, e.what());
    }

    connection.close();
    return sink.session();
}

// --- TransferListener ---

TransferListener::TransferListener(const Config& config, storage::SessionRegistry& registry,
                                   ConnectionResolver resolver)
    : config_(config), registry_(registry), resolver_(std::move(resolver)), acceptor_(io_context_) {}

TransferListener::~TransferListener() {
    stop();
}

void TransferListener::start() {
    if (running_) return;

    tcp::endpoint endpoint(tcp::v4(), config_.listen_port);
    boost::system::error_code ec;
    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (!ec) acceptor_.bind(endpoint, ec);
    if (!ec) acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
        boost::system::error_code ignored;
        acceptor_.close(ignored);
        throw NetworkBindError("Could not listen on TCP port " + std::to_string(config_.listen_port) +
                               ": " + ec.message(),
                               networking::find_port_owner(config_.listen_port));
    }
    port_ = acceptor_.local_endpoint().port();

    io_context_.restart();
    running_ = true;
    accept_next();

    thread_ = std::thread([this]() {
        try {
            io_context_.run();
        } catch (std::exception& e) {
            spdlog::error("Listener thread stopped: {}", e.what());
        }
    });
    spdlog::info("Listening for transfers on TCP {}", port_);
}

void TransferListener::stop() {
    if (!running_.exchange(false)) return;

    boost::asio::post(io_context_, [this]() {
        boost::system::error_code ignored;
        acceptor_.close(ignored);
    });
    if (thread_.joinable()) thread_.join();

    std::list<Task> tasks;
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        tasks.swap(tasks_);
    }
    for (auto& task : tasks) task.connection->abort();
    for (auto& task : tasks) {
        if (task.thread.joinable()) task.thread.join();
    }
    spdlog::info("Listener stopped");
}

void TransferListener::accept_next() {
    auto connection = std::make_shared<Connection>();
    acceptor_.async_accept(connection->socket(), [this, connection](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted || !running_) return;
        if (ec) {
            spdlog::warn("Accept failed: {}", ec.message());
        } else {
            spawn(connection);
        }
        accept_next();
    });
}

void TransferListener::spawn(std::shared_ptr<Connection> connection) {
    reap_finished();

    Task task;
    task.finished = std::make_shared<std::atomic<bool>>(false);
    task.connection = connection;
    auto finished = task.finished;
    task.thread = std::thread([this, connection, finished]() {
        run_connection(connection);
        finished->store(true);
    });

    std::lock_guard<std::mutex> lock(tasks_mutex_);
    tasks_.push_back(std::move(task));
}

void TransferListener::reap_finished() {
    std::lock_guard<std::mutex> lock(tasks_mutex_);
    for (auto it = tasks_.begin(); it != tasks_.end();) {
        if (it->finished->load()) {
            if (it->thread.joinable()) it->thread.join();
            it = tasks_.erase(it);
        } else {
            ++it;
        }
    }
}

void TransferListener::run_connection(const std::shared_ptr<Connection>& connection) {
    try {
        connection->apply_options(config_.socket_buffer_size);
        std::string address = connection->remote_address();
        uint16_t port = connection->remote_port();

        auto incoming = resolver_ ? resolver_(address, port) : std::nullopt;
        if (!incoming) {
            registry_.reject_request(storage::RequestRejection{"", address, "Unsolicited connection refused"});
            connection->close();
            return;
        }

        spdlog::info("Receiving transfer {} from {} into {}", incoming->session_id, address,
                     incoming->save_directory);
        receive_transfer(*connection, *incoming, config_, registry_, on_text_received);
    } catch (std::exception& e) {
        spdlog::error("Receive task failed: {}", e.what());
    }
}

} // namespace zipline::transfer
