#include "transfer/connection.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>

using boost::asio::ip::tcp;

namespace zipline::transfer {

Connection::Connection(CancelFlag cancel_flag)
    : socket_(io_context_), cancel_flag_(std::move(cancel_flag)) {}

Connection::~Connection() {
    close();
}

std::size_t Connection::run(const std::function<void(Completion)>& start,
                            std::chrono::milliseconds timeout, boost::system::error_code& ec) {
    if (cancel_requested()) {
        close();
        throw Cancelled();
    }

    bool done = false;
    std::size_t transferred = 0;
    io_context_.restart();
    start([&](const boost::system::error_code& result, std::size_t n) {
        ec = result;
        transferred = n;
        done = true;
    });

    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!done) {
        io_context_.run_for(kPollSlice);
        if (done) break;

        bool cancelled = cancel_requested();
        bool expired = timeout.count() > 0 && std::chrono::steady_clock::now() >= deadline;
        if (cancelled || expired) {
            close();
            // Let the aborted operation complete before its handler's captures go away.
            io_context_.restart();
            io_context_.run();
            if (cancelled) throw Cancelled();
            throw PeerGone("Timed out after " + std::to_string(timeout.count()) + " ms");
        }
    }
    return transferred;
}

void Connection::connect(const std::string& address, uint16_t port,
                         const std::optional<std::string>& local_address,
                         std::chrono::milliseconds timeout, int buffer_size) {
    boost::system::error_code ec;
    auto remote_ip = boost::asio::ip::make_address_v4(address, ec);
    if (ec) throw PeerGone("Invalid peer address: " + address);
    tcp::endpoint remote(remote_ip, port);

    socket_.open(tcp::v4(), ec);
    if (ec) throw PeerGone("Could not open socket: " + ec.message());

    if (local_address) {
        auto local_ip = boost::asio::ip::make_address_v4(*local_address, ec);
        if (!ec) socket_.bind(tcp::endpoint(local_ip, 0), ec);
        if (ec) {
            spdlog::debug("Could not bind to {} ({}), using default route", *local_address, ec.message());
            boost::system::error_code ignored;
            socket_.close(ignored);
            socket_.open(tcp::v4(), ec);
            if (ec) throw PeerGone("Could not open socket: " + ec.message());
        } else {
            spdlog::debug("Bound outgoing connection to {}", *local_address);
        }
    }

    apply_options(buffer_size);

    try {
        run([this, &remote](Completion done) {
                socket_.async_connect(remote, [done](const boost::system::error_code& result) {
                    done(result, 0);
                });
            },
            timeout, ec);
    } catch (const PeerGone& e) {
        throw PeerGone("Could not connect to " + address + ":" + std::to_string(port) + ": " + e.what());
    }

    if (ec) {
        close();
        throw PeerGone("Could not connect to " + address + ":" + std::to_string(port) + ": " +
                       ec.message());
    }
}

void Connection::apply_options(int buffer_size) {
    boost::system::error_code ec;
    socket_.set_option(tcp::no_delay(true), ec);
    if (ec) spdlog::trace("TCP_NODELAY not applied: {}", ec.message());
    if (buffer_size <= 0) return;
    socket_.set_option(boost::asio::socket_base::send_buffer_size(buffer_size), ec);
    if (ec) spdlog::trace("Send buffer size not applied: {}", ec.message());
    socket_.set_option(boost::asio::socket_base::receive_buffer_size(buffer_size), ec);
    if (ec) spdlog::trace("Receive buffer size not applied: {}", ec.message());
}

void Connection::write_all(const uint8_t* data, std::size_t length) {
    boost::system::error_code ec;
    run([this, data, length](Completion done) {
            boost::asio::async_write(socket_, boost::asio::buffer(data, length), done);
        },
        std::chrono::milliseconds(0), ec);
    if (ec) throw PeerGone("Connection lost while sending: " + ec.message());
}

std::size_t Connection::read_some(uint8_t* data, std::size_t capacity) {
    boost::system::error_code ec;
    std::size_t n = run([this, data, capacity](Completion done) {
                            socket_.async_read_some(boost::asio::buffer(data, capacity), done);
                        },
                        std::chrono::milliseconds(0), ec);
    if (ec == boost::asio::error::eof) return 0;
    if (ec) throw PeerGone("Connection lost while receiving: " + ec.message());
    return n;
}

void Connection::close() {
    if (!socket_.is_open()) return;
    boost::system::error_code ignored;
    socket_.shutdown(tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);
}

std::string Connection::remote_address() const {
    boost::system::error_code ec;
    auto endpoint = socket_.remote_endpoint(ec);
    return ec ? std::string() : endpoint.address().to_string();
}

uint16_t Connection::remote_port() const {
    boost::system::error_code ec;
    auto endpoint = socket_.remote_endpoint(ec);
    return ec ? 0 : endpoint.port();
}

} // namespace zipline::transfer
