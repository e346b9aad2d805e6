#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <boost/asio.hpp>

namespace zipline::transfer {

// A TCP stream with its own io_context. Every operation is started
// asynchronously and driven in short run_for() slices so that a cancel
// flag raised from another thread closes the socket promptly.
//
// Failures throw PeerGone; a raised cancel flag throws Cancelled.
class Connection {
public:
    using CancelFlag = std::shared_ptr<std::atomic<bool>>;

    static constexpr std::chrono::milliseconds kPollSlice{200};

    explicit Connection(CancelFlag cancel_flag = nullptr);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    boost::asio::ip::tcp::socket& socket() { return socket_; }
    boost::asio::io_context& io_context() { return io_context_; }

    void set_cancel_flag(CancelFlag flag) { cancel_flag_ = std::move(flag); }
    bool cancel_requested() const { return aborted_ || (cancel_flag_ && cancel_flag_->load()); }

    // Cancels the current and any later operation, from any thread.
    void abort() { aborted_ = true; }

    // Binds to local_address first when given; falls back to default
    // routing if that bind fails.
    void connect(const std::string& address, uint16_t port,
                 const std::optional<std::string>& local_address,
                 std::chrono::milliseconds timeout, int buffer_size);

    // TCP_NODELAY plus send/receive buffers; unsupported options are skipped.
    void apply_options(int buffer_size);

    void write_all(const uint8_t* data, std::size_t length);

    // Returns 0 at end of stream.
    std::size_t read_some(uint8_t* data, std::size_t capacity);

    void close();

    std::string remote_address() const;
    uint16_t remote_port() const;

private:
    using Completion = std::function<void(const boost::system::error_code&, std::size_t)>;

    // timeout of zero waits indefinitely.
    std::size_t run(const std::function<void(Completion)>& start, std::chrono::milliseconds timeout,
                    boost::system::error_code& ec);

    boost::asio::io_context io_context_;
    boost::asio::ip::tcp::socket socket_;
    CancelFlag cancel_flag_;
    std::atomic<bool> aborted_{false};
};

} // namespace zipline::transfer
