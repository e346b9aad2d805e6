#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace zipline::transfer {

// Receives the decoded elements of one transfer stream.
class FrameSink {
public:
    virtual ~FrameSink() = default;

    virtual void on_header(int64_t total_elements, int64_t total_size) = 0;
    virtual void on_folder(const std::string& name) = 0;
    virtual void on_element_start(const std::string& name, int64_t size, bool is_text) = 0;
    virtual void on_element_data(const uint8_t* data, std::size_t length) = 0;
    virtual void on_element_end() = 0;
};

// Incremental parser for the transfer stream. Input may be split at any
// byte; state is kept across feed() calls. Throws ProtocolError on a
// malformed stream; exceptions thrown by the sink propagate unchanged.
class FrameParser {
public:
    enum class State {
        READ_TOTAL_ELEMENTS,
        READ_TOTAL_SIZE,
        READ_ELEMENT_NAME,
        READ_ELEMENT_SIZE,
        READ_ELEMENT_DATA,
        DONE
    };

    static constexpr std::size_t kMaxNameLength = 32 * 1024;

    explicit FrameParser(FrameSink& sink);

    // Returns the number of bytes consumed. Bytes after the last element
    // are left unconsumed.
    std::size_t feed(const uint8_t* data, std::size_t length);

    State state() const { return state_; }
    bool done() const { return state_ == State::DONE; }
    int64_t total_elements() const { return total_elements_; }
    int64_t total_size() const { return total_size_; }
    int64_t elements_received() const { return elements_received_; }
    int64_t bytes_received() const { return bytes_received_; }

private:
    // Fills scratch_; true once 8 bytes are present.
    bool take_int64(const uint8_t*& data, const uint8_t* end, int64_t& out);
    void finish_element();

    FrameSink& sink_;
    State state_ = State::READ_TOTAL_ELEMENTS;
    std::array<uint8_t, 8> scratch_{};
    std::size_t scratch_used_ = 0;
    std::string name_;

    int64_t total_elements_ = 0;
    int64_t total_size_ = 0;
    int64_t elements_received_ = 0;
    int64_t bytes_received_ = 0;
    int64_t element_size_ = 0;
    int64_t element_received_ = 0;
};

} // namespace zipline::transfer
