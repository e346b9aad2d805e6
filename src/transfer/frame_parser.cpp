#include "transfer/frame_parser.hpp"
#include "errors.hpp"
#include "protocol/wire.hpp"
#include <algorithm>
#include <cstring>

namespace zipline::transfer {

FrameParser::FrameParser(FrameSink& sink) : sink_(sink) {}

bool FrameParser::take_int64(const uint8_t*& data, const uint8_t* end, int64_t& out) {
    std::size_t want = scratch_.size() - scratch_used_;
    std::size_t take = std::min<std::size_t>(want, static_cast<std::size_t>(end - data));
    std::memcpy(scratch_.data() + scratch_used_, data, take);
    scratch_used_ += take;
    data += take;
    if (scratch_used_ < scratch_.size()) return false;

    out = protocol::decode_int64(scratch_);
    scratch_used_ = 0;
    return true;
}

void FrameParser::finish_element() {
    ++elements_received_;
    state_ = elements_received_ < total_elements_ ? State::READ_ELEMENT_NAME : State::DONE;
}

std::size_t FrameParser::feed(const uint8_t* data, std::size_t length) {
    const uint8_t* p = data;
    const uint8_t* end = data + length;

    while (p < end && state_ != State::DONE) {
        switch (state_) {
        case State::READ_TOTAL_ELEMENTS:
            if (take_int64(p, end, total_elements_)) {
                if (total_elements_ < 0) {
                    throw ProtocolError("Negative element count: " + std::to_string(total_elements_));
                }
                state_ = State::READ_TOTAL_SIZE;
            }
            break;

        case State::READ_TOTAL_SIZE:
            if (take_int64(p, end, total_size_)) {
                if (total_size_ < 0) {
                    throw ProtocolError("Negative total size: " + std::to_string(total_size_));
                }
                sink_.on_header(total_elements_, total_size_);
                state_ = total_elements_ > 0 ? State::READ_ELEMENT_NAME : State::DONE;
            }
            break;

        case State::READ_ELEMENT_NAME: {
            const uint8_t* nul = std::find(p, end, uint8_t{0});
            name_.append(reinterpret_cast<const char*>(p), static_cast<std::size_t>(nul - p));
            if (name_.size() > kMaxNameLength) throw ProtocolError("Element name too long");
            p = nul;
            if (p < end) {
                ++p;    // terminator
                if (name_.empty()) throw ProtocolError("Empty element name");
                if (!protocol::is_valid_utf8(name_)) throw ProtocolError("Element name is not valid UTF-8");
                state_ = State::READ_ELEMENT_SIZE;
            }
            break;
        }

        case State::READ_ELEMENT_SIZE:
            if (take_int64(p, end, element_size_)) {
                std::string name = std::move(name_);
                name_.clear();
                bool is_text = name == protocol::kTextElementName;

                if (element_size_ == protocol::kFolderSize) {
                    if (is_text) throw ProtocolError("Text element announced as a folder");
                    sink_.on_folder(name);
                    finish_element();
                    break;
                }
                if (element_size_ < 0) {
                    throw ProtocolError("Invalid element size: " + std::to_string(element_size_));
                }
                if (element_size_ > total_size_ - bytes_received_) {
                    throw ProtocolError("Element '" + name + "' exceeds the announced total size");
                }

                element_received_ = 0;
                sink_.on_element_start(name, element_size_, is_text);
                if (element_size_ == 0) {
                    sink_.on_element_end();
                    finish_element();
                } else {
                    state_ = State::READ_ELEMENT_DATA;
                }
            }
            break;

        case State::READ_ELEMENT_DATA: {
            int64_t remaining = element_size_ - element_received_;
            std::size_t take = static_cast<std::size_t>(
                std::min<int64_t>(remaining, static_cast<int64_t>(end - p)));
            sink_.on_element_data(p, take);
            p += take;
            element_received_ += static_cast<int64_t>(take);
            bytes_received_ += static_cast<int64_t>(take);
            if (element_received_ == element_size_) {
                sink_.on_element_end();
                finish_element();
            }
            break;
        }

        case State::DONE:
            break;
        }
    }

    return static_cast<std::size_t>(p - data);
}

} // namespace zipline::transfer
