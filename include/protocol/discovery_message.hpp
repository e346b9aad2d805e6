#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>
#include "protocol/control_payload.hpp"

namespace zipline::protocol {

// First byte of every discovery datagram.
enum class MessageType : uint8_t {
    INVALID = 0x00,
    HELLO_BROADCAST = 0x01,
    HELLO_UNICAST = 0x02,
    GOODBYE = 0x03,
    HELLO_PORT_BROADCAST = 0x04,
    HELLO_PORT_UNICAST = 0x05,
    TRANSFER_REQUEST = 0x06,
    TRANSFER_ACCEPT = 0x07,
    TRANSFER_DECLINE = 0x08,
    TRANSFER_CANCEL = 0x09
};

struct InvalidMessage {};

// Covers the four HELLO wire types. Port-less variants are decoded with
// the caller's default port.
struct HelloMessage {
    bool broadcast = true;
    bool with_port = true;
    uint16_t port = 0;
    std::string signature;
};

struct GoodbyeMessage {
    std::string signature;
};

struct TransferRequest { ControlPayload payload; };
struct TransferAccept { ControlPayload payload; };
struct TransferDecline { ControlPayload payload; };
struct TransferCancel { ControlPayload payload; };

using DiscoveryMessage = std::variant<InvalidMessage, HelloMessage, GoodbyeMessage,
                                      TransferRequest, TransferAccept,
                                      TransferDecline, TransferCancel>;

MessageType message_type(const DiscoveryMessage& message);

std::vector<uint8_t> encode_message(const DiscoveryMessage& message);

// Never throws. Unknown type bytes, bad UTF-8, zero or truncated ports and
// malformed JSON all yield InvalidMessage.
DiscoveryMessage parse_message(const uint8_t* data, size_t length, uint16_t default_port);

inline bool is_valid(const DiscoveryMessage& message) {
    return !std::holds_alternative<InvalidMessage>(message);
}

const char* to_string(MessageType type);

} // namespace zipline::protocol
