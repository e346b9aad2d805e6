#include "protocol/discovery_message.hpp"
#include "protocol/wire.hpp"
#include <spdlog/spdlog.h>

namespace zipline::protocol {

namespace {

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

void append_utf8(std::vector<uint8_t>& out, const std::string& s) {
    out.insert(out.end(), s.begin(), s.end());
}

void append_control(std::vector<uint8_t>& out, MessageType type, const ControlPayload& payload) {
    out.push_back(static_cast<uint8_t>(type));
    nlohmann::json j = payload;
    append_utf8(out, j.dump());
}

std::string body_string(const uint8_t* data, size_t length, size_t offset) {
    if (length <= offset) return "";
    return std::string(reinterpret_cast<const char*>(data + offset), length - offset);
}

} // namespace

MessageType message_type(const DiscoveryMessage& message) {
    return std::visit(overloaded{
        [](const InvalidMessage&) { return MessageType::INVALID; },
        [](const HelloMessage& m) {
            if (m.with_port)
                return m.broadcast ? MessageType::HELLO_PORT_BROADCAST : MessageType::HELLO_PORT_UNICAST;
            return m.broadcast ? MessageType::HELLO_BROADCAST : MessageType::HELLO_UNICAST;
        },
        [](const GoodbyeMessage&) { return MessageType::GOODBYE; },
        [](const TransferRequest&) { return MessageType::TRANSFER_REQUEST; },
        [](const TransferAccept&) { return MessageType::TRANSFER_ACCEPT; },
        [](const TransferDecline&) { return MessageType::TRANSFER_DECLINE; },
        [](const TransferCancel&) { return MessageType::TRANSFER_CANCEL; },
    }, message);
}

std::vector<uint8_t> encode_message(const DiscoveryMessage& message) {
    std::vector<uint8_t> out;
    MessageType type = message_type(message);

    std::visit(overloaded{
        [&](const InvalidMessage&) { out.push_back(static_cast<uint8_t>(MessageType::INVALID)); },
        [&](const HelloMessage& m) {
            out.push_back(static_cast<uint8_t>(type));
            if (m.with_port) {
                out.push_back(static_cast<uint8_t>(m.port & 0xFF));
                out.push_back(static_cast<uint8_t>((m.port >> 8) & 0xFF));
            }
            append_utf8(out, m.signature);
        },
        [&](const GoodbyeMessage& m) {
            out.push_back(static_cast<uint8_t>(type));
            append_utf8(out, m.signature);
        },
        [&](const TransferRequest& m) { append_control(out, type, m.payload); },
        [&](const TransferAccept& m) { append_control(out, type, m.payload); },
        [&](const TransferDecline& m) { append_control(out, type, m.payload); },
        [&](const TransferCancel& m) { append_control(out, type, m.payload); },
    }, message);

    return out;
}

DiscoveryMessage parse_message(const uint8_t* data, size_t length, uint16_t default_port) {
    if (length == 0) return InvalidMessage{};

    // Everything after the type byte is UTF-8 except the two port bytes.
    auto type = static_cast<MessageType>(data[0]);
    switch (type) {
    case MessageType::HELLO_BROADCAST:
    case MessageType::HELLO_UNICAST: {
        if (!is_valid_utf8(data + 1, length - 1)) return InvalidMessage{};
        HelloMessage m;
        m.broadcast = type == MessageType::HELLO_BROADCAST;
        m.with_port = false;
        m.port = default_port;
        m.signature = body_string(data, length, 1);
        return m;
    }
    case MessageType::HELLO_PORT_BROADCAST:
    case MessageType::HELLO_PORT_UNICAST: {
        if (length < 3) return InvalidMessage{};
        uint16_t port = static_cast<uint16_t>(data[1] | (data[2] << 8));
        if (port == 0) return InvalidMessage{};
        if (!is_valid_utf8(data + 3, length - 3)) return InvalidMessage{};
        HelloMessage m;
        m.broadcast = type == MessageType::HELLO_PORT_BROADCAST;
        m.with_port = true;
        m.port = port;
        m.signature = body_string(data, length, 3);
        return m;
    }
    case MessageType::GOODBYE: {
        if (!is_valid_utf8(data + 1, length - 1)) return InvalidMessage{};
        return GoodbyeMessage{body_string(data, length, 1)};
    }
    case MessageType::TRANSFER_REQUEST:
    case MessageType::TRANSFER_ACCEPT:
    case MessageType::TRANSFER_DECLINE:
    case MessageType::TRANSFER_CANCEL: {
        if (!is_valid_utf8(data + 1, length - 1)) return InvalidMessage{};
        ControlPayload payload;
        try {
            auto j = nlohmann::json::parse(body_string(data, length, 1));
            payload = j.get<ControlPayload>();
        } catch (const nlohmann::json::exception& e) {
            spdlog::trace("Dropping {} with malformed payload: {}", to_string(type), e.what());
            return InvalidMessage{};
        }
        if (type == MessageType::TRANSFER_REQUEST) return TransferRequest{payload};
        if (type == MessageType::TRANSFER_ACCEPT) return TransferAccept{payload};
        if (type == MessageType::TRANSFER_DECLINE) return TransferDecline{payload};
        return TransferCancel{payload};
    }
    default:
        return InvalidMessage{};
    }
}

const char* to_string(MessageType type) {
    switch (type) {
    case MessageType::HELLO_BROADCAST: return "hello_broadcast";
    case MessageType::HELLO_UNICAST: return "hello_unicast";
    case MessageType::GOODBYE: return "goodbye";
    case MessageType::HELLO_PORT_BROADCAST: return "hello_port_broadcast";
    case MessageType::HELLO_PORT_UNICAST: return "hello_port_unicast";
    case MessageType::TRANSFER_REQUEST: return "transfer_request";
    case MessageType::TRANSFER_ACCEPT: return "transfer_accept";
    case MessageType::TRANSFER_DECLINE: return "transfer_decline";
    case MessageType::TRANSFER_CANCEL: return "transfer_cancel";
    default: return "invalid";
    }
}

} // namespace zipline::protocol
