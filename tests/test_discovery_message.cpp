#include <gtest/gtest.h>
#include "protocol/discovery_message.hpp"
#include <string>
#include <vector>

using namespace zipline::protocol;

class DiscoveryMessageTest : public ::testing::Test {
protected:
    static DiscoveryMessage parse(const std::vector<uint8_t>& bytes, uint16_t default_port = 6442) {
        return parse_message(bytes.data(), bytes.size(), default_port);
    }

    static std::vector<uint8_t> raw(uint8_t type, const std::string& body) {
        std::vector<uint8_t> out{type};
        out.insert(out.end(), body.begin(), body.end());
        return out;
    }
};

TEST_F(DiscoveryMessageTest, HelloPortIsLittleEndian) {
    HelloMessage hello;
    hello.broadcast = true;
    hello.with_port = true;
    hello.port = 0x1234;
    hello.signature = "Alice at A (Linux)";
    auto bytes = encode_message(hello);

    ASSERT_GE(bytes.size(), 3u);
    EXPECT_EQ(bytes[0], 0x04);
    EXPECT_EQ(bytes[1], 0x34);
    EXPECT_EQ(bytes[2], 0x12);

    auto parsed = parse(bytes);
    ASSERT_TRUE(std::holds_alternative<HelloMessage>(parsed));
    const auto& h = std::get<HelloMessage>(parsed);
    EXPECT_EQ(h.port, 0x1234);
    EXPECT_EQ(h.signature, "Alice at A (Linux)");
    EXPECT_TRUE(h.broadcast);
}

TEST_F(DiscoveryMessageTest, PortlessHelloUsesDefaultPort) {
    auto parsed = parse(raw(0x02, "Bob at B (Windows)"), 7000);
    ASSERT_TRUE(std::holds_alternative<HelloMessage>(parsed));
    const auto& h = std::get<HelloMessage>(parsed);
    EXPECT_FALSE(h.broadcast);
    EXPECT_FALSE(h.with_port);
    EXPECT_EQ(h.port, 7000);
    EXPECT_EQ(message_type(parsed), MessageType::HELLO_UNICAST);
}

TEST_F(DiscoveryMessageTest, ZeroOrTruncatedPortIsInvalid) {
    EXPECT_FALSE(is_valid(parse({0x05, 0x00, 0x00, 'x'})));
    EXPECT_FALSE(is_valid(parse({0x04, 0x10})));
}

TEST_F(DiscoveryMessageTest, GoodbyeWithAndWithoutSignature) {
    auto bare = parse({0x03});
    ASSERT_TRUE(std::holds_alternative<GoodbyeMessage>(bare));
    EXPECT_TRUE(std::get<GoodbyeMessage>(bare).signature.empty());

    auto signed_bye = parse(raw(0x03, "A (Linux)"));
    ASSERT_TRUE(std::holds_alternative<GoodbyeMessage>(signed_bye));
    EXPECT_EQ(std::get<GoodbyeMessage>(signed_bye).signature, "A (Linux)");
}

TEST_F(DiscoveryMessageTest, TransferRequestCarriesJson) {
    ControlPayload payload;
    payload.signature = "Alice at A (Linux)";
    payload.transfer_id = "1700000000000";
    payload.total_files = 2;
    payload.total_size = 3072;
    payload.description = "2 files";
    payload.file_names = {"a.bin", "b.bin"};

    auto bytes = encode_message(TransferRequest{payload});
    EXPECT_EQ(bytes[0], 0x06);

    auto parsed = parse(bytes);
    ASSERT_TRUE(std::holds_alternative<TransferRequest>(parsed));
    const auto& p = std::get<TransferRequest>(parsed).payload;
    EXPECT_EQ(p.transfer_id, "1700000000000");
    EXPECT_EQ(p.total_size.value_or(0), 3072);
    EXPECT_EQ(p.file_names.size(), 2u);
    EXPECT_FALSE(p.data.has_value());
}

TEST_F(DiscoveryMessageTest, DeclineReasonTravelsInData) {
    auto parsed = parse(raw(0x08, R"({"signature":"B","transfer_id":"42","data":"no space"})"));
    ASSERT_TRUE(std::holds_alternative<TransferDecline>(parsed));
    EXPECT_EQ(std::get<TransferDecline>(parsed).payload.data.value_or(""), "no space");
}

TEST_F(DiscoveryMessageTest, MalformedDatagramsAreInvalid) {
    EXPECT_FALSE(is_valid(parse({})));
    EXPECT_FALSE(is_valid(parse({0x00})));
    EXPECT_FALSE(is_valid(parse({0x0A, 'x'})));
    EXPECT_FALSE(is_valid(parse(raw(0x06, "{not json"))));
    EXPECT_FALSE(is_valid(parse(raw(0x07, R"({"signature":"B"})"))));
    EXPECT_FALSE(is_valid(parse({0x01, 0xFF, 0xFE})));
}
