#include <gtest/gtest.h>
#include "networking/discovery.hpp"
#include "test_helpers.hpp"
#include <vector>

using namespace zipline;
using namespace zipline::networking;

class DiscoveryServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.user_name = "Alice";
        config_.device_name = "A";
        config_.platform = "Linux";
        config_.download_directory = "/tmp";
        service_ = std::make_unique<DiscoveryService>(config_);
        service_->set_interface_provider([]() {
            InterfaceInfo wlan;
            wlan.name = "wlan0";
            wlan.address = "192.168.1.20";
            wlan.subnet_mask = "255.255.255.0";
            wlan.broadcast_address = "192.168.1.255";
            wlan.type = InterfaceType::WIFI;
            return std::vector<InterfaceInfo>{wlan};
        });
        service_->on_peer_found.subscribe([this](const models::Peer& p) { found_.push_back(p); });
        service_->on_peer_lost.subscribe([this](const models::Peer& p) { lost_.push_back(p); });
    }

    void deliver(const protocol::DiscoveryMessage& message, const std::string& from, uint16_t port = 6442) {
        auto bytes = protocol::encode_message(message);
        service_->handle_datagram(bytes.data(), bytes.size(), from, port);
    }

    static protocol::HelloMessage hello(const std::string& signature, uint16_t port = 6442,
                                        bool broadcast = true) {
        protocol::HelloMessage m;
        m.broadcast = broadcast;
        m.with_port = true;
        m.port = port;
        m.signature = signature;
        return m;
    }

    static protocol::ControlPayload payload(const std::string& id, const std::string& data = "") {
        protocol::ControlPayload p;
        p.signature = "Bob at B (Windows)";
        p.transfer_id = id;
        if (!data.empty()) p.data = data;
        return p;
    }

    Config config_;
    std::unique_ptr<DiscoveryService> service_;
    std::vector<models::Peer> found_;
    std::vector<models::Peer> lost_;
};

TEST_F(DiscoveryServiceTest, HelloAddsPeerOnce) {
    deliver(hello("Bob at B (Windows)"), "192.168.1.50");
    deliver(hello("Bob at B (Windows)"), "192.168.1.50");

    ASSERT_EQ(found_.size(), 1u);
    auto peers = service_->peers();
    ASSERT_EQ(peers.size(), 1u);
    EXPECT_EQ(peers[0].id, "192.168.1.50:6442:WiFi");
    EXPECT_EQ(peers[0].name, "Bob at B");
    EXPECT_EQ(peers[0].adapter_name, "wlan0");
    EXPECT_EQ(service_->find_peer_by_address("192.168.1.50")->port, 6442);
}

TEST_F(DiscoveryServiceTest, DifferentPortIsDifferentPeer) {
    deliver(hello("Bob at B (Windows)", 6442), "192.168.1.50");
    deliver(hello("Bob at B (Windows)", 7000), "192.168.1.50");
    EXPECT_EQ(service_->peers().size(), 2u);
}

TEST_F(DiscoveryServiceTest, OwnSignatureIsNeverAPeer) {
    deliver(hello("Alice at A (Linux)"), "192.168.1.20");
    deliver(hello("Alice at A (Linux)|ADAPTER|eth0"), "192.168.1.20");
    EXPECT_TRUE(service_->peers().empty());
    EXPECT_TRUE(found_.empty());
    EXPECT_FALSE(service_->is_bad_address("192.168.1.20"));
}

TEST_F(DiscoveryServiceTest, HelloFromOwnAddressIsDropped) {
    EXPECT_TRUE(service_->is_local_address("192.168.1.20"));
    deliver(hello("Somebody Else (Linux)"), "192.168.1.20");
    EXPECT_TRUE(service_->peers().empty());
}

TEST_F(DiscoveryServiceTest, EchoingAddressIsBlacklisted) {
    for (int i = 0; i < DiscoveryService::kEchoLimit - 1; ++i) {
        deliver(hello("Alice at A (Linux)"), "192.168.1.99");
    }
    EXPECT_FALSE(service_->is_bad_address("192.168.1.99"));
    deliver(hello("Alice at A (Linux)"), "192.168.1.99");
    EXPECT_TRUE(service_->is_bad_address("192.168.1.99"));

    deliver(hello("Bob at B (Windows)"), "192.168.1.99");
    EXPECT_TRUE(service_->peers().empty());
}

TEST_F(DiscoveryServiceTest, GoodbyeRemovesEveryPeerAtAddress) {
    deliver(hello("Bob at B (Windows)", 6442), "192.168.1.50");
    deliver(hello("Bob at B (Windows)", 7000), "192.168.1.50");
    deliver(hello("Carol at C (Linux)"), "192.168.1.60");

    deliver(protocol::GoodbyeMessage{"Bob at B (Windows)"}, "192.168.1.50");
    EXPECT_EQ(lost_.size(), 2u);
    ASSERT_EQ(service_->peers().size(), 1u);
    EXPECT_EQ(service_->peers()[0].address, "192.168.1.60");
}

TEST_F(DiscoveryServiceTest, IdlePeersExpireExactlyOnce) {
    deliver(hello("Bob at B (Windows)"), "192.168.1.50");
    auto later = DiscoveryService::Clock::now() + config_.peer_timeout + std::chrono::seconds(1);

    service_->expire_peers(DiscoveryService::Clock::now());
    EXPECT_TRUE(lost_.empty());

    service_->expire_peers(later);
    EXPECT_EQ(lost_.size(), 1u);
    EXPECT_TRUE(service_->peers().empty());

    service_->expire_peers(later);
    EXPECT_EQ(lost_.size(), 1u);
}

TEST_F(DiscoveryServiceTest, InvalidDatagramsAreIgnored) {
    std::vector<uint8_t> junk{0x42, 0x00, 0x01};
    service_->handle_datagram(junk.data(), junk.size(), "192.168.1.50");
    service_->handle_datagram(nullptr, 0, "192.168.1.50");
    EXPECT_TRUE(service_->peers().empty());
}

TEST_F(DiscoveryServiceTest, RequestsCarryTheSenderPort) {
    std::vector<IncomingControl> requests;
    service_->on_transfer_request.subscribe([&](const IncomingControl& c) { requests.push_back(c); });

    deliver(protocol::TransferRequest{payload("t1")}, "192.168.1.50", 7000);
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].address, "192.168.1.50");
    EXPECT_EQ(requests[0].port, 7000);
    EXPECT_EQ(requests[0].payload.transfer_id, "t1");
}

TEST_F(DiscoveryServiceTest, DeclineResolvesPendingResponse) {
    auto future = service_->expect_response("t2");
    deliver(protocol::TransferDecline{payload("t2", "no space")}, "192.168.1.50");

    ASSERT_EQ(future.wait_for(std::chrono::seconds(1)), std::future_status::ready);
    auto response = future.get();
    EXPECT_FALSE(response.accepted);
    EXPECT_EQ(response.data.value_or(""), "no space");
}

TEST_F(DiscoveryServiceTest, AcceptAndCancelResolveResponses) {
    auto accepted = service_->expect_response("t3");
    deliver(protocol::TransferAccept{payload("t3", "/srv/inbox")}, "192.168.1.50");
    auto a = accepted.get();
    EXPECT_TRUE(a.accepted);
    EXPECT_EQ(a.data.value_or(""), "/srv/inbox");

    int cancels = 0;
    service_->on_transfer_cancel.subscribe([&](const IncomingControl&) { ++cancels; });
    auto cancelled = service_->expect_response("t4");
    deliver(protocol::TransferCancel{payload("t4")}, "192.168.1.50");
    EXPECT_FALSE(cancelled.get().accepted);
    EXPECT_EQ(cancels, 1);
}

TEST_F(DiscoveryServiceTest, ControlTrafficRefreshesPeer) {
    deliver(hello("Bob at B (Windows)"), "192.168.1.50");
    auto first_seen = service_->peers()[0].last_seen;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    deliver(protocol::TransferRequest{payload("t5")}, "192.168.1.50");
    EXPECT_GT(service_->peers()[0].last_seen, first_seen);
}

TEST_F(DiscoveryServiceTest, InterfaceChangesAreDetected) {
    EXPECT_FALSE(service_->refresh_interfaces());
    service_->set_interface_provider([]() {
        InterfaceInfo eth;
        eth.name = "eth0";
        eth.address = "10.0.0.5";
        eth.subnet_mask = "255.255.255.0";
        eth.type = InterfaceType::ETHERNET;
        return std::vector<InterfaceInfo>{eth};
    });
    ASSERT_EQ(service_->interfaces().size(), 1u);
    EXPECT_EQ(service_->interfaces()[0].name, "eth0");
    EXPECT_FALSE(service_->refresh_interfaces());
}

// Two live services on loopback find each other through unicast hellos.
TEST(DiscoveryLoopbackTest, UnicastHelloRoundTrip) {
    Config a_config;
    a_config.user_name = "Alice";
    a_config.device_name = "A";
    a_config.platform = "Linux";
    a_config.download_directory = "/tmp";
    a_config.listen_port = test_support::free_port();

    Config b_config = a_config;
    b_config.user_name = "Bob";
    b_config.device_name = "B";
    b_config.platform = "Windows";
    b_config.listen_port = test_support::free_port();
    ASSERT_NE(a_config.listen_port, 0);
    ASSERT_NE(b_config.listen_port, 0);

    DiscoveryService a(a_config);
    DiscoveryService b(b_config);
    std::atomic<int> a_found{0}, b_found{0};
    a.on_peer_found.subscribe([&](const models::Peer&) { ++a_found; });
    b.on_peer_found.subscribe([&](const models::Peer&) { ++b_found; });

    a.start();
    b.start();
    a.say_hello_to("127.0.0.1", b_config.listen_port);
    b.say_hello_to("127.0.0.1", a_config.listen_port);

    EXPECT_TRUE(test_support::wait_until([&]() { return a_found >= 1 && b_found >= 1; },
                                         std::chrono::seconds(5)));
    auto a_peers = a.peers();
    ASSERT_EQ(a_peers.size(), 1u);
    EXPECT_EQ(a_peers[0].signature, b.signature());
    EXPECT_EQ(a_peers[0].port, b_config.listen_port);
    EXPECT_EQ(a_found.load(), 1);
    EXPECT_EQ(b_found.load(), 1);

    b.stop();
    a.stop();
}
