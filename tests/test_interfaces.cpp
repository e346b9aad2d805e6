#include <gtest/gtest.h>
#include "networking/interfaces.hpp"
#include "test_helpers.hpp"

using namespace zipline::networking;

class InterfacesTest : public ::testing::Test {
protected:
    static InterfaceInfo iface(const std::string& name, const std::string& address,
                               const std::string& mask = "255.255.255.0") {
        InterfaceInfo info;
        info.name = name;
        info.address = address;
        info.subnet_mask = mask;
        info.type = classify(name);
        info.broadcast_address = broadcast_address(address, mask);
        return info;
    }
};

TEST_F(InterfacesTest, ClassifyByName) {
    EXPECT_EQ(classify("Wi-Fi"), InterfaceType::WIFI);
    EXPECT_EQ(classify("wlp3s0"), InterfaceType::WIFI);
    EXPECT_EQ(classify("Microsoft Wi-Fi Direct Virtual Adapter"), InterfaceType::HOTSPOT);
    EXPECT_EQ(classify("eth0"), InterfaceType::ETHERNET);
    EXPECT_EQ(classify("enp0s31f6"), InterfaceType::ETHERNET);
    EXPECT_EQ(classify("vEthernet (Default Switch)"), InterfaceType::VIRTUAL);
    EXPECT_EQ(classify("docker0"), InterfaceType::VIRTUAL);
    EXPECT_EQ(classify("tun0"), InterfaceType::TUNNEL);
    EXPECT_EQ(classify("Teredo Tunneling Pseudo-Interface"), InterfaceType::TUNNEL);
    EXPECT_EQ(classify("bnep0"), InterfaceType::BLUETOOTH);
    EXPECT_EQ(classify("mystery"), InterfaceType::NETWORK);
}

TEST_F(InterfacesTest, ShortTokensMatchOnlyAsPrefix) {
    // "tap" inside a word must not mark the interface as a tunnel.
    EXPECT_NE(classify("Startap Link"), InterfaceType::TUNNEL);
}

TEST_F(InterfacesTest, TypeNames) {
    EXPECT_STREQ(to_string(InterfaceType::WIFI), "WiFi");
    EXPECT_STREQ(to_string(InterfaceType::ETHERNET), "Ethernet");
    EXPECT_STREQ(to_string(InterfaceType::NETWORK), "Network");
}

TEST_F(InterfacesTest, BroadcastAddress) {
    EXPECT_EQ(broadcast_address("192.168.1.20", "255.255.255.0"), "192.168.1.255");
    EXPECT_EQ(broadcast_address("10.1.2.3", "255.0.0.0"), "10.255.255.255");
    EXPECT_EQ(broadcast_address("192.168.1.20"), "192.168.1.255");
    EXPECT_EQ(broadcast_address("172.16.5.4"), "172.16.255.255");
    EXPECT_EQ(broadcast_address("169.254.10.1"), "169.254.255.255");
    EXPECT_EQ(broadcast_address("not an ip"), "");
}

TEST_F(InterfacesTest, SubnetMatching) {
    EXPECT_TRUE(same_subnet("192.168.1.20", "192.168.1.99", "255.255.255.0"));
    EXPECT_FALSE(same_subnet("192.168.1.20", "192.168.2.20", "255.255.255.0"));
    EXPECT_TRUE(same_subnet("192.168.1.20", "192.168.2.20", "255.255.0.0"));
}

TEST_F(InterfacesTest, ConnectionTypeForRemote) {
    std::vector<InterfaceInfo> ifaces{iface("wlan0", "192.168.1.20"), iface("eth0", "10.0.0.5")};
    EXPECT_EQ(connection_type_for("192.168.1.77", ifaces), "WiFi");
    EXPECT_EQ(connection_type_for("10.0.0.9", ifaces), "Ethernet");
    EXPECT_EQ(connection_type_for("169.254.3.3", ifaces), "Ethernet");
    EXPECT_EQ(connection_type_for("8.8.8.8", ifaces), "Network");
}

TEST_F(InterfacesTest, LocalAddressForRemote) {
    std::vector<InterfaceInfo> ifaces{iface("wlan0", "192.168.1.20"), iface("eth0", "10.0.0.5")};
    InterfaceInfo lo = iface("lo", "127.0.0.1", "255.0.0.0");
    lo.is_loopback = true;
    lo.type = InterfaceType::LOOPBACK;
    ifaces.push_back(lo);

    EXPECT_EQ(local_address_for("192.168.1.77", ifaces).value_or(""), "192.168.1.20");
    EXPECT_EQ(local_address_for("127.0.0.1", ifaces).value_or(""), "127.0.0.1");
    EXPECT_FALSE(local_address_for("172.20.0.1", ifaces).has_value());
}

TEST_F(InterfacesTest, BroadcastEligibility) {
    EXPECT_TRUE(iface("wlan0", "192.168.1.20").broadcast_eligible());
    auto lo = iface("lo", "127.0.0.1", "255.0.0.0");
    lo.is_loopback = true;
    EXPECT_FALSE(lo.broadcast_eligible());
    EXPECT_FALSE(iface("Teredo Tunneling Pseudo-Interface", "10.9.9.9").broadcast_eligible());
}

TEST_F(InterfacesTest, FingerprintChangesWithAddresses) {
    std::vector<InterfaceInfo> a{iface("wlan0", "192.168.1.20")};
    std::vector<InterfaceInfo> b{iface("wlan0", "192.168.1.21")};
    EXPECT_EQ(interfaces_fingerprint(a), interfaces_fingerprint(a));
    EXPECT_NE(interfaces_fingerprint(a), interfaces_fingerprint(b));
}

TEST_F(InterfacesTest, ListingIncludesSomething) {
    auto all = list_interfaces();
    for (const auto& info : all) {
        EXPECT_FALSE(info.address.empty());
    }
}

TEST_F(InterfacesTest, PortAvailability) {
    uint16_t port = zipline::test_support::free_port();
    ASSERT_NE(port, 0);
    EXPECT_TRUE(port_availability(port).available);

    boost::asio::io_context io;
    {
        boost::asio::ip::tcp::acceptor holder(
            io, boost::asio::ip::tcp::endpoint(boost::asio::ip::tcp::v4(), port), false);
        EXPECT_FALSE(port_availability(port).available);
    }
    {
        boost::asio::ip::udp::socket holder(
            io, boost::asio::ip::udp::endpoint(boost::asio::ip::udp::v4(), port));
        EXPECT_FALSE(port_availability(port).available);
    }
}
