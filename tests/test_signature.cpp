#include <gtest/gtest.h>
#include "protocol/signature.hpp"

using namespace zipline::protocol;

TEST(SignatureTest, BuildWithAndWithoutUser) {
    EXPECT_EQ(build_signature("Alice", "A", "Linux"), "Alice at A (Linux)");
    EXPECT_EQ(build_signature("", "A", "Linux"), "A (Linux)");
}

TEST(SignatureTest, ParseFullSignature) {
    auto info = parse_signature("Bob at B (Windows)");
    EXPECT_EQ(info.user, "Bob");
    EXPECT_EQ(info.host, "B");
    EXPECT_EQ(info.platform, "Windows");
    EXPECT_TRUE(info.adapter_name.empty());
    EXPECT_EQ(info.display, "Bob at B (Windows)");
}

TEST(SignatureTest, ParseWithoutPlatformIsUnknown) {
    auto info = parse_signature("workstation");
    EXPECT_TRUE(info.user.empty());
    EXPECT_EQ(info.host, "workstation");
    EXPECT_EQ(info.platform, "Unknown");
}

TEST(SignatureTest, AdapterMarkersAreStripped) {
    std::string sig = with_adapter("Alice at A (Linux)", "wlan0", "WiFi");
    EXPECT_EQ(sig, "Alice at A (Linux)|ADAPTER|wlan0|TYPE|WiFi");

    auto info = parse_signature(sig);
    EXPECT_EQ(info.display, "Alice at A (Linux)");
    EXPECT_EQ(info.adapter_name, "wlan0");
    EXPECT_EQ(info.adapter_type, "WiFi");
    EXPECT_EQ(info.platform, "Linux");
}

TEST(SignatureTest, AdapterWithoutType) {
    auto info = parse_signature("Host (Apple)|ADAPTER|en0");
    EXPECT_EQ(info.adapter_name, "en0");
    EXPECT_TRUE(info.adapter_type.empty());
    EXPECT_EQ(info.host, "Host");
}

TEST(SignatureTest, WithAdapterReplacesExistingMarkers) {
    auto sig = with_adapter("H (Linux)|ADAPTER|eth0", "wlan0");
    EXPECT_EQ(sig, "H (Linux)|ADAPTER|wlan0");
    EXPECT_EQ(with_adapter("H (Linux)", ""), "H (Linux)");
}
