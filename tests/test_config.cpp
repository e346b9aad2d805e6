#include <gtest/gtest.h>
#include "config.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"

using namespace zipline;

class ConfigTest : public ::testing::Test {
protected:
    Config valid() {
        Config config;
        config.download_directory = dir_.path().string();
        return config;
    }

    test_support::TempDir dir_;
};

TEST_F(ConfigTest, DefaultsMatchProtocol) {
    Config config;
    EXPECT_EQ(config.listen_port, 6442);
    EXPECT_EQ(config.peer_timeout, std::chrono::seconds(120));
    EXPECT_EQ(config.heartbeat_interval, std::chrono::seconds(60));
    EXPECT_EQ(config.initial_discovery_interval, std::chrono::seconds(3));
    EXPECT_EQ(config.initial_discovery_rounds, 5);
    EXPECT_EQ(config.broadcast_min_gap, std::chrono::milliseconds(1000));
    EXPECT_EQ(config.buffer_size, 1024u * 1024u);
    EXPECT_EQ(config.progress_update_interval, 256u * 1024u);
    EXPECT_EQ(config.tcp_connect_timeout, std::chrono::seconds(10));
}

TEST_F(ConfigTest, ValidateRejectsBadValues) {
    EXPECT_NO_THROW(valid().validate());

    Config no_dir;
    EXPECT_THROW(no_dir.validate(), ConfigError);

    auto zero_port = valid();
    zero_port.listen_port = 0;
    EXPECT_THROW(zero_port.validate(), ConfigError);

    auto zero_timeout = valid();
    zero_timeout.peer_timeout = std::chrono::seconds(0);
    EXPECT_THROW(zero_timeout.validate(), ConfigError);

    auto zero_buffer = valid();
    zero_buffer.buffer_size = 0;
    EXPECT_THROW(zero_buffer.validate(), ConfigError);
}

TEST_F(ConfigTest, SignatureUsesConfiguredIdentity) {
    auto config = valid();
    config.user_name = "Alice";
    config.device_name = "A";
    config.platform = "Linux";
    EXPECT_EQ(config.signature(), "Alice at A (Linux)");
}

TEST_F(ConfigTest, LoadConfigOverridesOnlyGivenKeys) {
    auto path = dir_ / "zipline.json";
    test_support::write_file(path, R"({"listen_port": 7000, "device_name": "box",
                                  "peer_timeout_seconds": 30, "broadcast_min_gap_ms": 250,
                                  "accept_unsolicited": false})");
    auto config = load_config(path.string());
    EXPECT_EQ(config.listen_port, 7000);
    EXPECT_EQ(config.device_name, "box");
    EXPECT_EQ(config.peer_timeout, std::chrono::seconds(30));
    EXPECT_EQ(config.broadcast_min_gap, std::chrono::milliseconds(250));
    EXPECT_FALSE(config.accept_unsolicited);
    EXPECT_EQ(config.heartbeat_interval, std::chrono::seconds(60));
}

TEST_F(ConfigTest, LoadConfigErrors) {
    EXPECT_THROW(load_config((dir_ / "missing.json").string()), ConfigError);

    auto broken = dir_ / "broken.json";
    test_support::write_file(broken, "{ not json");
    EXPECT_THROW(load_config(broken.string()), ConfigError);

    auto array = dir_ / "array.json";
    test_support::write_file(array, "[1, 2]");
    EXPECT_THROW(load_config(array.string()), ConfigError);

    auto bad_port = dir_ / "port.json";
    test_support::write_file(bad_port, R"({"listen_port": 70000})");
    EXPECT_THROW(load_config(bad_port.string()), ConfigError);

    auto wrong_type = dir_ / "type.json";
    test_support::write_file(wrong_type, R"({"listen_port": "http"})");
    EXPECT_THROW(load_config(wrong_type.string()), ConfigError);
}
