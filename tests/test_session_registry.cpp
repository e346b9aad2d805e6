#include <gtest/gtest.h>
#include "storage/session_registry.hpp"
#include <vector>

using namespace zipline;
using namespace zipline::storage;

class SessionRegistryTest : public ::testing::Test {
protected:
    models::TransferSession make_session(const std::string& id) {
        models::TransferSession session;
        session.id = id;
        session.peer = models::make_peer("192.168.1.20", 6442, "Bob at B (Windows)", "WiFi");
        session.direction = models::TransferDirection::RECEIVING;
        session.status = models::TransferStatus::IN_PROGRESS;
        session.total_size = 10;
        session.total_files = 1;
        return session;
    }

    std::shared_ptr<MemoryStore> store_ = std::make_shared<MemoryStore>();
    SessionRegistry registry_{store_};
};

TEST_F(SessionRegistryTest, LifecycleEmitsEvents) {
    std::vector<std::string> seen;
    registry_.on_session_started.subscribe([&](const models::TransferSession&) { seen.push_back("started"); });
    registry_.on_session_progress.subscribe([&](const models::TransferSession&) { seen.push_back("progress"); });
    registry_.on_session_completed.subscribe([&](const models::TransferSession&) { seen.push_back("completed"); });

    auto session = make_session("1");
    registry_.start(session);
    EXPECT_TRUE(registry_.is_active("1"));

    session.transferred_size = 10;
    registry_.update(session);
    session.status = models::TransferStatus::COMPLETED;
    registry_.finish(session);

    EXPECT_FALSE(registry_.is_active("1"));
    EXPECT_EQ(seen, (std::vector<std::string>{"started", "progress", "completed"}));
    ASSERT_EQ(registry_.completed_sessions().size(), 1u);
    EXPECT_EQ(registry_.find("1")->transferred_size, 10);
}

TEST_F(SessionRegistryTest, UpdateIgnoresUnknownSessions) {
    int progress = 0;
    registry_.on_session_progress.subscribe([&](const models::TransferSession&) { ++progress; });
    registry_.update(make_session("ghost"));
    EXPECT_EQ(progress, 0);
    EXPECT_FALSE(registry_.find("ghost").has_value());
}

TEST_F(SessionRegistryTest, FailedAndCancelledGoToFailedStream) {
    int failed = 0;
    registry_.on_session_failed.subscribe([&](const models::TransferSession&) { ++failed; });

    auto a = make_session("a");
    registry_.start(a);
    a.status = models::TransferStatus::FAILED;
    a.error = "Connection reset";
    registry_.finish(a);

    auto b = make_session("b");
    registry_.start(b);
    b.status = models::TransferStatus::CANCELLED;
    registry_.finish(b);

    EXPECT_EQ(failed, 2);
    EXPECT_EQ(registry_.find("a")->error.value_or(""), "Connection reset");
}

TEST_F(SessionRegistryTest, CancelTokenIsShared) {
    auto session = make_session("c");
    EXPECT_FALSE(registry_.request_cancel("c"));

    registry_.start(session);
    auto token = registry_.cancel_token("c");
    EXPECT_FALSE(token->load());
    EXPECT_TRUE(registry_.request_cancel("c"));
    EXPECT_TRUE(token->load());
}

TEST_F(SessionRegistryTest, HistoryPersistsAndReloads) {
    auto session = make_session("h");
    registry_.start(session);
    session.status = models::TransferStatus::COMPLETED;
    session.transferred_size = 10;
    registry_.finish(session);

    auto stored = store_->get(kHistoryKey);
    ASSERT_TRUE(stored.has_value());
    ASSERT_TRUE(stored->is_array());
    EXPECT_EQ(stored->size(), 1u);

    SessionRegistry reloaded(store_);
    reloaded.load_history();
    auto found = reloaded.find("h");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->status, models::TransferStatus::COMPLETED);
    EXPECT_EQ(found->peer.address, "192.168.1.20");

    reloaded.clear_history();
    EXPECT_TRUE(reloaded.completed_sessions().empty());
    EXPECT_TRUE(store_->get(kHistoryKey)->empty());
}

TEST_F(SessionRegistryTest, CorruptHistoryIsIgnored) {
    store_->set(kHistoryKey, nlohmann::json{{"not", "an array"}});
    registry_.load_history();
    EXPECT_TRUE(registry_.completed_sessions().empty());

    store_->set(kHistoryKey, nlohmann::json::array({nlohmann::json{{"bogus", true}}}));
    registry_.load_history();
    EXPECT_TRUE(registry_.completed_sessions().empty());
}

TEST_F(SessionRegistryTest, RejectionsAreBroadcast) {
    std::string reason;
    registry_.on_request_rejected.subscribe([&](const RequestRejection& r) { reason = r.reason; });
    registry_.reject_request({"42", "10.0.0.5", "no space"});
    EXPECT_EQ(reason, "no space");
}

TEST_F(SessionRegistryTest, UnsubscribedHandlersStopReceiving) {
    int calls = 0;
    auto id = registry_.on_session_started.subscribe([&](const models::TransferSession&) { ++calls; });
    EXPECT_EQ(registry_.on_session_started.subscriber_count(), 1u);

    registry_.start(make_session("a"));
    registry_.on_session_started.unsubscribe(id);
    registry_.start(make_session("b"));

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(registry_.on_session_started.subscriber_count(), 0u);
}
