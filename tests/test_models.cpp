#include <gtest/gtest.h>
#include "models/peer.hpp"
#include "models/transfer_session.hpp"
#include "transfer/source_walker.hpp"

using namespace zipline;
using namespace zipline::models;

TEST(PeerModelTest, MakePeerDerivesFieldsFromSignature) {
    auto peer = make_peer("192.168.1.20", 6442, "Bob at B (Windows)|ADAPTER|wlan0|TYPE|WiFi", "WiFi");
    EXPECT_EQ(peer.id, "192.168.1.20:6442:WiFi");
    EXPECT_EQ(peer.name, "Bob at B");
    EXPECT_EQ(peer.platform, "Windows");
    EXPECT_EQ(peer.adapter_name, "wlan0");
    EXPECT_EQ(peer.avatar_url, "http://192.168.1.20:6443/avatar");
    EXPECT_EQ(peer.display_name(), "Bob at B");
}

TEST(PeerModelTest, DisplayNameFallsBackToAddress) {
    Peer peer;
    peer.address = "10.0.0.7";
    EXPECT_EQ(peer.display_name(), "10.0.0.7");
}

TEST(TransferSessionTest, ProgressIsClamped) {
    TransferSession session;
    EXPECT_EQ(session.progress_percentage(), 0.0);
    session.status = TransferStatus::COMPLETED;
    EXPECT_EQ(session.progress_percentage(), 100.0);

    session.total_size = 200;
    session.transferred_size = 50;
    EXPECT_DOUBLE_EQ(session.progress_percentage(), 25.0);
    session.transferred_size = 400;
    EXPECT_DOUBLE_EQ(session.progress_percentage(), 100.0);
}

TEST(TransferSessionTest, TerminalStatuses) {
    TransferSession session;
    for (auto status : {TransferStatus::PENDING, TransferStatus::WAITING_FOR_ACCEPTANCE,
                        TransferStatus::IN_PROGRESS}) {
        session.status = status;
        EXPECT_FALSE(session.is_terminal()) << to_string(status);
    }
    for (auto status : {TransferStatus::COMPLETED, TransferStatus::FAILED, TransferStatus::CANCELLED}) {
        session.status = status;
        EXPECT_TRUE(session.is_terminal()) << to_string(status);
    }
}

TEST(TransferSessionTest, SessionIdsAreIncreasing) {
    auto a = std::stoll(next_session_id());
    auto b = std::stoll(next_session_id());
    EXPECT_LT(a, b);
}

TEST(TransferSessionTest, DescribeSummarisesItems) {
    auto text = transfer::make_text_item("ping");
    EXPECT_EQ(describe({text}), "Text snippet");

    TransferItem file;
    file.type = ItemType::FILE;
    file.name = "hello.txt";
    EXPECT_EQ(describe({file}), "hello.txt");

    TransferItem folder;
    folder.type = ItemType::FOLDER;
    folder.name = "root";
    EXPECT_EQ(describe({folder, file, file}), "2 files, 1 folder");
    EXPECT_EQ(describe({file, text, text}), "1 file, 2 text messages");
}

TEST(TransferSessionTest, JsonUsesStatusNames) {
    TransferSession session;
    session.id = "7";
    session.status = TransferStatus::WAITING_FOR_ACCEPTANCE;
    nlohmann::json j = session;
    EXPECT_EQ(j["status"], "waiting_for_acceptance");

    auto back = j.get<TransferSession>();
    EXPECT_EQ(back.status, TransferStatus::WAITING_FOR_ACCEPTANCE);
    EXPECT_EQ(back.id, "7");
}
