#include <gtest/gtest.h>
#include "storage/save_locations.hpp"

using namespace zipline::storage;

class SaveLocationsTest : public ::testing::Test {
protected:
    std::shared_ptr<MemoryStore> store_ = std::make_shared<MemoryStore>();
    SaveLocations locations_{store_};
};

TEST_F(SaveLocationsTest, BestLocationPrefersPeerThenDefault) {
    EXPECT_FALSE(locations_.best_location_for("Bob at B (Windows)").has_value());

    locations_.set_default_location("/srv/inbox");
    EXPECT_EQ(locations_.best_location_for("Bob at B (Windows)").value_or(""), "/srv/inbox");

    locations_.set_peer_location("Bob at B (Windows)", "/srv/bob");
    EXPECT_EQ(locations_.best_location_for("Bob at B (Windows)").value_or(""), "/srv/bob");
    EXPECT_EQ(locations_.best_location_for("Carol at C (Linux)").value_or(""), "/srv/inbox");
}

TEST_F(SaveLocationsTest, PeerLocationsAreStoredUnderOneKey) {
    locations_.set_peer_location("A", "/a");
    locations_.set_peer_location("B", "/b");

    auto all = locations_.all_peer_locations();
    EXPECT_EQ(all.size(), 2u);
    EXPECT_EQ(all["A"], "/a");

    auto raw = store_->get(kSaveLocationsKey);
    ASSERT_TRUE(raw.has_value());
    EXPECT_EQ((*raw)["B"], "/b");

    locations_.remove_peer_location("A");
    EXPECT_FALSE(locations_.peer_location("A").has_value());
    EXPECT_EQ(locations_.peer_location("B").value_or(""), "/b");
}

TEST_F(SaveLocationsTest, ClearAllForgetsEverything) {
    locations_.set_peer_location("A", "/a");
    locations_.set_default_location("/d");
    locations_.clear_all();
    EXPECT_TRUE(locations_.all_peer_locations().empty());
    EXPECT_FALSE(locations_.default_location().has_value());
    EXPECT_FALSE(locations_.best_location_for("A").has_value());
}
