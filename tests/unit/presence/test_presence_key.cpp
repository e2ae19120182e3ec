#include <gtest/gtest.h>

#include "hpl/presence/PresenceKey.hpp"

using namespace HPL::Presence;

TEST(PresenceKeyTest, MakePrefixesClientId) {
    EXPECT_EQ(MakePresenceKey("worker_01"), "presence.worker_01");
    EXPECT_EQ(MakePresenceKey("a"), "presence.a");
}

TEST(PresenceKeyTest, ParseExtractsClientId) {
    auto id = ParsePresenceKey("presence.worker_01");
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(*id, "worker_01");

    // Dots after the prefix belong to the id
    auto dotted = ParsePresenceKey("presence.lab.daq");
    ASSERT_TRUE(dotted.has_value());
    EXPECT_EQ(*dotted, "lab.daq");
}

TEST(PresenceKeyTest, ParseRejectsOtherKeys) {
    EXPECT_FALSE(ParsePresenceKey("presence.").has_value());
    EXPECT_FALSE(ParsePresenceKey("presence").has_value());
    EXPECT_FALSE(ParsePresenceKey("config.run").has_value());
    EXPECT_FALSE(ParsePresenceKey("xpresence.a").has_value());
    EXPECT_FALSE(ParsePresenceKey("").has_value());
}

TEST(PresenceKeyTest, ParseInvertsMake) {
    for (const char* id : {"a", "worker-7", "merger_01", "lab.daq"}) {
        auto parsed = ParsePresenceKey(MakePresenceKey(id));
        ASSERT_TRUE(parsed.has_value()) << id;
        EXPECT_EQ(*parsed, id);
    }
}

TEST(PresenceKeyTest, ValidClientIds) {
    EXPECT_TRUE(IsValidClientId("worker_01"));
    EXPECT_TRUE(IsValidClientId("merger-2"));
    EXPECT_TRUE(IsValidClientId("lab.daq"));
    EXPECT_TRUE(IsValidClientId("X"));
}

TEST(PresenceKeyTest, InvalidClientIds) {
    EXPECT_FALSE(IsValidClientId(""));
    EXPECT_FALSE(IsValidClientId("worker 1"));
    EXPECT_FALSE(IsValidClientId("worker*"));
    EXPECT_FALSE(IsValidClientId("worker>"));
    EXPECT_FALSE(IsValidClientId(".worker"));
    EXPECT_FALSE(IsValidClientId("worker."));
    EXPECT_FALSE(IsValidClientId("a..b"));
}
