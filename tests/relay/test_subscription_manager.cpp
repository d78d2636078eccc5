/*
FlowRelay — SubscriptionManager Tests
Role: Verify desired/joined bookkeeping and join/leave frame generation
Testing Strategy: Set transitions → assert sets, pending joins and frame JSON
Coverage: add/remove idempotence, wire reset on reconnect, frame shape
*/
#include <gtest/gtest.h>
#include "relay/ws/SubscriptionManager.hpp"
#include <nlohmann/json.hpp>

// =============================================================================
// Desired set
// =============================================================================

TEST(SubscriptionManager, StartsEmpty) {
    SubscriptionManager mgr;
    EXPECT_TRUE(mgr.desired().empty());
    EXPECT_TRUE(mgr.joined().empty());
    EXPECT_TRUE(mgr.pendingJoins().empty());
}

TEST(SubscriptionManager, AddReportsOnlyFirstInsertion) {
    SubscriptionManager mgr;
    EXPECT_TRUE(mgr.add("flow-alerts"));
    EXPECT_FALSE(mgr.add("flow-alerts"));
    ASSERT_EQ(mgr.desired().size(), 1);
    EXPECT_TRUE(mgr.isDesired("flow-alerts"));
}

TEST(SubscriptionManager, RemoveUnknownIsNoOp) {
    SubscriptionManager mgr;
    EXPECT_FALSE(mgr.remove("gex:SPY"));
    mgr.add("gex:SPY");
    EXPECT_TRUE(mgr.remove("gex:SPY"));
    EXPECT_FALSE(mgr.isDesired("gex:SPY"));
}

// =============================================================================
// Wire state
// =============================================================================

TEST(SubscriptionManager, PendingJoinsExcludeJoinedChannels) {
    SubscriptionManager mgr;
    mgr.add("flow-alerts");
    mgr.add("gex:SPY");
    mgr.markJoined("flow-alerts");

    auto pending = mgr.pendingJoins();
    ASSERT_EQ(pending.size(), 1);
    EXPECT_EQ(pending[0], "gex:SPY");
}

TEST(SubscriptionManager, ResetWireKeepsDesiredSet) {
    SubscriptionManager mgr;
    mgr.add("flow-alerts");
    mgr.add("gex:QQQ");
    mgr.markJoined("flow-alerts");
    mgr.markJoined("gex:QQQ");

    mgr.resetWire();

    EXPECT_TRUE(mgr.joined().empty());
    EXPECT_EQ(mgr.desired().size(), 2);
    EXPECT_EQ(mgr.pendingJoins().size(), 2);
}

TEST(SubscriptionManager, MarkLeftClearsJoinedOnly) {
    SubscriptionManager mgr;
    mgr.add("dark_pool");
    mgr.markJoined("dark_pool");
    mgr.markLeft("dark_pool");

    EXPECT_FALSE(mgr.isJoined("dark_pool"));
    EXPECT_TRUE(mgr.isDesired("dark_pool"));
}

// =============================================================================
// Frames
// =============================================================================

TEST(SubscriptionManager, JoinFrameShape) {
    auto j = nlohmann::json::parse(SubscriptionManager::buildJoinMsg("gex:SPY"));
    EXPECT_EQ(j["channel"], "gex:SPY");
    EXPECT_EQ(j["msg_type"], "join");
    EXPECT_EQ(j.size(), 2);
}

TEST(SubscriptionManager, LeaveFrameShape) {
    auto j = nlohmann::json::parse(SubscriptionManager::buildLeaveMsg("flow-alerts"));
    EXPECT_EQ(j["channel"], "flow-alerts");
    EXPECT_EQ(j["msg_type"], "leave");
}
