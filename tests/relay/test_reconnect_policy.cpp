/*
FlowRelay — ReconnectPolicy Tests
Role: Verify the backoff schedule, the cap, jitter bounds and the attempt limit
Testing Strategy: Deterministic jitter sources → assert exact delays
*/
#include <gtest/gtest.h>
#include "relay/ws/ReconnectPolicy.hpp"

using namespace std::chrono_literals;

namespace {

ReconnectPolicy::Params defaults(double jitter = 0.0) {
    ReconnectPolicy::Params p;
    p.baseDelay = 5000ms;
    p.maxDelay = 60000ms;
    p.maxAttempts = 5;
    p.jitter = jitter;
    return p;
}

}

TEST(ReconnectPolicy, DoublesFromBaseDelay) {
    ReconnectPolicy policy(defaults());
    EXPECT_EQ(policy.nominalDelay(1), 5000ms);
    EXPECT_EQ(policy.nominalDelay(2), 10000ms);
    EXPECT_EQ(policy.nominalDelay(3), 20000ms);
    EXPECT_EQ(policy.nominalDelay(4), 40000ms);
}

TEST(ReconnectPolicy, CapsAtMaxDelay) {
    ReconnectPolicy policy(defaults());
    EXPECT_EQ(policy.nominalDelay(5), 60000ms);
    EXPECT_EQ(policy.nominalDelay(6), 60000ms);
    EXPECT_EQ(policy.nominalDelay(1000), 60000ms);
}

TEST(ReconnectPolicy, ZeroJitterIsExact) {
    ReconnectPolicy policy(defaults(0.0));
    EXPECT_EQ(*policy.delayFor(1), 5000ms);
    EXPECT_EQ(*policy.delayFor(3), 20000ms);
}

TEST(ReconnectPolicy, JitterExtremesStayWithinTenPercent) {
    ReconnectPolicy up(defaults(0.1), [] { return 1.0; });
    ReconnectPolicy down(defaults(0.1), [] { return -1.0; });
    EXPECT_EQ(up.jitteredDelay(2), 11000ms);
    EXPECT_EQ(down.jitteredDelay(2), 9000ms);
}

TEST(ReconnectPolicy, JitterSourceIsClamped) {
    ReconnectPolicy policy(defaults(0.1), [] { return 7.0; });
    EXPECT_EQ(policy.jitteredDelay(1), 5500ms);
}

TEST(ReconnectPolicy, RandomJitterWithinBounds) {
    ReconnectPolicy policy(defaults(0.1));
    for (int i = 0; i < 200; ++i) {
        const auto d = policy.jitteredDelay(3);
        EXPECT_GE(d, 18000ms);
        EXPECT_LE(d, 22000ms);
    }
}

TEST(ReconnectPolicy, ExhaustedAfterMaxAttempts) {
    ReconnectPolicy policy(defaults());
    EXPECT_FALSE(policy.exhausted(5));
    EXPECT_TRUE(policy.exhausted(6));
    EXPECT_TRUE(policy.delayFor(5).has_value());
    EXPECT_FALSE(policy.delayFor(6).has_value());
}
