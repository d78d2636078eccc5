/*
FlowRelay — Envelope Tests
Role: Verify the downstream frame wrapper and its timestamp format
*/
#include <gtest/gtest.h>
#include "relay/dispatch/Envelope.hpp"
#include "fixtures/provider_frames.hpp"

using namespace std::chrono_literals;

namespace {
// 2025-10-14T12:34:56.789Z
const std::chrono::system_clock::time_point kFixed =
    std::chrono::system_clock::time_point(1760445296s) + 789ms;
}

TEST(Envelope, IsoTimestampUtcWithMilliseconds) {
    EXPECT_EQ(Envelope::isoTimestamp(kFixed), "2025-10-14T12:34:56.789Z");
}

TEST(Envelope, IsoTimestampPadsMilliseconds) {
    EXPECT_EQ(Envelope::isoTimestamp(kFixed - 789ms + 7ms), "2025-10-14T12:34:56.007Z");
}

TEST(Envelope, WrapsPayloadVerbatim) {
    const auto payload = fixtures::flowAlertPayload("AAPL");
    auto frame = Envelope::make("flow-alerts", payload, kFixed);
    ASSERT_NE(frame, nullptr);

    auto j = nlohmann::json::parse(*frame);
    EXPECT_EQ(j["channel"], "flow-alerts");
    EXPECT_EQ(j["timestamp"], "2025-10-14T12:34:56.789Z");
    EXPECT_EQ(j["data"], payload);
    EXPECT_EQ(j.size(), 3);
}
