/*
FlowRelay — FrameParser Tests
Role: Verify inbound provider frame classification
Testing Strategy: Golden frames and malformed inputs → assert DataFrame / MalformedFrame
Coverage: valid frames, trailing elements, wrong shapes, invalid JSON
*/
#include <gtest/gtest.h>
#include "relay/dispatch/FrameParser.hpp"
#include "fixtures/provider_frames.hpp"

// =============================================================================
// Valid frames
// =============================================================================

TEST(FrameParser, ParsesFlowAlertFrame) {
    auto event = FrameParser::parse(fixtures::flowAlertFrame("NVDA"));
    auto* frame = std::get_if<DataFrame>(&event);
    ASSERT_NE(frame, nullptr);
    EXPECT_EQ(frame->channel, "flow-alerts");
    EXPECT_EQ(frame->payload["ticker"], "NVDA");
}

TEST(FrameParser, ParsesTickerChannel) {
    auto event = FrameParser::parse(fixtures::gexFrame("SPY"));
    auto* frame = std::get_if<DataFrame>(&event);
    ASSERT_NE(frame, nullptr);
    EXPECT_EQ(frame->channel, "gex:SPY");
    EXPECT_EQ(frame->payload, fixtures::gexPayload("SPY"));
}

TEST(FrameParser, PayloadMayBeAnyJsonValue) {
    auto event = FrameParser::parse(R"(["market_movers", [1, 2, 3]])");
    auto* frame = std::get_if<DataFrame>(&event);
    ASSERT_NE(frame, nullptr);
    EXPECT_TRUE(frame->payload.is_array());

    event = FrameParser::parse(R"(["dark_pool", null])");
    frame = std::get_if<DataFrame>(&event);
    ASSERT_NE(frame, nullptr);
    EXPECT_TRUE(frame->payload.is_null());
}

TEST(FrameParser, TrailingElementsIgnored) {
    auto event = FrameParser::parse(R"(["flow-alerts", {"a": 1}, "extra", 42])");
    auto* frame = std::get_if<DataFrame>(&event);
    ASSERT_NE(frame, nullptr);
    EXPECT_EQ(frame->payload["a"], 1);
}

// =============================================================================
// Malformed frames
// =============================================================================

TEST(FrameParser, RejectsInvalidJson) {
    auto event = FrameParser::parse("[\"flow-alerts\", {");
    EXPECT_TRUE(std::holds_alternative<MalformedFrame>(event));
}

TEST(FrameParser, RejectsObjectFrame) {
    auto event = FrameParser::parse(R"({"channel": "flow-alerts", "data": {}})");
    EXPECT_TRUE(std::holds_alternative<MalformedFrame>(event));
}

TEST(FrameParser, RejectsSingleElementArray) {
    auto event = FrameParser::parse(R"(["flow-alerts"])");
    EXPECT_TRUE(std::holds_alternative<MalformedFrame>(event));
}

TEST(FrameParser, RejectsNonStringChannel) {
    EXPECT_TRUE(std::holds_alternative<MalformedFrame>(FrameParser::parse(R"([42, {}])")));
    EXPECT_TRUE(std::holds_alternative<MalformedFrame>(FrameParser::parse(R"(["", {}])")));
}
