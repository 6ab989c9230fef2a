// =============================================================================
// message_codec_test.cpp
// =============================================================================
// Unit tests for paper::MessageCodec (signal gateway wire format).
//
// Validates:
//   - signal / market / resolution messages decode into their domain types
//   - Optional fields default (confidence MEDIUM, horizon 0, liquidity 0)
//   - Malformed JSON, missing fields, unknown types and enums are
//     InvalidSignal, never exceptions
// =============================================================================

#include "paper/network/message_codec.hpp"

#include <gtest/gtest.h>

#include <variant>

class MessageCodecTest : public ::testing::Test {};

// -----------------------------------------------------------------------------
// 1. Full signal message.
// -----------------------------------------------------------------------------
TEST_F(MessageCodecTest, DecodesSignal) {
  auto r = paper::MessageCodec::decode(R"({
      "type": "signal", "market_id": "FED-DEC", "side": "NO",
      "probability": 0.7, "market_price": 0.55, "edge": 0.15,
      "confidence": "HIGH", "timestamp_ms": 1700, "horizon_ms": 86400000,
      "liquidity": 2500.0})");
  ASSERT_TRUE(r.ok()) << r.error().message;

  const auto* s = std::get_if<paper::domain::Signal>(&r.value());
  ASSERT_NE(s, nullptr);
  EXPECT_EQ(s->market_id, "FED-DEC");
  EXPECT_EQ(s->side, paper::domain::Side::No);
  EXPECT_DOUBLE_EQ(s->probability, 0.7);
  EXPECT_DOUBLE_EQ(s->market_price, 0.55);
  EXPECT_DOUBLE_EQ(s->edge, 0.15);
  EXPECT_EQ(s->confidence, paper::domain::ConfidenceTier::High);
  EXPECT_EQ(s->timestamp_ms, 1700);
  EXPECT_EQ(s->horizon_ms, 86400000);
  EXPECT_DOUBLE_EQ(s->liquidity, 2500.0);
  EXPECT_EQ(paper::MessageCodec::marketOf(r.value()), "FED-DEC");
}

// -----------------------------------------------------------------------------
// 2. Optional fields take defaults; lowercase sides are accepted.
// -----------------------------------------------------------------------------
TEST_F(MessageCodecTest, SignalDefaults) {
  auto r = paper::MessageCodec::decode(
      R"({"type": "signal", "market_id": "M", "side": "yes",
          "probability": 0.6, "market_price": 0.4, "edge": 0.2,
          "liquidity": null})");
  ASSERT_TRUE(r.ok());
  const auto& s = std::get<paper::domain::Signal>(r.value());
  EXPECT_EQ(s.side, paper::domain::Side::Yes);
  EXPECT_EQ(s.confidence, paper::domain::ConfidenceTier::Medium);
  EXPECT_EQ(s.horizon_ms, 0);
  EXPECT_DOUBLE_EQ(s.liquidity, 0.0);
}

// -----------------------------------------------------------------------------
// 3. Market updates and resolutions.
// -----------------------------------------------------------------------------
TEST_F(MessageCodecTest, DecodesMarketAndResolution) {
  auto m = paper::MessageCodec::decode(
      R"({"type": "market", "market_id": "M", "yes_price": 0.42,
          "liquidity": 900})");
  ASSERT_TRUE(m.ok());
  const auto& u = std::get<paper::domain::MarketUpdate>(m.value());
  EXPECT_DOUBLE_EQ(u.yes_price, 0.42);
  EXPECT_DOUBLE_EQ(u.liquidity, 900.0);

  auto res = paper::MessageCodec::decode(
      R"({"type": "resolution", "market_id": "M", "outcome": "NO"})");
  ASSERT_TRUE(res.ok());
  const auto& rr = std::get<paper::domain::MarketResolution>(res.value());
  EXPECT_EQ(rr.outcome, paper::domain::Side::No);
  EXPECT_EQ(paper::MessageCodec::marketOf(res.value()), "M");
}

// -----------------------------------------------------------------------------
// 4. Every malformed input is an InvalidSignal error.
// -----------------------------------------------------------------------------
TEST_F(MessageCodecTest, RejectsMalformedInput) {
  const char* bad[] = {
      "not json at all",
      R"({"market_id": "M"})",
      R"({"type": "order", "market_id": "M"})",
      R"({"type": "signal", "market_id": "M", "side": "MAYBE",
          "probability": 0.6, "market_price": 0.4, "edge": 0.2})",
      R"({"type": "signal", "market_id": "M", "side": "YES",
          "probability": 0.6, "market_price": 0.4, "edge": 0.2,
          "confidence": "EXTREME"})",
      R"({"type": "signal", "market_id": "M", "side": "YES",
          "probability": "high", "market_price": 0.4, "edge": 0.2})",
      R"({"type": "signal", "market_id": "M", "side": "YES",
          "market_price": 0.4, "edge": 0.2})",
      R"({"type": "resolution", "market_id": "M", "outcome": "VOID"})",
  };

  for (const char* payload : bad) {
    auto r = paper::MessageCodec::decode(payload);
    ASSERT_FALSE(r.ok()) << payload;
    EXPECT_EQ(r.kind(), paper::ErrorKind::InvalidSignal) << payload;
  }
}
