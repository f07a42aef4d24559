// =============================================================================
// price_feed_gateway_test.cpp
// =============================================================================
// Tests for the price feed: tick decoding and the owning thread's
// start/stop lifecycle. No publisher is needed; a SUB socket connects
// lazily and simply receives nothing.
// =============================================================================

#include "dca/gateway/price_feed_gateway.hpp"
#include "dca/network/price_feed_thread.hpp"

#include <gtest/gtest.h>

TEST(PriceFeedGatewayTest, ParsesWellFormedTick) {
  auto tick = dca::PriceFeedGateway::parseTick(
      R"({"timestamp": 1700000000, "price": 1850})");
  ASSERT_TRUE(tick.has_value());
  EXPECT_EQ(tick->timestamp, 1700000000);
  EXPECT_EQ(tick->price, 1850u);
}

TEST(PriceFeedGatewayTest, IgnoresExtraFields) {
  auto tick = dca::PriceFeedGateway::parseTick(
      R"({"timestamp": 5, "price": 7, "symbol": "WETH"})");
  ASSERT_TRUE(tick.has_value());
  EXPECT_EQ(tick->price, 7u);
}

// -----------------------------------------------------------------------------
// Malformed ticks decode to nullopt; the recv loop logs and skips them.
// -----------------------------------------------------------------------------
TEST(PriceFeedGatewayTest, RejectsMalformedTicks) {
  using dca::PriceFeedGateway;
  EXPECT_FALSE(PriceFeedGateway::parseTick("not json").has_value());
  EXPECT_FALSE(PriceFeedGateway::parseTick(R"({"price": 10})").has_value());
  EXPECT_FALSE(PriceFeedGateway::parseTick(R"({"timestamp": 1})").has_value());
  EXPECT_FALSE(
      PriceFeedGateway::parseTick(R"({"timestamp": 1, "price": "high"})")
          .has_value());
  EXPECT_FALSE(
      PriceFeedGateway::parseTick(R"({"timestamp": 1, "price": 0})")
          .has_value());
}

TEST(PriceFeedThreadTest, StartStopWithoutPublisher) {
  dca::SimulatedPriceOracle oracle(1000);
  dca::SimulationTimeProvider clock(0);

  dca::PriceFeedThread feed(oracle, &clock, "tcp://127.0.0.1:25555");
  feed.start();
  feed.start();  // idempotent
  feed.stop();
  feed.stop();

  EXPECT_EQ(oracle.latestPrice().value, 1000u);
  EXPECT_EQ(clock.now_seconds(), 0);
}
