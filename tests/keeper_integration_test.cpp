// =============================================================================
// keeper_integration_test.cpp
// =============================================================================
// Tests for dca::KeeperThread on its own and driving a DcaEngine.
//
// Validates:
//   - the poll callback runs repeatedly on the keeper thread
//   - stop() interrupts a long wait instead of sleeping it out
//   - a throwing callback does not kill the loop
//   - with the keeper enabled, advancing the simulation clock is enough
//     to get due orders executed, and events reach subscribers
// =============================================================================

#include "dca/custody/ledger_custody.hpp"
#include "dca/engine/dca_engine.hpp"
#include "dca/execution/simulated_exchange.hpp"
#include "dca/network/keeper_thread.hpp"
#include "dca/oracle/simulated_price_oracle.hpp"
#include "dca/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>

using namespace std::chrono_literals;

namespace {

// Spins until `pred` holds or `timeout` passes.
template <typename Pred>
bool waitFor(Pred pred, std::chrono::milliseconds timeout = 2000ms) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) {
      return true;
    }
    std::this_thread::sleep_for(5ms);
  }
  return pred();
}

}  // namespace

TEST(KeeperThreadTest, PollsRepeatedly) {
  std::atomic<int> calls{0};
  dca::KeeperThread keeper(
      [&calls]() -> std::size_t {
        ++calls;
        return 2;
      },
      5ms);

  keeper.start();
  ASSERT_TRUE(waitFor([&] { return calls.load() >= 3; }));
  keeper.stop();

  EXPECT_GE(keeper.pollCount(), 3u);
  EXPECT_EQ(keeper.executedCount(), 2 * keeper.pollCount());
}

// -----------------------------------------------------------------------------
// stop() must not wait out the interval.
// Why: shutdown on SIGINT joins the keeper; a 1 s (or longer) poll interval
//      would otherwise stall the whole process.
// -----------------------------------------------------------------------------
TEST(KeeperThreadTest, StopWakesLongWait) {
  std::atomic<int> calls{0};
  dca::KeeperThread keeper(
      [&calls]() -> std::size_t {
        ++calls;
        return 0;
      },
      std::chrono::milliseconds(60'000));

  keeper.start();
  ASSERT_TRUE(waitFor([&] { return calls.load() == 1; }));

  const auto begin = std::chrono::steady_clock::now();
  keeper.stop();
  EXPECT_LT(std::chrono::steady_clock::now() - begin, 1s);
  EXPECT_EQ(calls.load(), 1);
}

TEST(KeeperThreadTest, SurvivesThrowingCallback) {
  std::atomic<int> calls{0};
  dca::KeeperThread keeper(
      [&calls]() -> std::size_t {
        if (++calls == 1) {
          throw std::runtime_error("transient");
        }
        return 1;
      },
      5ms);

  keeper.start();
  ASSERT_TRUE(waitFor([&] { return calls.load() >= 3; }));
  keeper.stop();
  EXPECT_GE(keeper.executedCount(), 2u);
}

// -----------------------------------------------------------------------------
// End to end: create, advance the clock, let the keeper do the rest.
// -----------------------------------------------------------------------------
TEST(KeeperIntegrationTest, KeeperExecutesDueOrders) {
  constexpr dca::domain::UnixSeconds kDay = 86400;

  dca::SimulationTimeProvider clock(1'700'000'000);
  dca::LedgerCustody custody({{"alice", 1000}});
  dca::SimulatedExchange exchange;
  dca::SimulatedPriceOracle oracle(1000);

  dca::EngineConfig config;
  config.price_feed_endpoint.clear();
  config.ipc_cmd_endpoint.clear();
  config.ipc_pub_endpoint.clear();
  config.keeper_enabled = true;
  config.keeper_poll_interval_ms = 10;

  dca::DcaEngine engine(clock, custody, exchange, config);
  engine.initialize(config.admin_id, {"USDC", "WETH"}, &oracle);

  std::promise<dca::SwapExecutedEvent> first_swap;
  auto future = first_swap.get_future();
  std::atomic<bool> fulfilled{false};
  engine.eventBus().subscribe<dca::SwapExecutedEvent>(
      [&](const dca::SwapExecutedEvent& e) {
        if (!fulfilled.exchange(true)) {
          first_swap.set_value(e);
        }
      });

  dca::domain::OrderRequest request;
  request.owner = "alice";
  request.total_amount = 10;
  request.frequency = dca::domain::Frequency::Daily;
  request.duration_days = 5;
  const auto id = engine.createOrder(request);

  engine.start();

  // Nothing is due yet; the keeper must leave the order alone.
  std::this_thread::sleep_for(50ms);
  EXPECT_EQ(engine.getOrder(id)->swaps_executed, 0u);

  clock.advance_by(kDay);
  ASSERT_EQ(future.wait_for(2s), std::future_status::ready)
      << "keeper did not execute the due order";
  EXPECT_EQ(future.get().order_id, id);

  // Run the rest of the schedule through the keeper.
  for (int day = 2; day <= 5; ++day) {
    ASSERT_TRUE(waitFor([&] {
      auto order = engine.getOrder(id);
      return order && order->swaps_executed == static_cast<std::uint32_t>(day - 1);
    }));
    clock.advance_by(kDay);
  }
  ASSERT_TRUE(waitFor([&] { return !engine.containsOrder(id); }));

  engine.stop();
  EXPECT_EQ(engine.activeOrderCount(), 0u);
}
