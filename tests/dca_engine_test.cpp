// =============================================================================
// dca_engine_test.cpp
// =============================================================================
// Tests for dca::DcaEngine with the simulated adapters and no sockets.
//
// Validates:
//   - the end-to-end order scenarios (daily schedule, short schedule,
//     immediate cancel)
//   - the accounting identity after every execution
//   - the administrative surface and its error codes
//   - creation atomicity when custody refuses the funds
//   - executeDue(): batch semantics and per-order rejections
//   - lifecycle events: content, ordering, re-entrancy
//   - executeCommand(): JSON replies for success and every failure class
//
// Design: every test owns its clock, ledger, exchange, oracle and engine.
// Endpoints are empty and the keeper is disabled, so no threads run.
// =============================================================================

#include "dca/custody/ledger_custody.hpp"
#include "dca/domain/error.hpp"
#include "dca/engine/dca_engine.hpp"
#include "dca/execution/simulated_exchange.hpp"
#include "dca/oracle/simulated_price_oracle.hpp"
#include "dca/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <limits>
#include <variant>
#include <vector>

using dca::ErrorCode;
using dca::domain::Frequency;

namespace {

constexpr dca::domain::UnixSeconds kDay = 86400;
constexpr dca::domain::UnixSeconds kStart = 1'700'000'000;

template <typename Fn>
ErrorCode codeOf(Fn&& fn) {
  try {
    fn();
  } catch (const dca::OrderError& e) {
    return e.code();
  }
  ADD_FAILURE() << "expected OrderError";
  return ErrorCode::InvalidConfiguration;
}

dca::EngineConfig offlineConfig() {
  dca::EngineConfig config;
  config.admin_id = "admin";
  config.agent_id = "keeper";
  config.price_feed_endpoint.clear();
  config.ipc_cmd_endpoint.clear();
  config.ipc_pub_endpoint.clear();
  config.keeper_enabled = false;
  return config;
}

dca::domain::OrderRequest request(dca::domain::Amount total, Frequency f,
                                  std::uint32_t days,
                                  dca::domain::Price min_price = 0,
                                  dca::domain::Price max_price = 0) {
  dca::domain::OrderRequest r;
  r.owner = "alice";
  r.total_amount = total;
  r.frequency = f;
  r.duration_days = days;
  r.min_price = min_price;
  r.max_price = max_price;
  return r;
}

nlohmann::json command(dca::DcaEngine& engine, const nlohmann::json& req) {
  return nlohmann::json::parse(engine.executeCommand(req.dump()));
}

}  // namespace

class DcaEngineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    custody.deposit("alice", 1000);
    engine.initialize("admin", {"USDC", "WETH"}, &oracle);
  }

  void expectIdentity(dca::domain::OrderId id) {
    auto order = engine.getOrder(id);
    ASSERT_TRUE(order.has_value());
    EXPECT_EQ(order->remaining_balance +
                  order->amount_per_swap * order->swaps_executed,
              order->total_amount);
  }

  dca::SimulationTimeProvider clock{kStart};
  dca::LedgerCustody custody;
  dca::SimulatedExchange exchange;
  dca::SimulatedPriceOracle oracle{1000};
  dca::DcaEngine engine{clock, custody, exchange, offlineConfig(), &oracle};
};

// -----------------------------------------------------------------------------
// 1. 100 / Daily / 30 days / [900, 1100].
// -----------------------------------------------------------------------------
TEST_F(DcaEngineTest, DailyScheduleScenario) {
  auto id = engine.createOrder(request(100, Frequency::Daily, 30, 900, 1100));

  auto order = engine.getOrder(id);
  ASSERT_TRUE(order.has_value());
  EXPECT_EQ(order->total_swaps, 30u);
  EXPECT_EQ(order->amount_per_swap, 3u);
  EXPECT_EQ(custody.balanceOf("alice"), 900u);
  EXPECT_EQ(custody.custodyBalance(), 100u);

  // Not due yet on the creation second.
  EXPECT_EQ(codeOf([&] { engine.executeOrder(id, "keeper"); }),
            ErrorCode::TooEarly);

  clock.advance_by(kDay);
  engine.executeOrder(id, "keeper");
  order = engine.getOrder(id);
  EXPECT_EQ(order->remaining_balance, 97u);
  EXPECT_EQ(order->swaps_executed, 1u);
  expectIdentity(id);

  clock.advance_by(kDay);
  oracle.update(1200, clock.now_seconds());
  EXPECT_EQ(codeOf([&] { engine.executeOrder(id, "keeper"); }),
            ErrorCode::PriceAboveMaximum);
  order = engine.getOrder(id);
  EXPECT_EQ(order->remaining_balance, 97u);
  EXPECT_EQ(order->swaps_executed, 1u);
}

// -----------------------------------------------------------------------------
// 2. 10 / 5 days / Daily: 2 per swap, gone after 5 swaps, nothing refunded.
// -----------------------------------------------------------------------------
TEST_F(DcaEngineTest, ShortScheduleRunsToCompletion) {
  auto id = engine.createOrder(request(10, Frequency::Daily, 5));
  ASSERT_EQ(engine.getOrder(id)->amount_per_swap, 2u);

  for (int i = 0; i < 5; ++i) {
    ASSERT_TRUE(engine.containsOrder(id)) << "removed before swap " << i + 1;
    clock.advance_by(kDay);
    auto result = engine.executeOrder(id, "keeper");
    EXPECT_EQ(result.termination.has_value(), i == 4);
  }

  EXPECT_FALSE(engine.containsOrder(id));
  EXPECT_EQ(engine.activeOrderCount(), 0u);
  EXPECT_EQ(custody.balanceOf("alice"), 990u);
  EXPECT_EQ(custody.custodyBalance(), 10u);  // Swaps never draw on the pool
}

// -----------------------------------------------------------------------------
// 3. Cancel straight after creation.
// -----------------------------------------------------------------------------
TEST_F(DcaEngineTest, CancelRightAfterCreate) {
  auto id = engine.createOrder(request(100, Frequency::Daily, 30));

  auto result = engine.cancelOrder(id, "alice");
  EXPECT_EQ(result.refunded, 100u);
  EXPECT_FALSE(engine.containsOrder(id));
  EXPECT_EQ(custody.balanceOf("alice"), 1000u);

  EXPECT_EQ(codeOf([&] { engine.cancelOrder(id, "alice"); }),
            ErrorCode::OrderNotFound);
}

TEST_F(DcaEngineTest, CancelMidScheduleRefundsRemainder) {
  auto id = engine.createOrder(request(100, Frequency::Daily, 30));
  for (int i = 0; i < 4; ++i) {
    clock.advance_by(kDay);
    engine.executeOrder(id, "keeper");
  }
  EXPECT_EQ(codeOf([&] { engine.cancelOrder(id, "bob"); }),
            ErrorCode::NotOrderOwner);
  EXPECT_EQ(engine.cancelOrder(id, "alice").refunded, 88u);
}

// -----------------------------------------------------------------------------
// 4. Executing until completion executes exactly total_swaps times.
// -----------------------------------------------------------------------------
TEST_F(DcaEngineTest, ExactlyTotalSwapsExecutions) {
  auto id = engine.createOrder(request(480, Frequency::Hourly, 1));
  const auto total_swaps = engine.getOrder(id)->total_swaps;

  std::uint32_t executed = 0;
  while (engine.containsOrder(id)) {
    clock.advance_by(3600);
    engine.executeOrder(id, "keeper");
    ++executed;
    if (engine.containsOrder(id)) {
      expectIdentity(id);
    }
    ASSERT_LE(executed, total_swaps);
  }
  EXPECT_EQ(executed, total_swaps);
}

// -----------------------------------------------------------------------------
// 5. Administrative surface.
// -----------------------------------------------------------------------------
TEST_F(DcaEngineTest, InitializeOnlyOnce) {
  EXPECT_EQ(codeOf([&] {
              engine.initialize("admin", {"USDC", "WBTC"}, &oracle);
            }),
            ErrorCode::AlreadyInitialized);
  EXPECT_EQ(engine.settings().pair.target_asset, "WETH");
}

TEST(DcaEngineAdmin, InitializeValidation) {
  dca::SimulationTimeProvider clock{kStart};
  dca::LedgerCustody custody;
  dca::SimulatedExchange exchange;
  dca::SimulatedPriceOracle oracle{1000};
  dca::DcaEngine engine(clock, custody, exchange, offlineConfig());

  EXPECT_EQ(codeOf([&] { engine.createOrder(request(100, Frequency::Daily, 5)); }),
            ErrorCode::NotInitialized);
  EXPECT_EQ(codeOf([&] { engine.initialize("alice", {"USDC", "WETH"}, &oracle); }),
            ErrorCode::Unauthorized);
  EXPECT_EQ(codeOf([&] { engine.initialize("admin", {"USDC", "USDC"}, &oracle); }),
            ErrorCode::InvalidConfiguration);
  EXPECT_EQ(codeOf([&] { engine.initialize("admin", {"", "WETH"}, &oracle); }),
            ErrorCode::InvalidConfiguration);
  EXPECT_EQ(codeOf([&] { engine.initialize("admin", {"USDC", "WETH"}, nullptr); }),
            ErrorCode::InvalidConfiguration);
  EXPECT_FALSE(engine.settings().initialized);

  engine.initialize("admin", {"USDC", "WETH"}, &oracle);
  EXPECT_TRUE(engine.settings().initialized);
}

TEST_F(DcaEngineTest, SetAgentAndFee) {
  EXPECT_EQ(codeOf([&] { engine.setAgent("alice", "alice"); }),
            ErrorCode::Unauthorized);
  EXPECT_EQ(codeOf([&] { engine.setAgent("admin", ""); }),
            ErrorCode::InvalidConfiguration);
  EXPECT_EQ(codeOf([&] { engine.setExecutionFee("keeper", 5); }),
            ErrorCode::Unauthorized);

  engine.setAgent("admin", "bot");
  engine.setExecutionFee("admin", 5);
  EXPECT_EQ(engine.settings().agent_id, "bot");
  EXPECT_EQ(engine.settings().execution_fee, 5u);

  auto r = request(100, Frequency::Daily, 30);
  EXPECT_EQ(codeOf([&] { engine.createOrder(r); }), ErrorCode::InsufficientFee);
  r.fee_payment = 7;
  auto id = engine.createOrder(r);
  EXPECT_EQ(engine.accruedFees(), 7u);

  clock.advance_by(kDay);
  EXPECT_EQ(codeOf([&] { engine.executeOrder(id, "keeper"); }),
            ErrorCode::Unauthorized);
  EXPECT_NO_THROW(engine.executeOrder(id, "bot"));
}

// -----------------------------------------------------------------------------
// 6. Custody refuses the deposit: nothing is created.
// -----------------------------------------------------------------------------
TEST_F(DcaEngineTest, CreationIsAtomicWhenCustodyRefuses) {
  auto r = request(5000, Frequency::Daily, 30);  // alice only holds 1000
  EXPECT_EQ(codeOf([&] { engine.createOrder(r); }),
            ErrorCode::CustodyTransferFailed);
  EXPECT_EQ(engine.activeOrderCount(), 0u);
  EXPECT_EQ(custody.balanceOf("alice"), 1000u);
  EXPECT_EQ(engine.accruedFees(), 0u);
}

TEST_F(DcaEngineTest, SameOwnerSameSecondGetsDistinctIds) {
  auto a = engine.createOrder(request(100, Frequency::Daily, 30));
  auto b = engine.createOrder(request(100, Frequency::Daily, 30));
  EXPECT_NE(a, b);
  EXPECT_EQ(engine.activeOrderCount(), 2u);
}

// -----------------------------------------------------------------------------
// 7. Pre-authorization never debits.
// -----------------------------------------------------------------------------
TEST_F(DcaEngineTest, PreAuthorizeDoesNotDebit) {
  auto id = engine.createOrder(request(100, Frequency::Daily, 30, 900, 1100));
  engine.preAuthorize(id, "keeper");
  engine.preAuthorize(id, "keeper");
  EXPECT_EQ(engine.getOrder(id)->remaining_balance, 100u);

  oracle.update(800, kStart);
  EXPECT_EQ(codeOf([&] { engine.preAuthorize(id, "keeper"); }),
            ErrorCode::PriceBelowMinimum);
}

// -----------------------------------------------------------------------------
// 8. executeDue(): one failing order does not stop the batch.
// -----------------------------------------------------------------------------
TEST_F(DcaEngineTest, ExecuteDueSkipsRejectedOrders) {
  auto bounded =
      engine.createOrder(request(100, Frequency::Daily, 30, 900, 1100));
  auto unbounded = engine.createOrder(request(100, Frequency::Daily, 30));

  std::vector<dca::ExecutionRejectedEvent> rejections;
  engine.eventBus().subscribe<dca::ExecutionRejectedEvent>(
      [&rejections](const dca::ExecutionRejectedEvent& e) {
        rejections.push_back(e);
      });

  EXPECT_EQ(engine.executeDue("keeper"), 0u);  // nothing due yet

  clock.advance_by(kDay);
  oracle.update(1200, clock.now_seconds());
  EXPECT_EQ(engine.dueOrders().size(), 2u);
  EXPECT_EQ(engine.executeDue("keeper"), 1u);

  EXPECT_EQ(engine.getOrder(bounded)->swaps_executed, 0u);
  EXPECT_EQ(engine.getOrder(unbounded)->swaps_executed, 1u);

  ASSERT_EQ(rejections.size(), 1u);
  EXPECT_EQ(rejections[0].order_id, bounded);
  EXPECT_EQ(rejections[0].code, "PriceAboveMaximum");
  EXPECT_TRUE(rejections[0].retryable);

  EXPECT_EQ(codeOf([&] { engine.executeDue("alice"); }),
            ErrorCode::Unauthorized);
}

// -----------------------------------------------------------------------------
// 9. Completion refund refused: the order still completes, the refund is
//    parked and can be claimed later.
// -----------------------------------------------------------------------------
TEST_F(DcaEngineTest, DeferredRefundIsClaimable) {
  auto id = engine.createOrder(request(100, Frequency::Daily, 30));

  std::vector<dca::RefundDeferredEvent> deferred;
  engine.eventBus().subscribe<dca::RefundDeferredEvent>(
      [&deferred](const dca::RefundDeferredEvent& e) { deferred.push_back(e); });

  for (int i = 0; i < 29; ++i) {
    clock.advance_by(kDay);
    engine.executeOrder(id, "keeper");
  }
  custody.setFrozen(true);
  clock.advance_by(kDay);
  auto result = engine.executeOrder(id, "keeper");

  ASSERT_TRUE(result.termination.has_value());
  EXPECT_EQ(result.termination->deferred, 10u);
  EXPECT_FALSE(engine.containsOrder(id));
  EXPECT_EQ(engine.pendingRefund("alice"), 10u);
  ASSERT_EQ(deferred.size(), 1u);
  EXPECT_EQ(deferred[0].amount, 10u);

  custody.setFrozen(false);
  EXPECT_EQ(engine.claimRefund("alice"), 10u);
  EXPECT_EQ(engine.pendingRefund("alice"), 0u);
  EXPECT_EQ(custody.balanceOf("alice"), 910u);
}

// -----------------------------------------------------------------------------
// 10. Events: one per state change, in sequence order, after the state is
//     observable. A subscriber may call back into the engine.
// -----------------------------------------------------------------------------
TEST_F(DcaEngineTest, EventsDescribeCommittedState) {
  std::vector<dca::Event> events;
  std::vector<std::size_t> counts_seen;
  engine.eventBus().subscribe([&](const dca::Event& e) {
    events.push_back(e);
    counts_seen.push_back(engine.activeOrderCount());  // must not deadlock
  });

  auto id = engine.createOrder(request(10, Frequency::Daily, 5));
  for (int i = 0; i < 5; ++i) {
    clock.advance_by(kDay);
    engine.executeOrder(id, "keeper");
  }

  // created, 5 x swap, completed
  ASSERT_EQ(events.size(), 7u);
  EXPECT_TRUE(std::holds_alternative<dca::OrderCreatedEvent>(events[0]));
  for (int i = 1; i <= 5; ++i) {
    EXPECT_TRUE(std::holds_alternative<dca::SwapExecutedEvent>(events[i]));
  }
  ASSERT_TRUE(std::holds_alternative<dca::OrderCompletedEvent>(events[6]));

  const auto& created = std::get<dca::OrderCreatedEvent>(events[0]);
  EXPECT_EQ(created.order.id, id);
  EXPECT_EQ(counts_seen[0], 1u);

  const auto& completed = std::get<dca::OrderCompletedEvent>(events[6]);
  EXPECT_EQ(completed.swaps_executed, 5u);
  EXPECT_EQ(completed.remaining_balance, 0u);
  EXPECT_EQ(counts_seen[6], 0u);

  std::uint64_t previous = 0;
  for (const auto& e : events) {
    std::uint64_t seq =
        std::visit([](const auto& ev) { return ev.sequence_id; }, e);
    EXPECT_GT(seq, previous);
    previous = seq;
  }
}

// -----------------------------------------------------------------------------
// 11. executeCommand(): JSON in, JSON out, never throws.
// -----------------------------------------------------------------------------
TEST_F(DcaEngineTest, CommandRoundTrip) {
  EXPECT_EQ(command(engine, {{"cmd", "ping"}})["response"], "pong");

  auto created = command(engine, {{"cmd", "create"},
                                  {"owner", "alice"},
                                  {"total_amount", 100},
                                  {"frequency", "Daily"},
                                  {"duration_days", 30},
                                  {"min_price", 900},
                                  {"max_price", 1100}});
  ASSERT_EQ(created["status"], "ok") << created.dump();
  const auto id = created["order_id"].get<dca::domain::OrderId>();

  auto got = command(engine, {{"cmd", "get"}, {"order_id", id}});
  EXPECT_EQ(got["order"]["amount_per_swap"], 3);
  EXPECT_EQ(got["order"]["frequency_class"], "Daily");

  EXPECT_EQ(command(engine, {{"cmd", "count"}})["count"], 1);
  EXPECT_EQ(command(engine, {{"cmd", "contains"}, {"order_id", id}})["contains"],
            true);

  clock.advance_by(kDay);
  EXPECT_EQ(command(engine, {{"cmd", "due"}})["order_ids"].size(), 1u);

  auto executed = command(engine,
                          {{"cmd", "execute"}, {"order_id", id}, {"caller", "keeper"}});
  ASSERT_EQ(executed["status"], "ok") << executed.dump();
  EXPECT_EQ(executed["swap"]["remaining_balance"], 97);
  EXPECT_EQ(executed["completed"], false);

  auto status = command(engine, {{"cmd", "status"}});
  EXPECT_EQ(status["initialized"], true);
  EXPECT_EQ(status["active_orders"], 1);

  auto cancelled = command(engine,
                           {{"cmd", "cancel"}, {"order_id", id}, {"caller", "alice"}});
  EXPECT_EQ(cancelled["refunded"], 97);
}

TEST_F(DcaEngineTest, CommandErrorsAreReplies) {
  auto not_found = command(engine, {{"cmd", "get"}, {"order_id", 77}});
  EXPECT_EQ(not_found["status"], "error");
  EXPECT_EQ(not_found["code"], "OrderNotFound");
  EXPECT_EQ(not_found["retryable"], false);

  auto id = engine.createOrder(request(100, Frequency::Daily, 30));
  auto early = command(engine,
                       {{"cmd", "execute"}, {"order_id", id}, {"caller", "keeper"}});
  EXPECT_EQ(early["code"], "TooEarly");
  EXPECT_EQ(early["retryable"], true);

  auto bad_freq = command(engine, {{"cmd", "create"},
                                   {"owner", "alice"},
                                   {"total_amount", 100},
                                   {"frequency", "Yearly"},
                                   {"duration_days", 30}});
  EXPECT_EQ(bad_freq["code"], "InvalidSchedule");

  auto malformed = nlohmann::json::parse(engine.executeCommand("{not json"));
  EXPECT_EQ(malformed["status"], "error");
  EXPECT_EQ(malformed["code"], "BadRequest");

  auto missing = command(engine, {{"cmd", "cancel"}});
  EXPECT_EQ(missing["code"], "BadRequest");

  auto unknown = command(engine, {{"cmd", "launch"}});
  EXPECT_EQ(unknown["code"], "UnknownCommand");
}

TEST_F(DcaEngineTest, NegativeOrFractionalNumbersAreBadRequests) {
  nlohmann::json create = {{"cmd", "create"},      {"owner", "alice"},
                           {"total_amount", 100},  {"frequency", "Daily"},
                           {"duration_days", 30}};

  auto negative_duration = create;
  negative_duration["duration_days"] = -1;
  EXPECT_EQ(command(engine, negative_duration)["code"], "BadRequest");

  auto negative_amount = create;
  negative_amount["total_amount"] = -5;
  EXPECT_EQ(command(engine, negative_amount)["code"], "BadRequest");

  auto negative_bound = create;
  negative_bound["min_price"] = -900;
  EXPECT_EQ(command(engine, negative_bound)["code"], "BadRequest");

  auto fractional = create;
  fractional["total_amount"] = 99.5;
  EXPECT_EQ(command(engine, fractional)["code"], "BadRequest");

  auto too_long = create;
  too_long["duration_days"] = 4294967296LL;
  EXPECT_EQ(command(engine, too_long)["code"], "BadRequest");

  EXPECT_EQ(engine.activeOrderCount(), 0u);
  EXPECT_EQ(custody.balanceOf("alice"), 1000u);

  auto fee = command(engine, {{"cmd", "set_fee"}, {"caller", "admin"}, {"fee", -1}});
  EXPECT_EQ(fee["code"], "BadRequest");
  EXPECT_EQ(engine.settings().execution_fee, 0u);

  auto cancel =
      command(engine, {{"cmd", "cancel"}, {"order_id", -3}, {"caller", "alice"}});
  EXPECT_EQ(cancel["code"], "BadRequest");

  EXPECT_EQ(command(engine, create)["status"], "ok");
}

TEST_F(DcaEngineTest, PreAuthorizeRefusesFeeLargerThanBalance) {
  auto id = engine.createOrder(request(100, Frequency::Daily, 30));
  engine.setExecutionFee("admin",
                         std::numeric_limits<dca::domain::Amount>::max());

  auto reply = command(engine, {{"cmd", "pre_authorize"},
                                {"order_id", id},
                                {"caller", "keeper"}});
  EXPECT_EQ(reply["code"], "InsufficientBalance");
  EXPECT_EQ(engine.getOrder(id)->remaining_balance, 100u);
}

TEST_F(DcaEngineTest, AdminCommands) {
  EXPECT_EQ(command(engine, {{"cmd", "set_fee"}, {"caller", "admin"}, {"fee", 3}})
                ["status"],
            "ok");
  EXPECT_EQ(engine.settings().execution_fee, 3u);

  auto denied =
      command(engine, {{"cmd", "set_agent"}, {"caller", "alice"}, {"agent", "x"}});
  EXPECT_EQ(denied["code"], "Unauthorized");

  auto again = command(engine, {{"cmd", "initialize"},
                                {"caller", "admin"},
                                {"funding_asset", "USDC"},
                                {"target_asset", "WETH"}});
  EXPECT_EQ(again["code"], "AlreadyInitialized");

  EXPECT_EQ(command(engine, {{"cmd", "claim_refund"}, {"owner", "alice"}})["code"],
            "NothingToClaim");
  EXPECT_EQ(command(engine, {{"cmd", "accrued_fees"}})["accrued_fees"], 0);
}
