#pragma once

#include "dca/domain/engine_settings.hpp"
#include "dca/domain/order.hpp"
#include "dca/execution/i_exchange.hpp"
#include "dca/lifecycle/lifecycle_terminator.hpp"
#include "dca/store/order_store.hpp"

#include <optional>

namespace dca {

// -----------------------------------------------------------------------------
// SwapRecord — bookkeeping of one successful execution
// -----------------------------------------------------------------------------
struct SwapRecord {
  domain::OrderId order_id{};
  domain::AccountId owner;
  domain::Amount amount_in{0};      // Always the order's amount_per_swap
  domain::Amount amount_out{0};     // As reported by the exchange
  domain::Price price{0};           // Oracle reading that passed the gate
  std::uint32_t swaps_executed{0};  // After this swap
  domain::Amount remaining_balance{0};
  domain::UnixSeconds executed_at{0};
};

// -----------------------------------------------------------------------------
// ExecutionResult — what execute() did
// -----------------------------------------------------------------------------
// `termination` is set when the swap completed the order; the order is then
// already gone from the store.
// -----------------------------------------------------------------------------
struct ExecutionResult {
  SwapRecord swap;
  std::optional<TerminationResult> termination;
};

// -----------------------------------------------------------------------------
// ExecutionEngine — gates, debits and completes scheduled swaps
// -----------------------------------------------------------------------------
//
// @brief  The only mutator of swaps_executed, last_execution_time and
//         remaining_balance.
//
// @details
// execute(id, now, price, caller) checks, in order:
//
//   0. caller == settings.agent_id                      → Unauthorized
//   1. order exists                                     → OrderNotFound
//   2. now >= last_execution_time + frequency           → TooEarly
//   3. now <= end_time                                  → PeriodEnded
//   4. remaining_balance >= amount_per_swap             → InsufficientBalance
//   5. min_price == 0 || price >= min_price             → PriceBelowMinimum
//      max_price == 0 || price <= max_price             → PriceAboveMaximum
//
// then asks the exchange to swap amount_per_swap. A rejection throws
// ExchangeRejected. Up to this point nothing has been written.
//
// On success:
//   remaining_balance -= amount_per_swap
//   swaps_executed    += 1
//   last_execution_time = now
//
// Completion is evaluated right after the update:
//   swaps_executed >= total_swaps
//   OR now >= end_time
//   OR remaining_balance < amount_per_swap
// and a completed order is handed to LifecycleTerminator before execute()
// returns. A completed order is never observable as active.
//
// preAuthorize(id, price, caller) is the pre-trade gate used when the agent
// routes a swap through an external venue itself. It checks the agent,
// existence, the price bounds and
//   remaining_balance >= amount_per_swap + settings.execution_fee
// and throws on the first failure. It never debits: execute() is the single
// debit point, so one execution cycle debits amount_per_swap exactly once
// whether or not it was pre-authorized.
//
// Thread model: not synchronised; called under DcaEngine's lock.
// -----------------------------------------------------------------------------
class ExecutionEngine {
 public:
  ExecutionEngine(OrderStore& store, IExchange& exchange,
                  LifecycleTerminator& terminator,
                  const domain::EngineSettings& settings);

  ExecutionEngine(const ExecutionEngine&) = delete;
  ExecutionEngine& operator=(const ExecutionEngine&) = delete;

  ExecutionResult execute(domain::OrderId id, domain::UnixSeconds now,
                          domain::Price price,
                          const domain::AccountId& caller);

  void preAuthorize(domain::OrderId id, domain::Price price,
                    const domain::AccountId& caller) const;

  static bool isComplete(const domain::Order& order, domain::UnixSeconds now);

 private:
  void requireAgent(const domain::AccountId& caller) const;
  const domain::Order& requireOrder(domain::OrderId id) const;
  static void checkPriceBounds(const domain::Order& order,
                               domain::Price price);

  OrderStore& store_;
  IExchange& exchange_;
  LifecycleTerminator& terminator_;
  const domain::EngineSettings& settings_;
};

}  // namespace dca
