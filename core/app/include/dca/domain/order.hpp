#pragma once

#include "dca/domain/frequency.hpp"

#include <cstdint>
#include <string>

namespace dca {
namespace domain {

// -----------------------------------------------------------------------------
// Scalar aliases
// -----------------------------------------------------------------------------
// OrderId    — unique, never reused; produced by OrderIdGenerator.
// AccountId  — opaque account identity (owner, agent, admin). Empty means
//              "no account" and is never a valid owner.
// Amount     — funding asset in its smallest denomination.
// Price      — integer oracle reading. 0 inside a bound means "no bound".
// UnixSeconds — wall or simulated time, seconds since the epoch.
// -----------------------------------------------------------------------------
using OrderId = std::uint64_t;
using AccountId = std::string;
using Amount = std::uint64_t;
using Price = std::uint64_t;
using UnixSeconds = std::int64_t;

// -----------------------------------------------------------------------------
// TerminationReason
// -----------------------------------------------------------------------------
// Why an order left the store. Completed is decided by the ExecutionEngine
// after a successful swap; Cancelled is requested by the owner.
// -----------------------------------------------------------------------------
enum class TerminationReason {
  Completed,
  Cancelled,
};

// -----------------------------------------------------------------------------
// Order
// -----------------------------------------------------------------------------
//
// @brief  One standing DCA instruction: convert amount_per_swap of the
//         funding asset every `frequency` seconds, inside the price bounds,
//         until the budget or the deadline runs out.
//
// @details
// Immutable after creation: id, owner, total_amount, amount_per_swap,
// frequency, creation_time, end_time, min_price, max_price, total_swaps.
//
// Mutated only by the ExecutionEngine while the order sits in the
// OrderStore: last_execution_time, swaps_executed, remaining_balance.
//
// Accounting identity, holds at every observation point:
//   remaining_balance + amount_per_swap * swaps_executed == total_amount
//
// Value type. Snapshots travel inside events and query results; only the
// copy owned by OrderStore is authoritative.
// -----------------------------------------------------------------------------
struct Order {
  OrderId id{};
  AccountId owner;
  Amount total_amount{0};
  Amount amount_per_swap{0};
  std::int64_t frequency{0};          // Seconds between executions
  UnixSeconds creation_time{0};
  UnixSeconds last_execution_time{0};  // creation_time until first swap
  UnixSeconds end_time{0};             // creation_time + duration
  Price min_price{0};                  // 0 = unbounded below
  Price max_price{0};                  // 0 = unbounded above
  std::uint32_t swaps_executed{0};
  std::uint32_t total_swaps{0};
  Amount remaining_balance{0};

  // Earliest time the next execution may run.
  UnixSeconds nextEligibleTime() const {
    return last_execution_time + frequency;
  }
};

// -----------------------------------------------------------------------------
// OrderRequest
// -----------------------------------------------------------------------------
// User-supplied creation parameters. fee_payment is the value attached to
// the creation call; it must cover the currently configured execution fee.
// -----------------------------------------------------------------------------
struct OrderRequest {
  AccountId owner;
  Amount total_amount{0};
  Frequency frequency{Frequency::Daily};
  std::uint32_t duration_days{0};
  Price min_price{0};
  Price max_price{0};
  Amount fee_payment{0};
};

}  // namespace domain
}  // namespace dca
