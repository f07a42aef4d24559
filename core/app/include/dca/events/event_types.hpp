#pragma once

#include "dca/domain/order.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace dca {

// -----------------------------------------------------------------------------
// Lifecycle notifications
// -----------------------------------------------------------------------------
//
// @brief  Plain value structs published on the EventBus after each engine
//         operation commits.
//
// @details
// DcaEngine builds these from component results once the operation's
// state changes are complete and its lock is released. A subscriber never
// receives an event describing a state it could not also observe through a
// query.
//
// Every event carries:
//   timestamp   — engine time of the operation (seconds resolution).
//   sequence_id — engine-wide monotonic counter; gives subscribers a total
//                 order across event types.
// -----------------------------------------------------------------------------

using Timestamp = std::chrono::system_clock::time_point;

// A new order entered the store.
struct OrderCreatedEvent {
  domain::Order order;          // Snapshot right after insertion
  domain::Amount fee_paid{0};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// One slice was swapped.
struct SwapExecutedEvent {
  domain::OrderId order_id{};
  domain::AccountId owner;
  domain::Amount amount_in{0};
  domain::Amount amount_out{0};
  domain::Price price{0};
  std::uint32_t swaps_executed{0};
  domain::Amount remaining_balance{0};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// The final swap completed the order; it has left the store.
struct OrderCompletedEvent {
  domain::OrderId order_id{};
  domain::AccountId owner;
  std::uint32_t swaps_executed{0};
  domain::Amount remaining_balance{0};  // Balance owed back at completion
  domain::Amount refunded{0};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// The owner cancelled; the order has left the store.
struct OrderCancelledEvent {
  domain::OrderId order_id{};
  domain::AccountId owner;
  domain::Amount refunded{0};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// A completion refund could not be delivered and was parked.
struct RefundDeferredEvent {
  domain::OrderId order_id{};
  domain::AccountId owner;
  domain::Amount amount{0};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// The keeper's attempt to execute a due order was refused.
struct ExecutionRejectedEvent {
  domain::OrderId order_id{};
  std::string code;      // errorCodeToString() of the OrderError
  std::string message;
  bool retryable{false};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace dca
