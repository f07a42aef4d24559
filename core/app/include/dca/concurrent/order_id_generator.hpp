#pragma once

#include "dca/domain/order.hpp"

#include <atomic>
#include <cstdint>

namespace dca {

// -----------------------------------------------------------------------------
// OrderIdGenerator — monotonically increasing order id source
// -----------------------------------------------------------------------------
//
// @brief  Hands out order ids from an atomic counter. Ids start at 1 (0 is
//         the "unset" sentinel in domain::Order) and are never handed out
//         twice, so an id removed from the OrderStore is never reused.
//
// @details
// Ids deliberately do not depend on (owner, creation time): two orders
// created by the same owner within the same second must not collide.
//
// Thread model:
//   next_id() is safe from any thread. In practice DcaEngine calls it under
//   its own lock, so ids also increase in creation order.
//
// Ownership:
//   Value member of DcaEngine, injected into OrderFactory by reference.
// -----------------------------------------------------------------------------
class OrderIdGenerator {
 public:
  OrderIdGenerator() = default;

  OrderIdGenerator(const OrderIdGenerator&) = delete;
  OrderIdGenerator& operator=(const OrderIdGenerator&) = delete;
  OrderIdGenerator(OrderIdGenerator&&) = delete;
  OrderIdGenerator& operator=(OrderIdGenerator&&) = delete;

  domain::OrderId next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

 private:
  std::atomic<domain::OrderId> next_id_{1};
};

}  // namespace dca
