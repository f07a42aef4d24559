#pragma once

#include "dca/domain/order.hpp"
#include "dca/store/order_store.hpp"

#include <optional>
#include <vector>

namespace dca {

// -----------------------------------------------------------------------------
// DueOrderScanner — read-only view answering "what can run now?"
// -----------------------------------------------------------------------------
//
// @brief  Inspects the OrderStore and reports orders eligible for
//         execution at a caller-supplied time.
//
// @details
// An order is due iff
//     now >= last_execution_time + frequency   AND   now <= end_time
//
// Tie-break: the store's index order is arbitrary, so the scanner ranks
// due orders explicitly by (next eligible time, id) ascending. The order
// that has waited longest past its slot is served first; ids break exact
// ties deterministically.
//
// Price and balance gates are NOT evaluated here. A due order may still be
// refused by the ExecutionEngine.
//
// Complexity: linear in the number of active orders per call.
//
// Thread model: pure read; called under DcaEngine's lock.
// -----------------------------------------------------------------------------
class DueOrderScanner {
 public:
  explicit DueOrderScanner(const OrderStore& store);

  static bool isDue(const domain::Order& order, domain::UnixSeconds now);

  // Highest-ranked due order, if any.
  std::optional<domain::OrderId> findDue(domain::UnixSeconds now) const;

  // All due orders, highest-ranked first.
  std::vector<domain::OrderId> findAllDue(domain::UnixSeconds now) const;

 private:
  const OrderStore& store_;
};

}  // namespace dca
