#pragma once

#include "dca/custody/i_funds_custody.hpp"
#include "dca/domain/order.hpp"
#include "dca/store/order_store.hpp"

#include <unordered_map>

namespace dca {

// -----------------------------------------------------------------------------
// TerminationResult — what terminate() did
// -----------------------------------------------------------------------------
// `order` is the snapshot taken just before removal; its remaining_balance
// is the amount that was owed back to the owner. refunded + deferred always
// equals that amount.
// -----------------------------------------------------------------------------
struct TerminationResult {
  domain::Order order;
  domain::TerminationReason reason{domain::TerminationReason::Completed};
  domain::Amount refunded{0};
  domain::Amount deferred{0};
};

// -----------------------------------------------------------------------------
// LifecycleTerminator — the only path that deletes an order
// -----------------------------------------------------------------------------
//
// @brief  Removes a completed or cancelled order from the OrderStore and
//         returns its unspent balance to the owner.
//
// @details
// Cancelled (owner request):
//   1. Order must exist                          → OrderNotFound
//   2. Caller must be the owner                  → NotOrderOwner
//   3. Refund remaining_balance (if > 0)         → CustodyTransferFailed
//   4. Remove from the store.
//   The refund runs before the removal, so a failed refund leaves the order
//   exactly as it was; the owner can cancel again later.
//
// Completed (ExecutionEngine, after the final swap):
//   1. Remove from the store.
//   2. Refund remaining_balance (if > 0). If custody refuses, the amount is
//      parked in deferred_refunds_ under the owner and reported on stderr.
//      The swap that completed the order already happened and cannot be
//      undone, so the order must still leave the active set; parking the
//      refund keeps the funds accounted for until claimRefund() succeeds.
//
// A zero balance never triggers a custody call.
//
// Thread model: not synchronised; called under DcaEngine's lock.
// -----------------------------------------------------------------------------
class LifecycleTerminator {
 public:
  LifecycleTerminator(OrderStore& store, IFundsCustody& custody);

  LifecycleTerminator(const LifecycleTerminator&) = delete;
  LifecycleTerminator& operator=(const LifecycleTerminator&) = delete;

  // `caller` is checked against the owner for Cancelled and ignored for
  // Completed.
  TerminationResult terminate(domain::OrderId id,
                              domain::TerminationReason reason,
                              const domain::AccountId& caller);

  // Pays out the owner's parked refunds. Throws NothingToClaim when none
  // are parked and CustodyTransferFailed (keeping them parked) when custody
  // refuses.
  domain::Amount claimRefund(const domain::AccountId& owner);

  domain::Amount pendingRefund(const domain::AccountId& owner) const;

  // Sum of all parked refunds.
  domain::Amount totalPendingRefunds() const;

 private:
  TerminationResult cancel(domain::OrderId id,
                           const domain::AccountId& caller);
  TerminationResult complete(domain::OrderId id);

  OrderStore& store_;
  IFundsCustody& custody_;
  std::unordered_map<domain::AccountId, domain::Amount> deferred_refunds_;
};

}  // namespace dca
