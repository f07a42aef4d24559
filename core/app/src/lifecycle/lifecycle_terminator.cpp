#include "dca/lifecycle/lifecycle_terminator.hpp"
#include "dca/domain/error.hpp"

#include <iostream>
#include <string>
#include <utility>

namespace dca {

LifecycleTerminator::LifecycleTerminator(OrderStore& store,
                                         IFundsCustody& custody)
    : store_(store), custody_(custody) {}

// -----------------------------------------------------------------------------
// terminate(): dispatch on reason
// -----------------------------------------------------------------------------
TerminationResult LifecycleTerminator::terminate(
    domain::OrderId id, domain::TerminationReason reason,
    const domain::AccountId& caller) {
  switch (reason) {
    case domain::TerminationReason::Cancelled:
      return cancel(id, caller);
    case domain::TerminationReason::Completed:
      return complete(id);
  }
  throw OrderError(ErrorCode::InvalidConfiguration,
                   "unknown termination reason");
}

// -----------------------------------------------------------------------------
// cancel(): refund first, remove second
// -----------------------------------------------------------------------------
TerminationResult LifecycleTerminator::cancel(
    domain::OrderId id, const domain::AccountId& caller) {
  const domain::Order* order = store_.get(id);
  if (order == nullptr) {
    throw OrderError(ErrorCode::OrderNotFound,
                     "order " + std::to_string(id) + " not found");
  }
  if (order->owner != caller) {
    throw OrderError(ErrorCode::NotOrderOwner,
                     "caller '" + caller + "' does not own order " +
                         std::to_string(id));
  }

  const domain::Amount balance = order->remaining_balance;
  if (balance > 0 && !custody_.transferOut(order->owner, balance)) {
    throw OrderError(ErrorCode::CustodyTransferFailed,
                     "refund of " + std::to_string(balance) + " to '" +
                         order->owner + "' failed; order " +
                         std::to_string(id) + " left active");
  }

  TerminationResult result;
  result.reason = domain::TerminationReason::Cancelled;
  result.refunded = balance;
  result.order = *store_.removeById(id);
  return result;
}

// -----------------------------------------------------------------------------
// complete(): remove first, refund second, park on failure
// -----------------------------------------------------------------------------
TerminationResult LifecycleTerminator::complete(domain::OrderId id) {
  std::optional<domain::Order> removed = store_.removeById(id);
  if (!removed) {
    throw OrderError(ErrorCode::OrderNotFound,
                     "order " + std::to_string(id) + " not found");
  }

  TerminationResult result;
  result.reason = domain::TerminationReason::Completed;
  result.order = std::move(*removed);

  const domain::Amount balance = result.order.remaining_balance;
  if (balance == 0) {
    return result;
  }

  if (custody_.transferOut(result.order.owner, balance)) {
    result.refunded = balance;
  } else {
    deferred_refunds_[result.order.owner] += balance;
    result.deferred = balance;
    std::cerr << "[LifecycleTerminator] ERROR: refund of " << balance
              << " for completed order " << id << " to '"
              << result.order.owner
              << "' failed. Amount parked for claimRefund().\n";
  }
  return result;
}

// -----------------------------------------------------------------------------
// claimRefund()
// -----------------------------------------------------------------------------
domain::Amount LifecycleTerminator::claimRefund(
    const domain::AccountId& owner) {
  auto it = deferred_refunds_.find(owner);
  if (it == deferred_refunds_.end() || it->second == 0) {
    throw OrderError(ErrorCode::NothingToClaim,
                     "no parked refund for '" + owner + "'");
  }

  const domain::Amount amount = it->second;
  if (!custody_.transferOut(owner, amount)) {
    throw OrderError(ErrorCode::CustodyTransferFailed,
                     "refund claim of " + std::to_string(amount) + " for '" +
                         owner + "' failed; amount stays parked");
  }

  deferred_refunds_.erase(it);
  return amount;
}

domain::Amount LifecycleTerminator::pendingRefund(
    const domain::AccountId& owner) const {
  auto it = deferred_refunds_.find(owner);
  return it == deferred_refunds_.end() ? 0 : it->second;
}

domain::Amount LifecycleTerminator::totalPendingRefunds() const {
  domain::Amount total = 0;
  for (const auto& [owner, amount] : deferred_refunds_) {
    total += amount;
  }
  return total;
}

}  // namespace dca
