#pragma once

#include "dca/domain/order.hpp"

namespace dca {

// -----------------------------------------------------------------------------
// IFundsCustody — moves funding asset between accounts and the engine
// -----------------------------------------------------------------------------
//
// @brief  Atomic ledger operations. Each call either moves the full amount
//         and returns true, or moves nothing and returns false.
//
// @details
// transferIn(from, amount)  — account → engine custody (order creation).
// transferOut(to, amount)   — engine custody → account (refunds, claims).
//
// A false return is never retried by the engine. The calling operation
// either aborts with CustodyTransferFailed (creation, cancellation, claims)
// or parks the amount as a deferred refund (completion).
//
// Implementations must be safe to call from any thread.
// -----------------------------------------------------------------------------
class IFundsCustody {
 public:
  virtual ~IFundsCustody() = default;

  virtual bool transferIn(const domain::AccountId& from,
                          domain::Amount amount) = 0;

  virtual bool transferOut(const domain::AccountId& to,
                           domain::Amount amount) = 0;
};

}  // namespace dca
