#pragma once

#include "dca/custody/i_funds_custody.hpp"

#include <map>
#include <mutex>
#include <unordered_map>

namespace dca {

// -----------------------------------------------------------------------------
// LedgerCustody — in-memory IFundsCustody for simulation and tests
// -----------------------------------------------------------------------------
//
// @brief  Tracks one external balance per account plus the pool held by
//         the engine.
//
// @details
// transferIn fails when the account holds less than `amount`.
// transferOut fails when the pool holds less than `amount`.
// setFrozen(true) makes every transfer fail, which lets tests and the
// operator simulate a custody outage without touching balances.
//
// Thread model: every method takes the internal mutex.
// -----------------------------------------------------------------------------
class LedgerCustody final : public IFundsCustody {
 public:
  LedgerCustody() = default;
  explicit LedgerCustody(
      const std::map<domain::AccountId, domain::Amount>& initial_balances);

  bool transferIn(const domain::AccountId& from,
                  domain::Amount amount) override;
  bool transferOut(const domain::AccountId& to,
                   domain::Amount amount) override;

  // Credits an external balance (e.g. a user top-up).
  void deposit(const domain::AccountId& account, domain::Amount amount);

  domain::Amount balanceOf(const domain::AccountId& account) const;

  // Everything transferred in minus everything transferred out. Swaps run
  // through IExchange and never draw on the pool, so executed slices stay
  // counted here until the venue settles them.
  domain::Amount custodyBalance() const;

  void setFrozen(bool frozen);

 private:
  mutable std::mutex mutex_;
  std::unordered_map<domain::AccountId, domain::Amount> balances_;
  domain::Amount pool_{0};
  bool frozen_{false};
};

}  // namespace dca
