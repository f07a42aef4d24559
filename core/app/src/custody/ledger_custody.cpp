#include "dca/custody/ledger_custody.hpp"

namespace dca {

LedgerCustody::LedgerCustody(
    const std::map<domain::AccountId, domain::Amount>& initial_balances)
    : balances_(initial_balances.begin(), initial_balances.end()) {}

// -----------------------------------------------------------------------------
// transferIn(): account → pool
// -----------------------------------------------------------------------------
bool LedgerCustody::transferIn(const domain::AccountId& from,
                               domain::Amount amount) {
  std::lock_guard lock(mutex_);
  if (frozen_) {
    return false;
  }

  auto it = balances_.find(from);
  if (it == balances_.end() || it->second < amount) {
    return false;
  }

  it->second -= amount;
  pool_ += amount;
  return true;
}

// -----------------------------------------------------------------------------
// transferOut(): pool → account
// -----------------------------------------------------------------------------
bool LedgerCustody::transferOut(const domain::AccountId& to,
                                domain::Amount amount) {
  std::lock_guard lock(mutex_);
  if (frozen_ || pool_ < amount) {
    return false;
  }

  pool_ -= amount;
  balances_[to] += amount;
  return true;
}

void LedgerCustody::deposit(const domain::AccountId& account,
                            domain::Amount amount) {
  std::lock_guard lock(mutex_);
  balances_[account] += amount;
}

domain::Amount LedgerCustody::balanceOf(
    const domain::AccountId& account) const {
  std::lock_guard lock(mutex_);
  auto it = balances_.find(account);
  return it == balances_.end() ? 0 : it->second;
}

domain::Amount LedgerCustody::custodyBalance() const {
  std::lock_guard lock(mutex_);
  return pool_;
}

void LedgerCustody::setFrozen(bool frozen) {
  std::lock_guard lock(mutex_);
  frozen_ = frozen;
}

}  // namespace dca
