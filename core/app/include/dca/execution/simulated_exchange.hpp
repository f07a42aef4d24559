#pragma once

#include "dca/execution/i_exchange.hpp"

#include <atomic>
#include <cstdint>

namespace dca {

// -----------------------------------------------------------------------------
// SimulatedExchange — deterministic IExchange for simulation and tests
// -----------------------------------------------------------------------------
//
// @brief  Fills every swap at the oracle price with a fixed slippage.
//
// @details
// Fill model:
//   gross      = amount_in * price / price_scale
//   amount_out = gross - gross * slippage_bps / 10000
//
// The product is formed in 128 bits so large balances times large prices
// cannot wrap. setAccepting(false) rejects every swap until re-enabled,
// simulating a paused pool.
//
// Thread model: setAccepting() may be called from any thread; swap() is
// called under DcaEngine's lock.
// -----------------------------------------------------------------------------
class SimulatedExchange final : public IExchange {
 public:
  explicit SimulatedExchange(std::uint64_t price_scale = 1,
                             std::uint32_t slippage_bps = 0);

  std::optional<domain::Amount> swap(const domain::PairConfig& pair,
                                     domain::Amount amount_in,
                                     domain::Price price) override;

  void setAccepting(bool accepting) { accepting_.store(accepting); }

  std::uint64_t swapCount() const { return swap_count_.load(); }

 private:
  const std::uint64_t price_scale_;
  const std::uint32_t slippage_bps_;
  std::atomic<bool> accepting_{true};
  std::atomic<std::uint64_t> swap_count_{0};
};

}  // namespace dca
