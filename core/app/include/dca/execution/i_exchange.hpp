#pragma once

#include "dca/domain/engine_settings.hpp"
#include "dca/domain/order.hpp"

#include <optional>

namespace dca {

// -----------------------------------------------------------------------------
// IExchange — opaque swap venue for one execution slice
// -----------------------------------------------------------------------------
//
// @brief  Converts `amount_in` of the pair's funding asset into the target
//         asset and reports the output amount.
//
// @details
// Return value:
//   - amount_out  → swap accepted. The engine records it in the
//                   SwapExecutedEvent without verifying the rate.
//   - nullopt     → swap rejected. The engine aborts execute() with
//                   ExchangeRejected and leaves the order untouched.
//
// The engine never retries a rejected swap; the agent decides when to try
// again.
//
// `price` is the oracle reading that passed the price gate. Real venues can
// ignore it; SimulatedExchange prices the swap with it.
//
// Thread model:
//   Called under DcaEngine's lock, one swap at a time.
// -----------------------------------------------------------------------------
class IExchange {
 public:
  virtual ~IExchange() = default;

  virtual std::optional<domain::Amount> swap(const domain::PairConfig& pair,
                                             domain::Amount amount_in,
                                             domain::Price price) = 0;
};

}  // namespace dca
