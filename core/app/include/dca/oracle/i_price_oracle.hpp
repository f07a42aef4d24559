#pragma once

#include "dca/domain/order.hpp"

namespace dca {

// -----------------------------------------------------------------------------
// PriceReading — one oracle observation
// -----------------------------------------------------------------------------
// Only `value` feeds the price gate. `as_of` is informational; staleness
// policy belongs to whoever triggers the execution.
// -----------------------------------------------------------------------------
struct PriceReading {
  domain::Price value{0};
  domain::UnixSeconds as_of{0};
};

// -----------------------------------------------------------------------------
// IPriceOracle — source of the current price of the configured pair
// -----------------------------------------------------------------------------
//
// @details
// Bound to the engine once, by DcaEngine::initialize(). The engine reads it
// once per execute()/preAuthorize() call, under its own lock.
//
// Implementations must be safe to read from any thread.
// -----------------------------------------------------------------------------
class IPriceOracle {
 public:
  virtual ~IPriceOracle() = default;

  virtual PriceReading latestPrice() const = 0;
};

}  // namespace dca
