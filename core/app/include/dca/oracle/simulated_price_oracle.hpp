#pragma once

#include "dca/oracle/i_price_oracle.hpp"

#include <mutex>

namespace dca {

// -----------------------------------------------------------------------------
// SimulatedPriceOracle — settable IPriceOracle
// -----------------------------------------------------------------------------
//
// @brief  Holds the last price pushed by the PriceFeedGateway (or a test).
//
// @details
// value and as_of are updated together under a mutex so a reader never
// sees a price paired with another tick's timestamp.
// -----------------------------------------------------------------------------
class SimulatedPriceOracle final : public IPriceOracle {
 public:
  SimulatedPriceOracle() = default;
  explicit SimulatedPriceOracle(domain::Price initial) {
    reading_.value = initial;
  }

  PriceReading latestPrice() const override;

  void update(domain::Price value, domain::UnixSeconds as_of);

 private:
  mutable std::mutex mutex_;
  PriceReading reading_;
};

}  // namespace dca
