#include "dca/oracle/simulated_price_oracle.hpp"

namespace dca {

PriceReading SimulatedPriceOracle::latestPrice() const {
  std::lock_guard lock(mutex_);
  return reading_;
}

void SimulatedPriceOracle::update(domain::Price value,
                                  domain::UnixSeconds as_of) {
  std::lock_guard lock(mutex_);
  reading_.value = value;
  reading_.as_of = as_of;
}

}  // namespace dca
