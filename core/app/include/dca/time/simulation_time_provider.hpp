#pragma once

#include "dca/time/i_time_provider.hpp"

#include <atomic>

namespace dca {

// -----------------------------------------------------------------------------
// SimulationTimeProvider — externally-driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose "now" is whatever was last written with
//         advance_time().
//
// @details
// In simulation mode the PriceFeedGateway advances the clock to each
// tick's timestamp before updating the oracle, so a keeper poll that runs
// after the tick sees a consistent (time, price) pair. Tests drive it
// directly to step through an order's schedule without sleeping.
//
// Monotonicity is not enforced; tests occasionally rewind it on purpose.
//
// Thread model:
//   One writer (price feed thread or test), many readers (IPC, keeper).
//   std::atomic gives the visibility guarantee without a mutex.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(domain::UnixSeconds start)
      : current_time_(start) {}

  domain::UnixSeconds now_seconds() const override;

  void advance_time(domain::UnixSeconds new_time);

  // Convenience for tests: move the clock forward by `delta` seconds.
  void advance_by(domain::UnixSeconds delta);

 private:
  std::atomic<domain::UnixSeconds> current_time_{0};
};

}  // namespace dca
