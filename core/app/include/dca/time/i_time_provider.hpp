#pragma once

#include "dca/domain/order.hpp"

namespace dca {

// -----------------------------------------------------------------------------
// ITimeProvider — abstract "now" for the engine
// -----------------------------------------------------------------------------
//
// @brief  The engine has no timer of its own. Every operation that compares
//         timestamps (creation, due checks, execution) asks the injected
//         provider for the current time exactly once, at call time.
//
// @details
// Implementations:
//   - LiveTimeProvider        → std::chrono::system_clock.
//   - SimulationTimeProvider  → value written by the price feed or a test.
//
// Resolution is whole seconds: the schedule is defined in seconds (hourly
// is the finest cadence), and the price feed carries second timestamps.
//
// Thread-safety contract:
//   now_seconds() must be safe to call concurrently from any thread.
//
// Ownership:
//   DcaEngine holds a const reference. The provider must outlive it.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // Seconds since 1970-01-01 00:00:00 UTC.
  virtual domain::UnixSeconds now_seconds() const = 0;
};

}  // namespace dca
